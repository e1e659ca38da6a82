#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace game::gameplay
{

/// Conditions the legality layer cares about.
/// Each effect gates a different set of hostile actions or changes perception.
enum class StatusEffectType : std::uint8_t
{
    Stunned = 0,  ///< No hostile action of any kind
    Paralyzed,    ///< No hostile action of any kind
    Silenced,     ///< No harmful casts
    Disarmed,     ///< No weapon attacks (melee or ranged)
    Invisible,    ///< Only perceivable by viewers that are Revealing
    Revealing,    ///< Sees Invisible actors
    Count         ///< Total count of effect types
};

/// Single active status effect instance.
struct StatusEffect
{
    StatusEffectType type = StatusEffectType::Stunned;
    std::string sourceId;           ///< What caused this (spell, item, trap...)
    float duration = 0.0F;          ///< Total duration (0 = indefinite)
    float remainingTime = 0.0F;     ///< Time remaining
    bool infinite = false;          ///< Doesn't tick down

    /// Check if this effect has expired.
    [[nodiscard]] bool IsExpired() const
    {
        if (infinite)
        {
            return false;
        }
        return remainingTime <= 0.0F;
    }

    /// Timed effect helper.
    [[nodiscard]] static StatusEffect Timed(StatusEffectType type, std::string sourceId, float seconds)
    {
        StatusEffect effect;
        effect.type = type;
        effect.sourceId = std::move(sourceId);
        effect.duration = seconds;
        effect.remainingTime = seconds;
        effect.infinite = seconds <= 0.0F;
        return effect;
    }

    [[nodiscard]] static const char* TypeToName(StatusEffectType type)
    {
        switch (type)
        {
            case StatusEffectType::Stunned: return "Stunned";
            case StatusEffectType::Paralyzed: return "Paralyzed";
            case StatusEffectType::Silenced: return "Silenced";
            case StatusEffectType::Disarmed: return "Disarmed";
            case StatusEffectType::Invisible: return "Invisible";
            case StatusEffectType::Revealing: return "Revealing";
            default: return "Unknown";
        }
    }

    [[nodiscard]] static std::optional<StatusEffectType> ParseType(const std::string& str)
    {
        if (str == "stunned") return StatusEffectType::Stunned;
        if (str == "paralyzed") return StatusEffectType::Paralyzed;
        if (str == "silenced") return StatusEffectType::Silenced;
        if (str == "disarmed") return StatusEffectType::Disarmed;
        if (str == "invisible") return StatusEffectType::Invisible;
        if (str == "revealing") return StatusEffectType::Revealing;
        return std::nullopt;
    }
};

}  // namespace game::gameplay
