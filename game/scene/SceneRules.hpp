#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "game/actors/ActorTypes.hpp"

namespace game::scene
{

/// Canonical region taxonomy. Every region declares exactly one.
enum class SceneRuleContext : std::uint8_t
{
    MainlandHousing = 0,
    HotnowVillage,
    Dungeon,
    Count
};

constexpr std::size_t kSceneContextCount = static_cast<std::size_t>(SceneRuleContext::Count);

/// Hard gates. A cleared flag means the server refuses any intent that would violate it.
enum class SceneRuleFlag : std::uint64_t
{
    CombatAllowed = 1ULL << 0,
    DamageAllowed = 1ULL << 1,
    DeathAllowed = 1ULL << 2,
    DurabilityLossAllowed = 1ULL << 3,
    ResourceGatheringAllowed = 1ULL << 4,
    SkillGainAllowed = 1ULL << 5,
    HostileActorsAllowed = 1ULL << 6,
    PvPAllowed = 1ULL << 7
};

/// Immutable set of scene flags. "Modifiers" return a new value.
class SceneRuleFlags
{
public:
    constexpr SceneRuleFlags() = default;
    constexpr explicit SceneRuleFlags(std::uint64_t bits) : m_bits(bits & kAllBits) {}

    [[nodiscard]] static constexpr SceneRuleFlags None() { return SceneRuleFlags(); }
    [[nodiscard]] static constexpr SceneRuleFlags All() { return SceneRuleFlags(kAllBits); }

    [[nodiscard]] constexpr bool Has(SceneRuleFlag flag) const
    {
        return (m_bits & static_cast<std::uint64_t>(flag)) != 0;
    }

    [[nodiscard]] constexpr SceneRuleFlags With(SceneRuleFlag flag) const
    {
        return SceneRuleFlags(m_bits | static_cast<std::uint64_t>(flag));
    }

    [[nodiscard]] constexpr SceneRuleFlags Without(SceneRuleFlag flag) const
    {
        return SceneRuleFlags(m_bits & ~static_cast<std::uint64_t>(flag));
    }

    [[nodiscard]] constexpr std::uint64_t Bits() const { return m_bits; }

    constexpr bool operator==(const SceneRuleFlags&) const = default;

private:
    static constexpr std::uint64_t kAllBits = (1ULL << 8) - 1ULL;

    std::uint64_t m_bits = 0;
};

/// Rule state for one region. Replaced wholesale on transition, never edited.
class SceneRuleSnapshot
{
public:
    SceneRuleSnapshot(actors::RegionId region, SceneRuleContext context, SceneRuleFlags flags)
        : m_region(region)
        , m_context(context)
        , m_flags(flags)
        , m_valid(true)
    {
    }

    /// The "no usable rules" snapshot: nothing is permitted.
    [[nodiscard]] static SceneRuleSnapshot Restrictive(actors::RegionId region)
    {
        return SceneRuleSnapshot(region);
    }

    [[nodiscard]] actors::RegionId Region() const { return m_region; }
    [[nodiscard]] SceneRuleContext Context() const { return m_context; }
    [[nodiscard]] SceneRuleFlags Flags() const { return m_flags; }
    [[nodiscard]] bool IsValid() const { return m_valid; }

    [[nodiscard]] bool Allows(SceneRuleFlag flag) const { return m_valid && m_flags.Has(flag); }

private:
    explicit SceneRuleSnapshot(actors::RegionId region)
        : m_region(region)
        , m_context(SceneRuleContext::HotnowVillage)
        , m_flags(SceneRuleFlags::None())
        , m_valid(false)
    {
    }

    actors::RegionId m_region;
    SceneRuleContext m_context;
    SceneRuleFlags m_flags;
    bool m_valid;
};

using SceneContextTable = std::array<SceneRuleFlags, kSceneContextCount>;

[[nodiscard]] inline const char* ContextToId(SceneRuleContext context)
{
    switch (context)
    {
        case SceneRuleContext::MainlandHousing: return "mainland_housing";
        case SceneRuleContext::HotnowVillage: return "hotnow_village";
        case SceneRuleContext::Dungeon: return "dungeon";
        default: return "unknown";
    }
}

[[nodiscard]] inline std::optional<SceneRuleContext> ParseContext(const std::string& str)
{
    if (str == "mainland_housing") return SceneRuleContext::MainlandHousing;
    if (str == "hotnow_village") return SceneRuleContext::HotnowVillage;
    if (str == "dungeon") return SceneRuleContext::Dungeon;
    return std::nullopt;
}

[[nodiscard]] inline const char* FlagToId(SceneRuleFlag flag)
{
    switch (flag)
    {
        case SceneRuleFlag::CombatAllowed: return "combat";
        case SceneRuleFlag::DamageAllowed: return "damage";
        case SceneRuleFlag::DeathAllowed: return "death";
        case SceneRuleFlag::DurabilityLossAllowed: return "durability_loss";
        case SceneRuleFlag::ResourceGatheringAllowed: return "resource_gathering";
        case SceneRuleFlag::SkillGainAllowed: return "skill_gain";
        case SceneRuleFlag::HostileActorsAllowed: return "hostile_actors";
        case SceneRuleFlag::PvPAllowed: return "pvp";
        default: return "unknown";
    }
}

[[nodiscard]] inline std::optional<SceneRuleFlag> ParseFlag(const std::string& str)
{
    if (str == "combat") return SceneRuleFlag::CombatAllowed;
    if (str == "damage") return SceneRuleFlag::DamageAllowed;
    if (str == "death") return SceneRuleFlag::DeathAllowed;
    if (str == "durability_loss") return SceneRuleFlag::DurabilityLossAllowed;
    if (str == "resource_gathering") return SceneRuleFlag::ResourceGatheringAllowed;
    if (str == "skill_gain") return SceneRuleFlag::SkillGainAllowed;
    if (str == "hostile_actors") return SceneRuleFlag::HostileActorsAllowed;
    if (str == "pvp") return SceneRuleFlag::PvPAllowed;
    return std::nullopt;
}

constexpr std::array<SceneRuleFlag, 8> kAllSceneFlags{
    SceneRuleFlag::CombatAllowed,
    SceneRuleFlag::DamageAllowed,
    SceneRuleFlag::DeathAllowed,
    SceneRuleFlag::DurabilityLossAllowed,
    SceneRuleFlag::ResourceGatheringAllowed,
    SceneRuleFlag::SkillGainAllowed,
    SceneRuleFlag::HostileActorsAllowed,
    SceneRuleFlag::PvPAllowed,
};

} // namespace game::scene
