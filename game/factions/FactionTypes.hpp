#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace game::factions
{
enum class FactionId : std::uint16_t
{
    Neutral = 0,
    Players,
    Monsters,
    Village,
    Guards,
    Count
};

constexpr std::size_t kFactionCount = static_cast<std::size_t>(FactionId::Count);

/// Relationship from the viewer's perspective. Self is a targeting concept and lives in TargetingDisposition.
enum class FactionRelation : std::uint8_t
{
    Friendly = 0,
    Neutral,
    Hostile
};

[[nodiscard]] inline std::size_t FactionIndex(FactionId faction)
{
    return static_cast<std::size_t>(faction);
}

[[nodiscard]] inline const char* FactionToId(FactionId faction)
{
    switch (faction)
    {
        case FactionId::Neutral: return "neutral";
        case FactionId::Players: return "players";
        case FactionId::Monsters: return "monsters";
        case FactionId::Village: return "village";
        case FactionId::Guards: return "guards";
        default: return "unknown";
    }
}

[[nodiscard]] inline std::optional<FactionId> ParseFaction(const std::string& str)
{
    if (str == "neutral") return FactionId::Neutral;
    if (str == "players") return FactionId::Players;
    if (str == "monsters") return FactionId::Monsters;
    if (str == "village") return FactionId::Village;
    if (str == "guards") return FactionId::Guards;
    return std::nullopt;
}

[[nodiscard]] inline const char* RelationToId(FactionRelation relation)
{
    switch (relation)
    {
        case FactionRelation::Friendly: return "friendly";
        case FactionRelation::Neutral: return "neutral";
        case FactionRelation::Hostile: return "hostile";
        default: return "unknown";
    }
}

[[nodiscard]] inline std::optional<FactionRelation> ParseRelation(const std::string& str)
{
    if (str == "friendly") return FactionRelation::Friendly;
    if (str == "neutral") return FactionRelation::Neutral;
    if (str == "hostile") return FactionRelation::Hostile;
    return std::nullopt;
}
} // namespace game::factions
