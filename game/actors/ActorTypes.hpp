#pragma once

#include <cstdint>
#include <string>

#include <glm/vec3.hpp>

#include "game/factions/FactionTypes.hpp"

namespace game::actors
{
using ActorId = std::uint32_t;
constexpr ActorId kInvalidActorId = 0;

using RegionId = std::uint32_t;
constexpr RegionId kNoRegion = 0;

enum class ActorType : std::uint8_t
{
    Player = 0,
    Monster,
    Npc,
    Guard,
    Summon,
    Pet,
    Destructible
};

enum class CombatState : std::uint8_t
{
    Peaceful = 0,
    InCombat,
    Dead
};

/// Player flagging. Only meaningful on Player actors (and inherited by their summons/pets).
struct LawFlags
{
    bool criminal = false;
    bool murderer = false;
};

/// The one authoritative vitals record per actor. UI and combat both read this copy.
struct Vitals
{
    float health = 100.0F;
    float maxHealth = 100.0F;

    [[nodiscard]] float Health01() const
    {
        return maxHealth > 0.0F ? health / maxHealth : 0.0F;
    }
};

struct Actor
{
    ActorId id = kInvalidActorId;
    ActorType type = ActorType::Npc;
    factions::FactionId faction = factions::FactionId::Neutral;
    bool alive = true;
    CombatState combatState = CombatState::Peaceful;
    ActorId controllerId = kInvalidActorId; ///< Relation only; the controller never owns this actor.
    LawFlags law;
    RegionId region = kNoRegion;
    glm::vec3 position{0.0F, 0.0F, 0.0F};
    Vitals vitals;
    std::string name;

    [[nodiscard]] bool IsAlive() const { return alive; }
    [[nodiscard]] bool IsPlayer() const { return type == ActorType::Player; }
    [[nodiscard]] bool HasController() const { return controllerId != kInvalidActorId && controllerId != id; }

    /// Summons and pets answer for their controller socially.
    [[nodiscard]] bool InheritsControllerStanding() const
    {
        return HasController() && (type == ActorType::Summon || type == ActorType::Pet);
    }
};

struct ActorSpawnParams
{
    ActorType type = ActorType::Npc;
    factions::FactionId faction = factions::FactionId::Neutral;
    ActorId controllerId = kInvalidActorId;
    RegionId region = kNoRegion;
    glm::vec3 position{0.0F, 0.0F, 0.0F};
    Vitals vitals;
    std::string name;
};

[[nodiscard]] inline const char* ActorTypeToName(ActorType type)
{
    switch (type)
    {
        case ActorType::Player: return "Player";
        case ActorType::Monster: return "Monster";
        case ActorType::Npc: return "NPC";
        case ActorType::Guard: return "Guard";
        case ActorType::Summon: return "Summon";
        case ActorType::Pet: return "Pet";
        case ActorType::Destructible: return "Destructible";
        default: return "Unknown";
    }
}

[[nodiscard]] inline const char* CombatStateToName(CombatState state)
{
    switch (state)
    {
        case CombatState::Peaceful: return "Peaceful";
        case CombatState::InCombat: return "InCombat";
        case CombatState::Dead: return "Dead";
        default: return "Unknown";
    }
}
} // namespace game::actors
