#pragma once

#include <cstddef>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include "game/actors/ActorTypes.hpp"

namespace game::actors
{

/// Authoritative identity and state for every spawned actor in one world.
/// Writes happen on the world's single executor; reads hand out copies under a shared lock
/// so legality queries can run from request workers.
class ActorRegistry
{
public:
    ActorRegistry() = default;
    ActorRegistry(const ActorRegistry&) = delete;
    ActorRegistry& operator=(const ActorRegistry&) = delete;

    /// Spawn a new actor. Ids are never reused within a registry lifetime.
    /// @return The new actor id (never kInvalidActorId).
    ActorId Spawn(const ActorSpawnParams& params);

    /// Remove an actor. Controller links pointing at it are cleared.
    /// @return False if the id is unknown.
    bool Despawn(ActorId id);

    [[nodiscard]] bool Contains(ActorId id) const;

    /// Copy of the actor record, or nullopt if unknown.
    [[nodiscard]] std::optional<Actor> Find(ActorId id) const;

    [[nodiscard]] std::vector<ActorId> ActorIds() const;
    [[nodiscard]] std::vector<ActorId> ActorsInRegion(RegionId region) const;
    [[nodiscard]] std::size_t Count() const;

    /// Mark dead. Dead is terminal until Revive().
    bool Kill(ActorId id);

    /// Death/respawn pipeline hook: alive again, Peaceful, full health.
    bool Revive(ActorId id);

    /// Write the published combat state. Refuses to move an actor away from Dead.
    bool SetCombatState(ActorId id, CombatState state);

    /// Link a summon/pet to its controller. Self-links and unknown controllers are refused.
    bool SetController(ActorId id, ActorId controllerId);
    bool ClearController(ActorId id);

    bool SetLawFlags(ActorId id, const LawFlags& flags);
    bool SetFaction(ActorId id, factions::FactionId faction);
    bool SetPosition(ActorId id, const glm::vec3& position);
    bool SetRegion(ActorId id, RegionId region);

    /// Set current health (clamped to [0, maxHealth]). Reaching zero kills the actor.
    bool SetHealth(ActorId id, float health);

    [[nodiscard]] std::optional<Vitals> GetVitals(ActorId id) const;

    void Clear();

private:
    Actor* FindMutable(ActorId id);

    mutable std::shared_mutex m_mutex;
    ActorId m_nextId = 1;
    std::unordered_map<ActorId, Actor> m_actors;
};

} // namespace game::actors
