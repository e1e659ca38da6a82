#pragma once

#include <cstddef>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "game/combat/CombatCollaborators.hpp"
#include "game/gameplay/StatusEffect.hpp"

namespace game::gameplay
{

/// Manages status effects for all actors in a world.
/// Serves as the status source (action gates) and the visibility source (stealth / reveal)
/// for attack legality. Effects change on the simulation thread; queries may come from
/// request workers and read under a shared lock.
class StatusEffectManager final : public combat::IStatusSource, public combat::IVisibilitySource
{
public:
    StatusEffectManager() = default;

    /// Apply a new effect or refresh an existing one of the same type + source.
    /// @param actor The actor to apply the effect to.
    /// @param effect The effect to apply.
    void ApplyEffect(actors::ActorId actor, const StatusEffect& effect);

    /// Remove a specific effect type from an actor.
    void RemoveEffect(actors::ActorId actor, StatusEffectType type);

    /// Remove all effects from an actor that were caused by a specific source.
    void RemoveEffectBySource(actors::ActorId actor, const std::string& sourceId);

    /// Remove all effects from an actor (death, despawn).
    void ClearEffects(actors::ActorId actor);

    /// Get all active effects for an actor.
    /// @return Vector of active effects (may be empty).
    [[nodiscard]] std::vector<StatusEffect> GetActiveEffects(actors::ActorId actor) const;

    /// Check if an actor has a specific effect type active.
    [[nodiscard]] bool HasEffect(actors::ActorId actor, StatusEffectType type) const;

    /// Get a copy of a specific effect on an actor.
    [[nodiscard]] std::optional<StatusEffect> GetEffect(actors::ActorId actor, StatusEffectType type) const;

    /// Stunned/Paralyzed block everything, Silenced blocks casts, Disarmed blocks weapon attacks.
    [[nodiscard]] bool IsActionBlocked(actors::ActorId actor, targeting::ActionKind action) const override;

    /// Invisible targets are only perceivable by Revealing viewers. An actor always perceives itself.
    [[nodiscard]] bool CanPerceive(actors::ActorId viewer, actors::ActorId target) const override;

    /// Update all effects (tick timers, remove expired).
    /// @param deltaSeconds Time elapsed since last update.
    void Update(float deltaSeconds);

    /// Get the number of active effects across all actors.
    [[nodiscard]] std::size_t GetTotalActiveEffectCount() const;

    /// Clear all effects for all actors.
    void ClearAll();

private:
    [[nodiscard]] bool HasEffectLocked(actors::ActorId actor, StatusEffectType type) const;

    mutable std::shared_mutex m_mutex;

    /// Per-actor effect storage.
    std::unordered_map<actors::ActorId, std::vector<StatusEffect>> m_actorEffects;
};

}  // namespace game::gameplay
