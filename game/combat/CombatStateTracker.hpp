#pragma once

#include <unordered_map>

#include "engine/core/ServerClock.hpp"
#include "game/actors/ActorRegistry.hpp"
#include "game/combat/CombatCollaborators.hpp"
#include "game/combat/CombatEventBus.hpp"
#include "game/combat/CombatRules.hpp"
#include "game/scene/SceneRuleGate.hpp"
#include "game/targeting/TargetSelection.hpp"

namespace game::combat
{

/// Per-actor engagement record. Server only.
struct EngagementState
{
    double combatUntilTime = 0.0;
    bool hasActiveHostileEngagement = false; ///< Attacker side only.
    actors::ActorId engagedTarget = actors::kInvalidActorId;
    actors::ActorId lastHostileActor = actors::kInvalidActorId;
    actors::CombatState publishedState = actors::CombatState::Peaceful;
};

/// Engagement state machine: Peaceful / InCombat / Dead.
///
/// InCombat <=> hasActiveHostileEngagement || now < combatUntilTime, Dead overrides both.
/// Only validated hostile intents and resolved hostile outcomes extend the window;
/// selecting a target never does. The scene gate beats every timer.
class CombatStateTracker
{
public:
    CombatStateTracker(
        actors::ActorRegistry& registry,
        const scene::SceneRuleGate& sceneRules,
        const engine::core::ServerClock& clock,
        CombatEventBus& events,
        const EngagementTuning& tuning);

    void SetAttackScheduler(IAttackScheduler* scheduler) { m_scheduler = scheduler; }
    void SetSelection(targeting::TargetSelection* selection) { m_selection = selection; }

    /// Attack or harmful cast became Allowed. Attacker only: engaged flag set, window refreshed.
    /// @param intendedTarget Used for aggression bookkeeping (and the victim refresh when
    ///        EngagementTuning::targetedExtendsEngagement is on).
    void OnHostileIntentValidated(actors::ActorId attacker, actors::ActorId intendedTarget = actors::kInvalidActorId);

    /// A scheduled action landed (hit, miss or damage). Refreshes both sides; engaged flag untouched.
    void OnHostileResolution(actors::ActorId attacker, actors::ActorId victim);

    /// Explicit cancel or the target went away. Clears the engaged flag only; the timer runs out naturally.
    void OnEngagementEnded(actors::ActorId attacker);

    /// Region disallows combat: every actor in it drops to Peaceful right now.
    void ApplySceneOverride(const scene::SceneRuleSnapshot& snapshot);

    /// Zero the timer, clear engagement, cancel attacks and attack-driven selection.
    void ForcePeaceful(actors::ActorId actor);

    /// Death pipeline hooks.
    void MarkDead(actors::ActorId actor);
    void OnActorRevived(actors::ActorId actor);
    void OnActorDespawned(actors::ActorId actor);

    /// Run Sweep() if the fixed interval elapsed. @return True if a sweep ran.
    bool SweepIfDue();

    /// Expiry + scene overrides + disengage for every actor.
    /// An engagement ends here when its target is dead or gone, or when its window lapsed.
    void Sweep();

    [[nodiscard]] actors::CombatState GetCombatState(actors::ActorId actor) const;

    /// Display only. Seconds left on the window, 0 when none.
    [[nodiscard]] double RemainingSeconds(actors::ActorId actor) const;

    [[nodiscard]] const EngagementState* GetEngagement(actors::ActorId actor) const;

    /// Dead and unknown actors never travel. Portals flagged requireOutOfCombat also refuse InCombat.
    [[nodiscard]] bool CanTravel(actors::ActorId actor, bool requireOutOfCombat = true) const;

    [[nodiscard]] const EngagementTuning& Tuning() const { return m_tuning; }

private:
    [[nodiscard]] actors::CombatState Derive(const actors::Actor& actor, const EngagementState* state) const;
    EngagementState& StateFor(const actors::Actor& actor);
    bool RefreshWindow(actors::ActorId actor);
    void PublishDerivedState(const actors::Actor& actor);
    void Publish(actors::ActorId actor, actors::CombatState oldState, actors::CombatState newState);
    void ClearCombatBookkeeping(actors::ActorId actor, EngagementState& state);

    actors::ActorRegistry& m_registry;
    const scene::SceneRuleGate& m_sceneRules;
    const engine::core::ServerClock& m_clock;
    CombatEventBus& m_events;
    EngagementTuning m_tuning;
    IAttackScheduler* m_scheduler = nullptr;
    targeting::TargetSelection* m_selection = nullptr;

    std::unordered_map<actors::ActorId, EngagementState> m_states;
    double m_nextSweepTime = 0.0;
};

} // namespace game::combat
