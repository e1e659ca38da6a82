#pragma once

#include <functional>
#include <optional>

#include "engine/core/ServerClock.hpp"
#include "game/actors/ActorRegistry.hpp"
#include "game/combat/AutoAttackLoop.hpp"
#include "game/combat/CombatCollaborators.hpp"
#include "game/combat/CombatEventBus.hpp"
#include "game/combat/CombatRules.hpp"
#include "game/combat/CombatStateTracker.hpp"
#include "game/factions/FactionRelationService.hpp"
#include "game/scene/SceneRuleGate.hpp"
#include "game/targeting/AttackLegalityValidator.hpp"
#include "game/targeting/TargetSelection.hpp"
#include "game/targeting/TargetingResolver.hpp"

namespace game::combat
{

struct AttackRequest
{
    actors::ActorId attacker = actors::kInvalidActorId;
    actors::ActorId target = actors::kInvalidActorId;
    targeting::ActionKind action = targeting::ActionKind::MeleeAttack;
};

/// Server-side combat authority for one world.
/// Owns every rules service and is the single writer of actor, engagement and scene state.
/// ResolveDisposition and CanAttack read value copies under shared locks and may run on
/// request workers. Engagement queries (GetCombatState, RemainingSeconds, CanTravel) and every
/// mutator belong to the simulation thread.
class CombatAuthority
{
public:
    /// Invoked for every auto-attack swing that passed re-validation (damage pipeline hook).
    using SwingHandler = std::function<void(const DueSwing&)>;

    /// @param lineOfSight Optional. Null means line of sight is always clear.
    CombatAuthority(
        const CombatRules& rules,
        const engine::core::ServerClock& clock,
        const IStatusSource& statuses,
        const IVisibilitySource& visibility,
        const ILineOfSightSource* lineOfSight = nullptr);

    CombatAuthority(const CombatAuthority&) = delete;
    CombatAuthority& operator=(const CombatAuthority&) = delete;

    // Lifecycle
    actors::ActorId Spawn(const actors::ActorSpawnParams& params);
    bool Despawn(actors::ActorId actor);
    bool Kill(actors::ActorId actor);
    bool Revive(actors::ActorId actor);

    // Regions
    bool RegisterSceneProvider(actors::RegionId region, scene::SceneRuleContext context);
    void UnloadRegion(actors::RegionId region);
    bool OnRegionEntered(actors::ActorId actor, actors::RegionId region);

    // Intents
    /// Passive Select/Interact needs an eligible target; Attack goes through RequestAttack.
    bool SelectTarget(actors::ActorId viewer, actors::ActorId target, targeting::SelectionKind kind);

    /// Validate, record the hostile intent, make the selection attack-driven and start the
    /// auto-attack loop for weapon actions. Denials publish TargetIntentDenied.
    targeting::AttackResult RequestAttack(const AttackRequest& request);

    /// Ends the engagement and the loop; the target stays selected passively.
    bool CancelAttack(actors::ActorId attacker);

    /// A hit, miss or damage application landed.
    void ReportHostileResolution(actors::ActorId attacker, actors::ActorId victim);

    /// Dead actors never travel; portals requiring out-of-combat also refuse InCombat actors.
    [[nodiscard]] bool CanTravel(actors::ActorId actor, bool requireOutOfCombat = true) const;

    /// Resolve due swings, then sweep, then dispatch queued events.
    void Tick(const SwingHandler& onSwing = {});

    // Queries
    [[nodiscard]] targeting::DispositionResult ResolveDisposition(
        actors::ActorId viewer,
        actors::ActorId target,
        std::optional<float> rangeGateMeters = std::nullopt) const;

    [[nodiscard]] targeting::AttackResult CanAttack(const AttackRequest& request) const;

    [[nodiscard]] actors::CombatState GetCombatState(actors::ActorId actor) const;
    [[nodiscard]] double RemainingSeconds(actors::ActorId actor) const;

    // Services
    [[nodiscard]] actors::ActorRegistry& Registry() { return m_registry; }
    [[nodiscard]] const actors::ActorRegistry& Registry() const { return m_registry; }
    [[nodiscard]] const scene::SceneRuleGate& Scenes() const { return m_scenes; }
    [[nodiscard]] CombatEventBus& Events() { return m_events; }
    [[nodiscard]] const targeting::TargetSelection& Selection() const { return m_selection; }
    [[nodiscard]] const AutoAttackLoop& AutoAttacks() const { return m_autoAttacks; }
    [[nodiscard]] const CombatStateTracker& Tracker() const { return m_tracker; }
    [[nodiscard]] const CombatRules& Rules() const { return m_rules; }

private:
    /// Copies of an actor and its controller, taken under the registry read lock.
    struct ActorView
    {
        std::optional<actors::Actor> actor;
        std::optional<actors::Actor> controller;

        [[nodiscard]] const actors::Actor* Ptr() const { return actor ? &*actor : nullptr; }
        [[nodiscard]] const actors::Actor* ControllerPtr() const { return controller ? &*controller : nullptr; }
    };

    [[nodiscard]] ActorView View(actors::ActorId id) const;
    [[nodiscard]] bool InRangeAndSight(const actors::Actor& from, const actors::Actor& to, float maxRange) const;
    void PublishDenied(actors::ActorId actor, actors::ActorId target, targeting::DenyReason reason);

    CombatRules m_rules;
    const engine::core::ServerClock& m_clock;
    const IStatusSource& m_statuses;
    const IVisibilitySource& m_visibility;
    const ILineOfSightSource* m_lineOfSight = nullptr;

    actors::ActorRegistry m_registry;
    scene::SceneRuleGate m_scenes;
    factions::FactionRelationService m_factions;
    targeting::TargetingResolver m_resolver;
    targeting::AttackLegalityValidator m_validator;
    CombatEventBus m_events;
    targeting::TargetSelection m_selection;
    AutoAttackLoop m_autoAttacks;
    CombatStateTracker m_tracker;
};

} // namespace game::combat
