#include "game/combat/CombatAuthority.hpp"

#include <iostream>

#include <glm/geometric.hpp>

namespace game::combat
{

using actors::ActorId;
using targeting::ActionKind;
using targeting::AttackResult;
using targeting::DenyReason;

CombatAuthority::CombatAuthority(
    const CombatRules& rules,
    const engine::core::ServerClock& clock,
    const IStatusSource& statuses,
    const IVisibilitySource& visibility,
    const ILineOfSightSource* lineOfSight)
    : m_rules(rules)
    , m_clock(clock)
    , m_statuses(statuses)
    , m_visibility(visibility)
    , m_lineOfSight(lineOfSight)
    , m_scenes(m_rules.sceneContexts)
    , m_factions(m_rules.BuildFactionMatrix())
    , m_resolver(m_factions)
    , m_validator(m_resolver, m_statuses)
    , m_selection(m_events, m_clock)
    , m_tracker(m_registry, m_scenes, m_clock, m_events, m_rules.engagement)
{
    m_tracker.SetAttackScheduler(&m_autoAttacks);
    m_tracker.SetSelection(&m_selection);
}

// ============================================================================
// Lifecycle
// ============================================================================

ActorId CombatAuthority::Spawn(const actors::ActorSpawnParams& params)
{
    const ActorId id = m_registry.Spawn(params);
    if (!m_scenes.SnapshotFor(params.region).Allows(scene::SceneRuleFlag::CombatAllowed))
    {
        m_tracker.ForcePeaceful(id);
    }
    return id;
}

bool CombatAuthority::Despawn(ActorId actor)
{
    if (!m_registry.Contains(actor))
    {
        return false;
    }

    m_autoAttacks.CancelAutoAttack(actor);
    m_autoAttacks.CancelTargeting(actor);
    m_selection.OnActorDespawned(actor);
    m_tracker.OnActorDespawned(actor);
    return m_registry.Despawn(actor);
}

bool CombatAuthority::Kill(ActorId actor)
{
    const auto found = m_registry.Find(actor);
    if (!found || !found->IsAlive())
    {
        return false;
    }

    m_tracker.MarkDead(actor);
    std::cout << "[COMBAT] " << found->name << " (" << actor << ") died\n";
    return true;
}

bool CombatAuthority::Revive(ActorId actor)
{
    const auto found = m_registry.Find(actor);
    if (!found || found->IsAlive())
    {
        return false;
    }

    m_registry.Revive(actor);
    m_tracker.OnActorRevived(actor);
    return true;
}

// ============================================================================
// Regions
// ============================================================================

bool CombatAuthority::RegisterSceneProvider(actors::RegionId region, scene::SceneRuleContext context)
{
    const bool registered = m_scenes.RegisterProvider(region, context);

    // A refused duplicate leaves the region restrictive, which must take effect right away.
    m_tracker.ApplySceneOverride(m_scenes.SnapshotFor(region));
    return registered;
}

void CombatAuthority::UnloadRegion(actors::RegionId region)
{
    m_scenes.UnloadRegion(region);
    m_tracker.ApplySceneOverride(m_scenes.SnapshotFor(region));
}

bool CombatAuthority::OnRegionEntered(ActorId actor, actors::RegionId region)
{
    if (!m_registry.SetRegion(actor, region))
    {
        return false;
    }

    if (!m_scenes.SnapshotFor(region).Allows(scene::SceneRuleFlag::CombatAllowed))
    {
        m_tracker.ForcePeaceful(actor);
    }
    return true;
}

// ============================================================================
// Intents
// ============================================================================

bool CombatAuthority::SelectTarget(ActorId viewer, ActorId target, targeting::SelectionKind kind)
{
    if (kind == targeting::SelectionKind::Attack)
    {
        return RequestAttack(AttackRequest{viewer, target, ActionKind::MeleeAttack}).allowed;
    }

    if (target == actors::kInvalidActorId || kind == targeting::SelectionKind::None)
    {
        return m_selection.Clear(viewer);
    }

    const targeting::DispositionResult result = ResolveDisposition(viewer, target);
    if (!result.eligible)
    {
        PublishDenied(viewer, target, result.denyReason);
        return false;
    }

    // Selecting never touches the engagement window.
    m_selection.Select(viewer, target, kind);
    return true;
}

AttackResult CombatAuthority::RequestAttack(const AttackRequest& request)
{
    const AttackResult result = CanAttack(request);
    if (!result.allowed)
    {
        PublishDenied(request.attacker, request.target, result.denyReason);
        return result;
    }

    m_tracker.OnHostileIntentValidated(request.attacker, request.target);
    m_selection.Select(request.attacker, request.target, targeting::SelectionKind::Attack);

    if (request.action != ActionKind::HarmfulCast)
    {
        m_autoAttacks.Start(
            request.attacker,
            request.target,
            request.action,
            m_clock.Now(),
            m_rules.engagement.autoAttackIntervalSeconds);
    }
    return result;
}

bool CombatAuthority::CancelAttack(ActorId attacker)
{
    const bool wasRunning = m_autoAttacks.IsRunning(attacker);
    const EngagementState* engagement = m_tracker.GetEngagement(attacker);
    const bool wasEngaged = engagement != nullptr && engagement->hasActiveHostileEngagement;

    m_autoAttacks.CancelAutoAttack(attacker);
    m_tracker.OnEngagementEnded(attacker);
    const bool demoted = m_selection.DemoteToPassive(attacker);
    return wasRunning || wasEngaged || demoted;
}

void CombatAuthority::ReportHostileResolution(ActorId attacker, ActorId victim)
{
    m_tracker.OnHostileResolution(attacker, victim);
}

bool CombatAuthority::CanTravel(ActorId actor, bool requireOutOfCombat) const
{
    return m_tracker.CanTravel(actor, requireOutOfCombat);
}

void CombatAuthority::Tick(const SwingHandler& onSwing)
{
    for (const DueSwing& swing : m_autoAttacks.CollectDueSwings(m_clock.Now()))
    {
        // An earlier swing this tick may have killed or cancelled this one.
        if (!m_autoAttacks.IsRunning(swing.attacker))
        {
            continue;
        }

        const AttackResult result = CanAttack(AttackRequest{swing.attacker, swing.target, swing.action});
        if (result.allowed)
        {
            if (onSwing)
            {
                onSwing(swing);
            }
            m_tracker.OnHostileResolution(swing.attacker, swing.target);
            continue;
        }

        // Chasing, stunned or disarmed: the target is still legal, wait for the next swing.
        if (result.denyReason == DenyReason::RangeOrLineOfSight || result.denyReason == DenyReason::StatusGated)
        {
            continue;
        }

        m_autoAttacks.CancelAutoAttack(swing.attacker);
        m_tracker.OnEngagementEnded(swing.attacker);
        PublishDenied(swing.attacker, swing.target, result.denyReason);
    }

    m_tracker.SweepIfDue();
    m_events.DispatchQueued();
}

// ============================================================================
// Queries
// ============================================================================

targeting::DispositionResult CombatAuthority::ResolveDisposition(
    ActorId viewer,
    ActorId target,
    std::optional<float> rangeGateMeters) const
{
    const ActorView viewerView = View(viewer);
    const ActorView targetView = View(target);

    targeting::DispositionQuery query;
    query.viewer = viewerView.Ptr();
    query.target = targetView.Ptr();
    query.viewerController = viewerView.ControllerPtr();
    query.targetController = targetView.ControllerPtr();

    if (query.viewer != nullptr && query.target != nullptr)
    {
        query.sceneFlags = m_scenes.SnapshotFor(query.viewer->region).Flags();
        query.viewerCanPerceiveTarget = m_visibility.CanPerceive(viewer, target);
        if (rangeGateMeters)
        {
            query.rangeGate = InRangeAndSight(*query.viewer, *query.target, *rangeGateMeters);
        }
    }

    return m_resolver.ResolveDisposition(query);
}

AttackResult CombatAuthority::CanAttack(const AttackRequest& request) const
{
    const ActorView attackerView = View(request.attacker);
    const ActorView targetView = View(request.target);

    targeting::AttackQuery query;
    query.attacker = attackerView.Ptr();
    query.target = targetView.Ptr();
    query.attackerController = attackerView.ControllerPtr();
    query.targetController = targetView.ControllerPtr();
    query.action = request.action;

    if (query.attacker != nullptr && query.target != nullptr)
    {
        query.sceneFlags = m_scenes.SnapshotFor(query.attacker->region).Flags();
        query.inRangeAndLineOfSight =
            InRangeAndSight(*query.attacker, *query.target, m_rules.range.MaxRangeFor(request.action));
        query.attackerCanPerceiveTarget = m_visibility.CanPerceive(request.attacker, request.target);
    }

    return m_validator.CanAttack(query);
}

actors::CombatState CombatAuthority::GetCombatState(ActorId actor) const
{
    return m_tracker.GetCombatState(actor);
}

double CombatAuthority::RemainingSeconds(ActorId actor) const
{
    return m_tracker.RemainingSeconds(actor);
}

// ============================================================================
// Helpers
// ============================================================================

CombatAuthority::ActorView CombatAuthority::View(ActorId id) const
{
    ActorView view;
    view.actor = m_registry.Find(id);
    if (view.actor && view.actor->HasController())
    {
        view.controller = m_registry.Find(view.actor->controllerId);
    }
    return view;
}

bool CombatAuthority::InRangeAndSight(const actors::Actor& from, const actors::Actor& to, float maxRange) const
{
    if (from.region != to.region)
    {
        return false;
    }

    if (glm::distance(from.position, to.position) > maxRange)
    {
        return false;
    }

    return m_lineOfSight == nullptr || m_lineOfSight->HasLineOfSight(from.id, to.id);
}

void CombatAuthority::PublishDenied(ActorId actor, ActorId target, DenyReason reason)
{
    CombatEvent event;
    event.type = CombatEventType::TargetIntentDenied;
    event.time = m_clock.Now();
    event.actor = actor;
    event.other = target;
    event.reason = reason;
    m_events.Publish(event);
}

} // namespace game::combat
