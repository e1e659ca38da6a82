#include "game/combat/CombatStateTracker.hpp"

#include <algorithm>
#include <iostream>

namespace game::combat
{

using actors::ActorId;
using actors::CombatState;

CombatStateTracker::CombatStateTracker(
    actors::ActorRegistry& registry,
    const scene::SceneRuleGate& sceneRules,
    const engine::core::ServerClock& clock,
    CombatEventBus& events,
    const EngagementTuning& tuning)
    : m_registry(registry)
    , m_sceneRules(sceneRules)
    , m_clock(clock)
    , m_events(events)
    , m_tuning(tuning)
{
    m_tuning.disengageSeconds = std::max(m_tuning.disengageSeconds, 0.0);
    m_tuning.sweepIntervalSeconds = std::max(m_tuning.sweepIntervalSeconds, 0.01);
}

CombatState CombatStateTracker::Derive(const actors::Actor& actor, const EngagementState* state) const
{
    if (!actor.IsAlive())
    {
        return CombatState::Dead;
    }
    if (state == nullptr)
    {
        return CombatState::Peaceful;
    }
    if (state->hasActiveHostileEngagement || m_clock.Now() < state->combatUntilTime)
    {
        return CombatState::InCombat;
    }
    return CombatState::Peaceful;
}

EngagementState& CombatStateTracker::StateFor(const actors::Actor& actor)
{
    auto [it, inserted] = m_states.try_emplace(actor.id);
    if (inserted)
    {
        it->second.publishedState = actor.combatState;
    }
    return it->second;
}

bool CombatStateTracker::RefreshWindow(ActorId actorId)
{
    const auto actor = m_registry.Find(actorId);
    if (!actor || !actor->IsAlive())
    {
        return false;
    }

    // No timer survives a region that forbids combat.
    if (!m_sceneRules.SnapshotFor(actor->region).Allows(scene::SceneRuleFlag::CombatAllowed))
    {
        return false;
    }

    EngagementState& state = StateFor(*actor);
    state.combatUntilTime = std::max(state.combatUntilTime, m_clock.Now() + m_tuning.disengageSeconds);
    return true;
}

void CombatStateTracker::OnHostileIntentValidated(ActorId attacker, ActorId intendedTarget)
{
    if (!RefreshWindow(attacker))
    {
        return;
    }

    EngagementState& state = m_states[attacker];
    state.hasActiveHostileEngagement = true;
    if (intendedTarget != actors::kInvalidActorId)
    {
        state.engagedTarget = intendedTarget;
        state.lastHostileActor = intendedTarget;
    }

    if (m_tuning.targetedExtendsEngagement && intendedTarget != actors::kInvalidActorId && intendedTarget != attacker)
    {
        if (RefreshWindow(intendedTarget))
        {
            m_states[intendedTarget].lastHostileActor = attacker;
            if (const auto victim = m_registry.Find(intendedTarget))
            {
                PublishDerivedState(*victim);
            }
        }
    }

    if (const auto actor = m_registry.Find(attacker))
    {
        PublishDerivedState(*actor);
    }
}

void CombatStateTracker::OnHostileResolution(ActorId attacker, ActorId victim)
{
    if (RefreshWindow(attacker))
    {
        m_states[attacker].lastHostileActor = victim;
        if (const auto actor = m_registry.Find(attacker))
        {
            PublishDerivedState(*actor);
        }
    }

    if (victim != attacker && RefreshWindow(victim))
    {
        m_states[victim].lastHostileActor = attacker;
        if (const auto actor = m_registry.Find(victim))
        {
            PublishDerivedState(*actor);
        }
    }
}

void CombatStateTracker::OnEngagementEnded(ActorId attacker)
{
    auto it = m_states.find(attacker);
    if (it == m_states.end())
    {
        return;
    }

    it->second.hasActiveHostileEngagement = false;
    it->second.engagedTarget = actors::kInvalidActorId;
}

void CombatStateTracker::ApplySceneOverride(const scene::SceneRuleSnapshot& snapshot)
{
    if (snapshot.Allows(scene::SceneRuleFlag::CombatAllowed))
    {
        return;
    }

    for (ActorId id : m_registry.ActorsInRegion(snapshot.Region()))
    {
        ForcePeaceful(id);
    }
}

void CombatStateTracker::ForcePeaceful(ActorId actorId)
{
    const auto actor = m_registry.Find(actorId);
    if (!actor)
    {
        return;
    }

    EngagementState& state = StateFor(*actor);
    const bool hadCombat = state.hasActiveHostileEngagement
        || state.combatUntilTime > 0.0
        || state.publishedState == CombatState::InCombat;

    state.combatUntilTime = 0.0;
    ClearCombatBookkeeping(actorId, state);

    if (hadCombat && actor->IsAlive())
    {
        std::cout << "[COMBAT] Forced " << actor->name << " (" << actorId << ") peaceful in region "
                  << actor->region << "\n";
    }

    PublishDerivedState(*actor);
}

void CombatStateTracker::MarkDead(ActorId actorId)
{
    const auto actor = m_registry.Find(actorId);
    if (!actor)
    {
        return;
    }

    EngagementState& state = StateFor(*actor);
    state.combatUntilTime = 0.0;
    ClearCombatBookkeeping(actorId, state);

    m_registry.Kill(actorId);

    // Attackers engaged on the corpse disengage; their windows still run out naturally.
    for (auto& [attacker, other] : m_states)
    {
        if (other.engagedTarget == actorId)
        {
            other.hasActiveHostileEngagement = false;
            other.engagedTarget = actors::kInvalidActorId;
            if (m_scheduler != nullptr)
            {
                m_scheduler->CancelAutoAttack(attacker);
            }
            if (m_selection != nullptr)
            {
                m_selection->ClearIfAttackDriven(attacker);
            }
        }
    }

    if (const auto dead = m_registry.Find(actorId))
    {
        PublishDerivedState(*dead);
    }
}

void CombatStateTracker::OnActorRevived(ActorId actorId)
{
    const auto actor = m_registry.Find(actorId);
    if (!actor)
    {
        return;
    }

    EngagementState& state = StateFor(*actor);
    state.combatUntilTime = 0.0;
    state.hasActiveHostileEngagement = false;
    state.engagedTarget = actors::kInvalidActorId;
    state.lastHostileActor = actors::kInvalidActorId;
    PublishDerivedState(*actor);
}

void CombatStateTracker::OnActorDespawned(ActorId actorId)
{
    m_states.erase(actorId);

    for (auto& [attacker, state] : m_states)
    {
        if (state.engagedTarget == actorId)
        {
            state.hasActiveHostileEngagement = false;
            state.engagedTarget = actors::kInvalidActorId;
        }
        if (state.lastHostileActor == actorId)
        {
            state.lastHostileActor = actors::kInvalidActorId;
        }
    }
}

bool CombatStateTracker::SweepIfDue()
{
    const double now = m_clock.Now();
    if (now < m_nextSweepTime)
    {
        return false;
    }

    Sweep();
    m_nextSweepTime = now + m_tuning.sweepIntervalSeconds;
    return true;
}

void CombatStateTracker::Sweep()
{
    for (ActorId id : m_registry.ActorIds())
    {
        const auto actor = m_registry.Find(id);
        if (!actor)
        {
            continue;
        }

        if (!m_sceneRules.SnapshotFor(actor->region).Allows(scene::SceneRuleFlag::CombatAllowed))
        {
            ForcePeaceful(id);
            continue;
        }

        EngagementState& state = StateFor(*actor);
        if (state.hasActiveHostileEngagement)
        {
            // A pursuit that produced no combat-extending event for a whole window is stale.
            const auto target = m_registry.Find(state.engagedTarget);
            if (!target || !target->IsAlive() || m_clock.Now() >= state.combatUntilTime)
            {
                OnEngagementEnded(id);
                if (m_scheduler != nullptr)
                {
                    m_scheduler->CancelAutoAttack(id);
                }
            }
        }

        PublishDerivedState(*actor);
    }
}

void CombatStateTracker::PublishDerivedState(const actors::Actor& actor)
{
    EngagementState& state = StateFor(actor);
    const CombatState derived = Derive(actor, &state);
    const CombatState previous = state.publishedState;
    if (derived == previous && actor.combatState == derived)
    {
        return;
    }

    if (derived != CombatState::Dead)
    {
        m_registry.SetCombatState(actor.id, derived);
    }

    if (previous == CombatState::InCombat && derived != CombatState::InCombat)
    {
        ClearCombatBookkeeping(actor.id, state);
    }

    state.publishedState = derived;
    if (derived != previous)
    {
        Publish(actor.id, previous, derived);
    }
}

void CombatStateTracker::Publish(ActorId actor, CombatState oldState, CombatState newState)
{
    CombatEvent event;
    event.type = CombatEventType::CombatStateChanged;
    event.time = m_clock.Now();
    event.actor = actor;
    event.oldState = oldState;
    event.newState = newState;
    m_events.Publish(event);
}

void CombatStateTracker::ClearCombatBookkeeping(ActorId actor, EngagementState& state)
{
    state.hasActiveHostileEngagement = false;
    state.engagedTarget = actors::kInvalidActorId;
    state.lastHostileActor = actors::kInvalidActorId;

    if (m_scheduler != nullptr)
    {
        m_scheduler->CancelAutoAttack(actor);
    }
    if (m_selection != nullptr)
    {
        m_selection->ClearIfAttackDriven(actor);
    }
}

CombatState CombatStateTracker::GetCombatState(ActorId actorId) const
{
    const auto actor = m_registry.Find(actorId);
    if (!actor)
    {
        return CombatState::Peaceful;
    }
    return Derive(*actor, GetEngagement(actorId));
}

double CombatStateTracker::RemainingSeconds(ActorId actorId) const
{
    const auto actor = m_registry.Find(actorId);
    const EngagementState* state = GetEngagement(actorId);
    if (!actor || !actor->IsAlive() || state == nullptr)
    {
        return 0.0;
    }
    return std::max(0.0, state->combatUntilTime - m_clock.Now());
}

const EngagementState* CombatStateTracker::GetEngagement(ActorId actor) const
{
    const auto it = m_states.find(actor);
    return it != m_states.end() ? &it->second : nullptr;
}

bool CombatStateTracker::CanTravel(ActorId actorId, bool requireOutOfCombat) const
{
    const auto actor = m_registry.Find(actorId);
    if (!actor)
    {
        return false;
    }

    const CombatState state = GetCombatState(actorId);
    if (state == CombatState::Dead)
    {
        return false;
    }
    return !requireOutOfCombat || state == CombatState::Peaceful;
}

} // namespace game::combat
