/*
Combat state tracker tests: disengage window, sweep cleanup, scene override, death.
*/
#include <vector>

#include "game/combat/CombatStateTracker.hpp"
#include "tests/TestSupport.hpp"

using namespace game::combat;
using game::actors::ActorId;
using game::actors::ActorSpawnParams;
using game::actors::ActorType;
using game::actors::CombatState;
using game::factions::FactionId;
using game::scene::SceneRuleContext;
using game::scene::SceneRuleGate;
using game::targeting::SelectionKind;
using test_support::FakeAttackScheduler;
using test_support::NearlyEqual;

namespace
{
constexpr game::actors::RegionId kDungeon = 1;
constexpr game::actors::RegionId kVillage = 2;

struct TrackerRig
{
    explicit TrackerRig(EngagementTuning tuning = EngagementTuning{})
        : gate(SceneRuleGate::DefaultContextTable())
        , selection(events, clock)
        , tracker(registry, gate, clock, events, tuning)
    {
        gate.RegisterProvider(kDungeon, SceneRuleContext::Dungeon);
        gate.RegisterProvider(kVillage, SceneRuleContext::HotnowVillage);
        tracker.SetAttackScheduler(&scheduler);
        tracker.SetSelection(&selection);

        events.Subscribe(CombatEventType::CombatStateChanged, [this](const CombatEvent& event) {
            transitions.push_back(event);
        });

        attacker = Spawn(ActorType::Player, FactionId::Players);
        victim = Spawn(ActorType::Monster, FactionId::Monsters);
    }

    ActorId Spawn(ActorType type, FactionId faction)
    {
        ActorSpawnParams params;
        params.type = type;
        params.faction = faction;
        params.region = kDungeon;
        return registry.Spawn(params);
    }

    game::actors::ActorRegistry registry;
    SceneRuleGate gate;
    engine::core::ServerClock clock;
    CombatEventBus events;
    game::targeting::TargetSelection selection;
    FakeAttackScheduler scheduler;
    CombatStateTracker tracker;
    std::vector<CombatEvent> transitions;
    ActorId attacker = 0;
    ActorId victim = 0;
};
} // namespace

static int test_intent_enters_combat(void)
{
    TrackerRig rig;
    rig.tracker.OnHostileIntentValidated(rig.attacker, rig.victim);

    const EngagementState* state = rig.tracker.GetEngagement(rig.attacker);
    EXPECT(state != nullptr, "attacker tracked");
    EXPECT(NearlyEqual(state->combatUntilTime, 10.0), "window is now + 10");
    EXPECT(state->hasActiveHostileEngagement, "engaged");
    EXPECT(rig.tracker.GetCombatState(rig.attacker) == CombatState::InCombat, "attacker in combat");
    EXPECT(rig.registry.Find(rig.attacker)->combatState == CombatState::InCombat, "registry written");

    // Attacker only.
    EXPECT(rig.tracker.GetCombatState(rig.victim) == CombatState::Peaceful, "victim untouched");
    EXPECT(rig.tracker.CanTravel(rig.victim), "victim may travel");
    EXPECT(!rig.tracker.CanTravel(rig.attacker), "attacker may not travel");
    EXPECT(rig.tracker.CanTravel(rig.attacker, false), "portal without the combat check lets the attacker through");

    rig.events.DispatchQueued();
    EXPECT(rig.transitions.size() == 1, "one transition published");
    EXPECT(rig.transitions[0].oldState == CombatState::Peaceful, "from peaceful");
    EXPECT(rig.transitions[0].newState == CombatState::InCombat, "to in combat");
    return 0;
}

static int test_window_expires_on_sweep(void)
{
    TrackerRig rig;
    rig.selection.Select(rig.attacker, rig.victim, SelectionKind::Attack);
    rig.tracker.OnHostileIntentValidated(rig.attacker, rig.victim);

    rig.clock.Advance(9.5);
    rig.tracker.Sweep();
    EXPECT(rig.tracker.GetCombatState(rig.attacker) == CombatState::InCombat, "still in combat before expiry");
    EXPECT(rig.scheduler.cancelCount == 0, "nothing cancelled yet");

    rig.clock.Advance(0.5);
    rig.tracker.Sweep();
    EXPECT(rig.tracker.GetCombatState(rig.attacker) == CombatState::Peaceful, "peaceful at t=10");
    EXPECT(rig.registry.Find(rig.attacker)->combatState == CombatState::Peaceful, "registry written");
    EXPECT(rig.scheduler.cancelCount > 0, "auto attack cancelled");
    EXPECT(rig.scheduler.lastCancelled == rig.attacker, "attacker's loop cancelled");
    EXPECT(!rig.selection.Get(rig.attacker).has_value(), "attack selection cleared");
    EXPECT(!rig.tracker.GetEngagement(rig.attacker)->hasActiveHostileEngagement, "engagement over");
    EXPECT(NearlyEqual(rig.tracker.RemainingSeconds(rig.attacker), 0.0), "no time left");
    return 0;
}

static int test_sweep_keeps_passive_selection(void)
{
    TrackerRig rig;
    rig.selection.Select(rig.attacker, rig.victim, SelectionKind::Select);
    rig.tracker.OnHostileIntentValidated(rig.attacker, rig.victim);

    rig.clock.Advance(10.0);
    rig.tracker.Sweep();
    EXPECT(rig.tracker.GetCombatState(rig.attacker) == CombatState::Peaceful, "peaceful");
    EXPECT(rig.selection.Get(rig.attacker).has_value(), "passive selection survives");
    EXPECT(rig.selection.Get(rig.attacker)->kind == SelectionKind::Select, "still a passive select");
    return 0;
}

static int test_resolution_refreshes_both(void)
{
    TrackerRig rig;
    rig.tracker.OnHostileIntentValidated(rig.attacker, rig.victim);

    rig.clock.Advance(8.0);
    rig.tracker.OnHostileResolution(rig.attacker, rig.victim);

    EXPECT(NearlyEqual(rig.tracker.GetEngagement(rig.attacker)->combatUntilTime, 18.0), "attacker window 18");
    EXPECT(NearlyEqual(rig.tracker.GetEngagement(rig.victim)->combatUntilTime, 18.0), "victim window 18");
    EXPECT(!rig.tracker.GetEngagement(rig.victim)->hasActiveHostileEngagement, "victim not engaged");
    EXPECT(rig.tracker.GetCombatState(rig.victim) == CombatState::InCombat, "victim in combat");
    EXPECT(NearlyEqual(rig.tracker.RemainingSeconds(rig.victim), 10.0), "victim has 10s left");

    // The victim drops out once its window lapses.
    rig.clock.Advance(10.0);
    rig.tracker.Sweep();
    EXPECT(rig.tracker.GetCombatState(rig.victim) == CombatState::Peaceful, "victim peaceful at 18");
    return 0;
}

static int test_window_never_decreases(void)
{
    TrackerRig rig;
    rig.tracker.OnHostileIntentValidated(rig.attacker, rig.victim);
    rig.clock.Advance(8.0);
    rig.tracker.OnHostileResolution(rig.attacker, rig.victim);
    const double afterResolution = rig.tracker.GetEngagement(rig.attacker)->combatUntilTime;

    rig.clock.Advance(0.5);
    rig.tracker.OnHostileIntentValidated(rig.attacker, rig.victim);
    rig.tracker.OnHostileIntentValidated(rig.attacker, rig.victim);
    const EngagementState* state = rig.tracker.GetEngagement(rig.attacker);
    EXPECT(state->combatUntilTime >= afterResolution, "window did not shrink");
    EXPECT(NearlyEqual(state->combatUntilTime, 18.5), "window moved forward");
    EXPECT(state->hasActiveHostileEngagement, "still engaged");
    return 0;
}

static int test_scene_override(void)
{
    TrackerRig rig;
    rig.selection.Select(rig.attacker, rig.victim, SelectionKind::Attack);
    rig.tracker.OnHostileIntentValidated(rig.attacker, rig.victim);
    rig.clock.Advance(5.0);

    rig.registry.SetRegion(rig.attacker, kVillage);
    rig.tracker.ApplySceneOverride(rig.gate.SnapshotFor(kVillage));

    const EngagementState* state = rig.tracker.GetEngagement(rig.attacker);
    EXPECT(NearlyEqual(state->combatUntilTime, 0.0), "timer zeroed");
    EXPECT(!state->hasActiveHostileEngagement, "engagement cleared");
    EXPECT(rig.tracker.GetCombatState(rig.attacker) == CombatState::Peaceful, "peaceful immediately");
    EXPECT(rig.scheduler.lastCancelled == rig.attacker, "attack cancelled");
    EXPECT(!rig.selection.Get(rig.attacker).has_value(), "attack selection cleared");

    // Further intents in a safe region are ignored.
    rig.tracker.OnHostileIntentValidated(rig.attacker, rig.victim);
    EXPECT(rig.tracker.GetCombatState(rig.attacker) == CombatState::Peaceful, "no combat in the village");
    return 0;
}

static int test_override_for_allowed_region_is_noop(void)
{
    TrackerRig rig;
    rig.tracker.OnHostileIntentValidated(rig.attacker, rig.victim);
    rig.tracker.ApplySceneOverride(rig.gate.SnapshotFor(kDungeon));
    EXPECT(rig.tracker.GetCombatState(rig.attacker) == CombatState::InCombat, "dungeon leaves combat alone");
    return 0;
}

static int test_sweep_ends_engagement_on_dead_target(void)
{
    TrackerRig rig;
    rig.tracker.OnHostileIntentValidated(rig.attacker, rig.victim);
    rig.registry.Kill(rig.victim);
    rig.clock.Advance(1.0);
    rig.tracker.Sweep();

    const EngagementState* state = rig.tracker.GetEngagement(rig.attacker);
    EXPECT(!state->hasActiveHostileEngagement, "dead target ends engagement");
    EXPECT(NearlyEqual(state->combatUntilTime, 10.0), "timer untouched");
    EXPECT(rig.tracker.GetCombatState(rig.attacker) == CombatState::InCombat, "still in combat until expiry");
    return 0;
}

static int test_engagement_ended_keeps_timer(void)
{
    TrackerRig rig;
    rig.tracker.OnHostileIntentValidated(rig.attacker, rig.victim);
    rig.clock.Advance(3.0);
    rig.tracker.OnEngagementEnded(rig.attacker);

    const EngagementState* state = rig.tracker.GetEngagement(rig.attacker);
    EXPECT(!state->hasActiveHostileEngagement, "engagement cleared");
    EXPECT(NearlyEqual(state->combatUntilTime, 10.0), "timer kept");
    EXPECT(rig.tracker.GetCombatState(rig.attacker) == CombatState::InCombat, "natural expiry pending");
    return 0;
}

static int test_targeted_toggle(void)
{
    {
        TrackerRig rig;
        rig.tracker.OnHostileIntentValidated(rig.attacker, rig.victim);
        EXPECT(rig.tracker.GetCombatState(rig.victim) == CombatState::Peaceful, "off by default");
    }
    {
        EngagementTuning tuning;
        tuning.targetedExtendsEngagement = true;
        TrackerRig rig(tuning);
        rig.tracker.OnHostileIntentValidated(rig.attacker, rig.victim);
        EXPECT(rig.tracker.GetCombatState(rig.victim) == CombatState::InCombat, "victim refreshed when enabled");
        EXPECT(!rig.tracker.GetEngagement(rig.victim)->hasActiveHostileEngagement, "victim not engaged");
    }
    return 0;
}

static int test_death_and_revive(void)
{
    TrackerRig rig;
    rig.tracker.OnHostileIntentValidated(rig.attacker, rig.victim);
    rig.tracker.MarkDead(rig.victim);

    EXPECT(rig.tracker.GetCombatState(rig.victim) == CombatState::Dead, "victim dead");
    EXPECT(!rig.tracker.CanTravel(rig.victim), "dead cannot travel");
    EXPECT(!rig.tracker.CanTravel(rig.victim, false), "dead cannot use any portal");
    EXPECT(!rig.tracker.GetEngagement(rig.attacker)->hasActiveHostileEngagement, "attacker disengaged from corpse");
    EXPECT(rig.scheduler.lastCancelled == rig.attacker, "attacker's loop cancelled");

    // Dead overrides any later refresh.
    rig.tracker.OnHostileResolution(rig.attacker, rig.victim);
    EXPECT(rig.tracker.GetCombatState(rig.victim) == CombatState::Dead, "dead is sticky");

    rig.registry.Revive(rig.victim);
    rig.tracker.OnActorRevived(rig.victim);
    EXPECT(rig.tracker.GetCombatState(rig.victim) == CombatState::Peaceful, "revived peaceful");

    rig.events.DispatchQueued();
    bool sawDeath = false;
    bool sawRevive = false;
    for (const CombatEvent& event : rig.transitions)
    {
        sawDeath = sawDeath || (event.actor == rig.victim && event.newState == CombatState::Dead);
        sawRevive = sawRevive || (event.actor == rig.victim && event.oldState == CombatState::Dead
            && event.newState == CombatState::Peaceful);
    }
    EXPECT(sawDeath, "death published");
    EXPECT(sawRevive, "revive published");
    return 0;
}

static int test_sweep_interval(void)
{
    TrackerRig rig;
    EXPECT(rig.tracker.SweepIfDue(), "first sweep runs");
    EXPECT(!rig.tracker.SweepIfDue(), "not due again yet");
    rig.clock.Advance(0.25);
    EXPECT(rig.tracker.SweepIfDue(), "due after the interval");
    return 0;
}

int main(void)
{
    if (test_intent_enters_combat() != 0) return 1;
    if (test_window_expires_on_sweep() != 0) return 1;
    if (test_sweep_keeps_passive_selection() != 0) return 1;
    if (test_resolution_refreshes_both() != 0) return 1;
    if (test_window_never_decreases() != 0) return 1;
    if (test_scene_override() != 0) return 1;
    if (test_override_for_allowed_region_is_noop() != 0) return 1;
    if (test_sweep_ends_engagement_on_dead_target() != 0) return 1;
    if (test_engagement_ended_keeps_timer() != 0) return 1;
    if (test_targeted_toggle() != 0) return 1;
    if (test_death_and_revive() != 0) return 1;
    if (test_sweep_interval() != 0) return 1;
    return 0;
}
