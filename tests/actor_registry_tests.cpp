/*
Actor registry tests: lifecycle, controller links, vitals and law flags.
*/
#include "game/actors/ActorRegistry.hpp"
#include "tests/TestSupport.hpp"

using namespace game::actors;
using game::factions::FactionId;

static ActorSpawnParams test_params(ActorType type, FactionId faction, RegionId region)
{
    ActorSpawnParams params;
    params.type = type;
    params.faction = faction;
    params.region = region;
    return params;
}

static int test_spawn_assigns_sequential_ids(void)
{
    ActorRegistry registry;
    const ActorId a = registry.Spawn(test_params(ActorType::Player, FactionId::Players, 1));
    const ActorId b = registry.Spawn(test_params(ActorType::Monster, FactionId::Monsters, 1));

    EXPECT(a != kInvalidActorId, "first id valid");
    EXPECT(b == a + 1, "ids are sequential");
    EXPECT(registry.Count() == 2, "two actors registered");

    const auto found = registry.Find(b);
    EXPECT(found.has_value(), "monster found");
    EXPECT(found->IsAlive(), "spawned alive");
    EXPECT(found->combatState == CombatState::Peaceful, "spawned peaceful");
    EXPECT(found->name == "Monster", "default name is the type name");
    return 0;
}

static int test_spawn_with_zero_health_is_dead(void)
{
    ActorRegistry registry;
    ActorSpawnParams params = test_params(ActorType::Destructible, FactionId::Neutral, 1);
    params.vitals = Vitals{0.0F, 50.0F};
    const ActorId id = registry.Spawn(params);

    const auto found = registry.Find(id);
    EXPECT(found.has_value(), "destructible found");
    EXPECT(!found->IsAlive(), "zero health spawns dead");
    EXPECT(found->combatState == CombatState::Dead, "dead state");
    return 0;
}

static int test_unknown_controller_is_dropped(void)
{
    ActorRegistry registry;
    ActorSpawnParams params = test_params(ActorType::Pet, FactionId::Monsters, 1);
    params.controllerId = 42;
    const ActorId pet = registry.Spawn(params);

    EXPECT(!registry.Find(pet)->HasController(), "unknown controller dropped");
    return 0;
}

static int test_controller_links(void)
{
    ActorRegistry registry;
    const ActorId owner = registry.Spawn(test_params(ActorType::Player, FactionId::Players, 1));
    const ActorId pet = registry.Spawn(test_params(ActorType::Pet, FactionId::Monsters, 1));

    EXPECT(!registry.SetController(pet, pet), "self control refused");
    EXPECT(!registry.SetController(pet, 999), "unknown controller refused");
    EXPECT(registry.SetController(pet, owner), "controller set");
    EXPECT(registry.Find(pet)->InheritsControllerStanding(), "pet inherits standing");

    EXPECT(registry.ClearController(pet), "released");
    EXPECT(!registry.Find(pet)->HasController(), "no controller after release");
    EXPECT(!registry.ClearController(999), "unknown actor refused");
    EXPECT(registry.SetController(pet, owner), "controller set again");

    EXPECT(registry.Despawn(owner), "owner despawned");
    EXPECT(!registry.Find(pet)->HasController(), "dangling controller link cleared");
    EXPECT(!registry.Despawn(owner), "second despawn is a no-op");
    return 0;
}

static int test_kill_and_revive(void)
{
    ActorRegistry registry;
    const ActorId id = registry.Spawn(test_params(ActorType::Player, FactionId::Players, 1));

    EXPECT(registry.SetCombatState(id, CombatState::InCombat), "enter combat");
    EXPECT(registry.Kill(id), "kill");
    EXPECT(registry.Find(id)->combatState == CombatState::Dead, "dead after kill");
    EXPECT(!registry.SetCombatState(id, CombatState::Peaceful), "cannot leave Dead without revive");
    EXPECT(!registry.SetHealth(id, 50.0F), "no healing the dead");

    EXPECT(registry.Revive(id), "revive");
    const auto revived = registry.Find(id);
    EXPECT(revived->IsAlive(), "alive again");
    EXPECT(revived->combatState == CombatState::Peaceful, "revived peaceful");
    EXPECT(revived->vitals.health == revived->vitals.maxHealth, "revived at full health");
    return 0;
}

static int test_set_health_clamps_and_kills(void)
{
    ActorRegistry registry;
    const ActorId id = registry.Spawn(test_params(ActorType::Monster, FactionId::Monsters, 1));

    EXPECT(registry.SetHealth(id, 500.0F), "overheal accepted");
    EXPECT(registry.GetVitals(id)->health == 100.0F, "health clamped to max");

    EXPECT(registry.SetHealth(id, 25.0F), "wounded");
    EXPECT(registry.GetVitals(id)->Health01() == 0.25F, "quarter health");

    EXPECT(registry.SetHealth(id, -5.0F), "lethal damage accepted");
    EXPECT(registry.GetVitals(id)->health == 0.0F, "health clamped to zero");
    EXPECT(!registry.Find(id)->IsAlive(), "zero health kills");
    EXPECT(registry.GetVitals(id)->Health01() == 0.0F, "empty bar");
    return 0;
}

static int test_law_flags_players_only(void)
{
    ActorRegistry registry;
    const ActorId player = registry.Spawn(test_params(ActorType::Player, FactionId::Players, 1));
    const ActorId guard = registry.Spawn(test_params(ActorType::Guard, FactionId::Guards, 1));

    EXPECT(registry.SetLawFlags(player, LawFlags{true, false}), "player flagged criminal");
    EXPECT(registry.Find(player)->law.criminal, "criminal stored");
    EXPECT(!registry.SetLawFlags(guard, LawFlags{true, true}), "guards cannot be flagged");
    EXPECT(!registry.Find(guard)->law.murderer, "guard flags untouched");
    return 0;
}

static int test_region_queries(void)
{
    ActorRegistry registry;
    const ActorId a = registry.Spawn(test_params(ActorType::Player, FactionId::Players, 7));
    const ActorId b = registry.Spawn(test_params(ActorType::Monster, FactionId::Monsters, 8));
    const ActorId c = registry.Spawn(test_params(ActorType::Npc, FactionId::Village, 7));

    auto inSeven = registry.ActorsInRegion(7);
    EXPECT(inSeven.size() == 2 && inSeven[0] == a && inSeven[1] == c, "region 7 members sorted");

    EXPECT(registry.SetRegion(b, 7), "move to region 7");
    EXPECT(registry.ActorsInRegion(7).size() == 3, "region 7 grew");
    EXPECT(registry.ActorsInRegion(8).empty(), "region 8 emptied");
    EXPECT(!registry.SetRegion(999, 7), "unknown actor refused");
    return 0;
}

int main(void)
{
    if (test_spawn_assigns_sequential_ids() != 0) return 1;
    if (test_spawn_with_zero_health_is_dead() != 0) return 1;
    if (test_unknown_controller_is_dropped() != 0) return 1;
    if (test_controller_links() != 0) return 1;
    if (test_kill_and_revive() != 0) return 1;
    if (test_set_health_clamps_and_kills() != 0) return 1;
    if (test_law_flags_players_only() != 0) return 1;
    if (test_region_queries() != 0) return 1;
    return 0;
}
