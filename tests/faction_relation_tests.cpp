/*
Faction relation tests: matrix lookup, controller inheritance, law policy.
*/
#include "game/factions/FactionRelationService.hpp"
#include "tests/TestSupport.hpp"

using namespace game::factions;
using game::actors::Actor;
using game::actors::ActorType;
using test_support::MakeActor;

static int test_default_matrix(void)
{
    const FactionRelationMatrix matrix = FactionRelationMatrix::CreateDefault();

    EXPECT(matrix.Lookup(FactionId::Players, FactionId::Monsters) == FactionRelation::Hostile, "players hate monsters");
    EXPECT(matrix.Lookup(FactionId::Monsters, FactionId::Players) == FactionRelation::Hostile, "monsters hate players");
    EXPECT(matrix.Lookup(FactionId::Players, FactionId::Players) == FactionRelation::Friendly, "players are friends");
    EXPECT(matrix.Lookup(FactionId::Village, FactionId::Players) == FactionRelation::Friendly, "village likes players");
    EXPECT(matrix.Lookup(FactionId::Neutral, FactionId::Neutral) == FactionRelation::Neutral, "neutral stays neutral");
    EXPECT(matrix.Lookup(FactionId::Guards, FactionId::Players) == FactionRelation::Neutral, "guards neutral to players");
    EXPECT(matrix.Lookup(FactionId::Count, FactionId::Players) == FactionRelation::Neutral, "out of range is neutral");
    return 0;
}

static int test_directional_override(void)
{
    RelationTable relations = FactionRelationMatrix::DefaultRelations();
    relations[FactionIndex(FactionId::Village)][FactionIndex(FactionId::Monsters)] = FactionRelation::Hostile;
    const FactionRelationService service(FactionRelationMatrix(relations, FactionRelationMatrix::DefaultLawPolicies()));

    EXPECT(service.BaseRelation(FactionId::Village, FactionId::Monsters) == FactionRelation::Hostile, "override applied");
    EXPECT(service.BaseRelation(FactionId::Monsters, FactionId::Village) == FactionRelation::Neutral, "reverse untouched");
    return 0;
}

static int test_pet_inherits_controller_faction(void)
{
    const FactionRelationService service(FactionRelationMatrix::CreateDefault());

    const Actor owner = MakeActor(1, ActorType::Player, FactionId::Players);
    Actor pet = MakeActor(2, ActorType::Pet, FactionId::Monsters);
    pet.controllerId = owner.id;
    const Actor monster = MakeActor(3, ActorType::Monster, FactionId::Monsters);

    EXPECT(service.Relation(monster, nullptr, pet, &owner) == FactionRelation::Hostile, "monster sees player pet as hostile");
    EXPECT(service.Relation(pet, &owner, monster, nullptr) == FactionRelation::Hostile, "pet sees monsters as hostile");

    // Without the controller record the pet stands on its own faction.
    EXPECT(service.Relation(monster, nullptr, pet, nullptr) == FactionRelation::Friendly, "no controller, own faction");
    return 0;
}

static int test_only_summons_and_pets_inherit(void)
{
    const FactionRelationService service(FactionRelationMatrix::CreateDefault());

    const Actor owner = MakeActor(1, ActorType::Player, FactionId::Players);
    Actor hireling = MakeActor(2, ActorType::Npc, FactionId::Monsters);
    hireling.controllerId = owner.id;
    const Actor villager = MakeActor(3, ActorType::Npc, FactionId::Village);

    EXPECT(!hireling.InheritsControllerStanding(), "npc does not inherit");
    EXPECT(service.Relation(villager, nullptr, hireling, &owner) == FactionRelation::Neutral, "npc keeps own faction");
    return 0;
}

static int test_controller_and_pet_are_one_unit(void)
{
    const FactionRelationService service(FactionRelationMatrix::CreateDefault());

    Actor owner = MakeActor(1, ActorType::Player, FactionId::Players);
    owner.law.murderer = true;
    Actor pet = MakeActor(2, ActorType::Pet, FactionId::Players);
    pet.controllerId = owner.id;

    EXPECT(service.Relation(pet, &owner, owner, nullptr) == FactionRelation::Friendly, "pet never hostile to owner");
    EXPECT(service.Relation(owner, nullptr, pet, &owner) == FactionRelation::Friendly, "owner never hostile to pet");
    return 0;
}

static int test_law_policy_overrides_matrix(void)
{
    const FactionRelationService service(FactionRelationMatrix::CreateDefault());

    const Actor guard = MakeActor(1, ActorType::Guard, FactionId::Guards);
    const Actor villager = MakeActor(2, ActorType::Npc, FactionId::Village);
    Actor thief = MakeActor(3, ActorType::Player, FactionId::Players);
    thief.law.criminal = true;

    EXPECT(service.Relation(guard, nullptr, thief, nullptr) == FactionRelation::Hostile, "guards hunt criminals");
    EXPECT(service.Relation(villager, nullptr, thief, nullptr) == FactionRelation::Friendly, "village ignores criminals");

    Actor killer = MakeActor(4, ActorType::Player, FactionId::Players);
    killer.law.murderer = true;
    const Actor bystander = MakeActor(5, ActorType::Player, FactionId::Players);
    EXPECT(service.Relation(villager, nullptr, killer, nullptr) == FactionRelation::Hostile, "village hates murderers");
    EXPECT(service.Relation(bystander, nullptr, killer, nullptr) == FactionRelation::Hostile, "players hate murderers");

    // A murderer's summon carries the flag.
    Actor summon = MakeActor(6, ActorType::Summon, FactionId::Neutral);
    summon.controllerId = killer.id;
    EXPECT(service.Relation(guard, nullptr, summon, &killer) == FactionRelation::Hostile, "guard hostile to murderer summon");
    return 0;
}

static int test_name_round_trip(void)
{
    EXPECT(ParseFaction("guards") == FactionId::Guards, "parse guards");
    EXPECT(!ParseFaction("pirates").has_value(), "unknown faction rejected");
    EXPECT(ParseRelation("hostile") == FactionRelation::Hostile, "parse hostile");
    EXPECT(!ParseRelation("grumpy").has_value(), "unknown relation rejected");
    return 0;
}

int main(void)
{
    if (test_default_matrix() != 0) return 1;
    if (test_directional_override() != 0) return 1;
    if (test_pet_inherits_controller_faction() != 0) return 1;
    if (test_only_summons_and_pets_inherit() != 0) return 1;
    if (test_controller_and_pet_are_one_unit() != 0) return 1;
    if (test_law_policy_overrides_matrix() != 0) return 1;
    if (test_name_round_trip() != 0) return 1;
    return 0;
}
