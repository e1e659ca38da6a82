#include "game/factions/FactionRelationService.hpp"

#include <utility>

namespace game::factions
{

FactionRelationMatrix::FactionRelationMatrix(const RelationTable& relations, const LawPolicyTable& lawPolicies)
    : m_relations(relations)
    , m_lawPolicies(lawPolicies)
{
}

FactionRelationMatrix FactionRelationMatrix::CreateDefault()
{
    return FactionRelationMatrix(DefaultRelations(), DefaultLawPolicies());
}

RelationTable FactionRelationMatrix::DefaultRelations()
{
    RelationTable table{};

    for (std::size_t viewer = 0; viewer < kFactionCount; ++viewer)
    {
        for (std::size_t target = 0; target < kFactionCount; ++target)
        {
            table[viewer][target] = viewer == target ? FactionRelation::Friendly : FactionRelation::Neutral;
        }
    }

    // Neutral wins even against itself.
    const std::size_t neutral = FactionIndex(FactionId::Neutral);
    for (std::size_t other = 0; other < kFactionCount; ++other)
    {
        table[neutral][other] = FactionRelation::Neutral;
        table[other][neutral] = FactionRelation::Neutral;
    }

    auto setBoth = [&table](FactionId a, FactionId b, FactionRelation relation) {
        table[FactionIndex(a)][FactionIndex(b)] = relation;
        table[FactionIndex(b)][FactionIndex(a)] = relation;
    };

    setBoth(FactionId::Players, FactionId::Monsters, FactionRelation::Hostile);
    setBoth(FactionId::Guards, FactionId::Monsters, FactionRelation::Hostile);
    setBoth(FactionId::Village, FactionId::Players, FactionRelation::Friendly);
    setBoth(FactionId::Village, FactionId::Guards, FactionRelation::Friendly);

    return table;
}

LawPolicyTable FactionRelationMatrix::DefaultLawPolicies()
{
    LawPolicyTable policies{};
    policies[FactionIndex(FactionId::Guards)] = FactionLawPolicy{true, true};
    policies[FactionIndex(FactionId::Players)] = FactionLawPolicy{false, true};
    policies[FactionIndex(FactionId::Village)] = FactionLawPolicy{false, true};
    return policies;
}

FactionRelation FactionRelationMatrix::Lookup(FactionId viewer, FactionId target) const
{
    const std::size_t v = FactionIndex(viewer);
    const std::size_t t = FactionIndex(target);
    if (v >= kFactionCount || t >= kFactionCount)
    {
        return FactionRelation::Neutral;
    }
    return m_relations[v][t];
}

const FactionLawPolicy& FactionRelationMatrix::LawPolicy(FactionId faction) const
{
    static const FactionLawPolicy kNoPolicy{};
    const std::size_t index = FactionIndex(faction);
    return index < kFactionCount ? m_lawPolicies[index] : kNoPolicy;
}

FactionRelationService::FactionRelationService(FactionRelationMatrix matrix)
    : m_matrix(std::move(matrix))
{
}

SocialStanding FactionRelationService::ResolveStanding(const actors::Actor& actor, const actors::Actor* controller)
{
    if (actor.InheritsControllerStanding() && controller != nullptr && controller->id == actor.controllerId)
    {
        return SocialStanding{controller->faction, controller->law};
    }
    return SocialStanding{actor.faction, actor.law};
}

actors::ActorId FactionRelationService::ControlRoot(const actors::Actor& actor)
{
    return actor.InheritsControllerStanding() ? actor.controllerId : actor.id;
}

FactionRelation FactionRelationService::BaseRelation(FactionId viewer, FactionId target) const
{
    return m_matrix.Lookup(viewer, target);
}

FactionRelation FactionRelationService::Relation(
    const actors::Actor& viewer,
    const actors::Actor* viewerController,
    const actors::Actor& target,
    const actors::Actor* targetController) const
{
    // A controller and its own summons/pets are one social unit.
    if (ControlRoot(viewer) == ControlRoot(target))
    {
        return FactionRelation::Friendly;
    }

    // (a) controller inheritance, on both sides.
    const SocialStanding viewerStanding = ResolveStanding(viewer, viewerController);
    const SocialStanding targetStanding = ResolveStanding(target, targetController);

    FactionRelation relation = m_matrix.Lookup(viewerStanding.faction, targetStanding.faction);

    // (b) law enforcement overrides the matrix.
    const FactionLawPolicy& policy = m_matrix.LawPolicy(viewerStanding.faction);
    if (targetStanding.law.murderer && policy.hostileToMurderers)
    {
        relation = FactionRelation::Hostile;
    }
    else if (targetStanding.law.criminal && policy.hostileToCriminals)
    {
        relation = FactionRelation::Hostile;
    }

    return relation;
}

} // namespace game::factions
