#include "game/targeting/TargetingResolver.hpp"

namespace game::targeting
{

namespace
{
[[nodiscard]] TargetingDisposition ToDisposition(factions::FactionRelation relation)
{
    switch (relation)
    {
        case factions::FactionRelation::Friendly: return TargetingDisposition::Friendly;
        case factions::FactionRelation::Hostile: return TargetingDisposition::Hostile;
        case factions::FactionRelation::Neutral:
        default: return TargetingDisposition::Neutral;
    }
}

[[nodiscard]] bool IsSameActor(const actors::Actor& a, const actors::Actor& b)
{
    return &a == &b || a.id == b.id;
}
} // namespace

TargetingResolver::TargetingResolver(const factions::FactionRelationService& factions)
    : m_factions(factions)
{
}

bool TargetingResolver::IsEligible(const DispositionQuery& query, DenyReason& denyReason) const
{
    denyReason = DenyReason::None;

    if (query.viewer == nullptr || query.target == nullptr)
    {
        denyReason = DenyReason::NullActor;
        return false;
    }

    if (IsSameActor(*query.viewer, *query.target))
    {
        return true;
    }

    if (!query.target->IsAlive())
    {
        denyReason = DenyReason::TargetDead;
        return false;
    }

    if (!query.viewerCanPerceiveTarget)
    {
        denyReason = DenyReason::TargetNotPerceivable;
        return false;
    }

    if (query.rangeGate.has_value() && !*query.rangeGate)
    {
        denyReason = DenyReason::RangeOrLineOfSight;
        return false;
    }

    return true;
}

DispositionResult TargetingResolver::ResolveDisposition(const DispositionQuery& query) const
{
    if (query.viewer == nullptr || query.target == nullptr)
    {
        return DispositionResult{false, TargetingDisposition::Invalid, DenyReason::NullActor};
    }

    // 1) Self
    if (IsSameActor(*query.viewer, *query.target))
    {
        return DispositionResult{true, TargetingDisposition::Self, DenyReason::None};
    }

    // 2) Eligibility
    DenyReason eligibilityDeny = DenyReason::None;
    if (!IsEligible(query, eligibilityDeny))
    {
        return DispositionResult{false, TargetingDisposition::Invalid, eligibilityDeny};
    }

    // 3) Faction relation (controller inheritance and law flags included)
    factions::FactionRelation relation =
        m_factions.Relation(*query.viewer, query.viewerController, *query.target, query.targetController);

    // 4) Safe regions never produce Hostile; downgrade rather than deny so UI can still label the target.
    if (!query.sceneFlags.Has(scene::SceneRuleFlag::HostileActorsAllowed)
        && relation == factions::FactionRelation::Hostile)
    {
        relation = factions::FactionRelation::Neutral;
    }

    // 5) Player vs player needs PvP.
    const bool bothPlayers = query.viewer->IsPlayer() && query.target->IsPlayer();
    if (bothPlayers && !query.sceneFlags.Has(scene::SceneRuleFlag::PvPAllowed)
        && relation == factions::FactionRelation::Hostile)
    {
        relation = factions::FactionRelation::Neutral;
    }

    // 6) Map
    return DispositionResult{true, ToDisposition(relation), DenyReason::None};
}

} // namespace game::targeting
