#include "game/targeting/AttackLegalityValidator.hpp"

namespace game::targeting
{

AttackLegalityValidator::AttackLegalityValidator(const TargetingResolver& resolver, const combat::IStatusSource& statuses)
    : m_resolver(resolver)
    , m_statuses(statuses)
{
}

AttackResult AttackLegalityValidator::CanAttack(const AttackQuery& query) const
{
    if (query.attacker == nullptr || query.target == nullptr)
    {
        return AttackResult::Denied(DenyReason::NullActor);
    }

    if (!query.attacker->IsAlive())
    {
        return AttackResult::Denied(DenyReason::AttackerDead);
    }

    if (!query.target->IsAlive())
    {
        return AttackResult::Denied(DenyReason::TargetDead);
    }

    if (!query.sceneFlags.Has(scene::SceneRuleFlag::CombatAllowed))
    {
        return AttackResult::Denied(DenyReason::SceneDisallowsCombat);
    }

    if (!query.sceneFlags.Has(scene::SceneRuleFlag::DamageAllowed))
    {
        return AttackResult::Denied(DenyReason::SceneDisallowsDamage);
    }

    const bool bothPlayers = query.attacker->IsPlayer() && query.target->IsPlayer();
    if (bothPlayers && !query.sceneFlags.Has(scene::SceneRuleFlag::PvPAllowed))
    {
        return AttackResult::Denied(DenyReason::PvPNotAllowed);
    }

    if (!query.inRangeAndLineOfSight)
    {
        return AttackResult::Denied(DenyReason::RangeOrLineOfSight);
    }

    if (m_statuses.IsActionBlocked(query.attacker->id, query.action))
    {
        return AttackResult::Denied(DenyReason::StatusGated);
    }

    if (!query.attackerCanPerceiveTarget)
    {
        return AttackResult::Denied(DenyReason::TargetNotPerceivable);
    }

    // Range was already checked above, so the disposition pass runs without a range gate.
    DispositionQuery dispositionQuery;
    dispositionQuery.viewer = query.attacker;
    dispositionQuery.target = query.target;
    dispositionQuery.viewerController = query.attackerController;
    dispositionQuery.targetController = query.targetController;
    dispositionQuery.sceneFlags = query.sceneFlags;
    dispositionQuery.viewerCanPerceiveTarget = query.attackerCanPerceiveTarget;
    dispositionQuery.rangeGate = std::nullopt;

    const DispositionResult disposition = m_resolver.ResolveDisposition(dispositionQuery);
    if (!disposition.eligible)
    {
        return AttackResult::Denied(disposition.denyReason);
    }

    if (disposition.disposition != TargetingDisposition::Hostile)
    {
        return AttackResult::Denied(DenyReason::NotHostile);
    }

    return AttackResult::Allowed();
}

} // namespace game::targeting
