#pragma once

#include "game/combat/CombatCollaborators.hpp"
#include "game/targeting/TargetingResolver.hpp"

namespace game::targeting
{

/// "Can this attacker attack that target right now?"
/// Short-circuit chain, each failure mapped to one DenyReason:
/// null actors, attacker alive, target alive, scene combat, scene damage, PvP (player vs player),
/// range/line of sight, status gate, perception, disposition must be Hostile.
/// Never mutates actor or engagement state.
class AttackLegalityValidator
{
public:
    AttackLegalityValidator(const TargetingResolver& resolver, const combat::IStatusSource& statuses);

    [[nodiscard]] AttackResult CanAttack(const AttackQuery& query) const;

private:
    const TargetingResolver& m_resolver;
    const combat::IStatusSource& m_statuses;
};

} // namespace game::targeting
