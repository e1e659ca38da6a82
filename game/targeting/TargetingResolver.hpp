#pragma once

#include "game/factions/FactionRelationService.hpp"
#include "game/targeting/TargetingTypes.hpp"

namespace game::targeting
{

/// Pure targeting rules: eligibility, then disposition in a fixed order.
/// Range, line of sight and perception arrive precomputed in the query.
class TargetingResolver
{
public:
    explicit TargetingResolver(const factions::FactionRelationService& factions);

    /// Eligibility, first failure wins:
    /// null guard, self (always eligible), target alive, target perceivable, optional range gate.
    [[nodiscard]] bool IsEligible(const DispositionQuery& query, DenyReason& denyReason) const;

    /// Disposition in LOCKED order:
    /// 1) Self  2) eligibility  3) faction relation  4) no-hostile-actors scene downgrade
    /// 5) PvP downgrade  6) relation -> disposition.
    /// Downgrades go Hostile -> Neutral, never to Friendly.
    [[nodiscard]] DispositionResult ResolveDisposition(const DispositionQuery& query) const;

private:
    const factions::FactionRelationService& m_factions;
};

} // namespace game::targeting
