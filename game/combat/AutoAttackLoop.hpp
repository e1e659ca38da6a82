#pragma once

#include <unordered_map>
#include <vector>

#include "game/combat/CombatCollaborators.hpp"

namespace game::combat
{

struct ScheduledAutoAttack
{
    actors::ActorId target = actors::kInvalidActorId;
    targeting::ActionKind action = targeting::ActionKind::MeleeAttack;
    double intervalSeconds = 2.0;
    double nextSwingTime = 0.0;
};

struct DueSwing
{
    actors::ActorId attacker = actors::kInvalidActorId;
    actors::ActorId target = actors::kInvalidActorId;
    targeting::ActionKind action = targeting::ActionKind::MeleeAttack;
};

/// Repeating weapon attacks, at most one per attacker.
/// Being out of range does not stop the loop; the owner decides what a due swing means.
class AutoAttackLoop final : public IAttackScheduler
{
public:
    /// (Re)start the loop. The first swing is due one interval after `now`.
    void Start(actors::ActorId attacker, actors::ActorId target, targeting::ActionKind action, double now, double intervalSeconds);

    void CancelAutoAttack(actors::ActorId attacker) override;

    /// Drop every loop that targets `target` (despawn).
    void CancelTargeting(actors::ActorId target);

    [[nodiscard]] bool IsRunning(actors::ActorId attacker) const;
    [[nodiscard]] const ScheduledAutoAttack* Get(actors::ActorId attacker) const;

    /// Swings due at `now`, ordered by attacker id. Each returned loop is advanced by one interval.
    [[nodiscard]] std::vector<DueSwing> CollectDueSwings(double now);

    void ClearAll();

private:
    std::unordered_map<actors::ActorId, ScheduledAutoAttack> m_loops;
};

} // namespace game::combat
