#include "game/combat/AutoAttackLoop.hpp"

#include <algorithm>

namespace game::combat
{

void AutoAttackLoop::Start(
    actors::ActorId attacker,
    actors::ActorId target,
    targeting::ActionKind action,
    double now,
    double intervalSeconds)
{
    if (attacker == actors::kInvalidActorId || target == actors::kInvalidActorId)
    {
        return;
    }

    ScheduledAutoAttack loop;
    loop.target = target;
    loop.action = action;
    loop.intervalSeconds = std::max(intervalSeconds, 0.05);
    loop.nextSwingTime = now + loop.intervalSeconds;
    m_loops[attacker] = loop;
}

void AutoAttackLoop::CancelAutoAttack(actors::ActorId attacker)
{
    m_loops.erase(attacker);
}

void AutoAttackLoop::CancelTargeting(actors::ActorId target)
{
    for (auto it = m_loops.begin(); it != m_loops.end();)
    {
        if (it->second.target == target)
        {
            it = m_loops.erase(it);
        }
        else
        {
            ++it;
        }
    }
}

bool AutoAttackLoop::IsRunning(actors::ActorId attacker) const
{
    return m_loops.contains(attacker);
}

const ScheduledAutoAttack* AutoAttackLoop::Get(actors::ActorId attacker) const
{
    const auto it = m_loops.find(attacker);
    return it != m_loops.end() ? &it->second : nullptr;
}

std::vector<DueSwing> AutoAttackLoop::CollectDueSwings(double now)
{
    std::vector<DueSwing> due;
    for (auto& [attacker, loop] : m_loops)
    {
        if (now < loop.nextSwingTime)
        {
            continue;
        }

        due.push_back(DueSwing{attacker, loop.target, loop.action});

        // One swing per collection even after a long stall.
        loop.nextSwingTime += loop.intervalSeconds;
        if (loop.nextSwingTime <= now)
        {
            loop.nextSwingTime = now + loop.intervalSeconds;
        }
    }

    std::sort(due.begin(), due.end(), [](const DueSwing& a, const DueSwing& b) { return a.attacker < b.attacker; });
    return due;
}

void AutoAttackLoop::ClearAll()
{
    m_loops.clear();
}

} // namespace game::combat
