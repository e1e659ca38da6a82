#pragma once

#include "game/actors/ActorTypes.hpp"
#include "game/targeting/TargetingTypes.hpp"

namespace game::combat
{

/// Stun / paralyze / silence / disarm source.
class IStatusSource
{
public:
    virtual ~IStatusSource() = default;
    [[nodiscard]] virtual bool IsActionBlocked(actors::ActorId actor, targeting::ActionKind action) const = 0;
};

/// Stealth / reveal source.
class IVisibilitySource
{
public:
    virtual ~IVisibilitySource() = default;
    [[nodiscard]] virtual bool CanPerceive(actors::ActorId viewer, actors::ActorId target) const = 0;
};

/// Geometry owner (physics / nav). Optional: without one, line of sight is always clear.
class ILineOfSightSource
{
public:
    virtual ~ILineOfSightSource() = default;
    [[nodiscard]] virtual bool HasLineOfSight(actors::ActorId from, actors::ActorId to) const = 0;
};

/// Whatever schedules repeating attacks. Cancelling is a synchronous state write.
class IAttackScheduler
{
public:
    virtual ~IAttackScheduler() = default;
    virtual void CancelAutoAttack(actors::ActorId attacker) = 0;
};

} // namespace game::combat
