#pragma once

#include <optional>
#include <unordered_map>

#include "engine/core/ServerClock.hpp"
#include "game/combat/CombatEventBus.hpp"
#include "game/targeting/TargetingTypes.hpp"

namespace game::targeting
{

struct Selection
{
    actors::ActorId target = actors::kInvalidActorId;
    SelectionKind kind = SelectionKind::None;

    [[nodiscard]] bool IsAttackDriven() const { return kind == SelectionKind::Attack; }
};

/// Current selection per actor. Selecting is looking, not fighting: nothing here touches engagement.
class TargetSelection
{
public:
    TargetSelection(combat::CombatEventBus& events, const engine::core::ServerClock& clock);

    /// Replace the viewer's selection. Publishes SelectionChanged when it actually changes.
    void Select(actors::ActorId viewer, actors::ActorId target, SelectionKind kind);

    /// Drop the selection entirely.
    bool Clear(actors::ActorId viewer);

    /// Drop the selection only if it was made by an attack. Passive Select/Interact survives.
    bool ClearIfAttackDriven(actors::ActorId viewer);

    /// Keep the target but stop treating it as an attack selection.
    bool DemoteToPassive(actors::ActorId viewer);

    [[nodiscard]] std::optional<Selection> Get(actors::ActorId viewer) const;

    /// Remove the actor's own selection and every selection pointing at it.
    void OnActorDespawned(actors::ActorId actor);

    void ClearAll();

private:
    void PublishChanged(actors::ActorId viewer, const Selection& selection);

    combat::CombatEventBus& m_events;
    const engine::core::ServerClock& m_clock;
    std::unordered_map<actors::ActorId, Selection> m_selections;
};

} // namespace game::targeting
