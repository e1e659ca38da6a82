#include "game/targeting/TargetSelection.hpp"

#include <vector>

namespace game::targeting
{

TargetSelection::TargetSelection(combat::CombatEventBus& events, const engine::core::ServerClock& clock)
    : m_events(events)
    , m_clock(clock)
{
}

void TargetSelection::Select(actors::ActorId viewer, actors::ActorId target, SelectionKind kind)
{
    if (target == actors::kInvalidActorId || kind == SelectionKind::None)
    {
        Clear(viewer);
        return;
    }

    const Selection next{target, kind};
    auto it = m_selections.find(viewer);
    if (it != m_selections.end() && it->second.target == next.target && it->second.kind == next.kind)
    {
        return;
    }

    m_selections[viewer] = next;
    PublishChanged(viewer, next);
}

bool TargetSelection::Clear(actors::ActorId viewer)
{
    if (m_selections.erase(viewer) == 0)
    {
        return false;
    }
    PublishChanged(viewer, Selection{});
    return true;
}

bool TargetSelection::ClearIfAttackDriven(actors::ActorId viewer)
{
    auto it = m_selections.find(viewer);
    if (it == m_selections.end() || !it->second.IsAttackDriven())
    {
        return false;
    }
    m_selections.erase(it);
    PublishChanged(viewer, Selection{});
    return true;
}

bool TargetSelection::DemoteToPassive(actors::ActorId viewer)
{
    auto it = m_selections.find(viewer);
    if (it == m_selections.end() || !it->second.IsAttackDriven())
    {
        return false;
    }
    it->second.kind = SelectionKind::Select;
    PublishChanged(viewer, it->second);
    return true;
}

std::optional<Selection> TargetSelection::Get(actors::ActorId viewer) const
{
    const auto it = m_selections.find(viewer);
    if (it == m_selections.end())
    {
        return std::nullopt;
    }
    return it->second;
}

void TargetSelection::OnActorDespawned(actors::ActorId actor)
{
    m_selections.erase(actor);

    std::vector<actors::ActorId> orphaned;
    for (const auto& [viewer, selection] : m_selections)
    {
        if (selection.target == actor)
        {
            orphaned.push_back(viewer);
        }
    }

    for (const actors::ActorId viewer : orphaned)
    {
        Clear(viewer);
    }
}

void TargetSelection::ClearAll()
{
    m_selections.clear();
}

void TargetSelection::PublishChanged(actors::ActorId viewer, const Selection& selection)
{
    combat::CombatEvent event;
    event.type = combat::CombatEventType::SelectionChanged;
    event.time = m_clock.Now();
    event.actor = viewer;
    event.other = selection.target;
    event.selection = selection.kind;
    m_events.Publish(event);
}

} // namespace game::targeting
