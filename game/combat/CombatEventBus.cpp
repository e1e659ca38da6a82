#include "game/combat/CombatEventBus.hpp"

#include <utility>

namespace game::combat
{
void CombatEventBus::Subscribe(CombatEventType type, Handler handler)
{
    const auto index = static_cast<std::size_t>(type);
    if (index >= m_handlers.size())
    {
        return;
    }
    m_handlers[index].push_back(std::move(handler));
}

void CombatEventBus::Publish(CombatEvent event)
{
    m_queue.push(std::move(event));
}

void CombatEventBus::DispatchQueued()
{
    while (!m_queue.empty())
    {
        CombatEvent event = std::move(m_queue.front());
        m_queue.pop();

        const auto index = static_cast<std::size_t>(event.type);
        if (index >= m_handlers.size())
        {
            continue;
        }

        for (const Handler& handler : m_handlers[index])
        {
            handler(event);
        }
    }
}
} // namespace game::combat
