#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <queue>
#include <vector>

#include "game/actors/ActorTypes.hpp"
#include "game/targeting/TargetingTypes.hpp"

namespace game::combat
{

enum class CombatEventType : std::uint8_t
{
    SelectionChanged = 0,
    TargetIntentDenied,
    CombatStateChanged,
    Count
};

/// Notification payload. Consumers read it; nothing authoritative may be derived from it.
struct CombatEvent
{
    CombatEventType type = CombatEventType::CombatStateChanged;
    double time = 0.0;
    actors::ActorId actor = actors::kInvalidActorId;
    actors::ActorId other = actors::kInvalidActorId; ///< Selected / denied target.

    // SelectionChanged
    targeting::SelectionKind selection = targeting::SelectionKind::None;

    // TargetIntentDenied
    targeting::DenyReason reason = targeting::DenyReason::None;

    // CombatStateChanged
    actors::CombatState oldState = actors::CombatState::Peaceful;
    actors::CombatState newState = actors::CombatState::Peaceful;
};

/// Queued notification channel. Publish from the world executor, dispatch once per tick.
class CombatEventBus
{
public:
    using Handler = std::function<void(const CombatEvent&)>;

    void Subscribe(CombatEventType type, Handler handler);
    void Publish(CombatEvent event);
    void DispatchQueued();

    [[nodiscard]] std::size_t PendingCount() const { return m_queue.size(); }

private:
    std::array<std::vector<Handler>, static_cast<std::size_t>(CombatEventType::Count)> m_handlers;
    std::queue<CombatEvent> m_queue;
};

[[nodiscard]] inline const char* CombatEventTypeToName(CombatEventType type)
{
    switch (type)
    {
        case CombatEventType::SelectionChanged: return "SelectionChanged";
        case CombatEventType::TargetIntentDenied: return "TargetIntentDenied";
        case CombatEventType::CombatStateChanged: return "CombatStateChanged";
        default: return "Unknown";
    }
}

} // namespace game::combat
