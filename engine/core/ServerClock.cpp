#include "engine/core/ServerClock.hpp"

#include <algorithm>

namespace engine::core
{
ServerClock::ServerClock(double fixedDeltaSeconds)
    : m_fixedDeltaSeconds(1.0 / 30.0)
    , m_deltaSeconds(0.0)
    , m_nowSeconds(0.0)
    , m_lastWallSeconds(0.0)
    , m_accumulator(0.0)
    , m_frameIndex(0)
    , m_firstFrame(true)
{
    SetFixedDeltaSeconds(fixedDeltaSeconds);
}

void ServerClock::SetFixedDeltaSeconds(double fixedDeltaSeconds)
{
    m_fixedDeltaSeconds = std::clamp(fixedDeltaSeconds, 1.0 / 240.0, 1.0 / 5.0);
    m_accumulator = std::min(m_accumulator, m_fixedDeltaSeconds * 2.0);
}

void ServerClock::BeginFrame(double wallSeconds)
{
    if (m_firstFrame)
    {
        m_lastWallSeconds = wallSeconds;
        m_firstFrame = false;
    }

    // A stalled process must not fast-forward every engagement timer at once.
    const double rawDelta = wallSeconds - m_lastWallSeconds;
    m_deltaSeconds = std::clamp(rawDelta, 0.0, 0.25);
    m_lastWallSeconds = wallSeconds;
    m_accumulator += m_deltaSeconds;
    ++m_frameIndex;
}

bool ServerClock::ShouldRunFixedStep() const
{
    return m_accumulator >= m_fixedDeltaSeconds;
}

void ServerClock::ConsumeFixedStep()
{
    m_accumulator -= m_fixedDeltaSeconds;
    if (m_accumulator < 0.0)
    {
        m_accumulator = 0.0;
    }
    m_nowSeconds += m_fixedDeltaSeconds;
}

void ServerClock::Advance(double seconds)
{
    if (seconds <= 0.0)
    {
        return;
    }
    m_deltaSeconds = seconds;
    m_nowSeconds += seconds;
    ++m_frameIndex;
}
} // namespace engine::core
