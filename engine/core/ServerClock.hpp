#pragma once

namespace engine::core
{
/// Authoritative simulation clock for one world.
/// Every engagement timer is expressed in Now() units; client timestamps are never read.
/// Now() moves only when a fixed step is consumed or the clock is advanced by script.
class ServerClock
{
public:
    explicit ServerClock(double fixedDeltaSeconds = 1.0 / 30.0);

    void SetFixedDeltaSeconds(double fixedDeltaSeconds);

    /// Feed the wall clock once per server frame. The frame delta is clamped to [0, 0.25] s.
    void BeginFrame(double wallSeconds);
    bool ShouldRunFixedStep() const;
    void ConsumeFixedStep();

    /// Scripted stepping (simulations, replays). Negative deltas are ignored.
    void Advance(double seconds);

    [[nodiscard]] double Now() const { return m_nowSeconds; }
    [[nodiscard]] double DeltaSeconds() const { return m_deltaSeconds; }
    [[nodiscard]] double FixedDeltaSeconds() const { return m_fixedDeltaSeconds; }
    [[nodiscard]] unsigned long long FrameIndex() const { return m_frameIndex; }

private:
    double m_fixedDeltaSeconds;
    double m_deltaSeconds;
    double m_nowSeconds;
    double m_lastWallSeconds;
    double m_accumulator;
    unsigned long long m_frameIndex;
    bool m_firstFrame;
};
} // namespace engine::core
