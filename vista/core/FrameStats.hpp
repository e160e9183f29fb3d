#pragma once

#include <cstdint>

namespace vista::core
{
/// Counters of the last drawn frame, read by the host for display.
struct PerformanceStats
{
    float fps = 0.0F;
    std::uint32_t triangleCount = 0;
    std::uint32_t drawCallCount = 0;
};

/// Frames-per-second over rolling windows of at least one second. The value
/// only changes when a window closes, so it never reports an instantaneous rate.
class FpsCounter
{
public:
    explicit FpsCounter(double windowMs = 1000.0);

    /// Registers a frame presented at |nowMs|. Returns true when a window closed
    /// and Fps() changed.
    bool AddFrame(double nowMs);
    void Reset();

    [[nodiscard]] float Fps() const { return m_fps; }
    [[nodiscard]] double WindowMs() const { return m_windowMs; }

private:
    double m_windowMs;
    double m_lastFrameMs = 0.0;
    double m_accumulatedMs = 0.0;
    std::uint32_t m_frames = 0;
    float m_fps = 0.0F;
    bool m_firstFrame = true;
};
} // namespace vista::core
