#include "vista/core/FrameStats.hpp"

#include <algorithm>
#include <cmath>

namespace vista::core
{
FpsCounter::FpsCounter(double windowMs)
    : m_windowMs(std::max(1.0, windowMs))
{
}

bool FpsCounter::AddFrame(double nowMs)
{
    // The first frame only anchors the window.
    if (m_firstFrame)
    {
        m_lastFrameMs = nowMs;
        m_firstFrame = false;
        return false;
    }

    // Clock jumps backwards (scene reload, host clock reset) count as zero time.
    const double delta = std::max(0.0, nowMs - m_lastFrameMs);
    m_lastFrameMs = nowMs;
    m_accumulatedMs += delta;
    ++m_frames;

    if (m_accumulatedMs < m_windowMs)
    {
        return false;
    }

    m_fps = static_cast<float>(std::round(static_cast<double>(m_frames) * 1000.0 / m_accumulatedMs));
    m_frames = 0;
    m_accumulatedMs = 0.0;
    return true;
}

void FpsCounter::Reset()
{
    m_lastFrameMs = 0.0;
    m_accumulatedMs = 0.0;
    m_frames = 0;
    m_fps = 0.0F;
    m_firstFrame = true;
}
} // namespace vista::core
