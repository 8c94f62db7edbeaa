#include "frame_resampler.h"

#include "segment_interpolator.h"

FrameResampler::FrameResampler(const RecordedMotion &motion, EasingMode mode)
    : m_motion(motion),
      m_mode(mode),
      m_cursor(0) {
}

void FrameResampler::reset() {
    m_cursor = 0;
}

FrameResampler::Sample FrameResampler::sample(int32_t elapsedMs) {
    Sample result;
    const auto &frames = m_motion.frames;

    if (frames.size() < 2) {
        if (!frames.empty()) {
            result.positions = frames.front().positions;
        }
        result.finished = true;
        return result;
    }

    if (elapsedMs < 0 || static_cast<uint32_t>(elapsedMs) <= frames.front().timestampMs) {
        m_cursor = 0;
        result.positions = frames.front().positions;
        return result;
    }

    uint32_t elapsed = static_cast<uint32_t>(elapsedMs);
    if (elapsed >= frames.back().timestampMs) {
        m_cursor = frames.size() - 2;
        result.positions = frames.back().positions;
        result.finished = true;
        return result;
    }

    size_t index = locateBracket(elapsed);
    const MotionFrame &from = frames[index];
    const MotionFrame &to = frames[index + 1];

    float progress = 0.0f;
    if (to.timestampMs > from.timestampMs) {
        progress = static_cast<float>(elapsed - from.timestampMs) /
                   static_cast<float>(to.timestampMs - from.timestampMs);
    }

    result.positions = blendPoses(from.positions, to.positions, progress, m_mode);
    return result;
}

size_t FrameResampler::locateBracket(uint32_t elapsedMs) {
    const auto &frames = m_motion.frames;
    size_t lastPair = frames.size() - 2;

    if (m_cursor > lastPair || frames[m_cursor].timestampMs > elapsedMs) {
        m_cursor = 0;
    }
    while (m_cursor < lastPair && frames[m_cursor + 1].timestampMs <= elapsedMs) {
        ++m_cursor;
    }
    return m_cursor;
}
