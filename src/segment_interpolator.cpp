#include "segment_interpolator.h"

#include <algorithm>
#include <cmath>

Pose blendPoses(const Pose &start, const Pose &end, float progress, EasingMode mode) {
    if (!(progress < 1.0f)) {
        return end;
    }

    float eased = applyEasing(progress, mode);
    if (eased >= 1.0f) {
        return end;
    }

    Pose result(end);
    size_t shared = std::min(start.size(), end.size());
    for (size_t i = 0; i < shared; ++i) {
        float delta = static_cast<float>(end[i] - start[i]);
        result[i] = start[i] + static_cast<int>(std::lround(delta * eased));
    }
    return result;
}

SegmentInterpolator::SegmentInterpolator()
    : m_durationMs(0),
      m_mode(EasingMode::Smooth) {
}

void SegmentInterpolator::configure(const Pose &start, const Pose &end, int32_t durationMs, EasingMode mode) {
    m_start = start;
    m_end = end;
    m_durationMs = durationMs;
    m_mode = mode;
}

float SegmentInterpolator::progressAt(int32_t elapsedMs) const {
    if (m_durationMs <= 0) {
        return 1.0f;
    }
    if (elapsedMs <= 0) {
        return 0.0f;
    }
    if (elapsedMs >= m_durationMs) {
        return 1.0f;
    }
    return static_cast<float>(elapsedMs) / static_cast<float>(m_durationMs);
}

bool SegmentInterpolator::isFinishedAt(int32_t elapsedMs) const {
    return progressAt(elapsedMs) >= 1.0f;
}

Pose SegmentInterpolator::sample(int32_t elapsedMs) const {
    float progress = progressAt(elapsedMs);
    if (progress <= 0.0f && m_start.size() == m_end.size()) {
        return m_start;
    }
    return blendPoses(m_start, m_end, progress, m_mode);
}
