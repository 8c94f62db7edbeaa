#ifndef SEGMENT_INTERPOLATOR_H
#define SEGMENT_INTERPOLATOR_H

#include <stdint.h>

#include "easing.h"
#include "pose.h"

// Blend of two poses at eased progress. At progress >= 1 the end pose is
// returned verbatim so a finished segment lands exactly on target.
Pose blendPoses(const Pose &start, const Pose &end, float progress, EasingMode mode);

// Moves from one fixed pose to another over a caller-chosen duration.
class SegmentInterpolator {
public:
    SegmentInterpolator();

    void configure(const Pose &start, const Pose &end, int32_t durationMs, EasingMode mode);

    Pose sample(int32_t elapsedMs) const;
    float progressAt(int32_t elapsedMs) const;
    bool isFinishedAt(int32_t elapsedMs) const;

    const Pose &startPose() const { return m_start; }
    const Pose &endPose() const { return m_end; }
    int32_t durationMs() const { return m_durationMs; }
    EasingMode easingMode() const { return m_mode; }

private:
    Pose m_start;
    Pose m_end;
    int32_t m_durationMs;
    EasingMode m_mode;
};

#endif  // SEGMENT_INTERPOLATOR_H
