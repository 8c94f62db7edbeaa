#ifndef POSE_H
#define POSE_H

#include <stddef.h>
#include <stdint.h>

#include <vector>

// One commanded position per servo channel, in device units.
using Pose = std::vector<int>;

struct MotionFrame {
    uint32_t timestampMs = 0;
    Pose positions;
};

// Frames captured while recording. Timestamps are strictly increasing and
// the first one is 0.
struct RecordedMotion {
    std::vector<MotionFrame> frames;

    bool empty() const { return frames.empty(); }
    size_t frameCount() const { return frames.size(); }
    uint32_t durationMs() const { return frames.empty() ? 0 : frames.back().timestampMs; }
};

#endif  // POSE_H
