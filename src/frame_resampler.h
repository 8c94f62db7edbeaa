#ifndef FRAME_RESAMPLER_H
#define FRAME_RESAMPLER_H

#include <stdint.h>

#include "easing.h"
#include "pose.h"

/**
 * Resamples an irregularly timestamped recording at arbitrary elapsed times.
 *
 * Elapsed time is expected to grow monotonically within one pass, so the
 * bracket search resumes from the last located frame instead of rescanning
 * from the start. Asking for an earlier time restarts the search.
 *
 * The recording is borrowed and must outlive the resampler.
 */
class FrameResampler {
public:
    struct Sample {
        Pose positions;
        bool finished = false;
    };

    FrameResampler(const RecordedMotion &motion, EasingMode mode);

    Sample sample(int32_t elapsedMs);
    void reset();

    size_t cursor() const { return m_cursor; }
    uint32_t durationMs() const { return m_motion.durationMs(); }
    EasingMode easingMode() const { return m_mode; }

private:
    size_t locateBracket(uint32_t elapsedMs);

    const RecordedMotion &m_motion;
    EasingMode m_mode;
    size_t m_cursor;
};

#endif  // FRAME_RESAMPLER_H
