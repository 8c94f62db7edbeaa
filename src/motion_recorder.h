#ifndef MOTION_RECORDER_H
#define MOTION_RECORDER_H

#include <stdint.h>

#include "infra/time_provider.h"
#include "playback_engine.h"
#include "pose.h"

// Captures live arm positions into a RecordedMotion while the operator moves
// the arm by hand. Call captureFrame() from the control loop; frames are
// taken no more often than the configured interval.
class MotionRecorder : public PlaybackEngine::IRecorder {
public:
    static constexpr uint32_t kDefaultIntervalMs = 50;

    MotionRecorder(infra::ITimeProvider &time, PlaybackEngine::IActuator &actuator,
                   uint32_t intervalMs = kDefaultIntervalMs);

    void setIntervalMs(uint32_t intervalMs);
    uint32_t intervalMs() const { return m_intervalMs; }

    // Discards any previous recording.
    void start();
    void stop() override;
    bool isRecording() const override { return m_recording; }

    // Returns true when a frame was appended.
    bool captureFrame();

    const RecordedMotion &motion() const { return m_motion; }
    void clear();

private:
    infra::ITimeProvider &m_time;
    PlaybackEngine::IActuator &m_actuator;
    uint32_t m_intervalMs;
    bool m_recording;
    uint32_t m_originMs;
    RecordedMotion m_motion;
};

#endif  // MOTION_RECORDER_H
