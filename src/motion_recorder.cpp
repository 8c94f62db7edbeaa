#include "motion_recorder.h"

#include "logging_manager.h"

static constexpr const char *TAG = "Recorder";

MotionRecorder::MotionRecorder(infra::ITimeProvider &time, PlaybackEngine::IActuator &actuator, uint32_t intervalMs)
    : m_time(time),
      m_actuator(actuator),
      m_intervalMs(intervalMs),
      m_recording(false),
      m_originMs(0) {
}

void MotionRecorder::setIntervalMs(uint32_t intervalMs) {
    m_intervalMs = intervalMs;
}

void MotionRecorder::start() {
    m_motion.frames.clear();
    m_originMs = m_time.nowMillis();
    m_recording = true;
    LOG_INFO(TAG, "Recording started (every %u ms)", static_cast<unsigned>(m_intervalMs));
}

void MotionRecorder::stop() {
    if (!m_recording) {
        return;
    }
    m_recording = false;
    LOG_INFO(TAG, "Recording stopped: %u frames over %u ms",
             static_cast<unsigned>(m_motion.frameCount()), static_cast<unsigned>(m_motion.durationMs()));
}

bool MotionRecorder::captureFrame() {
    if (!m_recording) {
        return false;
    }

    uint32_t nowMs = m_time.nowMillis();
    if (m_motion.empty()) {
        // The first frame defines time zero.
        m_originMs = nowMs;
    }

    uint32_t timestamp = nowMs - m_originMs;
    if (!m_motion.empty()) {
        uint32_t last = m_motion.frames.back().timestampMs;
        if (timestamp <= last || timestamp - last < m_intervalMs) {
            return false;
        }
    }

    MotionFrame frame;
    frame.timestampMs = timestamp;
    frame.positions = m_actuator.readAll();
    m_motion.frames.push_back(frame);
    LOG_VERBOSE(TAG, "Frame %u at %u ms", static_cast<unsigned>(m_motion.frameCount()),
                static_cast<unsigned>(timestamp));
    return true;
}

void MotionRecorder::clear() {
    m_motion.frames.clear();
    LOG_INFO(TAG, "Cleared recorded motion");
}
