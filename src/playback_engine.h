#ifndef PLAYBACK_ENGINE_H
#define PLAYBACK_ENGINE_H

#include <stddef.h>
#include <stdint.h>

#include <functional>
#include <memory>
#include <vector>

#include "amplitude_envelope.h"
#include "easing.h"
#include "frame_resampler.h"
#include "infra/cancellation_source.h"
#include "infra/log_sink.h"
#include "infra/time_provider.h"
#include "jaw_animator.h"
#include "pose.h"
#include "segment_interpolator.h"

/**
 * Fixed-cadence playback of saved poses, recorded motion and audio-driven jaw
 * motion. The engine is the only writer of actuator output while a session
 * runs.
 *
 * Sessions can be driven non-blocking with begin*() followed by tick(), or
 * run to completion with the run*Session() wrappers, which sleep one tick
 * interval between ticks. Cancellation is polled once at the top of each tick.
 */
class PlaybackEngine {
public:
    enum class State {
        Idle,
        Running,
        Cancelled,
        Completed
    };

    enum class TerminalReason {
        None,
        Cancelled,
        Completed
    };

    enum class SessionMode {
        None,
        PoseList,
        RecordedMotion,
        AudioSync
    };

    struct Settings {
        uint32_t tickMs = 10;
        uint32_t instantDwellMs = 1000;
        uint32_t poseSettleMs = 50;
    };

    struct TickSnapshot {
        SessionMode mode = SessionMode::None;
        State state = State::Idle;
        size_t segmentIndex = 0;
        size_t segmentCount = 0;
        uint32_t elapsedMs = 0;
        uint32_t passesCompleted = 0;
        Pose positions;
    };

    using TickListener = std::function<void(const TickSnapshot &)>;

    class IActuator {
    public:
        virtual ~IActuator() = default;
        virtual size_t channelCount() const = 0;
        virtual bool writeChannel(size_t channel, int position) = 0;
        virtual bool writeAll(const Pose &positions) = 0;
        virtual Pose readAll() = 0;
    };

    class IAudioPlayback {
    public:
        virtual ~IAudioPlayback() = default;
        virtual bool start() = 0;
        virtual bool isPlaying() const = 0;
        virtual void stop() = 0;
    };

    class IRecorder {
    public:
        virtual ~IRecorder() = default;
        virtual bool isRecording() const = 0;
        virtual void stop() = 0;
    };

    struct Dependencies {
        infra::ITimeProvider *time = nullptr;
        infra::ILogSink *log = nullptr;
        IActuator *actuator = nullptr;
        infra::ICancellationSource *cancel = nullptr;
        IAudioPlayback *audio = nullptr;
        IRecorder *recorder = nullptr;
    };

    explicit PlaybackEngine(const Dependencies &deps);

    void setSettings(const Settings &settings);
    const Settings &settings() const { return m_settings; }
    void setTickListener(TickListener listener);

    bool beginPoseListSession(const std::vector<Pose> &poses, int32_t durationMs, EasingMode easing, bool loop);
    bool beginRecordedMotionSession(const RecordedMotion &motion, EasingMode easing, bool loop);
    bool beginAudioSyncSession(const AmplitudeEnvelope &envelope, const JawSyncParams &jaw);

    State tick();
    TerminalReason runToCompletion();

    TerminalReason runPoseListSession(const std::vector<Pose> &poses, int32_t durationMs, EasingMode easing, bool loop);
    TerminalReason runRecordedMotionSession(const RecordedMotion &motion, EasingMode easing, bool loop);
    TerminalReason runAudioSyncSession(const AmplitudeEnvelope &envelope, const JawSyncParams &jaw);

    State state() const { return m_state; }
    TerminalReason terminalReason() const { return m_terminalReason; }
    SessionMode sessionMode() const { return m_mode; }
    bool isRunning() const { return m_state == State::Running; }
    uint32_t passesCompleted() const { return m_passesCompleted; }
    size_t segmentIndex() const { return m_segmentIndex; }
    const Pose &lastWritten() const { return m_lastWritten; }
    uint32_t writeFailures() const { return m_writeFailures; }

private:
    enum class Phase {
        Moving,
        Holding
    };

    bool prepareSession(SessionMode mode);
    void startRunning(const char *reason);
    void finish(State terminal, const char *reason);

    void tickPoseList(uint32_t nowMs);
    void tickInstantPose(uint32_t nowMs);
    void tickInterpolatedPose(uint32_t nowMs);
    void advancePose(uint32_t nowMs);
    void configureSegment(const Pose &from, size_t targetIndex);
    void tickRecordedMotion(uint32_t nowMs);
    void tickAudioSync(uint32_t nowMs);

    void writePose(const Pose &positions);
    void writeJaw(int position);
    void emitSnapshot(uint32_t nowMs);
    uint32_t now() const;
    void log(infra::LogLevel level, const char *fmt, ...) const
#if defined(__GNUC__)
        __attribute__((format(printf, 3, 4)))
#endif
        ;

    Dependencies m_deps;
    Settings m_settings;
    TickListener m_tickListener;

    State m_state = State::Idle;
    TerminalReason m_terminalReason = TerminalReason::None;
    SessionMode m_mode = SessionMode::None;

    std::vector<Pose> m_poses;
    int32_t m_durationMs = 0;
    EasingMode m_easing = EasingMode::Smooth;
    bool m_loop = false;
    Phase m_phase = Phase::Moving;
    size_t m_segmentIndex = 0;
    uint32_t m_segmentStartMs = 0;
    uint32_t m_holdStartMs = 0;
    uint32_t m_holdDurationMs = 0;
    uint32_t m_passesCompleted = 0;
    SegmentInterpolator m_segment;

    RecordedMotion m_motion;
    std::unique_ptr<FrameResampler> m_resampler;

    AmplitudeEnvelope m_envelope;
    JawAnimator m_jaw;

    Pose m_lastWritten;
    uint32_t m_writeFailures = 0;
};

const char *playbackStateName(PlaybackEngine::State state);
const char *terminalReasonName(PlaybackEngine::TerminalReason reason);
const char *sessionModeName(PlaybackEngine::SessionMode mode);

#endif  // PLAYBACK_ENGINE_H
