#include "playback_engine.h"

#include <algorithm>
#include <cstdarg>
#include <cstdio>
#include <utility>

namespace {

constexpr const char *kTag = "Playback";
constexpr uint32_t kMinTickMs = 1;
constexpr uint32_t kMaxTickMs = 100;

}  // namespace

const char *playbackStateName(PlaybackEngine::State state) {
    switch (state) {
        case PlaybackEngine::State::Idle: return "IDLE";
        case PlaybackEngine::State::Running: return "RUNNING";
        case PlaybackEngine::State::Cancelled: return "CANCELLED";
        case PlaybackEngine::State::Completed: return "COMPLETED";
        default: return "UNKNOWN";
    }
}

const char *terminalReasonName(PlaybackEngine::TerminalReason reason) {
    switch (reason) {
        case PlaybackEngine::TerminalReason::Cancelled: return "CANCELLED";
        case PlaybackEngine::TerminalReason::Completed: return "COMPLETED";
        case PlaybackEngine::TerminalReason::None:
        default:
            return "NONE";
    }
}

const char *sessionModeName(PlaybackEngine::SessionMode mode) {
    switch (mode) {
        case PlaybackEngine::SessionMode::PoseList: return "pose-list";
        case PlaybackEngine::SessionMode::RecordedMotion: return "recorded-motion";
        case PlaybackEngine::SessionMode::AudioSync: return "audio-sync";
        case PlaybackEngine::SessionMode::None:
        default:
            return "none";
    }
}

PlaybackEngine::PlaybackEngine(const Dependencies &deps)
    : m_deps(deps) {
}

void PlaybackEngine::setSettings(const Settings &settings) {
    m_settings = settings;
    if (m_settings.tickMs < kMinTickMs || m_settings.tickMs > kMaxTickMs) {
        uint32_t clamped = std::max(kMinTickMs, std::min(kMaxTickMs, m_settings.tickMs));
        log(infra::LogLevel::Warn, "Tick interval %u ms out of range; using %u ms",
            static_cast<unsigned int>(m_settings.tickMs), static_cast<unsigned int>(clamped));
        m_settings.tickMs = clamped;
    }
}

void PlaybackEngine::setTickListener(TickListener listener) {
    m_tickListener = std::move(listener);
}

bool PlaybackEngine::beginPoseListSession(const std::vector<Pose> &poses, int32_t durationMs, EasingMode easing,
                                          bool loop) {
    if (!prepareSession(SessionMode::PoseList)) {
        return false;
    }

    m_poses = poses;
    m_durationMs = durationMs;
    m_easing = easing;
    m_loop = loop;

    if (!m_poses.empty()) {
        if (m_easing == EasingMode::Instant) {
            m_segmentIndex = 0;
        } else {
            // Single anchor read; every later segment starts from the previous target.
            Pose anchor = m_deps.actuator->readAll();
            configureSegment(anchor, 0);
        }
    }

    log(infra::LogLevel::Info, "Playing %u poses (%s, %d ms per pose)%s",
        static_cast<unsigned int>(m_poses.size()), easingModeName(m_easing),
        static_cast<int>(m_durationMs), m_loop ? " [LOOP]" : "");
    startRunning("Pose list started");
    return true;
}

bool PlaybackEngine::beginRecordedMotionSession(const RecordedMotion &motion, EasingMode easing, bool loop) {
    if (!prepareSession(SessionMode::RecordedMotion)) {
        return false;
    }

    m_motion = motion;
    m_easing = easing;
    m_loop = loop;
    m_resampler.reset(new FrameResampler(m_motion, m_easing));

    log(infra::LogLevel::Info, "Playing recorded motion (%u ms, %u frames, %s)%s",
        static_cast<unsigned int>(m_motion.durationMs()), static_cast<unsigned int>(m_motion.frameCount()),
        easingModeName(m_easing), m_loop ? " [LOOP]" : "");
    startRunning("Recorded motion started");
    return true;
}

bool PlaybackEngine::beginAudioSyncSession(const AmplitudeEnvelope &envelope, const JawSyncParams &jaw) {
    if (!m_deps.audio) {
        log(infra::LogLevel::Error, "Audio playback seam missing; cannot start audio sync");
        return false;
    }
    if (m_deps.actuator && jaw.channel >= m_deps.actuator->channelCount()) {
        log(infra::LogLevel::Error, "Jaw channel %u outside actuator range (%u channels)",
            static_cast<unsigned int>(jaw.channel), static_cast<unsigned int>(m_deps.actuator->channelCount()));
        return false;
    }
    if (!prepareSession(SessionMode::AudioSync)) {
        return false;
    }

    m_envelope = envelope;
    m_jaw.configure(jaw);
    m_loop = false;

    if (!m_deps.audio->start()) {
        log(infra::LogLevel::Error, "Audio playback failed to start");
        m_mode = SessionMode::None;
        m_state = State::Idle;
        return false;
    }

    log(infra::LogLevel::Info, "Speaking (%s mode, %u ms of audio, %u envelope points)",
        jawSyncModeName(jaw.mode), static_cast<unsigned int>(m_envelope.audioDurationMs()),
        static_cast<unsigned int>(m_envelope.points().size()));
    startRunning("Audio sync started");
    return true;
}

bool PlaybackEngine::prepareSession(SessionMode mode) {
    if (!m_deps.actuator) {
        log(infra::LogLevel::Error, "No actuator attached; cannot start %s session", sessionModeName(mode));
        return false;
    }

    if (m_state == State::Running) {
        if (m_mode == SessionMode::AudioSync && m_deps.audio) {
            m_deps.audio->stop();
        }
        finish(State::Cancelled, "Superseded by a new session");
    }

    if (m_deps.recorder && m_deps.recorder->isRecording()) {
        log(infra::LogLevel::Info, "Stopping active recording before playback");
        m_deps.recorder->stop();
    }

    m_mode = mode;
    m_terminalReason = TerminalReason::None;
    m_phase = Phase::Moving;
    m_segmentIndex = 0;
    m_passesCompleted = 0;
    m_holdStartMs = 0;
    m_holdDurationMs = 0;
    m_writeFailures = 0;
    m_poses.clear();
    m_resampler.reset();
    m_motion = RecordedMotion();
    return true;
}

void PlaybackEngine::startRunning(const char *reason) {
    m_segmentStartMs = now();
    m_state = State::Running;
    log(infra::LogLevel::Debug, "%s (%s)", reason, sessionModeName(m_mode));
}

void PlaybackEngine::finish(State terminal, const char *reason) {
    m_state = terminal;
    m_terminalReason = terminal == State::Cancelled ? TerminalReason::Cancelled : TerminalReason::Completed;
    log(infra::LogLevel::Info, "%s session %s: %s (passes=%u, write failures=%u)", sessionModeName(m_mode),
        terminalReasonName(m_terminalReason), reason, static_cast<unsigned int>(m_passesCompleted),
        static_cast<unsigned int>(m_writeFailures));
}

PlaybackEngine::State PlaybackEngine::tick() {
    if (m_state != State::Running) {
        return m_state;
    }

    uint32_t nowMs = now();

    if (m_deps.cancel && m_deps.cancel->pollCancelRequested()) {
        if (m_mode == SessionMode::AudioSync && m_deps.audio) {
            m_deps.audio->stop();
        }
        finish(State::Cancelled, "Cancel requested");
        emitSnapshot(nowMs);
        return m_state;
    }

    switch (m_mode) {
        case SessionMode::PoseList:
            tickPoseList(nowMs);
            break;
        case SessionMode::RecordedMotion:
            tickRecordedMotion(nowMs);
            break;
        case SessionMode::AudioSync:
            tickAudioSync(nowMs);
            break;
        case SessionMode::None:
        default:
            finish(State::Completed, "No session mode");
            break;
    }

    emitSnapshot(nowMs);
    return m_state;
}

PlaybackEngine::TerminalReason PlaybackEngine::runToCompletion() {
    if (m_state != State::Running) {
        return m_terminalReason;
    }

    while (tick() == State::Running) {
        if (m_deps.time) {
            m_deps.time->delayMillis(m_settings.tickMs);
        }
    }
    return m_terminalReason;
}

PlaybackEngine::TerminalReason PlaybackEngine::runPoseListSession(const std::vector<Pose> &poses, int32_t durationMs,
                                                                  EasingMode easing, bool loop) {
    if (!beginPoseListSession(poses, durationMs, easing, loop)) {
        return TerminalReason::None;
    }
    return runToCompletion();
}

PlaybackEngine::TerminalReason PlaybackEngine::runRecordedMotionSession(const RecordedMotion &motion, EasingMode easing,
                                                                        bool loop) {
    if (!beginRecordedMotionSession(motion, easing, loop)) {
        return TerminalReason::None;
    }
    return runToCompletion();
}

PlaybackEngine::TerminalReason PlaybackEngine::runAudioSyncSession(const AmplitudeEnvelope &envelope,
                                                                   const JawSyncParams &jaw) {
    if (!beginAudioSyncSession(envelope, jaw)) {
        return TerminalReason::None;
    }
    return runToCompletion();
}

void PlaybackEngine::tickPoseList(uint32_t nowMs) {
    if (m_poses.empty()) {
        finish(State::Completed, "No poses saved");
        return;
    }

    if (m_easing == EasingMode::Instant) {
        tickInstantPose(nowMs);
    } else {
        tickInterpolatedPose(nowMs);
    }
}

void PlaybackEngine::tickInstantPose(uint32_t nowMs) {
    if (m_phase == Phase::Holding) {
        if (nowMs - m_holdStartMs < m_holdDurationMs) {
            return;
        }
        advancePose(nowMs);
        if (m_state != State::Running) {
            return;
        }
    }

    log(infra::LogLevel::Debug, "Pose %u/%u", static_cast<unsigned int>(m_segmentIndex + 1),
        static_cast<unsigned int>(m_poses.size()));
    writePose(m_poses[m_segmentIndex]);
    m_phase = Phase::Holding;
    m_holdStartMs = nowMs;
    m_holdDurationMs = m_settings.instantDwellMs;
}

void PlaybackEngine::tickInterpolatedPose(uint32_t nowMs) {
    if (m_phase == Phase::Holding) {
        if (nowMs - m_holdStartMs < m_holdDurationMs) {
            return;
        }
        advancePose(nowMs);
        if (m_state != State::Running) {
            return;
        }
    }

    int32_t elapsed = static_cast<int32_t>(nowMs - m_segmentStartMs);
    writePose(m_segment.sample(elapsed));

    if (m_segment.isFinishedAt(elapsed)) {
        m_phase = Phase::Holding;
        m_holdStartMs = nowMs;
        m_holdDurationMs = m_settings.poseSettleMs;
    }
}

void PlaybackEngine::advancePose(uint32_t nowMs) {
    size_t next = m_segmentIndex + 1;
    if (next >= m_poses.size()) {
        ++m_passesCompleted;
        if (!m_loop) {
            finish(State::Completed, "All poses played");
            return;
        }
        log(infra::LogLevel::Debug, "Looping pose list (pass %u done)", static_cast<unsigned int>(m_passesCompleted));
        next = 0;
    }

    // On a loop restart this runs from the last pose back to pose 0.
    Pose from = m_poses[m_segmentIndex];
    configureSegment(from, next);
    m_segmentStartMs = nowMs;
}

void PlaybackEngine::configureSegment(const Pose &from, size_t targetIndex) {
    m_segmentIndex = targetIndex;
    m_segment.configure(from, m_poses[targetIndex], m_durationMs, m_easing);
    m_phase = Phase::Moving;
}

void PlaybackEngine::tickRecordedMotion(uint32_t nowMs) {
    if (m_motion.empty() || !m_resampler) {
        finish(State::Completed, "No recorded motion");
        return;
    }

    int32_t elapsed = static_cast<int32_t>(nowMs - m_segmentStartMs);
    FrameResampler::Sample sample = m_resampler->sample(elapsed);
    m_segmentIndex = m_resampler->cursor();
    writePose(sample.positions);

    if (!sample.finished) {
        return;
    }

    ++m_passesCompleted;
    // A zero-length recording would restart on every tick.
    if (!m_loop || m_motion.durationMs() == 0) {
        finish(State::Completed, "Recorded motion finished");
        return;
    }

    log(infra::LogLevel::Debug, "Looping recorded motion (pass %u done)",
        static_cast<unsigned int>(m_passesCompleted));
    m_resampler->reset();
    m_segmentStartMs = nowMs;
}

void PlaybackEngine::tickAudioSync(uint32_t nowMs) {
    if (!m_deps.audio->isPlaying()) {
        m_jaw.reset();
        writeJaw(m_jaw.params().closedPosition);
        ++m_passesCompleted;
        finish(State::Completed, "Audio finished");
        return;
    }

    uint32_t elapsed = nowMs - m_segmentStartMs;
    float amplitude = m_envelope.amplitudeAt(static_cast<float>(elapsed));
    writeJaw(m_jaw.update(nowMs, amplitude));
}

void PlaybackEngine::writePose(const Pose &positions) {
    m_lastWritten = positions;
    if (!m_deps.actuator->writeAll(positions)) {
        ++m_writeFailures;
    }
}

void PlaybackEngine::writeJaw(int position) {
    size_t channel = m_jaw.params().channel;
    if (m_lastWritten.size() <= channel) {
        m_lastWritten.resize(channel + 1, 0);
    }
    m_lastWritten[channel] = position;
    if (!m_deps.actuator->writeChannel(channel, position)) {
        ++m_writeFailures;
    }
}

void PlaybackEngine::emitSnapshot(uint32_t nowMs) {
    if (!m_tickListener) {
        return;
    }

    TickSnapshot snapshot;
    snapshot.mode = m_mode;
    snapshot.state = m_state;
    snapshot.segmentIndex = m_segmentIndex;
    switch (m_mode) {
        case SessionMode::PoseList:
            snapshot.segmentCount = m_poses.size();
            break;
        case SessionMode::RecordedMotion:
            snapshot.segmentCount = m_motion.frameCount();
            break;
        case SessionMode::AudioSync:
            snapshot.segmentCount = m_envelope.points().size();
            break;
        default:
            break;
    }
    snapshot.elapsedMs = nowMs - m_segmentStartMs;
    snapshot.passesCompleted = m_passesCompleted;
    snapshot.positions = m_lastWritten;
    m_tickListener(snapshot);
}

uint32_t PlaybackEngine::now() const {
    return m_deps.time ? m_deps.time->nowMillis() : 0;
}

void PlaybackEngine::log(infra::LogLevel level, const char *fmt, ...) const {
    char buffer[256]{0};
    va_list args;
    va_start(args, fmt);
    vsnprintf(buffer, sizeof(buffer), fmt, args);
    va_end(args);

    if (m_deps.log) {
        m_deps.log->log(level, kTag, buffer);
        return;
    }
    infra::emitLog(level, kTag, "%s", buffer);
}
