#include "app_controller.h"

#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <utility>

#include "amplitude_envelope.h"
#include "infra/cancellation_source.h"
#include "infra/log_sink.h"
#include "infra/time_provider.h"
#include "logging_manager.h"
#include "motion_recorder.h"
#include "process_audio_playback.h"
#include "servo_bank.h"
#include "simulated_servo_bus.h"
#include "wav_reader.h"

namespace {

constexpr char TAG[] = "Main";
constexpr char SESSION_TAG[] = "Session";

constexpr int SERVO_REST_POSITION = 2048;

}  // namespace

AppController::StdioPrinter::StdioPrinter(std::FILE* stream) : m_stream(stream) {}

void AppController::StdioPrinter::print(const std::string& value) {
    std::fputs(value.c_str(), m_stream);
}

void AppController::StdioPrinter::println(const std::string& value) {
    std::fputs(value.c_str(), m_stream);
    std::fputc('\n', m_stream);
}

void AppController::StdioPrinter::println() {
    std::fputc('\n', m_stream);
}

void AppController::StdioPrinter::printf(const char* fmt, ...) {
    if (!fmt) {
        return;
    }
    va_list args;
    va_start(args, fmt);
    std::vfprintf(m_stream, fmt, args);
    va_end(args);
}

AppController::AppController(infra::ITimeProvider& timeProvider,
                             infra::ICancellationSource& cancellation,
                             infra::ILogSink* logSink)
    : m_timeProvider(timeProvider),
      m_cancellation(cancellation),
      m_logSink(logSink),
      m_printer(stdout) {
}

AppController::~AppController() = default;

bool AppController::parseArguments(int argc, char** argv, Options& options, std::string& error) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i] ? argv[i] : "";
        if (options.command.empty() && arg == "--config") {
            if (i + 1 >= argc) {
                error = "--config requires a file path";
                return false;
            }
            options.configPath = argv[++i];
            options.configExplicit = true;
            continue;
        }
        if (options.command.empty() && arg.rfind("--config=", 0) == 0) {
            options.configPath = arg.substr(9);
            options.configExplicit = true;
            if (options.configPath.empty()) {
                error = "--config requires a file path";
                return false;
            }
            continue;
        }
        options.command.push_back(arg);
    }
    return true;
}

int AppController::run(const Options& options) {
    setupLogging();
    configureCliRouter();

    if (options.command.empty()) {
        return m_cliRouter->handleCommand(options.command);
    }

    // Help needs neither config nor servos.
    const std::string& first = options.command.front();
    if (first == "help" || first == "--help" || first == "-h" || first == "?") {
        return m_cliRouter->handleCommand(options.command);
    }

    if (!loadConfiguration(options)) {
        return CliCommandRouter::kExitError;
    }
    initializeServos();

    return m_cliRouter->handleCommand(options.command);
}

void AppController::setupLogging() {
    LoggingManager::instance().begin(stderr);
    if (m_logSink) {
        infra::setLogSink(m_logSink);
    }
}

bool AppController::loadConfiguration(const Options& options) {
    ConfigManager& config = ConfigManager::getInstance();
    config.setFileSystem(&m_fileSystem);

    if (!m_fileSystem.exists(options.configPath.c_str())) {
        if (options.configExplicit) {
            LOG_ERROR(TAG, "Config file %s not found", options.configPath.c_str());
            return false;
        }
        LOG_WARN(TAG, "No %s found; using built-in defaults", options.configPath.c_str());
    } else if (!config.loadConfig(options.configPath)) {
        LOG_ERROR(TAG, "Failed to load configuration from %s", options.configPath.c_str());
        return false;
    } else {
        LOG_INFO(TAG, "Configuration loaded successfully");
        m_configLoaded = true;
    }

    LoggingManager::instance().setMinimumLevel(config.getLogLevel());
    m_settings.applyConfig(config);
    m_library.setFileSystem(&m_fileSystem);
    return true;
}

void AppController::initializeServos() {
    ConfigManager& config = ConfigManager::getInstance();
    std::vector<uint8_t> ids = config.getServoIds();

    m_servoBus.reset(new SimulatedServoBus(ids, SERVO_REST_POSITION));
    m_servoBank.reset(new ServoBank(*m_servoBus, ids, config.getPositionMin(), config.getPositionMax()));

    LOG_INFO(TAG, "Servo bank ready: %u channels, range %d-%d (simulated bus)",
             static_cast<unsigned>(ids.size()), config.getPositionMin(), config.getPositionMax());
}

void AppController::configureCliRouter() {
    CliCommandRouter::Dependencies deps;
    deps.printer = &m_printer;
    deps.talk = [this](const std::vector<std::string>& args) { return runTalk(args); };
    deps.poses = [this](const std::vector<std::string>& args) { return runPoses(args); };
    deps.motion = [this](const std::vector<std::string>& args) { return runMotion(args); };
    deps.record = [this](const std::vector<std::string>& args) { return runRecord(args); };
    deps.pose = [this](const std::vector<std::string>& args) { return runSavePose(args); };
    deps.configPrinter = [this]() { return printConfiguration(); };
    m_cliRouter.reset(new CliCommandRouter(deps));
}

PlaybackEngine::Dependencies AppController::engineDependencies(PlaybackEngine::IAudioPlayback* audio) {
    PlaybackEngine::Dependencies deps;
    deps.time = &m_timeProvider;
    deps.log = m_logSink;
    deps.actuator = m_servoBank.get();
    deps.cancel = &m_cancellation;
    deps.audio = audio;
    return deps;
}

void AppController::configureEngine(PlaybackEngine& engine) const {
    const ConfigManager& config = ConfigManager::getInstance();
    PlaybackEngine::Settings settings;
    settings.tickMs = config.getTickMs();
    settings.instantDwellMs = config.getInstantDwellMs();
    settings.poseSettleMs = config.getPoseSettleMs();
    engine.setSettings(settings);
}

void AppController::onTick(const PlaybackEngine::TickSnapshot& snapshot) {
    bool segmentChanged = snapshot.mode != m_lastReportedMode || snapshot.segmentIndex != m_lastReportedSegment;
    if (segmentChanged || snapshot.state != PlaybackEngine::State::Running) {
        LOG_DEBUG(SESSION_TAG, "%s %s: segment %u/%u at %u ms, passes %u",
                  sessionModeName(snapshot.mode), playbackStateName(snapshot.state),
                  static_cast<unsigned>(snapshot.segmentIndex + 1), static_cast<unsigned>(snapshot.segmentCount),
                  static_cast<unsigned>(snapshot.elapsedMs), static_cast<unsigned>(snapshot.passesCompleted));
    }
    m_lastReportedMode = snapshot.mode;
    m_lastReportedSegment = snapshot.segmentIndex;
}

JawSyncParams AppController::jawParamsFromConfig() const {
    const ConfigManager& config = ConfigManager::getInstance();
    JawSyncParams params;
    params.mode = config.getJawMode();
    params.channel = config.getJawChannel();
    params.closedPosition = config.getJawClosed();
    params.openPosition = config.getJawOpen();
    params.pulse.threshold = config.getPulseThreshold();
    params.pulse.openDurationMs = config.getPulseDurationMs();
    params.pulse.cooldownMs = config.getPulseCooldownMs();
    params.amplitudeGamma = config.getAmplitudeGamma();
    params.amplitudeSmoothing = config.getAmplitudeSmoothing();
    return params;
}

std::string AppController::libraryPathFor(const std::vector<std::string>& args) const {
    if (!args.empty() && !args.front().empty()) {
        return args.front();
    }
    return ConfigManager::getInstance().getLibraryPath();
}

bool AppController::loadLibrary(const std::string& path, bool allowMissing) {
    if (allowMissing && !m_fileSystem.exists(path.c_str())) {
        LOG_INFO(TAG, "Starting a new motion library at %s", path.c_str());
        return true;
    }
    return m_library.load(path);
}

int AppController::runTalk(const std::vector<std::string>& args) {
    const std::string& wavPath = args.front();
    JawSyncParams jaw = jawParamsFromConfig();
    if (args.size() > 1 && !parseJawSyncMode(args[1], jaw.mode)) {
        LOG_ERROR(TAG, "Unknown jaw mode '%s'", args[1].c_str());
        return CliCommandRouter::kExitError;
    }

    WavReader reader;
    reader.setFileSystem(&m_fileSystem);
    PcmAudio audio;
    if (!reader.read(wavPath, audio)) {
        return CliCommandRouter::kExitError;
    }

    AmplitudeEnvelope envelope;
    if (!envelope.build(audio, ConfigManager::getInstance().getEnvelopeChunkMs())) {
        LOG_ERROR(TAG, "Could not analyse %s", wavPath.c_str());
        return CliCommandRouter::kExitError;
    }
    LOG_INFO(TAG, "Speaking %s (%u ms, %u envelope points, %s mode)", wavPath.c_str(),
             static_cast<unsigned>(audio.durationMs()), static_cast<unsigned>(envelope.points().size()),
             jawSyncModeName(jaw.mode));

    ProcessAudioPlayback playback(ConfigManager::getInstance().getAudioCommand(), wavPath, audio.durationMs());
    PlaybackEngine engine(engineDependencies(&playback));
    configureEngine(engine);
    engine.setTickListener([this](const PlaybackEngine::TickSnapshot& snapshot) { onTick(snapshot); });

    PlaybackEngine::TerminalReason reason = engine.runAudioSyncSession(envelope, jaw);
    return exitCodeFor(reason);
}

int AppController::runPoses(const std::vector<std::string>& args) {
    std::string path = libraryPathFor(args);
    if (!loadLibrary(path, false)) {
        return CliCommandRouter::kExitError;
    }
    if (m_library.poseCount() == 0) {
        LOG_WARN(TAG, "%s has no saved poses", path.c_str());
    }

    LOG_INFO(TAG, "Playing %u poses: %u ms each, %s easing, loop %s",
             static_cast<unsigned>(m_library.poseCount()), static_cast<unsigned>(m_settings.durationMs()),
             easingModeName(m_settings.easingMode()), m_settings.loop() ? "on" : "off");

    PlaybackEngine engine(engineDependencies(nullptr));
    configureEngine(engine);
    engine.setTickListener([this](const PlaybackEngine::TickSnapshot& snapshot) { onTick(snapshot); });

    PlaybackEngine::TerminalReason reason = engine.runPoseListSession(
        m_library.poses(), static_cast<int32_t>(m_settings.durationMs()), m_settings.easingMode(), m_settings.loop());
    return exitCodeFor(reason);
}

int AppController::runMotion(const std::vector<std::string>& args) {
    std::string path = libraryPathFor(args);
    if (!loadLibrary(path, false)) {
        return CliCommandRouter::kExitError;
    }
    const RecordedMotion& motion = m_library.recordedMotion();
    if (motion.empty()) {
        LOG_WARN(TAG, "%s has no recorded motion", path.c_str());
    }

    LOG_INFO(TAG, "Playing %u recorded frames (%u ms), %s easing, loop %s",
             static_cast<unsigned>(motion.frameCount()), static_cast<unsigned>(motion.durationMs()),
             easingModeName(m_settings.easingMode()), m_settings.loop() ? "on" : "off");

    PlaybackEngine engine(engineDependencies(nullptr));
    configureEngine(engine);
    engine.setTickListener([this](const PlaybackEngine::TickSnapshot& snapshot) { onTick(snapshot); });

    PlaybackEngine::TerminalReason reason =
        engine.runRecordedMotionSession(motion, m_settings.easingMode(), m_settings.loop());
    return exitCodeFor(reason);
}

int AppController::runRecord(const std::vector<std::string>& args) {
    const std::string& path = args[0];
    uint32_t durationMs = static_cast<uint32_t>(std::strtoul(args[1].c_str(), nullptr, 10));
    if (!loadLibrary(path, true)) {
        return CliCommandRouter::kExitError;
    }

    MotionRecorder recorder(m_timeProvider, *m_servoBank, ConfigManager::getInstance().getRecordIntervalMs());
    recorder.start();
    LOG_INFO(TAG, "Recording for %u ms (Ctrl-C to stop early)", static_cast<unsigned>(durationMs));

    uint32_t startMs = m_timeProvider.nowMillis();
    while (m_timeProvider.nowMillis() - startMs < durationMs) {
        if (m_cancellation.pollCancelRequested()) {
            LOG_INFO(TAG, "Recording stopped early");
            break;
        }
        recorder.captureFrame();
        m_timeProvider.delayMillis(recorder.intervalMs());
    }
    recorder.captureFrame();
    recorder.stop();

    m_library.setRecordedMotion(recorder.motion());
    if (!m_library.save(path)) {
        return CliCommandRouter::kExitError;
    }
    m_printer.printf("Recorded %u frames (%u ms) into %s\n", static_cast<unsigned>(recorder.motion().frameCount()),
                     static_cast<unsigned>(recorder.motion().durationMs()), path.c_str());
    return CliCommandRouter::kExitCompleted;
}

int AppController::runSavePose(const std::vector<std::string>& args) {
    std::string path = libraryPathFor(args);
    if (!loadLibrary(path, true)) {
        return CliCommandRouter::kExitError;
    }

    Pose pose = m_servoBank->readAll();
    m_library.savePose(pose);
    if (!m_library.save(path)) {
        return CliCommandRouter::kExitError;
    }

    std::string positions;
    for (size_t i = 0; i < pose.size(); ++i) {
        if (i > 0) {
            positions += ",";
        }
        positions += std::to_string(pose[i]);
    }
    m_printer.printf("Pose %u saved: [%s]\n", static_cast<unsigned>(m_library.poseCount()), positions.c_str());
    return CliCommandRouter::kExitCompleted;
}

int AppController::printConfiguration() {
    const ConfigManager& config = ConfigManager::getInstance();
    std::string ids;
    for (uint8_t id : config.getServoIds()) {
        if (!ids.empty()) {
            ids += ",";
        }
        ids += std::to_string(id);
    }

    m_printer.println("\n=== CONFIGURATION ===");
    m_printer.printf("Source:           %s\n", m_configLoaded ? config.configPath().c_str() : "(defaults)");
    m_printer.printf("Servo ids:        %s\n", ids.c_str());
    m_printer.printf("Position range:   %d-%d\n", config.getPositionMin(), config.getPositionMax());
    m_printer.printf("Tick:             %u ms\n", static_cast<unsigned>(config.getTickMs()));
    m_printer.printf("Pose duration:    %u ms (step %u ms)\n", static_cast<unsigned>(m_settings.durationMs()),
                     static_cast<unsigned>(m_settings.durationStepMs()));
    m_printer.printf("Easing:           %s\n", easingModeName(m_settings.easingMode()));
    m_printer.printf("Loop:             %s\n", m_settings.loop() ? "ON" : "OFF");
    m_printer.printf("Instant dwell:    %u ms\n", static_cast<unsigned>(config.getInstantDwellMs()));
    m_printer.printf("Pose settle:      %u ms\n", static_cast<unsigned>(config.getPoseSettleMs()));
    m_printer.printf("Record interval:  %u ms\n", static_cast<unsigned>(config.getRecordIntervalMs()));
    m_printer.printf("Envelope chunk:   %u ms\n", static_cast<unsigned>(config.getEnvelopeChunkMs()));

    JawSyncParams jaw = jawParamsFromConfig();
    m_printer.printf("Jaw:              channel %u, closed %d, open %d, %s mode\n",
                     static_cast<unsigned>(jaw.channel), jaw.closedPosition, jaw.openPosition,
                     jawSyncModeName(jaw.mode));
    m_printer.printf("Pulse:            threshold %.3f, open %u ms, cooldown %u ms\n",
                     static_cast<double>(jaw.pulse.threshold), static_cast<unsigned>(jaw.pulse.openDurationMs),
                     static_cast<unsigned>(jaw.pulse.cooldownMs));
    m_printer.printf("Amplitude:        gamma %.2f, smoothing %.2f\n", static_cast<double>(jaw.amplitudeGamma),
                     static_cast<double>(jaw.amplitudeSmoothing));
    std::string audioCommand = config.getAudioCommand();
    m_printer.printf("Audio command:    %s\n", audioCommand.empty() ? "(silent)" : audioCommand.c_str());
    m_printer.printf("Library:          %s\n", config.getLibraryPath().c_str());
    return CliCommandRouter::kExitCompleted;
}

int AppController::exitCodeFor(PlaybackEngine::TerminalReason reason) {
    switch (reason) {
        case PlaybackEngine::TerminalReason::Completed:
            return CliCommandRouter::kExitCompleted;
        case PlaybackEngine::TerminalReason::Cancelled:
            return CliCommandRouter::kExitCancelled;
        case PlaybackEngine::TerminalReason::None:
        default:
            return CliCommandRouter::kExitError;
    }
}
