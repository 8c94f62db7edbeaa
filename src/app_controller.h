#ifndef APP_CONTROLLER_H
#define APP_CONTROLLER_H

#include <memory>
#include <string>
#include <vector>

#include "cli_command_router.h"
#include "config_manager.h"
#include "infra/posix_filesystem.h"
#include "jaw_animator.h"
#include "motion_library.h"
#include "playback_engine.h"
#include "playback_settings.h"

class ServoBank;
class SimulatedServoBus;

namespace infra {
class ICancellationSource;
class ILogSink;
class ITimeProvider;
}  // namespace infra

class AppController {
public:
    struct Options {
        std::string configPath = ConfigManager::kDefaultPath;
        bool configExplicit = false;
        std::vector<std::string> command;
    };

    AppController(infra::ITimeProvider& timeProvider,
                  infra::ICancellationSource& cancellation,
                  infra::ILogSink* logSink);
    ~AppController();

    // Splits "--config <file>" from the command tokens. Returns false with
    // a message when the option is malformed.
    static bool parseArguments(int argc, char** argv, Options& options, std::string& error);

    // Returns the process exit code.
    int run(const Options& options);

private:
    class StdioPrinter : public CliCommandRouter::IPrinter {
    public:
        explicit StdioPrinter(std::FILE* stream);
        void print(const std::string& value) override;
        void println(const std::string& value) override;
        void println() override;
        void printf(const char* fmt, ...) override;
    private:
        std::FILE* m_stream;
    };

    void setupLogging();
    bool loadConfiguration(const Options& options);
    void initializeServos();
    void configureCliRouter();

    PlaybackEngine::Dependencies engineDependencies(PlaybackEngine::IAudioPlayback* audio);
    void configureEngine(PlaybackEngine& engine) const;
    void onTick(const PlaybackEngine::TickSnapshot& snapshot);
    JawSyncParams jawParamsFromConfig() const;
    std::string libraryPathFor(const std::vector<std::string>& args) const;
    bool loadLibrary(const std::string& path, bool allowMissing);

    int runTalk(const std::vector<std::string>& args);
    int runPoses(const std::vector<std::string>& args);
    int runMotion(const std::vector<std::string>& args);
    int runRecord(const std::vector<std::string>& args);
    int runSavePose(const std::vector<std::string>& args);
    int printConfiguration();

    static int exitCodeFor(PlaybackEngine::TerminalReason reason);

    infra::ITimeProvider& m_timeProvider;
    infra::ICancellationSource& m_cancellation;
    infra::ILogSink* m_logSink;

    infra::PosixFileSystem m_fileSystem;
    PlaybackSettings m_settings;
    MotionLibrary m_library;

    std::unique_ptr<SimulatedServoBus> m_servoBus;
    std::unique_ptr<ServoBank> m_servoBank;

    StdioPrinter m_printer;
    std::unique_ptr<CliCommandRouter> m_cliRouter;

    bool m_configLoaded = false;
    size_t m_lastReportedSegment = 0;
    PlaybackEngine::SessionMode m_lastReportedMode = PlaybackEngine::SessionMode::None;
};

#endif  // APP_CONTROLLER_H
