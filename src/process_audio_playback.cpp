#include "process_audio_playback.h"

#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <sstream>
#include <vector>

#include "logging_manager.h"

static constexpr const char *TAG = "Audio";

ProcessAudioPlayback::ProcessAudioPlayback(const std::string &command, const std::string &wavPath,
                                           uint32_t durationMs)
    : m_command(command),
      m_wavPath(wavPath),
      m_durationMs(durationMs),
      m_playing(false),
      m_pid(-1),
      m_stopRequested(false) {
}

ProcessAudioPlayback::~ProcessAudioPlayback() {
    stop();
}

bool ProcessAudioPlayback::start() {
    if (m_playing.load()) {
        LOG_WARN(TAG, "Playback already running; ignoring start");
        return false;
    }
    joinWaiter();

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopRequested = false;
    }

    if (m_command.empty()) {
        LOG_INFO(TAG, "No audio command configured; timing %u ms of silence", static_cast<unsigned>(m_durationMs));
        m_playing.store(true);
        m_waiter = std::thread(&ProcessAudioPlayback::waitForDuration, this);
        return true;
    }

    return spawnPlayer();
}

bool ProcessAudioPlayback::spawnPlayer() {
    std::vector<std::string> tokens;
    std::istringstream stream(m_command);
    std::string token;
    while (stream >> token) {
        tokens.push_back(token);
    }
    tokens.push_back(m_wavPath);

    std::vector<char *> argv;
    for (auto &arg : tokens) {
        argv.push_back(&arg[0]);
    }
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        LOG_ERROR(TAG, "fork() failed: %s", std::strerror(errno));
        return false;
    }

    if (pid == 0) {
        execvp(argv[0], argv.data());
        // Only reached when exec fails.
        _exit(127);
    }

    LOG_INFO(TAG, "Started '%s' for %s (pid %d)", m_command.c_str(), m_wavPath.c_str(), static_cast<int>(pid));
    m_pid.store(pid);
    m_playing.store(true);
    m_waiter = std::thread(&ProcessAudioPlayback::waitForPlayer, this, pid);
    return true;
}

void ProcessAudioPlayback::waitForPlayer(pid_t pid) {
    int status = 0;
    pid_t result = 0;
    do {
        result = waitpid(pid, &status, 0);
    } while (result < 0 && errno == EINTR);

    if (result < 0) {
        LOG_WARN(TAG, "waitpid failed for pid %d: %s", static_cast<int>(pid), std::strerror(errno));
    } else if (WIFEXITED(status) && WEXITSTATUS(status) == 127) {
        LOG_ERROR(TAG, "Audio command '%s' could not be started", m_command.c_str());
    } else if (WIFEXITED(status) && WEXITSTATUS(status) != 0) {
        LOG_WARN(TAG, "Audio player exited with status %d", WEXITSTATUS(status));
    } else {
        LOG_DEBUG(TAG, "Audio player finished");
    }

    m_pid.store(-1);
    m_playing.store(false);
}

void ProcessAudioPlayback::waitForDuration() {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_stopSignal.wait_for(lock, std::chrono::milliseconds(m_durationMs), [this] { return m_stopRequested; });
    m_playing.store(false);
}

void ProcessAudioPlayback::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopRequested = true;
    }
    m_stopSignal.notify_all();

    pid_t pid = m_pid.load();
    if (pid > 0) {
        LOG_INFO(TAG, "Stopping audio player (pid %d)", static_cast<int>(pid));
        if (kill(pid, SIGTERM) != 0 && errno != ESRCH) {
            LOG_WARN(TAG, "kill(%d) failed: %s", static_cast<int>(pid), std::strerror(errno));
        }
    }

    joinWaiter();
}

void ProcessAudioPlayback::joinWaiter() {
    if (m_waiter.joinable()) {
        m_waiter.join();
    }
}
