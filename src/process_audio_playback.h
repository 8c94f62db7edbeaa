#ifndef PROCESS_AUDIO_PLAYBACK_H
#define PROCESS_AUDIO_PLAYBACK_H

#include <stdint.h>
#include <sys/types.h>

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

#include "playback_engine.h"

/**
 * Plays a WAV file through an external player command (for example
 * "aplay -q"), with the file path appended as the last argument.
 *
 * A waiter thread clears the playing flag when the player exits. With an
 * empty command nothing is spawned and playback is simulated by waiting out
 * the audio duration.
 */
class ProcessAudioPlayback : public PlaybackEngine::IAudioPlayback {
public:
    ProcessAudioPlayback(const std::string &command, const std::string &wavPath, uint32_t durationMs);
    ~ProcessAudioPlayback() override;

    ProcessAudioPlayback(const ProcessAudioPlayback &) = delete;
    ProcessAudioPlayback &operator=(const ProcessAudioPlayback &) = delete;

    bool start() override;
    bool isPlaying() const override { return m_playing.load(); }
    void stop() override;

private:
    bool spawnPlayer();
    void waitForPlayer(pid_t pid);
    void waitForDuration();
    void joinWaiter();

    std::string m_command;
    std::string m_wavPath;
    uint32_t m_durationMs;

    std::atomic<bool> m_playing;
    std::atomic<pid_t> m_pid;
    bool m_stopRequested;
    std::mutex m_mutex;
    std::condition_variable m_stopSignal;
    std::thread m_waiter;
};

#endif  // PROCESS_AUDIO_PLAYBACK_H
