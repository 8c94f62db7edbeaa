#ifndef PLAYBACK_SETTINGS_H
#define PLAYBACK_SETTINGS_H

#include <stdint.h>

#include "easing.h"

class ConfigManager;

// The operator's current playback choices: easing, time per pose and loop.
class PlaybackSettings {
public:
    static constexpr uint32_t kMinDurationMs = 100;
    static constexpr uint32_t kMaxDurationMs = 5000;
    static constexpr uint32_t kDefaultDurationMs = 1000;
    static constexpr uint32_t kDefaultStepMs = 100;

    PlaybackSettings();

    void applyConfig(const ConfigManager &config);

    EasingMode easingMode() const { return m_easing; }
    void setEasingMode(EasingMode mode) { m_easing = mode; }
    EasingMode cycleEasingMode();

    uint32_t durationMs() const { return m_durationMs; }
    void setDurationMs(uint32_t durationMs);
    uint32_t durationStepMs() const { return m_stepMs; }
    void setDurationStepMs(uint32_t stepMs);

    // Shorter moves.
    uint32_t faster();
    // Longer moves.
    uint32_t slower();

    bool loop() const { return m_loop; }
    void setLoop(bool loop) { m_loop = loop; }
    bool toggleLoop();

private:
    EasingMode m_easing;
    uint32_t m_durationMs;
    uint32_t m_stepMs;
    bool m_loop;
};

#endif  // PLAYBACK_SETTINGS_H
