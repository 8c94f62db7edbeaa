#include "playback_settings.h"

#include <algorithm>

#include "config_manager.h"
#include "logging_manager.h"

static constexpr const char *TAG = "Settings";

PlaybackSettings::PlaybackSettings()
    : m_easing(EasingMode::Smooth),
      m_durationMs(kDefaultDurationMs),
      m_stepMs(kDefaultStepMs),
      m_loop(false) {
}

void PlaybackSettings::applyConfig(const ConfigManager &config) {
    m_easing = config.getEasingMode();
    setDurationMs(config.getPoseDurationMs());
    setDurationStepMs(config.getDurationStepMs());
    m_loop = config.getLoop();
    LOG_DEBUG(TAG, "Easing %s, %u ms per pose (step %u ms), loop %s", easingModeName(m_easing),
              static_cast<unsigned>(m_durationMs), static_cast<unsigned>(m_stepMs), m_loop ? "on" : "off");
}

EasingMode PlaybackSettings::cycleEasingMode() {
    m_easing = nextEasingMode(m_easing);
    LOG_INFO(TAG, "Easing: %s - %s", easingModeName(m_easing), easingModeDescription(m_easing));
    return m_easing;
}

void PlaybackSettings::setDurationMs(uint32_t durationMs) {
    m_durationMs = std::max(kMinDurationMs, std::min(kMaxDurationMs, durationMs));
}

void PlaybackSettings::setDurationStepMs(uint32_t stepMs) {
    m_stepMs = stepMs == 0 ? kDefaultStepMs : stepMs;
}

uint32_t PlaybackSettings::faster() {
    uint32_t next = m_durationMs > m_stepMs ? m_durationMs - m_stepMs : kMinDurationMs;
    setDurationMs(next);
    LOG_INFO(TAG, "Speed: %u ms per pose (faster)", static_cast<unsigned>(m_durationMs));
    return m_durationMs;
}

uint32_t PlaybackSettings::slower() {
    setDurationMs(m_durationMs + m_stepMs);
    LOG_INFO(TAG, "Speed: %u ms per pose (slower)", static_cast<unsigned>(m_durationMs));
    return m_durationMs;
}

bool PlaybackSettings::toggleLoop() {
    m_loop = !m_loop;
    LOG_INFO(TAG, "Loop: %s", m_loop ? "ON - will repeat" : "OFF - play once");
    return m_loop;
}
