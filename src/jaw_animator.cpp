#include "jaw_animator.h"

#include <algorithm>
#include <cctype>
#include <cmath>

#include "logging_manager.h"

static constexpr const char *TAG = "JawAnimator";

const char *jawSyncModeName(JawSyncMode mode) {
    switch (mode) {
        case JawSyncMode::Pulse: return "pulse";
        case JawSyncMode::Amplitude: return "amplitude";
        default: return "unknown";
    }
}

bool parseJawSyncMode(const std::string &name, JawSyncMode &mode) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "pulse") {
        mode = JawSyncMode::Pulse;
        return true;
    }
    if (lowered == "amplitude") {
        mode = JawSyncMode::Amplitude;
        return true;
    }
    return false;
}

JawAnimator::JawAnimator()
    : JawAnimator(JawSyncParams()) {
}

JawAnimator::JawAnimator(const JawSyncParams &params)
    : m_params(params),
      m_pulse(params.pulse),
      m_openness(0.0f),
      m_position(params.closedPosition) {
}

void JawAnimator::configure(const JawSyncParams &params) {
    m_params = params;
    m_pulse.setParams(params.pulse);
    reset();
    LOG_DEBUG(TAG, "Jaw on channel %u, %s mode, closed=%d open=%d",
              static_cast<unsigned>(m_params.channel), jawSyncModeName(m_params.mode),
              m_params.closedPosition, m_params.openPosition);
}

void JawAnimator::reset() {
    m_pulse.reset();
    m_openness = 0.0f;
    m_position = m_params.closedPosition;
}

int JawAnimator::positionForOpenness(float openness) const {
    float clamped = std::max(0.0f, std::min(1.0f, openness));
    float span = static_cast<float>(m_params.openPosition - m_params.closedPosition);
    return m_params.closedPosition + static_cast<int>(std::lround(span * clamped));
}

float JawAnimator::updateAmplitudeMode(float amplitude) {
    float clamped = std::max(0.0f, std::min(1.0f, amplitude));
    float target = std::pow(clamped, m_params.amplitudeGamma);
    float alpha = m_params.amplitudeSmoothing;
    return m_openness * alpha + target * (1.0f - alpha);
}

int JawAnimator::update(uint32_t nowMs, float amplitude) {
    if (m_params.mode == JawSyncMode::Pulse) {
        PulseTrigger::Transition transition = m_pulse.update(nowMs, amplitude);
        if (transition == PulseTrigger::Transition::Opened) {
            LOG_VERBOSE(TAG, "Pulse open at %u ms (amplitude %.3f)", static_cast<unsigned>(nowMs), amplitude);
        }
        m_openness = m_pulse.isOpen() ? 1.0f : 0.0f;
    } else {
        m_openness = updateAmplitudeMode(amplitude);
    }

    m_position = positionForOpenness(m_openness);
    return m_position;
}
