#include "jaw_pulse_trigger.h"

PulseTrigger::PulseTrigger()
    : PulseTrigger(Params()) {
}

PulseTrigger::PulseTrigger(const Params &params)
    : m_params(params),
      m_state(State::Closed),
      m_openedAtMs(0),
      m_lastTriggerMs(0),
      m_hasTriggered(false),
      m_previousAmplitude(0.0f) {
}

void PulseTrigger::setParams(const Params &params) {
    m_params = params;
}

void PulseTrigger::reset() {
    m_state = State::Closed;
    m_openedAtMs = 0;
    m_lastTriggerMs = 0;
    m_hasTriggered = false;
    m_previousAmplitude = 0.0f;
}

PulseTrigger::Transition PulseTrigger::update(uint32_t nowMs, float amplitude) {
    Transition transition = Transition::None;

    if (m_state == State::Open && nowMs - m_openedAtMs >= m_params.openDurationMs) {
        m_state = State::Closed;
        transition = Transition::Closed;
    }

    bool risingEdge = m_previousAmplitude < m_params.threshold && amplitude >= m_params.threshold;
    m_previousAmplitude = amplitude;

    if (m_state == State::Closed && risingEdge) {
        bool cooledDown = !m_hasTriggered || nowMs - m_lastTriggerMs >= m_params.cooldownMs;
        if (cooledDown) {
            m_state = State::Open;
            m_openedAtMs = nowMs;
            m_lastTriggerMs = nowMs;
            m_hasTriggered = true;
            transition = Transition::Opened;
        }
    }

    return transition;
}

const char *pulseStateName(PulseTrigger::State state) {
    switch (state) {
        case PulseTrigger::State::Closed: return "CLOSED";
        case PulseTrigger::State::Open: return "OPEN";
        default: return "UNKNOWN";
    }
}
