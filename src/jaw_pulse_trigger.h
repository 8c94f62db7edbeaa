#ifndef JAW_PULSE_TRIGGER_H
#define JAW_PULSE_TRIGGER_H

#include <stdint.h>

/**
 * Percussive jaw pulses from an amplitude stream.
 *
 * A pulse opens on a rising edge through the threshold, provided the cooldown
 * since the previous trigger has elapsed, and closes again after a fixed open
 * duration regardless of amplitude. The release check runs before the trigger
 * check on every update.
 */
class PulseTrigger {
public:
    enum class State {
        Closed,
        Open
    };

    enum class Transition {
        None,
        Opened,
        Closed
    };

    struct Params {
        float threshold = 0.05f;
        uint32_t cooldownMs = 50;
        uint32_t openDurationMs = 100;
    };

    PulseTrigger();
    explicit PulseTrigger(const Params &params);

    void setParams(const Params &params);
    const Params &params() const { return m_params; }

    Transition update(uint32_t nowMs, float amplitude);
    void reset();

    State state() const { return m_state; }
    bool isOpen() const { return m_state == State::Open; }
    uint32_t openedAtMs() const { return m_openedAtMs; }
    uint32_t lastTriggerMs() const { return m_lastTriggerMs; }
    bool hasTriggered() const { return m_hasTriggered; }

private:
    Params m_params;
    State m_state;
    uint32_t m_openedAtMs;
    uint32_t m_lastTriggerMs;
    bool m_hasTriggered;
    float m_previousAmplitude;
};

const char *pulseStateName(PulseTrigger::State state);

#endif  // JAW_PULSE_TRIGGER_H
