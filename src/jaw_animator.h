#ifndef JAW_ANIMATOR_H
#define JAW_ANIMATOR_H

#include <stddef.h>
#include <stdint.h>

#include <string>

#include "jaw_pulse_trigger.h"

enum class JawSyncMode {
    Pulse,      // snap open on syllable onsets, puppet-like
    Amplitude   // follow loudness continuously
};

const char *jawSyncModeName(JawSyncMode mode);
bool parseJawSyncMode(const std::string &name, JawSyncMode &mode);

struct JawSyncParams {
    JawSyncMode mode = JawSyncMode::Pulse;
    size_t channel = 5;
    int closedPosition = 1945;
    int openPosition = 2600;
    PulseTrigger::Params pulse;

    // Boosts quiet passages before they reach the jaw.
    float amplitudeGamma = 0.7f;

    // Weight kept from the previous output each update, in [0,1).
    float amplitudeSmoothing = 0.3f;
};

// Converts envelope amplitude into a jaw servo position.
class JawAnimator {
public:
    JawAnimator();
    explicit JawAnimator(const JawSyncParams &params);

    void configure(const JawSyncParams &params);
    const JawSyncParams &params() const { return m_params; }

    // Returns the position to command for this update.
    int update(uint32_t nowMs, float amplitude);
    void reset();

    float openness() const { return m_openness; }
    int position() const { return m_position; }
    const PulseTrigger &pulseTrigger() const { return m_pulse; }

    int positionForOpenness(float openness) const;

private:
    float updateAmplitudeMode(float amplitude);

    JawSyncParams m_params;
    PulseTrigger m_pulse;
    float m_openness;
    int m_position;
};

#endif  // JAW_ANIMATOR_H
