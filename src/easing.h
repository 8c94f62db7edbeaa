#ifndef EASING_H
#define EASING_H

#include <string>

enum class EasingMode {
    Smooth,   // smootherstep, slow -> fast -> slow
    Snap,     // quartic ease-in, slow start then snaps into place
    Gentle,   // quartic ease-out, fast start with a soft landing
    Linear,   // constant speed
    Instant   // playback flag: no interpolation, jump to each pose
};

// Maps progress t to eased progress. t is clamped to [0,1] first; every
// mode returns 0 at t=0 and 1 at t=1. Instant holds 0 until t reaches 1.
float applyEasing(float t, EasingMode mode);

float easeInOutSmoother(float t);
float easeInQuartic(float t);
float easeOutQuartic(float t);
float easeLinear(float t);

EasingMode nextEasingMode(EasingMode mode);
const char *easingModeName(EasingMode mode);
const char *easingModeDescription(EasingMode mode);

// Case-insensitive. Returns false and leaves mode untouched on unknown names.
bool parseEasingMode(const std::string &name, EasingMode &mode);

#endif  // EASING_H
