#include "easing.h"

#include <algorithm>
#include <cctype>

namespace {

float clampUnit(float t) {
    if (!(t > 0.0f)) {
        return 0.0f;
    }
    return std::min(t, 1.0f);
}

}  // namespace

float easeInOutSmoother(float t) {
    t = clampUnit(t);
    return t * t * t * (t * (t * 6.0f - 15.0f) + 10.0f);
}

float easeInQuartic(float t) {
    t = clampUnit(t);
    return t * t * t * t;
}

float easeOutQuartic(float t) {
    t = clampUnit(t);
    float inverse = 1.0f - t;
    return 1.0f - inverse * inverse * inverse * inverse;
}

float easeLinear(float t) {
    return clampUnit(t);
}

float applyEasing(float t, EasingMode mode) {
    switch (mode) {
        case EasingMode::Smooth: return easeInOutSmoother(t);
        case EasingMode::Snap:   return easeInQuartic(t);
        case EasingMode::Gentle: return easeOutQuartic(t);
        case EasingMode::Linear: return easeLinear(t);
        case EasingMode::Instant:
        default:
            return clampUnit(t) >= 1.0f ? 1.0f : 0.0f;
    }
}

EasingMode nextEasingMode(EasingMode mode) {
    switch (mode) {
        case EasingMode::Smooth: return EasingMode::Snap;
        case EasingMode::Snap:   return EasingMode::Gentle;
        case EasingMode::Gentle: return EasingMode::Linear;
        case EasingMode::Linear: return EasingMode::Instant;
        case EasingMode::Instant:
        default:
            return EasingMode::Smooth;
    }
}

const char *easingModeName(EasingMode mode) {
    switch (mode) {
        case EasingMode::Smooth:  return "SMOOTH";
        case EasingMode::Snap:    return "SNAP";
        case EasingMode::Gentle:  return "GENTLE";
        case EasingMode::Linear:  return "LINEAR";
        case EasingMode::Instant: return "INSTANT";
        default:                  return "UNKNOWN";
    }
}

const char *easingModeDescription(EasingMode mode) {
    switch (mode) {
        case EasingMode::Smooth:  return "ease-in-out (slow -> fast -> slow)";
        case EasingMode::Snap:    return "ease-in (slow -> snap)";
        case EasingMode::Gentle:  return "ease-out (fast -> gentle stop)";
        case EasingMode::Linear:  return "constant (robotic)";
        case EasingMode::Instant: return "no interpolation (jump to pose)";
        default:                  return "";
    }
}

bool parseEasingMode(const std::string &name, EasingMode &mode) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "smooth") {
        mode = EasingMode::Smooth;
    } else if (lowered == "snap") {
        mode = EasingMode::Snap;
    } else if (lowered == "gentle") {
        mode = EasingMode::Gentle;
    } else if (lowered == "linear") {
        mode = EasingMode::Linear;
    } else if (lowered == "instant") {
        mode = EasingMode::Instant;
    } else {
        return false;
    }
    return true;
}
