#pragma once

#include <string>

namespace shapegrid {

// How a touch mutates a control's logical state
enum class ControlType {
    Trigger,  // Flip on press, release ignored
    Toggle,   // On while held, off on release
    Slider    // Horizontal position of the press within the shape
};

inline ControlType controlTypeFromString(const std::string& s)
{
    if (s == "trigger") return ControlType::Trigger;
    if (s == "toggle")  return ControlType::Toggle;
    if (s == "slider")  return ControlType::Slider;
    return ControlType::Trigger;
}

inline std::string controlTypeToString(ControlType t)
{
    switch (t) {
        case ControlType::Trigger: return "trigger";
        case ControlType::Toggle:  return "toggle";
        case ControlType::Slider:  return "slider";
    }
    return "trigger";
}

// How a lit control's level is derived from its state
enum class BrightnessPolicy {
    Static,  // base when off, peak when on
    Flash    // peak stepping down to base over 400ms after a touch
};

inline BrightnessPolicy brightnessPolicyFromString(const std::string& s)
{
    if (s == "flash") return BrightnessPolicy::Flash;
    return BrightnessPolicy::Static;
}

inline std::string brightnessPolicyToString(BrightnessPolicy p)
{
    switch (p) {
        case BrightnessPolicy::Static: return "static";
        case BrightnessPolicy::Flash:  return "flash";
    }
    return "static";
}

} // namespace shapegrid
