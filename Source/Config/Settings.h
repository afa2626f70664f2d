#pragma once

#include "../Model/ControlType.h"
#include <juce_core/juce_core.h>
#include <string>

namespace shapegrid {

// ============================================================
// Settings — runtime configuration, loaded from a JSON file.
// Missing keys keep their defaults; out-of-range values clamp.
// ============================================================
struct Settings {
    int frameRateHz = 30;
    double doublePressMs = 500.0;
    BrightnessPolicy brightnessPolicy = BrightnessPolicy::Static;
    int defaultBaseBrightness = 3;
    int defaultPeakBrightness = 15;

    std::string serialoscHost = "127.0.0.1";
    int serialoscPort = 12002;
    int listenPort = 0;             // 0 = any free port
    std::string prefix = "/shapegrid";
    std::string logFile;            // empty = log to stderr only

    int framePeriodMs() const { return juce::jmax(1, 1000 / juce::jmax(1, frameRateHz)); }

    juce::var toVar() const;
    juce::Result fromVar(const juce::var& v);
    juce::Result fromJson(const juce::String& json);
    juce::Result loadFromFile(const juce::File& file);
};

} // namespace shapegrid
