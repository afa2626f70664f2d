#include "Settings.h"

namespace shapegrid {

juce::var Settings::toVar() const
{
    auto obj = new juce::DynamicObject();
    obj->setProperty("frame_rate_hz", frameRateHz);
    obj->setProperty("double_press_ms", doublePressMs);
    obj->setProperty("brightness_policy", juce::String(brightnessPolicyToString(brightnessPolicy)));
    obj->setProperty("default_base_brightness", defaultBaseBrightness);
    obj->setProperty("default_peak_brightness", defaultPeakBrightness);
    obj->setProperty("serialosc_host", juce::String(serialoscHost));
    obj->setProperty("serialosc_port", serialoscPort);
    obj->setProperty("listen_port", listenPort);
    obj->setProperty("prefix", juce::String(prefix));
    obj->setProperty("log_file", juce::String(logFile));
    return juce::var(obj);
}

juce::Result Settings::fromVar(const juce::var& v)
{
    if (!v.isObject())
        return juce::Result::fail("settings root is not a JSON object");

    // Parse into a copy so a failure leaves the current values intact
    Settings s = *this;

    s.frameRateHz = juce::jlimit(1, 120, (int)v.getProperty("frame_rate_hz", frameRateHz));
    s.doublePressMs = juce::jlimit(50.0, 5000.0, (double)v.getProperty("double_press_ms", doublePressMs));

    auto policy = v.getProperty("brightness_policy", juce::String(brightnessPolicyToString(brightnessPolicy)))
                      .toString().toStdString();
    if (policy != "static" && policy != "flash")
        return juce::Result::fail("unknown brightness_policy '" + juce::String(policy) + "'");
    s.brightnessPolicy = brightnessPolicyFromString(policy);

    s.defaultBaseBrightness = juce::jlimit(0, 13, (int)v.getProperty("default_base_brightness", defaultBaseBrightness));
    s.defaultPeakBrightness = juce::jlimit(2, 15, (int)v.getProperty("default_peak_brightness", defaultPeakBrightness));

    s.serialoscHost = v.getProperty("serialosc_host", juce::String(serialoscHost)).toString().toStdString();
    s.serialoscPort = juce::jlimit(1, 65535, (int)v.getProperty("serialosc_port", serialoscPort));
    s.listenPort = juce::jlimit(0, 65535, (int)v.getProperty("listen_port", listenPort));

    s.prefix = v.getProperty("prefix", juce::String(prefix)).toString().toStdString();
    if (s.prefix.empty() || s.prefix[0] != '/')
        s.prefix = "/" + s.prefix;

    s.logFile = v.getProperty("log_file", juce::String(logFile)).toString().toStdString();

    *this = s;
    return juce::Result::ok();
}

juce::Result Settings::fromJson(const juce::String& json)
{
    juce::var parsed;
    auto result = juce::JSON::parse(json, parsed);
    if (result.failed())
        return result;
    return fromVar(parsed);
}

juce::Result Settings::loadFromFile(const juce::File& file)
{
    if (!file.existsAsFile())
        return juce::Result::fail("no such file: " + file.getFullPathName());
    return fromJson(file.loadFileAsString());
}

} // namespace shapegrid
