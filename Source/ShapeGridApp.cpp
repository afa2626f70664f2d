#include "ShapeGridApp.h"

namespace shapegrid {

ShapeGridApp::ShapeGridApp(const Settings& settings, GridDevice& device)
    : device_(device),
      engine_(editor_),
      renderer_(editor_, device_, stateLock_)
{
    editor_.setDefaultBrightness(settings.defaultBaseBrightness, settings.defaultPeakBrightness);
    engine_.setDoublePressMs(settings.doublePressMs);
    renderer_.setFrameRate(settings.frameRateHz);
    renderer_.setBrightnessPolicy(settings.brightnessPolicy);

    device_.addListener(this);

    // Device may already be up by the time we attach
    if (device_.isConnected())
        gridReady(device_.getWidth(), device_.getHeight());
}

ShapeGridApp::~ShapeGridApp()
{
    shutdown();
    device_.removeListener(this);
}

void ShapeGridApp::shutdown()
{
    if (shutDown_) return;
    shutDown_ = true;
    renderer_.shutdown();
}

void ShapeGridApp::gridReady(int width, int height)
{
    {
        std::lock_guard<std::mutex> lock(stateLock_);
        editor_.setGridSize(width, height);
        editor_.reset();
        engine_.reset();
    }
    DBG("[editor] Session started on " + juce::String(width) + "x" + juce::String(height) + " grid");
    renderer_.start();
}

void ShapeGridApp::gridDisconnected()
{
    renderer_.stop();

    std::lock_guard<std::mutex> lock(stateLock_);
    editor_.reset();
    engine_.reset();
    DBG("[editor] Session reset, waiting for grid");
}

void ShapeGridApp::gridKey(int x, int y, bool pressed)
{
    handleKey(x, y, pressed, juce::Time::getMillisecondCounterHiRes());
}

EditResult ShapeGridApp::handleKey(int x, int y, bool pressed, double nowMs)
{
    std::lock_guard<std::mutex> lock(stateLock_);
    return engine_.handleKey(x, y, pressed, nowMs);
}

} // namespace shapegrid
