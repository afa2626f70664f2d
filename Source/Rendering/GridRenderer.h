#pragma once

#include "../Core/EditorState.h"
#include "../Grid/FrameBuffer.h"
#include "../Grid/GridDevice.h"
#include "../Model/ControlType.h"
#include <juce_events/juce_events.h>
#include <atomic>
#include <mutex>

namespace shapegrid {

// ============================================================
// GridRenderer — fixed-rate frame loop. Each tick composes the
// editor into a frame under the state lock, then pushes it to the
// device with the lock released.
// ============================================================
class GridRenderer : public juce::Timer {
public:
    static constexpr int PendingPointLevel = 15;
    static constexpr int MetaKeyActiveLevel = 15;
    static constexpr int MetaKeyIdleLevel = 4;
    static constexpr int IncrementLevel = 12;
    static constexpr int DecrementLevel = 6;
    static constexpr int CopyFullLevel = 15;
    static constexpr int CopyEmptyLevel = 9;
    static constexpr int CycleLevel = 3;

    GridRenderer(EditorState& editor, GridDevice& device, std::mutex& stateLock);
    ~GridRenderer() override;

    void setFrameRate(int hz);
    int getFramePeriodMs() const { return periodMs_; }
    void setBrightnessPolicy(BrightnessPolicy p) { policy_ = p; }

    void start();
    void stop();
    bool isRunning() const { return running_.load(); }

    // Stops the loop and leaves the device dark if it is still there
    void shutdown();

    // Composition only; the caller holds the state lock
    void renderFrame(FrameBuffer& frame, double nowMs) const;

    // One loop iteration: compose under the lock, push outside it
    void tick(double nowMs);

    void pushDarkFrame();

    int getFramesSent() const { return framesSent_.load(); }

    // juce::Timer
    void timerCallback() override;

private:
    EditorState& editor_;
    GridDevice& device_;
    std::mutex& stateLock_;
    BrightnessPolicy policy_ = BrightnessPolicy::Static;
    int periodMs_ = 33;
    std::atomic<bool> running_ {false};
    std::atomic<int> framesSent_ {0};
    FrameBuffer frame_;  // reused between ticks
};

} // namespace shapegrid
