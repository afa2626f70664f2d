#pragma once

#include "Shape.h"
#include "ControlType.h"
#include <string>

namespace shapegrid {

class FrameBuffer;

// ============================================================
// Control — a placed Trigger/Toggle/Slider backed by one Shape.
// The ID is fixed for the control's lifetime; duplicates get a
// new one through duplicate().
// ============================================================
class Control {
public:
    static constexpr int MinBase = 0, MaxBase = 13;
    static constexpr int MinPeak = 2, MaxPeak = 15;
    static constexpr int DefaultBase = 3, DefaultPeak = 15;

    static constexpr double FlashMs = 400.0;
    static constexpr double FlashStepMs = 100.0;
    static constexpr int FlashStepLevels = 4;

    Control(std::string id, Shape shape, ControlType type = ControlType::Trigger,
            int baseBrightness = DefaultBase, int peakBrightness = DefaultPeak);

    // Same variant, state and brightness under a new ID and shape
    Control duplicate(std::string newId, Shape newShape) const;

    const std::string& getId() const { return id_; }
    const Shape& getShape() const { return shape_; }
    ControlType getType() const { return type_; }
    float getState() const { return state_; }
    bool isOn() const { return state_ != 0.0f; }
    double getLastTouch() const { return lastTouchMs_; }
    int getBaseBrightness() const { return baseBrightness_; }
    int getPeakBrightness() const { return peakBrightness_; }

    bool contains(int x, int y) const { return Geometry::containsPoint(shape_, x, y); }

    // Applies the variant's press/release semantics. Returns true if state changed.
    bool touch(int x, int y, bool pressed, double nowMs);

    void adjustBrightness(int delta);
    void setBrightness(int base, int peak);

    // Trigger -> Toggle -> Slider -> Trigger, state cleared
    void cycleType();

    int getBrightness(BrightnessPolicy policy, double nowMs) const;
    void draw(FrameBuffer& frame, BrightnessPolicy policy, double nowMs) const;

private:
    float sliderValueAt(int x) const;
    void drawSlider(FrameBuffer& frame) const;

    std::string id_;
    Shape shape_;
    ControlType type_;
    float state_ = 0.0f;
    double lastTouchMs_ = 0.0;
    int baseBrightness_;
    int peakBrightness_;
};

} // namespace shapegrid
