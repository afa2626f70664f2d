#include "Control.h"
#include "../Grid/FrameBuffer.h"
#include <juce_core/juce_core.h>
#include <cmath>

namespace shapegrid {

Control::Control(std::string id, Shape shape, ControlType type, int baseBrightness, int peakBrightness)
    : id_(std::move(id)), shape_(std::move(shape)), type_(type),
      baseBrightness_(juce::jlimit(MinBase, MaxBase, baseBrightness)),
      peakBrightness_(juce::jlimit(MinPeak, MaxPeak, peakBrightness))
{
}

Control Control::duplicate(std::string newId, Shape newShape) const
{
    Control copy = *this;
    copy.id_ = std::move(newId);
    copy.shape_ = std::move(newShape);
    return copy;
}

bool Control::touch(int x, int /*y*/, bool pressed, double nowMs)
{
    lastTouchMs_ = nowMs;
    DBG("[control] " + juce::String(id_) + (pressed ? " pressed" : " released"));

    float before = state_;
    switch (type_) {
        case ControlType::Trigger:
            if (pressed)
                state_ = isOn() ? 0.0f : 1.0f;
            break;
        case ControlType::Toggle:
            state_ = pressed ? 1.0f : 0.0f;
            break;
        case ControlType::Slider:
            if (pressed)
                state_ = sliderValueAt(x);
            break;
    }
    return state_ != before;
}

void Control::adjustBrightness(int delta)
{
    setBrightness(baseBrightness_ + delta, peakBrightness_ + delta);
}

void Control::setBrightness(int base, int peak)
{
    baseBrightness_ = juce::jlimit(MinBase, MaxBase, base);
    peakBrightness_ = juce::jlimit(MinPeak, MaxPeak, peak);
}

void Control::cycleType()
{
    switch (type_) {
        case ControlType::Trigger: type_ = ControlType::Toggle;  break;
        case ControlType::Toggle:  type_ = ControlType::Slider;  break;
        case ControlType::Slider:  type_ = ControlType::Trigger; break;
    }
    state_ = 0.0f;
}

int Control::getBrightness(BrightnessPolicy policy, double nowMs) const
{
    if (!isOn())
        return baseBrightness_;

    if (policy == BrightnessPolicy::Static)
        return peakBrightness_;

    double elapsed = nowMs - lastTouchMs_;
    if (elapsed >= 0.0 && elapsed < FlashMs) {
        int step = (int)std::floor(elapsed / FlashStepMs);
        return juce::jlimit(baseBrightness_, peakBrightness_, peakBrightness_ - step * FlashStepLevels);
    }
    return type_ == ControlType::Toggle ? peakBrightness_ : baseBrightness_;
}

void Control::draw(FrameBuffer& frame, BrightnessPolicy policy, double nowMs) const
{
    if (type_ == ControlType::Slider)
        drawSlider(frame);
    else
        Geometry::draw(shape_, getBrightness(policy, nowMs), frame);
}

float Control::sliderValueAt(int x) const
{
    auto b = Geometry::bounds(shape_);
    if (b.xMax <= b.xMin) return 1.0f;
    return juce::jlimit(0.0f, 1.0f, (float)(x - b.xMin) / (float)(b.xMax - b.xMin));
}

void Control::drawSlider(FrameBuffer& frame) const
{
    if (Geometry::isDegenerate(shape_)) return;

    // Each row is a run: filled up to the value at peak, the rest at base
    auto b = Geometry::bounds(shape_);
    for (int gy = b.yMin; gy <= b.yMax; ++gy) {
        for (int gx = b.xMin; gx <= b.xMax; ++gx) {
            if (!Geometry::containsPoint(shape_, gx, gy)) continue;
            bool filled = isOn() && sliderValueAt(gx) <= state_;
            frame.setLevel(gx, gy, filled ? peakBrightness_ : baseBrightness_);
        }
    }
}

} // namespace shapegrid
