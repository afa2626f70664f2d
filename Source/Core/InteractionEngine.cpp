#include "InteractionEngine.h"
#include <algorithm>

namespace shapegrid {

InteractionEngine::InteractionEngine(EditorState& editor)
    : editor_(editor) {}

EditResult InteractionEngine::handleKey(int x, int y, bool pressed, double nowMs)
{
    GridPoint p {x, y};

    if (p == editor_.metaKey()) {
        if (pressed) {
            editor_.setMetaMode(true);
            DBG("[editor] Meta mode on");
            return EditResult::None;
        }
        return releaseMeta(nowMs);
    }

    if (editor_.isMetaMode()) {
        if (pressed)
            return handleMetaPress(x, y, nowMs);
        auto& points = editor_.pointBuffer();
        if (std::find(points.begin(), points.end(), p) != points.end())
            ++gestureKeysReleased_;
        return EditResult::None;
    }

    return pressed ? handleNormalPress(x, y, nowMs) : handleNormalRelease(x, y, nowMs);
}

// ============================================================
// Normal mode
// ============================================================
EditResult InteractionEngine::handleNormalPress(int x, int y, double nowMs)
{
    if (editor_.isInBottomRow(x, y)) return EditResult::None;

    auto& points = editor_.pointBuffer();
    points.push_back({x, y});

    // A Toggle mirrors contact, so it has to see the press itself
    if (points.size() == 1) {
        auto* control = editor_.findControlAt(x, y);
        if (control && control->getType() == ControlType::Toggle) {
            heldToggleId_ = control->getId();
            touchControl(*control, x, y, true, nowMs);
            return EditResult::Touched;
        }
    }
    return EditResult::None;
}

EditResult InteractionEngine::handleNormalRelease(int x, int y, double nowMs)
{
    if (editor_.isInBottomRow(x, y)) return EditResult::None;

    auto& points = editor_.pointBuffer();
    if (points.empty() && pendingReleases_ > 0) {
        --pendingReleases_;
        return EditResult::None;
    }

    EditResult result = EditResult::None;
    pendingReleases_ = points.empty() ? 0 : (int)points.size() - 1;

    if (points.size() == 2 || points.size() == 3) {
        releaseHeldToggle(x, y, nowMs);
        result = commitPoints();
    } else if (!heldToggleId_.empty()) {
        releaseHeldToggle(x, y, nowMs);
        result = EditResult::Touched;
    } else if (auto* control = editor_.findControlAt(x, y)) {
        // A completed tap activates the control; a Toggle only ever sees contact
        touchControl(*control, x, y, control->getType() != ControlType::Toggle, nowMs);
        result = EditResult::Touched;
    }

    points.clear();
    return result;
}

EditResult InteractionEngine::commitPoints()
{
    auto& points = editor_.pointBuffer();
    auto shape = Shape::fromPoints(points);
    if (!shape || shape->type == ShapeType::Point) {
        DBG("[editor] Ignoring gesture with " + juce::String((int)points.size()) + " points");
        return EditResult::RejectedPointCount;
    }

    return editor_.addControl(*shape, ControlType::Trigger);
}

void InteractionEngine::touchControl(Control& control, int x, int y, bool pressed, double nowMs)
{
    control.touch(x, y, pressed, nowMs);
    if (listener_)
        listener_->controlTouched(control, pressed);
}

void InteractionEngine::releaseHeldToggle(int x, int y, double nowMs)
{
    if (heldToggleId_.empty()) return;
    if (auto* control = editor_.getControl(heldToggleId_))
        touchControl(*control, x, y, false, nowMs);
    heldToggleId_.clear();
}

// ============================================================
// Meta mode
// ============================================================
EditResult InteractionEngine::handleMetaPress(int x, int y, double nowMs)
{
    GridPoint p {x, y};
    editor_.metaHistory().push(p);

    bool afterCopy = lastPressWasCopyCell_;
    lastPressWasCopyCell_ = false;

    if (auto* selected = editor_.selectedControl()) {
        auto result = handleMetaCell(*selected, p, nowMs);
        if (result != EditResult::None)
            return result;
    }

    // Select whatever is under the press
    if (auto* control = editor_.findControlAt(x, y)) {
        editor_.selection().select(control->getId());
        DBG("[editor] Selected " + juce::String(control->getId()));
        return EditResult::Selected;
    }

    // Paste only straight after a press that activated copy/delete
    if (afterCopy && editor_.clipboard().hasContent()) {
        std::string newId;
        auto result = editor_.paste(p, &newId);
        if (result == EditResult::Pasted)
            editor_.selection().select(newId);
        return result;
    }

    // Otherwise drop a single-cell trigger here
    std::string newId;
    auto result = editor_.addControl(Shape::point(p), ControlType::Trigger, &newId);
    if (result == EditResult::Created)
        editor_.selection().select(newId);
    return result;
}

EditResult InteractionEngine::handleMetaCell(Control& selected, GridPoint p, double nowMs)
{
    auto cells = editor_.metaCellsFor(selected.getShape());

    if (p == cells.increment) {
        selected.adjustBrightness(1);
        return EditResult::Adjusted;
    }
    if (p == cells.decrement) {
        selected.adjustBrightness(-1);
        return EditResult::Adjusted;
    }
    if (p == cells.copyDelete) {
        // Timed from this cell's own last activation
        auto last = editor_.lastCopyPressTime();
        auto lastCell = editor_.lastCopyCell();
        bool doublePress = last && lastCell && *lastCell == p && nowMs - *last < doublePressMs_;
        lastPressWasCopyCell_ = true;

        if (doublePress) {
            auto result = editor_.deleteSelected();
            editor_.markCopyPress(p, nowMs);
            editor_.clearCopyPressTime();
            return result;
        }
        editor_.markCopyPress(p, nowMs);
        return editor_.copySelected();
    }
    if (p == cells.cycle) {
        selected.cycleType();
        DBG("[editor] " + juce::String(selected.getId()) + " is now "
            + juce::String(controlTypeToString(selected.getType())));
        return EditResult::Cycled;
    }
    return EditResult::None;
}

EditResult InteractionEngine::releaseMeta(double nowMs)
{
    auto key = editor_.metaKey();
    releaseHeldToggle(key.x, key.y, nowMs);

    // Gesture keys still held owe their key-ups to the committed shape
    EditResult result = EditResult::None;
    auto& points = editor_.pointBuffer();
    pendingReleases_ = 0;
    if (points.size() == 2 || points.size() == 3) {
        result = commitPoints();
        pendingReleases_ = std::max(0, (int)points.size() - gestureKeysReleased_);
    }

    points.clear();
    gestureKeysReleased_ = 0;
    lastPressWasCopyCell_ = false;
    editor_.selection().clear();
    editor_.setMetaMode(false);
    DBG("[editor] Meta mode off");
    return result;
}

} // namespace shapegrid
