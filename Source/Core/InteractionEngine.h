#pragma once

#include "EditorState.h"
#include "EditResult.h"
#include <string>

namespace shapegrid {

// ============================================================
// InteractionEngine — turns raw grid key events into edits.
// Normal mode builds shapes from held presses and taps controls;
// holding the meta key (bottom-left) turns presses into
// select / brightness / copy / delete / paste / create.
// ============================================================
class InteractionEngine {
public:
    static constexpr double DefaultDoublePressMs = 500.0;

    // Consumer of control state changes (e.g. a MIDI mapper)
    class Listener {
    public:
        virtual ~Listener() = default;
        virtual void controlTouched(const Control& control, bool pressed) = 0;
    };

    explicit InteractionEngine(EditorState& editor);

    void setDoublePressMs(double ms) { doublePressMs_ = ms; }
    double getDoublePressMs() const { return doublePressMs_; }

    void setListener(Listener* l) { listener_ = l; }

    EditResult handleKey(int x, int y, bool pressed, double nowMs);

    // Forget held keys (session reset)
    void reset()
    {
        heldToggleId_.clear();
        pendingReleases_ = 0;
        gestureKeysReleased_ = 0;
        lastPressWasCopyCell_ = false;
    }

private:
    EditResult handleNormalPress(int x, int y, double nowMs);
    EditResult handleNormalRelease(int x, int y, double nowMs);
    EditResult handleMetaPress(int x, int y, double nowMs);
    EditResult handleMetaCell(Control& selected, GridPoint p, double nowMs);
    EditResult releaseMeta(double nowMs);

    EditResult commitPoints();
    void touchControl(Control& control, int x, int y, bool pressed, double nowMs);
    void releaseHeldToggle(int x, int y, double nowMs);

    EditorState& editor_;
    Listener* listener_ = nullptr;
    double doublePressMs_ = DefaultDoublePressMs;
    std::string heldToggleId_;
    int pendingReleases_ = 0;  // key-ups still owed by a committed multi-press gesture
    int gestureKeysReleased_ = 0;  // gesture keys lifted while the meta key was held
    bool lastPressWasCopyCell_ = false;  // previous meta press hit copy/delete
};

} // namespace shapegrid
