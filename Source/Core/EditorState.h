#pragma once

#include "../Model/Control.h"
#include "Clipboard.h"
#include "EditResult.h"
#include "MetaHistory.h"
#include "SelectionManager.h"
#include <juce_core/juce_core.h>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace shapegrid {

// Affordance cells drawn next to the selected control in meta mode
struct MetaCells {
    GridPoint increment;
    GridPoint decrement;
    GridPoint copyDelete;
    GridPoint cycle;
};

// ============================================================
// EditorState — every control on the grid plus the editing
// context around them. Single source of truth; callers hold the
// application's state lock while touching it.
// ============================================================
class EditorState {
public:
    // Keyed by ID so iteration order (and so render order) is stable
    using ControlMap = std::map<std::string, Control>;

    EditorState(int width = 8, int height = 8);

    void setGridSize(int width, int height);
    int getGridWidth() const { return gridWidth_; }
    int getGridHeight() const { return gridHeight_; }
    int bottomRow() const { return gridHeight_ - 1; }
    GridPoint metaKey() const { return {0, bottomRow()}; }
    bool isInBottomRow(int /*x*/, int y) const { return y == bottomRow(); }

    // Clears everything except the clipboard
    void reset();

    // Controls
    const ControlMap& controls() const { return controls_; }
    int numControls() const { return (int)controls_.size(); }
    Control* getControl(const std::string& id);
    const Control* getControl(const std::string& id) const;
    Control* findControlAt(int x, int y);

    // Created if `shape` could be placed, else the rejection reason
    EditResult checkPlacement(const Shape& shape, const std::string& ignoreId = {}) const;

    EditResult addControl(const Shape& shape, ControlType type, std::string* newId = nullptr);
    bool removeControl(const std::string& id);

    void setDefaultBrightness(int base, int peak);

    // In-progress press gesture
    std::vector<GridPoint>& pointBuffer() { return pointBuffer_; }
    const std::vector<GridPoint>& pointBuffer() const { return pointBuffer_; }

    bool isMetaMode() const { return metaMode_; }
    void setMetaMode(bool on) { metaMode_ = on; }

    // Selection, resolved by ID
    SelectionManager& selection() { return selection_; }
    Control* selectedControl();
    const Control* selectedControl() const;
    std::optional<MetaCells> selectedMetaCells() const;
    MetaCells metaCellsFor(const Shape& shape) const;

    // Clipboard
    Clipboard& clipboard() { return clipboard_; }
    const Clipboard& clipboard() const { return clipboard_; }
    EditResult copySelected();
    EditResult deleteSelected();
    EditResult paste(GridPoint target, std::string* newId = nullptr);

    MetaHistory& metaHistory() { return metaHistory_; }
    const MetaHistory& metaHistory() const { return metaHistory_; }

    // Last activation of the copy/delete cell
    void markCopyPress(GridPoint cell, double nowMs);
    void clearCopyPressTime() { copyPressMs_.reset(); }
    std::optional<double> lastCopyPressTime() const { return copyPressMs_; }
    std::optional<GridPoint> lastCopyCell() const { return copyCell_; }

    void setRandomSeed(juce::int64 seed) { random_.setSeed(seed); }
    std::string generateId();

private:
    int gridWidth_, gridHeight_;
    int defaultBase_ = Control::DefaultBase;
    int defaultPeak_ = Control::DefaultPeak;

    ControlMap controls_;
    std::vector<GridPoint> pointBuffer_;
    bool metaMode_ = false;
    SelectionManager selection_;
    Clipboard clipboard_;
    MetaHistory metaHistory_;
    std::optional<double> copyPressMs_;
    std::optional<GridPoint> copyCell_;
    juce::Random random_;
};

} // namespace shapegrid
