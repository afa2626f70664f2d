#include "EditorState.h"
#include "IdGenerator.h"

namespace shapegrid {

EditorState::EditorState(int width, int height)
    : gridWidth_(width), gridHeight_(height)
{
}

void EditorState::setGridSize(int width, int height)
{
    gridWidth_ = width;
    gridHeight_ = height;
}

void EditorState::reset()
{
    controls_.clear();
    pointBuffer_.clear();
    metaMode_ = false;
    selection_.clear();
    metaHistory_.clear();
    copyPressMs_.reset();
    copyCell_.reset();
    // clipboard_ survives so a copied control outlives a reconnect
}

Control* EditorState::getControl(const std::string& id)
{
    auto it = controls_.find(id);
    return it != controls_.end() ? &it->second : nullptr;
}

const Control* EditorState::getControl(const std::string& id) const
{
    auto it = controls_.find(id);
    return it != controls_.end() ? &it->second : nullptr;
}

Control* EditorState::findControlAt(int x, int y)
{
    for (auto& [id, control] : controls_)
        if (control.contains(x, y))
            return &control;
    return nullptr;
}

EditResult EditorState::checkPlacement(const Shape& shape, const std::string& ignoreId) const
{
    if (!typeForPointCount((int)shape.points.size()))
        return EditResult::RejectedPointCount;
    if (!Geometry::withinGrid(shape, gridWidth_, gridHeight_))
        return EditResult::RejectedOffGrid;
    if (Geometry::touchesRow(shape, bottomRow()))
        return EditResult::RejectedBottomRow;
    if (Geometry::isDegenerate(shape))
        return EditResult::RejectedDegenerate;

    for (auto& [id, control] : controls_) {
        if (id == ignoreId) continue;
        if (Geometry::shapesOverlap(shape, control.getShape()))
            return EditResult::RejectedOverlap;
    }
    return EditResult::Created;
}

EditResult EditorState::addControl(const Shape& shape, ControlType type, std::string* newId)
{
    auto check = checkPlacement(shape);
    if (check != EditResult::Created) {
        juce::Logger::writeToLog("[editor] Cannot create " + juce::String(shape.typeString())
                                 + ": shape " + editResultToString(check));
        return check;
    }

    auto id = generateId();
    controls_.emplace(id, Control(id, shape, type, defaultBase_, defaultPeak_));
    DBG("[editor] Created " + juce::String(controlTypeToString(type)) + " "
        + juce::String(shape.typeString()) + " " + juce::String(id));

    if (newId) *newId = id;
    return EditResult::Created;
}

bool EditorState::removeControl(const std::string& id)
{
    if (controls_.erase(id) == 0)
        return false;
    selection_.forget(id);
    DBG("[editor] Deleted " + juce::String(id));
    return true;
}

void EditorState::setDefaultBrightness(int base, int peak)
{
    defaultBase_ = juce::jlimit(Control::MinBase, Control::MaxBase, base);
    defaultPeak_ = juce::jlimit(Control::MinPeak, Control::MaxPeak, peak);
}

Control* EditorState::selectedControl()
{
    if (selection_.isEmpty()) return nullptr;
    return getControl(selection_.getSelectedId());
}

const Control* EditorState::selectedControl() const
{
    if (selection_.isEmpty()) return nullptr;
    return getControl(selection_.getSelectedId());
}

std::optional<MetaCells> EditorState::selectedMetaCells() const
{
    if (auto* control = selectedControl())
        return metaCellsFor(control->getShape());
    return std::nullopt;
}

MetaCells EditorState::metaCellsFor(const Shape& shape) const
{
    auto b = Geometry::bounds(shape);

    // Right of the shape at its top row; mirrored to the left when the
    // three-cell strip would run off the right edge
    int mx = b.xMax + 1;
    int my = b.yMin;
    if (mx + 2 >= gridWidth_)
        mx = b.xMin - 3;

    mx = juce::jlimit(0, std::max(0, gridWidth_ - 3), mx);
    my = juce::jlimit(0, std::max(0, gridHeight_ - 2), my);

    return {{mx, my}, {mx + 1, my}, {mx + 2, my}, {mx, my + 1}};
}

EditResult EditorState::copySelected()
{
    auto* control = selectedControl();
    if (!control) return EditResult::None;

    clipboard_.copy(*control);
    DBG("[editor] Copied " + juce::String(control->getId()));
    return EditResult::Copied;
}

EditResult EditorState::deleteSelected()
{
    auto* control = selectedControl();
    if (!control) return EditResult::None;

    auto id = control->getId();
    removeControl(id);
    return EditResult::Deleted;
}

EditResult EditorState::paste(GridPoint target, std::string* newId)
{
    if (!clipboard_.hasContent()) return EditResult::None;

    auto id = generateId();
    auto candidate = clipboard_.makePaste(target, id);
    if (!candidate) return EditResult::None;

    auto check = checkPlacement(candidate->getShape());
    if (check != EditResult::Created) {
        juce::Logger::writeToLog("[editor] warning: paste at " + juce::String(target.x) + ","
                                 + juce::String(target.y) + " rejected, shape "
                                 + editResultToString(check));
        return check;
    }

    controls_.emplace(id, std::move(*candidate));
    DBG("[editor] Pasted " + juce::String(id) + " at " + juce::String(target.x) + ","
        + juce::String(target.y));

    if (newId) *newId = id;
    return EditResult::Pasted;
}

void EditorState::markCopyPress(GridPoint cell, double nowMs)
{
    copyCell_ = cell;
    copyPressMs_ = nowMs;
}

std::string EditorState::generateId()
{
    return IdGenerator::generateUniqueId(controls_, random_);
}

} // namespace shapegrid
