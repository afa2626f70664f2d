#pragma once

#include <string>

namespace shapegrid {

// Single selection held by ID. Owners resolve it against the live
// control map on every use, so a deleted control reads as "nothing selected".
class SelectionManager {
public:
    SelectionManager() = default;

    void select(const std::string& id) { selectedId_ = id; }

    void clear() { selectedId_.clear(); }

    // Drop the selection if it names `id`
    void forget(const std::string& id)
    {
        if (selectedId_ == id)
            selectedId_.clear();
    }

    bool isSelected(const std::string& id) const { return !id.empty() && selectedId_ == id; }
    bool isEmpty() const { return selectedId_.empty(); }

    const std::string& getSelectedId() const { return selectedId_; }

private:
    std::string selectedId_;
};

} // namespace shapegrid
