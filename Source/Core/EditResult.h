#pragma once

namespace shapegrid {

// Outcome of one edit attempt. Rejections leave the editor unchanged.
enum class EditResult {
    None,
    Created,
    Touched,
    Selected,
    Copied,
    Deleted,
    Pasted,
    Adjusted,
    Cycled,
    RejectedOverlap,
    RejectedBottomRow,
    RejectedOffGrid,
    RejectedDegenerate,
    RejectedPointCount
};

inline bool isRejection(EditResult r)
{
    switch (r) {
        case EditResult::RejectedOverlap:
        case EditResult::RejectedBottomRow:
        case EditResult::RejectedOffGrid:
        case EditResult::RejectedDegenerate:
        case EditResult::RejectedPointCount:
            return true;
        default:
            return false;
    }
}

inline const char* editResultToString(EditResult r)
{
    switch (r) {
        case EditResult::None:               return "none";
        case EditResult::Created:            return "created";
        case EditResult::Touched:            return "touched";
        case EditResult::Selected:           return "selected";
        case EditResult::Copied:             return "copied";
        case EditResult::Deleted:            return "deleted";
        case EditResult::Pasted:             return "pasted";
        case EditResult::Adjusted:           return "adjusted";
        case EditResult::Cycled:             return "cycled";
        case EditResult::RejectedOverlap:    return "overlaps an existing control";
        case EditResult::RejectedBottomRow:  return "touches the reserved bottom row";
        case EditResult::RejectedOffGrid:    return "lies outside the grid";
        case EditResult::RejectedDegenerate: return "is degenerate";
        case EditResult::RejectedPointCount: return "has an unsupported point count";
    }
    return "none";
}

} // namespace shapegrid
