#pragma once

#include "../Model/Control.h"
#include <optional>
#include <string>

namespace shapegrid {

// Single-slot clipboard holding a deep copy of one control
class Clipboard {
public:
    Clipboard() = default;

    void copy(const Control& control) { buffer_ = control; }

    void clear() { buffer_.reset(); }

    bool hasContent() const { return buffer_.has_value(); }

    const Control* get() const { return buffer_ ? &*buffer_ : nullptr; }

    // Duplicate under `newId`, translated so the first point lands on `target`
    std::optional<Control> makePaste(GridPoint target, std::string newId) const
    {
        if (!buffer_ || buffer_->getShape().points.empty()) return std::nullopt;

        auto& shape = buffer_->getShape();
        int dx = target.x - shape.points[0].x;
        int dy = target.y - shape.points[0].y;
        return buffer_->duplicate(std::move(newId), Geometry::translated(shape, dx, dy));
    }

private:
    std::optional<Control> buffer_;
};

} // namespace shapegrid
