#pragma once

#include <algorithm>
#include <cstdint>
#include <vector>

namespace shapegrid {

// ============================================================
// FrameBuffer — off-screen grid frame, one level (0-15) per cell
// Origin is top-left, same as the device's key coordinates.
// ============================================================
class FrameBuffer {
public:
    static constexpr int MaxLevel = 15;

    explicit FrameBuffer(int width = 0, int height = 0) { resize(width, height); }

    void resize(int width, int height)
    {
        width_ = std::max(0, width);
        height_ = std::max(0, height);
        levels_.assign((size_t)(width_ * height_), 0);
    }

    void clear() { std::fill(levels_.begin(), levels_.end(), (uint8_t)0); }

    // Out-of-range cells are ignored, out-of-range levels are clamped
    void setLevel(int x, int y, int level)
    {
        if (!contains(x, y)) return;
        levels_[(size_t)(y * width_ + x)] = (uint8_t)std::max(0, std::min(MaxLevel, level));
    }

    int getLevel(int x, int y) const
    {
        if (!contains(x, y)) return 0;
        return levels_[(size_t)(y * width_ + x)];
    }

    bool contains(int x, int y) const { return x >= 0 && x < width_ && y >= 0 && y < height_; }

    int getWidth() const { return width_; }
    int getHeight() const { return height_; }

    bool isDark() const
    {
        return std::all_of(levels_.begin(), levels_.end(), [](uint8_t l) { return l == 0; });
    }

    bool operator==(const FrameBuffer& o) const
    {
        return width_ == o.width_ && height_ == o.height_ && levels_ == o.levels_;
    }
    bool operator!=(const FrameBuffer& o) const { return !(*this == o); }

private:
    int width_ = 0, height_ = 0;
    std::vector<uint8_t> levels_;  // row-major [y][x]
};

} // namespace shapegrid
