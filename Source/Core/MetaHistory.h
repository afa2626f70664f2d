#pragma once

#include "../Model/Shape.h"
#include <array>
#include <optional>

namespace shapegrid {

// Last few meta-mode key-downs, newest last
class MetaHistory {
public:
    static constexpr int Capacity = 5;

    void push(GridPoint p)
    {
        entries_[(size_t)head_] = p;
        head_ = (head_ + 1) % Capacity;
        if (count_ < Capacity) ++count_;
    }

    // 0 = newest
    std::optional<GridPoint> recent(int back) const
    {
        if (back < 0 || back >= count_) return std::nullopt;
        int idx = (head_ - 1 - back + Capacity * 2) % Capacity;
        return entries_[(size_t)idx];
    }

    std::optional<GridPoint> latest() const { return recent(0); }
    std::optional<GridPoint> previous() const { return recent(1); }

    int size() const { return count_; }
    bool isEmpty() const { return count_ == 0; }

    void clear()
    {
        head_ = 0;
        count_ = 0;
    }

private:
    std::array<GridPoint, Capacity> entries_ {};
    int head_ = 0;
    int count_ = 0;
};

} // namespace shapegrid
