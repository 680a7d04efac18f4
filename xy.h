// X/Y coordinate pairs and screen rectangles.

#pragma once

#include <algorithm>
#include <cstdint>

namespace snapmcp {

// Convenience struct for coordinate pairs.
template <typename T>
struct XY {
    T x = {}, y = {};

    template <typename U> XY<U> as() const { return XY<U>(x, y); }
    operator bool() const { return x || y; }
    bool operator==(XY const&) const = default;

    XY operator+(XY const other) const { return {x + other.x, y + other.y}; }
    XY operator-(XY const other) const { return {x - other.x, y - other.y}; }
};

// Pixel rectangle, origin at top left; sizes are never negative.
struct Region {
    XY<int64_t> origin;
    XY<int64_t> size;
    bool operator==(Region const&) const = default;

    // True if nonempty and entirely inside a (0,0)-based area of this size.
    bool fits_within(XY<int64_t> const area) const {
        return size.x > 0 && size.y > 0 && origin.x >= 0 && origin.y >= 0 &&
            origin.x + size.x <= area.x && origin.y + size.y <= area.y;
    }

    // The part inside a (0,0)-based area of this size; empty if none.
    Region clipped_to(XY<int64_t> const area) const {
        XY<int64_t> const lo = {
            std::max<int64_t>(origin.x, 0), std::max<int64_t>(origin.y, 0)
        };
        XY<int64_t> const hi = {
            std::min(origin.x + size.x, area.x),
            std::min(origin.y + size.y, area.y)
        };
        if (hi.x <= lo.x || hi.y <= lo.y) return {lo, {0, 0}};
        return {lo, hi - lo};
    }
};

}  // namespace snapmcp
