#pragma once

#include <vector>

namespace stepplot
{

// A coordinate pair. The same type carries data-space values (caller units)
// and device-space values (canvas units, y-up).
struct Point
{
    double x = 0.0;
    double y = 0.0;

    constexpr bool operator==(const Point&) const = default;
};

// Ordered points; order is the traversal order along the line.
using PointSequence = std::vector<Point>;
using Polyline      = std::vector<Point>;

// Axis-aligned rectangle in device space. `min` is the bottom-left corner.
struct Rect
{
    Point min;
    Point max;

    constexpr double width() const { return max.x - min.x; }
    constexpr double height() const { return max.y - min.y; }

    constexpr Point center() const { return {(min.x + max.x) / 2, (min.y + max.y) / 2}; }

    constexpr bool contains(Point p) const
    {
        return p.x >= min.x && p.x <= max.x && p.y >= min.y && p.y <= max.y;
    }

    constexpr bool operator==(const Rect&) const = default;
};

}   // namespace stepplot
