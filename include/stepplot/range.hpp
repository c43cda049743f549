#pragma once

#include <limits>
#include <span>
#include <stepplot/geometry.hpp>

namespace stepplot
{

struct DataRange
{
    double x_min = std::numeric_limits<double>::infinity();
    double x_max = -std::numeric_limits<double>::infinity();
    double y_min = std::numeric_limits<double>::infinity();
    double y_max = -std::numeric_limits<double>::infinity();

    // True when no point has been accumulated.
    bool empty() const { return x_min > x_max || y_min > y_max; }

    bool operator==(const DataRange&) const = default;
};

// Tight bounding box of `points`. An empty span gives an empty range
// ({+inf, -inf, +inf, -inf}).
DataRange xy_range(std::span<const Point> points);

// Bounding box widened to include y = 0 when a fill is drawn, so the fill
// baseline is always inside the plotted range.
DataRange compute_range(std::span<const Point> points, bool fill_enabled);

}   // namespace stepplot
