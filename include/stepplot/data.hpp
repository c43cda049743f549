#pragma once

#include <span>
#include <stepplot/geometry.hpp>

namespace stepplot
{

// Copy caller data into a PointSequence.
// Throws InvalidInput if the lengths differ or a coordinate is NaN or infinite.
PointSequence copy_points(std::span<const double> x, std::span<const double> y);
PointSequence copy_points(std::span<const float> x, std::span<const float> y);
PointSequence copy_points(std::span<const Point> points);

// Returns the index of the first point with a non-finite coordinate, or
// points.size() if all are finite.
size_t first_non_finite(std::span<const Point> points);

}   // namespace stepplot
