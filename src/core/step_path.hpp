#pragma once

#include <span>
#include <stepplot/canvas.hpp>
#include <stepplot/geometry.hpp>
#include <stepplot/path.hpp>
#include <stepplot/step.hpp>
#include <vector>

namespace stepplot
{

// Step geometry in device space. All functions are pure: identical inputs
// give identical paths, and the input points are never modified.

// Closed outline of the area between the step line and the horizontal line
// y = min_y. Starts and ends on min_y.
//
// For Pre the riser from (x0, min_y) to points[0] is not emitted on its own;
// the first Pre step rises straight from the baseline to (x0, points[1].y).
// For Post the final riser to the last point is not emitted; the outline
// drops from (x_last, y_prev) to the baseline.
//
// Empty input gives an empty path. A single point gives a zero-area path.
Path build_fill_polygon(std::span<const Point> points, StepKind kind, double min_y);

// Open stepped polyline through `points`. Fewer than two points give an
// empty path.
Path build_stroke_path(std::span<const Point> points, StepKind kind);

// Clips `points` to the area bounds and returns one stroke path per visible
// fragment, in order. Fragments with a single point are dropped.
std::vector<Path> build_stroke_segments(std::span<const Point> points,
                                        StepKind               kind,
                                        const DrawArea&        area);

}   // namespace stepplot
