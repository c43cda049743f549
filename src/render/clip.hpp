#pragma once

#include <span>
#include <stepplot/geometry.hpp>
#include <vector>

namespace stepplot
{

// Rectangle clipping in device space, one half-plane at a time.

enum class ClipEdge : unsigned char
{
    Left,     // keep x >= rect.min.x
    Right,    // keep x <= rect.max.x
    Bottom,   // keep y >= rect.min.y
    Top,      // keep y <= rect.max.y
};

// Points on the edge count as inside. NaN coordinates are never inside.
bool inside(Point p, ClipEdge edge, const Rect& rect);

// Crossing of segment a→b with the edge line. The clipped coordinate is
// exactly the edge value.
Point intersect(Point a, Point b, ClipEdge edge, const Rect& rect);

// Splits a polyline into the runs that lie inside the half-plane.
std::vector<Polyline> clip_line(std::span<const Point> line, ClipEdge edge, const Rect& rect);

// Applies `edges` in order, splitting further on each pass.
std::vector<Polyline> clip_lines(std::span<const Point>   line,
                                 std::span<const ClipEdge> edges,
                                 const Rect&               rect);

// Sutherland–Hodgman against one edge. The polygon is implicitly closed.
Polyline clip_polygon(std::span<const Point> polygon, ClipEdge edge, const Rect& rect);

Polyline clip_polygon(std::span<const Point>   polygon,
                      std::span<const ClipEdge> edges,
                      const Rect&               rect);

inline constexpr ClipEdge CLIP_EDGES_X[]  = {ClipEdge::Left, ClipEdge::Right};
inline constexpr ClipEdge CLIP_EDGES_Y[]  = {ClipEdge::Bottom, ClipEdge::Top};
inline constexpr ClipEdge CLIP_EDGES_XY[] = {ClipEdge::Left,
                                             ClipEdge::Right,
                                             ClipEdge::Bottom,
                                             ClipEdge::Top};

}   // namespace stepplot
