#pragma once

#include <stepplot/geometry.hpp>

namespace stepplot
{

// Legend icon geometry for step series. Independent of the plotted data.

// Area to fill: the whole box, or its lower half when a line is drawn too.
Rect thumbnail_fill_rect(const Rect& box, bool has_line);

// Height of the horizontal legend line.
double thumbnail_line_y(const Rect& box);

// Corners of `r`, counter-clockwise from the bottom-left.
Polyline rect_polygon(const Rect& r);

}   // namespace stepplot
