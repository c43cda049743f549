#pragma once

#include <stepplot/geometry.hpp>
#include <stepplot/plot_context.hpp>

namespace stepplot
{

// Linear data → device mapping used by PlotContext::linear().
// The pipeline is: data → normalized [0, 1] → device units inside `area`.

// Map a data value to [0, 1] given axis limits. Values outside the limits
// map outside [0, 1]. A zero-width range is treated as a range of 1.
double data_to_unit(double value, AxisLimits limits);

// Map a normalized value onto [lo, hi].
double unit_to_device(double unit, double lo, double hi);

// Convenience: data → device in one step, per axis.
double data_to_device_x(double data_x, AxisLimits limits, const Rect& area);
double data_to_device_y(double data_y, AxisLimits limits, const Rect& area);

// Convenience: both axes.
Point data_to_device(Point data, AxisLimits x_limits, AxisLimits y_limits, const Rect& area);

}   // namespace stepplot
