#include "transform.hpp"

namespace stepplot
{

double data_to_unit(double value, AxisLimits limits)
{
    double range = limits.max - limits.min;

    // Avoid division by zero
    if (range == 0.0)
        range = 1.0;

    return (value - limits.min) / range;
}

double unit_to_device(double unit, double lo, double hi)
{
    return lo + unit * (hi - lo);
}

double data_to_device_x(double data_x, AxisLimits limits, const Rect& area)
{
    return unit_to_device(data_to_unit(data_x, limits), area.min.x, area.max.x);
}

double data_to_device_y(double data_y, AxisLimits limits, const Rect& area)
{
    return unit_to_device(data_to_unit(data_y, limits), area.min.y, area.max.y);
}

Point data_to_device(Point data, AxisLimits x_limits, AxisLimits y_limits, const Rect& area)
{
    return {data_to_device_x(data.x, x_limits, area), data_to_device_y(data.y, y_limits, area)};
}

}   // namespace stepplot
