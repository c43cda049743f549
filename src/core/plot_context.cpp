#include <stepplot/plot_context.hpp>
#include <utility>

#include "transform.hpp"

namespace stepplot
{

PlotContext::PlotContext(AxisLimits x_limits,
                         AxisLimits y_limits,
                         Transform  to_x,
                         Transform  to_y)
    : x_limits_(x_limits), y_limits_(y_limits), to_x_(std::move(to_x)), to_y_(std::move(to_y))
{
}

PlotContext PlotContext::linear(AxisLimits x_limits, AxisLimits y_limits, const Rect& area)
{
    return PlotContext(
        x_limits,
        y_limits,
        [x_limits, area](double x) { return data_to_device_x(x, x_limits, area); },
        [y_limits, area](double y) { return data_to_device_y(y, y_limits, area); });
}

PlotContext PlotContext::fit(const DataRange& range, const Rect& area)
{
    if (range.empty())
        return linear(AxisLimits{}, AxisLimits{}, area);
    return linear({range.x_min, range.x_max}, {range.y_min, range.y_max}, area);
}

PointSequence PlotContext::to_device(std::span<const Point> points) const
{
    PointSequence out;
    out.reserve(points.size());
    for (const auto& p : points)
        out.push_back(to_device(p));
    return out;
}

}   // namespace stepplot
