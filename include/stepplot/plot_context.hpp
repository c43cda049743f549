#pragma once

#include <functional>
#include <span>
#include <stepplot/geometry.hpp>
#include <stepplot/range.hpp>

namespace stepplot
{

struct AxisLimits
{
    double min = 0.0;
    double max = 1.0;
};

// Per-draw-call coordinate mapping from data space to device space.
// Supplied by the surrounding plot framework.
class PlotContext
{
   public:
    using Transform = std::function<double(double)>;

    PlotContext(AxisLimits x_limits, AxisLimits y_limits, Transform to_x, Transform to_y);

    // Linear mapping of the axis limits onto `area`.
    static PlotContext linear(AxisLimits x_limits, AxisLimits y_limits, const Rect& area);

    // Linear mapping using a data range as the axis limits.
    static PlotContext fit(const DataRange& range, const Rect& area);

    double to_device_x(double x) const { return to_x_(x); }
    double to_device_y(double y) const { return to_y_(y); }
    Point  to_device(Point p) const { return {to_x_(p.x), to_y_(p.y)}; }

    // Always a fresh buffer; the input is left untouched.
    PointSequence to_device(std::span<const Point> points) const;

    // Device y of the y-axis minimum. The fill polygon is closed against it.
    double baseline() const { return to_y_(y_limits_.min); }

    const AxisLimits& x_limits() const { return x_limits_; }
    const AxisLimits& y_limits() const { return y_limits_; }

   private:
    AxisLimits x_limits_;
    AxisLimits y_limits_;
    Transform  to_x_;
    Transform  to_y_;
};

}   // namespace stepplot
