#include <cmath>
#include <stepplot/data.hpp>
#include <stepplot/error.hpp>
#include <stepplot/logger.hpp>
#include <string>

namespace stepplot
{

namespace
{

template <typename T>
PointSequence copy_xy(std::span<const T> x, std::span<const T> y)
{
    if (x.size() != y.size())
    {
        STEPPLOT_LOG_WARN("data", "x/y length mismatch: {} vs {}", x.size(), y.size());
        throw InvalidInput("copy_points: x has " + std::to_string(x.size()) + " values, y has "
                           + std::to_string(y.size()));
    }

    PointSequence out;
    out.reserve(x.size());
    for (size_t i = 0; i < x.size(); ++i)
        out.push_back({static_cast<double>(x[i]), static_cast<double>(y[i])});

    return copy_points(std::span<const Point>(out));
}

}   // namespace

size_t first_non_finite(std::span<const Point> points)
{
    for (size_t i = 0; i < points.size(); ++i)
    {
        if (!std::isfinite(points[i].x) || !std::isfinite(points[i].y))
            return i;
    }
    return points.size();
}

PointSequence copy_points(std::span<const Point> points)
{
    const size_t bad = first_non_finite(points);
    if (bad != points.size())
    {
        const Point& p    = points[bad];
        const char*  what = std::isnan(p.x) || std::isnan(p.y) ? "NaN" : "infinite";
        STEPPLOT_LOG_WARN("data", "rejecting {} coordinate at index {}", what, bad);
        throw InvalidInput("copy_points: " + std::string(what) + " coordinate at index "
                           + std::to_string(bad));
    }
    return PointSequence(points.begin(), points.end());
}

PointSequence copy_points(std::span<const double> x, std::span<const double> y)
{
    return copy_xy(x, y);
}

PointSequence copy_points(std::span<const float> x, std::span<const float> y)
{
    return copy_xy(x, y);
}

}   // namespace stepplot
