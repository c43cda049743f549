#include <algorithm>
#include <stepplot/range.hpp>

namespace stepplot
{

DataRange xy_range(std::span<const Point> points)
{
    DataRange r;
    for (const auto& p : points)
    {
        r.x_min = std::min(r.x_min, p.x);
        r.x_max = std::max(r.x_max, p.x);
        r.y_min = std::min(r.y_min, p.y);
        r.y_max = std::max(r.y_max, p.y);
    }
    return r;
}

DataRange compute_range(std::span<const Point> points, bool fill_enabled)
{
    DataRange r = xy_range(points);
    if (fill_enabled)
    {
        r.y_min = std::min(r.y_min, 0.0);
        r.y_max = std::max(r.y_max, 0.0);
    }
    return r;
}

}   // namespace stepplot
