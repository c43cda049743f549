#include "step_path.hpp"

#include <stepplot/logger.hpp>

namespace stepplot
{

namespace
{

double midpoint(double a, double b)
{
    return (a + b) / 2;
}

// Vertices between prev and pt, excluding both.
void append_step(Path& path, Point prev, Point pt, StepKind kind)
{
    switch (kind)
    {
        case StepKind::Pre:
            path.line_to({prev.x, pt.y});
            break;
        case StepKind::Mid:
        {
            const double mx = midpoint(prev.x, pt.x);
            path.line_to({mx, prev.y});
            path.line_to({mx, pt.y});
            break;
        }
        case StepKind::Post:
            path.line_to({pt.x, prev.y});
            break;
    }
}

}   // namespace

Path build_fill_polygon(std::span<const Point> points, StepKind kind, double min_y)
{
    Path path;
    if (points.empty())
        return path;

    path.move_to({points.front().x, min_y});
    if (kind != StepKind::Pre)
        path.line_to(points.front());

    const size_t last = points.size() - 1;
    Point        prev = points.front();
    for (size_t i = 1; i < points.size(); ++i)
    {
        const Point pt = points[i];
        switch (kind)
        {
            case StepKind::Pre:
            case StepKind::Mid:
                append_step(path, prev, pt, kind);
                path.line_to(pt);
                break;
            case StepKind::Post:
                append_step(path, prev, pt, kind);
                if (i != last)
                    path.line_to(pt);
                break;
        }
        prev = pt;
    }

    path.line_to({points.back().x, min_y});
    path.close();
    return path;
}

Path build_stroke_path(std::span<const Point> points, StepKind kind)
{
    Path path;
    if (points.size() < 2)
        return path;

    Point prev = points.front();
    path.move_to(prev);
    for (const Point& pt : points.subspan(1))
    {
        append_step(path, prev, pt, kind);
        path.line_to(pt);
        prev = pt;
    }
    return path;
}

std::vector<Path> build_stroke_segments(std::span<const Point> points,
                                        StepKind               kind,
                                        const DrawArea&        area)
{
    const auto fragments = area.clip_lines_xy(points);

    std::vector<Path> paths;
    paths.reserve(fragments.size());
    for (const auto& fragment : fragments)
    {
        if (fragment.size() < 2)
            continue;
        paths.push_back(build_stroke_path(fragment, kind));
    }

    STEPPLOT_LOG_TRACE("step",
                       "{} points clipped to {} fragments, {} stroked",
                       points.size(),
                       fragments.size(),
                       paths.size());
    return paths;
}

}   // namespace stepplot
