#include "clip.hpp"

#include <cmath>

namespace stepplot
{

namespace
{

bool is_finite(Point p)
{
    return std::isfinite(p.x) && std::isfinite(p.y);
}

// Appends a polygon vertex unless it repeats the previous one or is not finite.
void append_vertex(Polyline& run, Point p)
{
    if (!is_finite(p))
        return;
    if (!run.empty() && run.back() == p)
        return;
    run.push_back(p);
}

}   // namespace

bool inside(Point p, ClipEdge edge, const Rect& rect)
{
    switch (edge)
    {
        case ClipEdge::Left:
            return p.x >= rect.min.x;
        case ClipEdge::Right:
            return p.x <= rect.max.x;
        case ClipEdge::Bottom:
            return p.y >= rect.min.y;
        case ClipEdge::Top:
            return p.y <= rect.max.y;
    }
    return false;
}

Point intersect(Point a, Point b, ClipEdge edge, const Rect& rect)
{
    switch (edge)
    {
        case ClipEdge::Left:
        case ClipEdge::Right:
        {
            const double x = edge == ClipEdge::Left ? rect.min.x : rect.max.x;
            const double t = (x - a.x) / (b.x - a.x);
            return {x, a.y + t * (b.y - a.y)};
        }
        case ClipEdge::Bottom:
        case ClipEdge::Top:
        {
            const double y = edge == ClipEdge::Bottom ? rect.min.y : rect.max.y;
            const double t = (y - a.y) / (b.y - a.y);
            return {a.x + t * (b.x - a.x), y};
        }
    }
    return a;
}

std::vector<Polyline> clip_line(std::span<const Point> line, ClipEdge edge, const Rect& rect)
{
    std::vector<Polyline> out;

    if (line.size() == 1)
    {
        if (inside(line.front(), edge, rect))
            out.push_back({line.front()});
        return out;
    }

    Polyline run;
    for (size_t i = 1; i < line.size(); ++i)
    {
        const Point cur     = line[i - 1];
        const Point next    = line[i];
        const bool  cur_in  = inside(cur, edge, rect);
        const bool  next_in = inside(next, edge, rect);

        if (cur_in && next_in)
        {
            run.push_back(cur);
        }
        else if (cur_in && !next_in)
        {
            // Leaving: close the current run on the boundary.
            run.push_back(cur);
            const Point crossing = intersect(cur, next, edge, rect);
            if (is_finite(crossing) && crossing != cur)
                run.push_back(crossing);
            out.push_back(std::move(run));
            run.clear();
        }
        else if (!cur_in && next_in)
        {
            // Entering: start a new run on the boundary.
            const Point entry = intersect(cur, next, edge, rect);
            if (is_finite(entry) && entry != next)
                run.push_back(entry);
        }

        if (next_in && i == line.size() - 1)
            run.push_back(next);
    }

    if (!run.empty())
        out.push_back(std::move(run));
    return out;
}

std::vector<Polyline> clip_lines(std::span<const Point>    line,
                                 std::span<const ClipEdge> edges,
                                 const Rect&               rect)
{
    std::vector<Polyline> current;
    current.emplace_back(line.begin(), line.end());

    for (ClipEdge edge : edges)
    {
        std::vector<Polyline> next;
        for (const auto& l : current)
        {
            auto pieces = clip_line(l, edge, rect);
            for (auto& p : pieces)
                next.push_back(std::move(p));
        }
        current = std::move(next);
    }

    return current;
}

Polyline clip_polygon(std::span<const Point> polygon, ClipEdge edge, const Rect& rect)
{
    Polyline out;
    for (size_t i = 0; i < polygon.size(); ++i)
    {
        const Point cur     = polygon[i];
        const Point next    = polygon[(i + 1) % polygon.size()];
        const bool  cur_in  = inside(cur, edge, rect);
        const bool  next_in = inside(next, edge, rect);

        if (cur_in && next_in)
        {
            append_vertex(out, cur);
        }
        else if (cur_in && !next_in)
        {
            append_vertex(out, cur);
            append_vertex(out, intersect(cur, next, edge, rect));
        }
        else if (!cur_in && next_in)
        {
            append_vertex(out, intersect(cur, next, edge, rect));
        }
    }

    // The wrap-around edge can repeat the first vertex.
    if (out.size() > 1 && out.front() == out.back())
        out.pop_back();
    return out;
}

Polyline clip_polygon(std::span<const Point>    polygon,
                      std::span<const ClipEdge> edges,
                      const Rect&               rect)
{
    Polyline current(polygon.begin(), polygon.end());
    for (ClipEdge edge : edges)
        current = clip_polygon(current, edge, rect);
    return current;
}

}   // namespace stepplot
