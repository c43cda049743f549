#include <algorithm>
#include <stepplot/canvas.hpp>
#include <stepplot/logger.hpp>

#include "clip.hpp"

namespace stepplot
{

// --- RecordingCanvas ---

void RecordingCanvas::stroke(const Path& path, const LineStyle& style)
{
    DrawCommand cmd;
    cmd.op    = DrawCommand::Op::Stroke;
    cmd.path  = path;
    cmd.line  = style;
    cmd.color = style.color;
    commands_.push_back(std::move(cmd));
}

void RecordingCanvas::fill(const Path& path, const Color& color)
{
    DrawCommand cmd;
    cmd.op    = DrawCommand::Op::Fill;
    cmd.path  = path;
    cmd.color = color;
    commands_.push_back(std::move(cmd));
}

size_t RecordingCanvas::stroke_count() const
{
    return static_cast<size_t>(
        std::count_if(commands_.begin(),
                      commands_.end(),
                      [](const DrawCommand& c) { return c.op == DrawCommand::Op::Stroke; }));
}

size_t RecordingCanvas::fill_count() const
{
    return static_cast<size_t>(
        std::count_if(commands_.begin(),
                      commands_.end(),
                      [](const DrawCommand& c) { return c.op == DrawCommand::Op::Fill; }));
}

// --- DrawArea ---

std::vector<Polyline> DrawArea::clip_lines_x(std::span<const Point> line) const
{
    return clip_lines(line, CLIP_EDGES_X, bounds_);
}

std::vector<Polyline> DrawArea::clip_lines_y(std::span<const Point> line) const
{
    return clip_lines(line, CLIP_EDGES_Y, bounds_);
}

std::vector<Polyline> DrawArea::clip_lines_xy(std::span<const Point> line) const
{
    auto out = clip_lines(line, CLIP_EDGES_XY, bounds_);
    STEPPLOT_LOG_TRACE("clip",
                       "polyline of {} points split into {} fragments",
                       line.size(),
                       out.size());
    return out;
}

Polyline DrawArea::clip_polygon_x(std::span<const Point> polygon) const
{
    return clip_polygon(polygon, CLIP_EDGES_X, bounds_);
}

Polyline DrawArea::clip_polygon_y(std::span<const Point> polygon) const
{
    return clip_polygon(polygon, CLIP_EDGES_Y, bounds_);
}

Polyline DrawArea::clip_polygon_xy(std::span<const Point> polygon) const
{
    return clip_polygon(polygon, CLIP_EDGES_XY, bounds_);
}

void DrawArea::stroke(const Path& path, const LineStyle& style) const
{
    canvas_->stroke(path, style);
}

void DrawArea::fill(const Path& path, const Color& color) const
{
    canvas_->fill(path, color);
}

void DrawArea::fill_polygon(const Color& color, std::span<const Point> polygon) const
{
    if (polygon.size() < 3)
        return;

    Path path;
    path.move_to(polygon.front());
    for (const Point& p : polygon.subspan(1))
        path.line_to(p);
    path.close();
    canvas_->fill(path, color);
}

void DrawArea::stroke_line(const LineStyle& style, Point from, Point to) const
{
    Path path;
    path.move_to(from);
    path.line_to(to);
    canvas_->stroke(path, style);
}

}   // namespace stepplot
