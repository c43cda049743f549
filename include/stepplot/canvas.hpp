#pragma once

#include <span>
#include <stepplot/color.hpp>
#include <stepplot/fwd.hpp>
#include <stepplot/geometry.hpp>
#include <stepplot/line_style.hpp>
#include <stepplot/path.hpp>
#include <vector>

namespace stepplot
{

// ─── Canvas ──────────────────────────────────────────────────────────────────
// Drawing backend. Implementations rasterize or serialize the paths they are
// given; stepplot only builds geometry.

class Canvas
{
   public:
    virtual ~Canvas() = default;

    virtual void stroke(const Path& path, const LineStyle& style) = 0;
    virtual void fill(const Path& path, const Color& color)       = 0;
};

// Keeps every command it receives, in call order. Used for headless
// rendering and in tests.
class RecordingCanvas : public Canvas
{
   public:
    struct DrawCommand
    {
        enum class Op : unsigned char
        {
            Stroke,
            Fill,
        };

        Op        op = Op::Stroke;
        Path      path;
        LineStyle line;    // Stroke only
        Color     color;   // Fill color, or the line color for Stroke
    };

    void stroke(const Path& path, const LineStyle& style) override;
    void fill(const Path& path, const Color& color) override;

    const std::vector<DrawCommand>& commands() const { return commands_; }
    size_t                          stroke_count() const;
    size_t                          fill_count() const;
    void                            clear() { commands_.clear(); }

   private:
    std::vector<DrawCommand> commands_;
};

// ─── DrawArea ────────────────────────────────────────────────────────────────
// A Canvas restricted to a rectangle. Owns the rectangle clipping primitives
// used by plotters. Does not own the Canvas.

class DrawArea
{
   public:
    DrawArea(Canvas& canvas, const Rect& bounds) : canvas_(&canvas), bounds_(bounds) {}

    Canvas&     canvas() const { return *canvas_; }
    const Rect& bounds() const { return bounds_; }
    Point       center() const { return bounds_.center(); }
    bool        contains(Point p) const { return bounds_.contains(p); }

    // A new area on the same canvas.
    DrawArea sub_area(const Rect& bounds) const { return DrawArea(*canvas_, bounds); }

    // Split a polyline into the fragments that lie within the bounds.
    // Every exit and re-entry starts a new fragment; crossing points lie
    // exactly on the boundary.
    std::vector<Polyline> clip_lines_x(std::span<const Point> line) const;
    std::vector<Polyline> clip_lines_y(std::span<const Point> line) const;
    std::vector<Polyline> clip_lines_xy(std::span<const Point> line) const;

    // Clip a closed polygon to the bounds.
    Polyline clip_polygon_x(std::span<const Point> polygon) const;
    Polyline clip_polygon_y(std::span<const Point> polygon) const;
    Polyline clip_polygon_xy(std::span<const Point> polygon) const;

    void stroke(const Path& path, const LineStyle& style) const;
    void fill(const Path& path, const Color& color) const;

    // Fills the polygon. Does nothing for fewer than three vertices.
    void fill_polygon(const Color& color, std::span<const Point> polygon) const;

    void stroke_line(const LineStyle& style, Point from, Point to) const;

   private:
    Canvas* canvas_;
    Rect    bounds_;
};

}   // namespace stepplot
