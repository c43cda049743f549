#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <stepplot/color.hpp>
#include <stepplot/geometry.hpp>
#include <stepplot/line_style.hpp>
#include <stepplot/plotter.hpp>
#include <string>
#include <string_view>

namespace stepplot
{

// ─── Step Kinds ──────────────────────────────────────────────────────────────
// Where the vertical transition between two consecutive points happens.

enum class StepKind : uint8_t
{
    Pre,    // vertical at the left point, then horizontal
    Mid,    // horizontal, vertical halfway between the points, horizontal
    Post,   // horizontal, then vertical at the right point
};

constexpr const char* step_kind_name(StepKind k)
{
    switch (k)
    {
        case StepKind::Pre:
            return "pre";
        case StepKind::Mid:
            return "mid";
        case StepKind::Post:
            return "post";
    }
    return "unknown";
}

constexpr std::optional<StepKind> parse_step_kind(std::string_view name)
{
    if (name == "pre")
        return StepKind::Pre;
    if (name == "mid")
        return StepKind::Mid;
    if (name == "post")
        return StepKind::Post;
    return std::nullopt;
}

// ─── StepSeries ──────────────────────────────────────────────────────────────
// A stepped line with an optional fill down to the axis baseline.
// Drawing is const and allocates its device-space buffers per call, so the
// same series can be drawn onto several canvases concurrently.

class StepSeries : public Plotter
{
   public:
    // Copies the data. Throws InvalidInput on mismatched lengths or
    // non-finite values.
    StepSeries(std::span<const double> x, std::span<const double> y);
    explicit StepSeries(std::span<const Point> points);

    StepSeries& label(const std::string& lbl)
    {
        label_ = lbl;
        return *this;
    }
    StepSeries& step_kind(StepKind k)
    {
        kind_ = k;
        return *this;
    }
    StepSeries& line_style(std::optional<LineStyle> s)
    {
        line_ = std::move(s);
        return *this;
    }
    StepSeries& no_line()
    {
        line_.reset();
        return *this;
    }
    StepSeries& fill_color(std::optional<Color> c)
    {
        fill_ = c;
        return *this;
    }
    StepSeries& no_fill()
    {
        fill_.reset();
        return *this;
    }

    // Apply a MATLAB-style line spec (e.g. "r--"). See parse_line_spec().
    StepSeries& format(std::string_view spec);

    const std::string&              label() const { return label_; }
    StepKind                        step_kind() const { return kind_; }
    const std::optional<LineStyle>& line_style() const { return line_; }
    const std::optional<Color>&     fill_color() const { return fill_; }

    std::span<const Point> points() const { return points_; }
    size_t                 point_count() const { return points_.size(); }

    void      draw(DrawArea& area, const PlotContext& ctx) const override;
    DataRange data_range() const override;
    void      thumbnail(DrawArea& area) const override;

   private:
    PointSequence            points_;
    std::string              label_;
    StepKind                 kind_ = StepKind::Pre;
    std::optional<LineStyle> line_ = default_line_style();
    std::optional<Color>     fill_;
};

}   // namespace stepplot
