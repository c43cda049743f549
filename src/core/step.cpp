#include <stepplot/canvas.hpp>
#include <stepplot/data.hpp>
#include <stepplot/logger.hpp>
#include <stepplot/plot_context.hpp>
#include <stepplot/step.hpp>

#include "step_path.hpp"
#include "thumbnail.hpp"

namespace stepplot
{

StepSeries::StepSeries(std::span<const double> x, std::span<const double> y)
    : points_(copy_points(x, y))
{
}

StepSeries::StepSeries(std::span<const Point> points) : points_(copy_points(points)) {}

StepSeries& StepSeries::format(std::string_view spec)
{
    line_ = apply_line_spec(line_.value_or(default_line_style()), spec);
    return *this;
}

void StepSeries::draw(DrawArea& area, const PlotContext& ctx) const
{
    const PointSequence device = ctx.to_device(points_);

    STEPPLOT_LOG_TRACE("step",
                       "draw '{}': {} points, kind {}, fill {}, line {}",
                       label_,
                       device.size(),
                       step_kind_name(kind_),
                       fill_.has_value(),
                       line_.has_value());

    if (fill_.has_value() && !device.empty())
    {
        area.fill(build_fill_polygon(device, kind_, ctx.baseline()), *fill_);
    }

    if (line_.has_value())
    {
        for (const auto& path : build_stroke_segments(device, kind_, area))
            area.stroke(path, *line_);
    }
}

DataRange StepSeries::data_range() const
{
    return compute_range(points_, fill_.has_value());
}

void StepSeries::thumbnail(DrawArea& area) const
{
    const Rect& box = area.bounds();
    STEPPLOT_LOG_TRACE("step",
                       "thumbnail '{}': {}x{}",
                       label_,
                       box.width(),
                       box.height());

    if (fill_.has_value())
    {
        const Rect     r    = thumbnail_fill_rect(box, line_.has_value());
        const Polyline poly = area.clip_polygon_y(rect_polygon(r));
        area.fill_polygon(*fill_, poly);
    }

    if (line_.has_value())
    {
        const double y = thumbnail_line_y(box);
        area.stroke_line(*line_, {box.min.x, y}, {box.max.x, y});
    }
}

}   // namespace stepplot
