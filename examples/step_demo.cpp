// Draws the same data with every step kind onto a recording canvas and prints
// the resulting draw commands.

#include <cmath>
#include <cstdio>
#include <stepplot/stepplot.hpp>
#include <vector>

using namespace stepplot;

namespace
{

const char* op_name(RecordingCanvas::DrawCommand::Op op)
{
    switch (op)
    {
        case RecordingCanvas::DrawCommand::Op::Stroke:
            return "stroke";
        case RecordingCanvas::DrawCommand::Op::Fill:
            return "fill";
    }
    return "?";
}

void print_commands(const RecordingCanvas& canvas)
{
    for (const auto& cmd : canvas.commands())
    {
        std::printf("  %-6s", op_name(cmd.op));
        for (const Point& p : cmd.path.vertices())
            std::printf(" (%.1f, %.1f)", p.x, p.y);
        if (cmd.path.is_closed())
            std::printf(" close");
        std::printf("\n");
    }
}

}   // namespace

int main()
{
    Logger::instance().add_sink(sinks::console_sink());
    Logger::instance().configure_from_env();

    std::vector<double> x(8);
    std::vector<double> y(8);
    for (size_t i = 0; i < x.size(); ++i)
    {
        x[i] = static_cast<double>(i);
        y[i] = std::round(4.0 + 3.0 * std::sin(x[i] * 0.9));
    }

    const Rect plot_area = {{40, 30}, {640, 330}};
    const Rect legend    = {{660, 300}, {700, 312}};

    for (StepKind kind : {StepKind::Pre, StepKind::Mid, StepKind::Post})
    {
        StepSeries series(x, y);
        series.label(step_kind_name(kind))
            .step_kind(kind)
            .fill_color(rgba(0.2f, 0.6f, 1.0f, 0.3f))
            .format("b-");

        auto ctx = PlotContext::fit(series.data_range(), plot_area);

        RecordingCanvas canvas;
        DrawArea        area(canvas, plot_area);
        series.draw(area, ctx);

        DrawArea icon = area.sub_area(legend);
        series.thumbnail(icon);

        std::printf("%s: %zu fills, %zu strokes\n",
                    series.label().c_str(),
                    canvas.fill_count(),
                    canvas.stroke_count());
        print_commands(canvas);
    }

    return 0;
}
