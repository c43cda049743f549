// Eigen integration demo: build step series straight from Eigen vectors.
// Build with: cmake -DSTEPPLOT_USE_EIGEN=ON ..

#include <eigen3/Eigen/Core>
#include <cmath>
#include <cstdio>
#include <stepplot/canvas.hpp>
#include <stepplot/eigen.hpp>
#include <stepplot/plot_context.hpp>

int main()
{
    // Generate data using Eigen
    const int       N = 40;
    Eigen::VectorXf x = Eigen::VectorXf::LinSpaced(N, 0.0f, 4.0f * static_cast<float>(M_PI));
    Eigen::VectorXf y = x.array().sin().round();

    auto series = stepplot::make_step_series(x, y);
    series.label("round(sin(x))")
        .step_kind(stepplot::StepKind::Mid)
        .fill_color(stepplot::colors::light_gray)
        .format("r--");

    const stepplot::Rect plot_area = {{0, 0}, {800, 200}};

    stepplot::RecordingCanvas canvas;
    stepplot::DrawArea        area(canvas, plot_area);
    series.draw(area, stepplot::PlotContext::fit(series.data_range(), plot_area));

    const auto range = series.data_range();
    std::printf("%s: x [%g, %g], y [%g, %g], %zu fills, %zu strokes\n",
                series.label().c_str(),
                range.x_min,
                range.x_max,
                range.y_min,
                range.y_max,
                canvas.fill_count(),
                canvas.stroke_count());
    return 0;
}
