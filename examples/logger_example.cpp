#include <chrono>
#include <stepplot/canvas.hpp>
#include <stepplot/error.hpp>
#include <stepplot/logger.hpp>
#include <stepplot/plot_context.hpp>
#include <stepplot/step.hpp>
#include <thread>
#include <vector>

using namespace stepplot;

int main()
{
    // Initialize logger with console output
    Logger::instance().set_level(LogLevel::Trace);
    Logger::instance().add_sink(sinks::console_sink());

    // Also log to file
    Logger::instance().add_sink(sinks::file_sink("stepplot_example.log"));

    // STEPPLOT_LOG_LEVEL overrides the level set above
    Logger::instance().configure_from_env();

    STEPPLOT_LOG_INFO("example", "Logger example starting up");

    // Drawing logs clipping and path construction at trace level
    std::vector<Point> pts = {{0, 1}, {1, 3}, {2, 12}, {3, 2}};
    StepSeries         series(pts);
    series.label("clipped").step_kind(StepKind::Post);

    RecordingCanvas canvas;
    DrawArea        area(canvas, {{0, 0}, {100, 100}});
    series.draw(area, PlotContext::linear({0, 3}, {0, 10}, area.bounds()));

    // Rejected input is logged as a warning before the exception propagates
    try
    {
        std::vector<double> x = {0, 1, 2};
        std::vector<double> y = {0, 1};
        StepSeries          bad(x, y);
    }
    catch (const InvalidInput& e)
    {
        STEPPLOT_LOG_ERROR("example", "construction failed: {}", e.what());
    }

    // Test thread safety
    auto worker = [&series](int id)
    {
        for (int i = 0; i < 5; ++i)
        {
            RecordingCanvas local;
            DrawArea        local_area(local, {{0, 0}, {50, 50}});
            series.draw(local_area, PlotContext::linear({0, 3}, {0, 10}, local_area.bounds()));
            STEPPLOT_LOG_DEBUG("worker", "Worker {} iteration {}", id, i);
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    };

    std::thread t1(worker, 1);
    std::thread t2(worker, 2);

    t1.join();
    t2.join();

    STEPPLOT_LOG_INFO("example", "Logger example completed");

    return 0;
}
