#pragma once

#include <stepplot/canvas.hpp>
#include <stepplot/color.hpp>
#include <stepplot/data.hpp>
#include <stepplot/error.hpp>
#include <stepplot/fwd.hpp>
#include <stepplot/geometry.hpp>
#include <stepplot/line_style.hpp>
#include <stepplot/logger.hpp>
#include <stepplot/path.hpp>
#include <stepplot/plot_context.hpp>
#include <stepplot/plotter.hpp>
#include <stepplot/range.hpp>
#include <stepplot/step.hpp>
