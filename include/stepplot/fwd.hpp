#pragma once

#include <cstddef>

namespace stepplot
{

struct Point;
struct Rect;
struct Color;
struct LineStyle;
struct AxisLimits;
struct DataRange;

class Path;
class Canvas;
class RecordingCanvas;
class DrawArea;
class PlotContext;

class Plotter;
class StepSeries;

class Logger;

}   // namespace stepplot
