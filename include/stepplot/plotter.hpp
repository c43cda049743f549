#pragma once

#include <stepplot/fwd.hpp>
#include <stepplot/range.hpp>

namespace stepplot
{

// A drawable plot element, as seen by the surrounding plot framework.
class Plotter
{
   public:
    virtual ~Plotter() = default;

    // Render into `area` using the transforms of `ctx`.
    virtual void draw(DrawArea& area, const PlotContext& ctx) const = 0;

    // Data-space extent the axes must cover to show this element.
    virtual DataRange data_range() const = 0;

    // Legend icon filling the whole of `area`.
    virtual void thumbnail(DrawArea& area) const = 0;
};

}   // namespace stepplot
