#include "thumbnail.hpp"

namespace stepplot
{

Rect thumbnail_fill_rect(const Rect& box, bool has_line)
{
    Rect r = box;
    if (has_line)
        r.max.y = box.center().y;
    return r;
}

double thumbnail_line_y(const Rect& box)
{
    return box.center().y;
}

Polyline rect_polygon(const Rect& r)
{
    return {
        {r.min.x, r.min.y},
        {r.max.x, r.min.y},
        {r.max.x, r.max.y},
        {r.min.x, r.max.y},
    };
}

}   // namespace stepplot
