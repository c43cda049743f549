#pragma once

#include <cstddef>
#include <stepplot/geometry.hpp>
#include <vector>

namespace stepplot
{

struct PathComponent
{
    enum class Type : unsigned char
    {
        Move,
        Line,
        Close,
    };

    Type  type = Type::Move;
    Point pos;   // unused for Close

    bool operator==(const PathComponent&) const = default;
};

// Vector path made of straight segments. Built by the step geometry code and
// executed by a Canvas as a stroke or a fill.
class Path
{
   public:
    Path() = default;

    void move_to(Point p);
    void line_to(Point p);
    void close();

    bool   empty() const { return components_.empty(); }
    size_t size() const { return components_.size(); }
    void   clear() { components_.clear(); }

    const std::vector<PathComponent>& components() const { return components_; }

    // Positions of all Move/Line components, in order.
    std::vector<Point> vertices() const;

    // True when the last component is a Close.
    bool is_closed() const;

    bool operator==(const Path&) const = default;

   private:
    std::vector<PathComponent> components_;
};

}   // namespace stepplot
