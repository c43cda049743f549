#include <stepplot/path.hpp>

namespace stepplot
{

void Path::move_to(Point p)
{
    components_.push_back({PathComponent::Type::Move, p});
}

void Path::line_to(Point p)
{
    components_.push_back({PathComponent::Type::Line, p});
}

void Path::close()
{
    components_.push_back({PathComponent::Type::Close, {}});
}

std::vector<Point> Path::vertices() const
{
    std::vector<Point> out;
    out.reserve(components_.size());
    for (const auto& c : components_)
    {
        if (c.type != PathComponent::Type::Close)
            out.push_back(c.pos);
    }
    return out;
}

bool Path::is_closed() const
{
    return !components_.empty() && components_.back().type == PathComponent::Type::Close;
}

}   // namespace stepplot
