#include <cmath>
#include <gtest/gtest.h>
#include <limits>
#include <vector>

#include "render/clip.hpp"

using namespace stepplot;

namespace
{

const Rect kBox = {{0, 0}, {10, 10}};

}   // namespace

// --- inside / intersect ---

TEST(ClipEdgeTest, BoundaryCountsAsInside)
{
    EXPECT_TRUE(inside({0, 5}, ClipEdge::Left, kBox));
    EXPECT_TRUE(inside({10, 5}, ClipEdge::Right, kBox));
    EXPECT_TRUE(inside({5, 0}, ClipEdge::Bottom, kBox));
    EXPECT_TRUE(inside({5, 10}, ClipEdge::Top, kBox));

    EXPECT_FALSE(inside({-0.1, 5}, ClipEdge::Left, kBox));
    EXPECT_FALSE(inside({10.1, 5}, ClipEdge::Right, kBox));
    EXPECT_FALSE(inside({5, -0.1}, ClipEdge::Bottom, kBox));
    EXPECT_FALSE(inside({5, 10.1}, ClipEdge::Top, kBox));
}

TEST(ClipEdgeTest, NaNIsNeverInside)
{
    const double nan = std::numeric_limits<double>::quiet_NaN();
    EXPECT_FALSE(inside({nan, 5}, ClipEdge::Left, kBox));
    EXPECT_FALSE(inside({nan, 5}, ClipEdge::Right, kBox));
    EXPECT_FALSE(inside({5, nan}, ClipEdge::Bottom, kBox));
    EXPECT_FALSE(inside({5, nan}, ClipEdge::Top, kBox));
}

TEST(ClipEdgeTest, IntersectionLiesOnEdge)
{
    Point p = intersect({-10, 0}, {10, 10}, ClipEdge::Left, kBox);
    EXPECT_DOUBLE_EQ(p.x, 0.0);
    EXPECT_DOUBLE_EQ(p.y, 5.0);

    p = intersect({5, 5}, {5, 20}, ClipEdge::Top, kBox);
    EXPECT_DOUBLE_EQ(p.x, 5.0);
    EXPECT_DOUBLE_EQ(p.y, 10.0);

    p = intersect({2, 4}, {6, -4}, ClipEdge::Bottom, kBox);
    EXPECT_DOUBLE_EQ(p.x, 4.0);
    EXPECT_DOUBLE_EQ(p.y, 0.0);
}

// --- clip_line ---

TEST(ClipLine, EmptyInput)
{
    EXPECT_TRUE(clip_line({}, ClipEdge::Left, kBox).empty());
    EXPECT_TRUE(clip_lines({}, CLIP_EDGES_XY, kBox).empty());
}

TEST(ClipLine, SinglePoint)
{
    std::vector<Point> in  = {{5, 5}};
    std::vector<Point> out = {{50, 5}};

    auto kept = clip_lines(in, CLIP_EDGES_XY, kBox);
    ASSERT_EQ(kept.size(), 1u);
    ASSERT_EQ(kept[0].size(), 1u);
    EXPECT_EQ(kept[0][0], (Point{5, 5}));

    EXPECT_TRUE(clip_lines(out, CLIP_EDGES_XY, kBox).empty());
}

TEST(ClipLine, FullyInsideUnchanged)
{
    std::vector<Point> line = {{1, 1}, {2, 8}, {9, 3}, {9, 3}, {10, 10}};
    auto               out  = clip_lines(line, CLIP_EDGES_XY, kBox);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0], line);
}

TEST(ClipLine, FullyOutsideRemoved)
{
    std::vector<Point> line = {{-5, -5}, {-1, 20}, {-3, 4}};
    EXPECT_TRUE(clip_lines(line, CLIP_EDGES_XY, kBox).empty());
}

TEST(ClipLine, ExitAndReentrySplits)
{
    std::vector<Point> line = {{1, 5}, {5, 15}, {9, 5}};
    auto               out  = clip_lines(line, CLIP_EDGES_XY, kBox);
    ASSERT_EQ(out.size(), 2u);

    ASSERT_EQ(out[0].size(), 2u);
    EXPECT_DOUBLE_EQ(out[0][0].x, 1.0);
    EXPECT_DOUBLE_EQ(out[0][1].x, 3.0);
    EXPECT_DOUBLE_EQ(out[0][1].y, 10.0);

    ASSERT_EQ(out[1].size(), 2u);
    EXPECT_DOUBLE_EQ(out[1][0].x, 7.0);
    EXPECT_DOUBLE_EQ(out[1][0].y, 10.0);
    EXPECT_DOUBLE_EQ(out[1][1].x, 9.0);
}

TEST(ClipLine, CrossingBothSides)
{
    // Enters on the left, leaves on the right.
    std::vector<Point> line = {{-10, 5}, {20, 5}};
    auto               out  = clip_lines(line, CLIP_EDGES_X, kBox);
    ASSERT_EQ(out.size(), 1u);
    ASSERT_EQ(out[0].size(), 2u);
    EXPECT_EQ(out[0][0], (Point{0, 5}));
    EXPECT_EQ(out[0][1], (Point{10, 5}));
}

TEST(ClipLine, OnlyYEdgesIgnoresX)
{
    std::vector<Point> line = {{-100, 5}, {100, 5}};
    auto               out  = clip_lines(line, CLIP_EDGES_Y, kBox);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0], line);
}

TEST(ClipLine, EndingOnBoundaryDoesNotDuplicate)
{
    std::vector<Point> line = {{5, 20}, {5, 10}, {5, 5}};
    auto               out  = clip_lines(line, CLIP_EDGES_XY, kBox);
    ASSERT_EQ(out.size(), 1u);
    ASSERT_EQ(out[0].size(), 2u);
    EXPECT_EQ(out[0][0], (Point{5, 10}));
    EXPECT_EQ(out[0][1], (Point{5, 5}));
}

TEST(ClipLine, AllFragmentsInside)
{
    std::vector<Point> line;
    for (int i = 0; i < 50; ++i)
        line.push_back({i * 0.5 - 2.0, 12.0 * std::sin(i * 0.4)});

    for (const auto& fragment : clip_lines(line, CLIP_EDGES_XY, kBox))
    {
        for (const auto& p : fragment)
        {
            EXPECT_GE(p.x, kBox.min.x - 1e-9);
            EXPECT_LE(p.x, kBox.max.x + 1e-9);
            EXPECT_GE(p.y, kBox.min.y - 1e-9);
            EXPECT_LE(p.y, kBox.max.y + 1e-9);
        }
    }
}

// --- clip_polygon ---

TEST(ClipPolygon, InsideUnchanged)
{
    std::vector<Point> poly = {{1, 1}, {9, 1}, {9, 9}, {1, 9}};
    EXPECT_EQ(clip_polygon(poly, CLIP_EDGES_XY, kBox), poly);
}

TEST(ClipPolygon, TrimsToBox)
{
    std::vector<Point> poly = {{-5, 2}, {15, 2}, {15, 20}, {-5, 20}};
    auto               out  = clip_polygon(poly, CLIP_EDGES_XY, kBox);
    ASSERT_EQ(out.size(), 4u);
    for (const auto& p : out)
        EXPECT_TRUE(kBox.contains(p));
    EXPECT_EQ(out[0], (Point{0, 2}));
    EXPECT_EQ(out[1], (Point{10, 2}));
    EXPECT_EQ(out[2], (Point{10, 10}));
    EXPECT_EQ(out[3], (Point{0, 10}));
}

TEST(ClipPolygon, YOnlyLeavesXAlone)
{
    std::vector<Point> poly = {{-5, -5}, {15, -5}, {15, 5}, {-5, 5}};
    auto               out  = clip_polygon(poly, CLIP_EDGES_Y, kBox);
    ASSERT_EQ(out.size(), 4u);
    EXPECT_EQ(out[0], (Point{15, 0}));
    EXPECT_EQ(out[1], (Point{15, 5}));
    EXPECT_EQ(out[2], (Point{-5, 5}));
    EXPECT_EQ(out[3], (Point{-5, 0}));
}

TEST(ClipPolygon, OutsideIsEmpty)
{
    std::vector<Point> poly = {{20, 20}, {30, 20}, {30, 30}};
    EXPECT_TRUE(clip_polygon(poly, CLIP_EDGES_XY, kBox).empty());
}
