// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include <gtest/gtest.h>
#include <cmath>
#include "geom/Geometry2D.hpp"

using namespace vrig;

namespace
{
    constexpr float eps = 1e-5f;
}

TEST(Geometry2DTest, AngleBetweenIsWorldSpace)
{
    EXPECT_NEAR(geom::angle_between({ 0, 0 }, { 10, 0 }), 0.0f, eps);
    EXPECT_NEAR(geom::angle_between({ 0, 0 }, { 0, 10 }), geom::pi / 2, eps);
    EXPECT_NEAR(geom::angle_between({ 5, 5 }, { 0, 5 }), geom::pi, eps);
}

TEST(Geometry2DTest, RotateAroundOriginAndPivot)
{
    auto r = geom::rotate({ 1, 0 }, geom::pi / 2);
    EXPECT_NEAR(r.x, 0.0f, eps);
    EXPECT_NEAR(r.y, 1.0f, eps);

    auto p = geom::rotate_point({ 20, 10 }, { 10, 10 }, geom::pi);
    EXPECT_NEAR(p.x, 0.0f, 1e-4f);
    EXPECT_NEAR(p.y, 10.0f, 1e-4f);
}

TEST(Geometry2DTest, PointToSegmentDistance)
{
    // Projection inside, beyond the end, and a degenerate segment
    EXPECT_NEAR(geom::point_to_segment_distance({ 5, 3 }, { 0, 0 }, { 10, 0 }), 3.0f, eps);
    EXPECT_NEAR(geom::point_to_segment_distance({ 13, 4 }, { 0, 0 }, { 10, 0 }), 5.0f, eps);
    EXPECT_NEAR(geom::point_to_segment_distance({ 3, 4 }, { 0, 0 }, { 0, 0 }), 5.0f, eps);
}

TEST(Geometry2DTest, WrapAngleRange)
{
    EXPECT_NEAR(geom::wrap_angle(0.0f), 0.0f, eps);
    EXPECT_NEAR(geom::wrap_angle(1.5f * geom::pi), -0.5f * geom::pi, 1e-4f);
    EXPECT_NEAR(geom::wrap_angle(-1.5f * geom::pi), 0.5f * geom::pi, 1e-4f);
    EXPECT_NEAR(geom::wrap_angle(geom::pi), geom::pi, 1e-4f);
    EXPECT_NEAR(geom::wrap_angle(-geom::pi), geom::pi, 1e-4f);
    EXPECT_NEAR(geom::wrap_angle(7.0f * geom::two_pi + 0.25f), 0.25f, 1e-4f);
}

TEST(Geometry2DTest, WrapAnglePassesNonFiniteThrough)
{
    EXPECT_TRUE(std::isinf(geom::wrap_angle(INFINITY)));
    EXPECT_TRUE(std::isnan(geom::wrap_angle(NAN)));
}

TEST(Geometry2DTest, LerpAngleTakesShortestArc)
{
    const float a = 170.0f * geom::pi / 180.0f;
    const float b = -170.0f * geom::pi / 180.0f;

    // Halfway between 170 and -170 degrees is 180, not 0
    const float mid = geom::lerp_angle(a, b, 0.5f);
    EXPECT_NEAR(std::cos(mid), -1.0f, 1e-4f);

    EXPECT_NEAR(geom::lerp_angle(0.0f, 1.0f, 0.25f), 0.25f, eps);
}
