// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "floorplan/FloorPlanTools.hpp"

using namespace FloorPlan;

namespace {

void expectNear(const QPointF& a, const QPointF& b, double eps = 1e-9)
{
    EXPECT_NEAR(a.x(), b.x(), eps);
    EXPECT_NEAR(a.y(), b.y(), eps);
}

} // namespace

TEST(FloorPlanToolsTests, FitsViewportWithUniformScaleAndCentres)
{
    const QRectF vp(0.0, 0.0, 100.0, 100.0);
    const QSizeF surface(400.0, 200.0);

    EXPECT_DOUBLE_EQ(Tools::fitScale(vp, surface), 2.0);

    // 200x200 content centred horizontally in a 400 wide surface.
    expectNear(Tools::toSurface(QPointF(0.0, 0.0), vp, surface), QPointF(100.0, 0.0));
    expectNear(Tools::toSurface(QPointF(100.0, 100.0), vp, surface), QPointF(300.0, 200.0));
}

TEST(FloorPlanToolsTests, SurfaceWorldRoundTrip)
{
    const QRectF vp(-40.0, 25.0, 300.0, 120.0);
    const QSizeF surface(640.0, 480.0);

    const QPointF world(17.5, 88.25);
    const QPointF surfacePos = Tools::toSurface(world, vp, surface);
    expectNear(Tools::toWorld(surfacePos, vp, surface), world);
}

TEST(FloorPlanToolsTests, MissingTransformMapsToOrigin)
{
    EXPECT_FALSE(Tools::worldToSurfaceTransform(QRectF(0, 0, 100, 100), QSizeF()).has_value());
    EXPECT_FALSE(Tools::worldToSurfaceTransform(QRectF(0, 0, 0, 100), QSizeF(10, 10)).has_value());

    EXPECT_EQ(Tools::toWorld(QPointF(12.0, 34.0), std::nullopt), QPointF(0.0, 0.0));
    EXPECT_EQ(Tools::toWorld(QPointF(12.0, 34.0), QRectF(0, 0, 100, 100), QSizeF(0, 0)), QPointF(0.0, 0.0));
}

TEST(FloorPlanToolsTests, PixelDeltaIsConsistentAcrossSurface)
{
    const QRectF vp(0.0, 0.0, 200.0, 100.0);
    const QSizeF surface(800.0, 400.0);

    const QPointF a = Tools::toWorld(QPointF(10.0, 10.0), vp, surface);
    const QPointF b = Tools::toWorld(QPointF(30.0, 10.0), vp, surface);
    const QPointF c = Tools::toWorld(QPointF(610.0, 300.0), vp, surface);
    const QPointF d = Tools::toWorld(QPointF(630.0, 300.0), vp, surface);

    expectNear(b - a, d - c);
    EXPECT_NEAR((b - a).x(), 5.0, 1e-9);
}

TEST(FloorPlanToolsTests, ResizedViewportKeepsCentre)
{
    const QRectF vp(0.0, 0.0, 100.0, 50.0);
    const QRectF zoomed = Tools::resizedViewport(vp, 0.5);
    EXPECT_EQ(zoomed.center(), vp.center());
    EXPECT_DOUBLE_EQ(zoomed.width(), 50.0);
    EXPECT_DOUBLE_EQ(zoomed.height(), 25.0);

    EXPECT_EQ(Tools::resizedViewport(vp, 0.0), vp);
}
