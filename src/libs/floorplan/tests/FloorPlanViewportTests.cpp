// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "floorplan/FloorPlanViewport.hpp"

#include <limits>

using namespace FloorPlan;

namespace {

Slot makeSlot(const QString& id, double x, double y, double w, double h)
{
    Slot slot;
    slot.id = SlotId(id);
    slot.x = x;
    slot.y = y;
    slot.width = w;
    slot.height = h;
    return slot;
}

} // namespace

TEST(FloorPlanViewportTests, EmptyCollectionUsesDefault)
{
    EXPECT_EQ(computeInitialViewport({}), QRectF(0.0, 0.0, 100.0, 100.0));
    EXPECT_EQ(computeInitialViewport({}), defaultViewport());
}

TEST(FloorPlanViewportTests, UnionIsPaddedOnEverySide)
{
    const SlotList slots{makeSlot(QStringLiteral("a"), 0, 0, 100, 50),
                         makeSlot(QStringLiteral("b"), 200, 100, 40, 40)};

    const QRectF vp = computeInitialViewport(slots, 10.0);
    EXPECT_EQ(vp, QRectF(-10.0, -10.0, 260.0, 160.0));
}

TEST(FloorPlanViewportTests, SinglePointYieldsCentredSquare)
{
    const SlotList slots{makeSlot(QStringLiteral("p"), 20, 30, 0, 0)};

    const QRectF vp = computeInitialViewport(slots, 50.0);
    EXPECT_DOUBLE_EQ(vp.width(), 200.0);
    EXPECT_DOUBLE_EQ(vp.height(), 200.0);
    EXPECT_EQ(vp.center(), QPointF(20.0, 30.0));
}

TEST(FloorPlanViewportTests, NonFiniteSlotsAreIgnored)
{
    Slot bad = makeSlot(QStringLiteral("bad"), 0, 0, 10, 10);
    bad.x = std::numeric_limits<double>::infinity();

    const SlotList slots{bad, makeSlot(QStringLiteral("ok"), 0, 0, 10, 10)};
    EXPECT_EQ(computeInitialViewport(slots, 5.0), QRectF(-5.0, -5.0, 20.0, 20.0));

    EXPECT_EQ(computeInitialViewport(SlotList{bad}), defaultViewport());
}

TEST(FloorPlanViewportTests, PanMovesOppositeToPointer)
{
    const QRectF vp(0.0, 0.0, 100.0, 100.0);
    EXPECT_EQ(panViewport(vp, 10.0, -5.0), QRectF(-10.0, 5.0, 100.0, 100.0));
    EXPECT_EQ(panViewport(vp, 0.0, 0.0), vp);
}
