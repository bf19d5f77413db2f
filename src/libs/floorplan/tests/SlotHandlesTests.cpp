// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "floorplan/SlotHandles.hpp"

using namespace FloorPlan;

namespace {

SlotGeometry geometry(double x, double y, double w, double h, double rotation = 0.0)
{
    SlotGeometry g;
    g.rect = QRectF(x, y, w, h);
    g.rotation = rotation;
    return g;
}

QPointF handleAt(const QVector<SlotHandle>& handles, HandleKind kind)
{
    for (const SlotHandle& h : handles) {
        if (h.kind == kind)
            return h.world;
    }
    return QPointF(-1e9, -1e9);
}

} // namespace

TEST(SlotHandlesTests, HandlesSitOnCornersAndAboveTopEdge)
{
    const auto handles = slotHandles(geometry(10, 10, 40, 20), 24.0);

    ASSERT_EQ(handles.size(), 5);
    EXPECT_EQ(handleAt(handles, HandleKind::TopLeft), QPointF(10, 10));
    EXPECT_EQ(handleAt(handles, HandleKind::TopRight), QPointF(50, 10));
    EXPECT_EQ(handleAt(handles, HandleKind::BottomRight), QPointF(50, 30));
    EXPECT_EQ(handleAt(handles, HandleKind::BottomLeft), QPointF(10, 30));
    EXPECT_EQ(handleAt(handles, HandleKind::Rotate), QPointF(30, -14));
}

TEST(SlotHandlesTests, HandlesFollowRotation)
{
    // 40x20 centred on (20, 10), turned a quarter clockwise.
    const auto handles = slotHandles(geometry(0, 0, 40, 20, 90.0), 10.0);

    EXPECT_EQ(handleAt(handles, HandleKind::TopLeft), QPointF(30, -10));
    EXPECT_EQ(handleAt(handles, HandleKind::BottomRight), QPointF(10, 30));
    EXPECT_EQ(handleAt(handles, HandleKind::Rotate), QPointF(40, 10));
}

TEST(SlotHandlesTests, HitTestPicksNearestWithinRadius)
{
    const auto handles = slotHandles(geometry(0, 0, 10, 10), 5.0);

    EXPECT_EQ(hitTestHandle(handles, QPointF(1, 1), 3.0), HandleKind::TopLeft);
    EXPECT_EQ(hitTestHandle(handles, QPointF(9, 9.5), 3.0), HandleKind::BottomRight);
    EXPECT_EQ(hitTestHandle(handles, QPointF(5, -5), 1.0), HandleKind::Rotate);
    EXPECT_EQ(hitTestHandle(handles, QPointF(5, 5), 3.0), HandleKind::None);
}

TEST(SlotHandlesTests, ResizeKeepsOppositeCornerFixed)
{
    const SlotGeometry start = geometry(10, 10, 40, 20);

    EXPECT_EQ(resizedGeometry(start, HandleKind::BottomRight, QPointF(70, 50), 1.0).rect, QRectF(10, 10, 60, 40));
    EXPECT_EQ(resizedGeometry(start, HandleKind::TopLeft, QPointF(0, 0), 1.0).rect, QRectF(0, 0, 50, 30));
    EXPECT_EQ(resizedGeometry(start, HandleKind::TopRight, QPointF(60, 0), 1.0).rect, QRectF(10, 0, 50, 30));
    EXPECT_EQ(resizedGeometry(start, HandleKind::BottomLeft, QPointF(0, 40), 1.0).rect, QRectF(0, 10, 50, 30));
}

TEST(SlotHandlesTests, ResizeClampsAtMinimumExtent)
{
    const SlotGeometry start = geometry(10, 10, 40, 20);
    const SlotGeometry crossed = resizedGeometry(start, HandleKind::BottomRight, QPointF(5, 5), 1.0);

    EXPECT_EQ(crossed.rect, QRectF(10, 10, 1, 1));
    EXPECT_EQ(crossed.rotation, 0.0);
}

TEST(SlotHandlesTests, ResizeOfRotatedSlotWorksInItsOwnFrame)
{
    const SlotGeometry start = geometry(0, 0, 40, 20, 90.0);
    const SlotGeometry out = resizedGeometry(start, HandleKind::BottomRight, QPointF(0, 30), 1.0);

    EXPECT_EQ(out.rect, QRectF(-5, -5, 40, 30));
    EXPECT_EQ(out.rotation, 90.0);
}

TEST(SlotHandlesTests, KeepSquareGrowsBothExtents)
{
    const SlotGeometry start = geometry(0, 0, 20, 20);
    const SlotGeometry out = resizedGeometry(start, HandleKind::BottomRight, QPointF(50, 30), 1.0, true);

    EXPECT_EQ(out.rect, QRectF(0, 0, 50, 50));
}

TEST(SlotHandlesTests, NonResizeHandleLeavesGeometryAlone)
{
    const SlotGeometry start = geometry(10, 10, 40, 20);

    EXPECT_EQ(resizedGeometry(start, HandleKind::Rotate, QPointF(70, 50), 1.0), start);
    EXPECT_EQ(resizedGeometry(start, HandleKind::None, QPointF(70, 50), 1.0), start);
    EXPECT_FALSE(isResizeHandle(HandleKind::Rotate));
    EXPECT_TRUE(isResizeHandle(HandleKind::BottomLeft));
}

TEST(SlotHandlesTests, RotationPointsKnobAtPointer)
{
    const QPointF c(20, 10);

    EXPECT_NEAR(rotationToward(c, QPointF(20, 0)), 0.0, 1e-9);
    EXPECT_NEAR(rotationToward(c, QPointF(30, 10)), 90.0, 1e-9);
    EXPECT_NEAR(rotationToward(c, QPointF(20, 20)), 180.0, 1e-9);
    EXPECT_NEAR(rotationToward(c, QPointF(10, 10)), 270.0, 1e-9);
    EXPECT_EQ(rotationToward(c, c), 0.0);
}

TEST(SlotHandlesTests, GeometryOfCircleUsesWidthForBothExtents)
{
    Slot slot;
    slot.id = SlotId(QStringLiteral("c"));
    slot.shape = SlotShape::Circle;
    slot.x = 5;
    slot.y = 6;
    slot.width = 30;
    slot.height = 90;
    slot.rotation = -90;

    const SlotGeometry g = SlotGeometry::of(slot);
    EXPECT_EQ(g.rect, QRectF(5, 6, 30, 30));
    EXPECT_EQ(g.rotation, 270.0);

    const SlotPatch patch = g.toPatch();
    ASSERT_TRUE(patch.width && patch.height && patch.rotation);
    EXPECT_EQ(*patch.width, 30.0);
    EXPECT_EQ(*patch.height, 30.0);
    EXPECT_EQ(*patch.rotation, 270.0);
    EXPECT_TRUE(patch.isTransformOnly());
}
