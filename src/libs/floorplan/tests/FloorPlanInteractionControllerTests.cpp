// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "floorplan/controllers/FloorPlanInteractionController.hpp"

#include <QtCore/QPair>
#include <QtCore/QVector>

using namespace FloorPlan;

namespace {

Slot makeSlot(const QString& id, double x, double y, double w = 20.0, double h = 20.0)
{
    Slot slot;
    slot.id = SlotId(id);
    slot.label = id;
    slot.x = x;
    slot.y = y;
    slot.width = w;
    slot.height = h;
    return slot;
}

struct Recorder {
    QVector<QPair<SlotId, bool>> selects;
    QVector<QPair<SlotId, QPointF>> moves;
    QVector<QPair<SlotId, SlotGeometry>> transforms;
    QVector<QRectF> viewports;
    int previewChanges = 0;

    explicit Recorder(FloorPlanInteractionController& c)
    {
        QObject::connect(&c, &FloorPlanInteractionController::selectSlotRequested, &c,
                         [this](const SlotId& id, bool multi) { selects.push_back({id, multi}); });
        QObject::connect(&c, &FloorPlanInteractionController::itemMoved, &c,
                         [this](const SlotId& id, const QPointF& p) { moves.push_back({id, p}); });
        QObject::connect(&c, &FloorPlanInteractionController::itemTransformed, &c,
                         [this](const SlotId& id, const SlotGeometry& g) { transforms.push_back({id, g}); });
        QObject::connect(&c, &FloorPlanInteractionController::viewportChanged, &c,
                         [this](const QRectF& vp) { viewports.push_back(vp); });
        QObject::connect(&c, &FloorPlanInteractionController::dragPreviewChanged, &c,
                         [this]() { ++previewChanges; });
    }
};

// 1:1 mapping: a 100x100 viewport on a 100x100 surface.
void setupIdentity(FloorPlanInteractionController& c)
{
    c.setViewport(QRectF(0, 0, 100, 100));
    c.setSurfaceSize(QSizeF(100, 100));
}

} // namespace

TEST(FloorPlanInteractionControllerTests, DragCommitsFinalTopLeft)
{
    FloorPlanInteractionController c;
    setupIdentity(c);
    c.setSlots({makeSlot(QStringLiteral("t1"), 10, 10)});
    Recorder rec(c);

    c.onPointerPressed(QPointF(15, 15), Qt::LeftButton, Qt::NoModifier);
    EXPECT_EQ(c.mode(), Interaction::InteractionMode::DraggingItem);
    ASSERT_EQ(rec.selects.size(), 1);
    EXPECT_EQ(rec.selects.first().first, SlotId(QStringLiteral("t1")));
    EXPECT_FALSE(rec.selects.first().second);

    c.onPointerMoved(QPointF(55, 35), Qt::LeftButton, Qt::NoModifier);
    ASSERT_TRUE(c.dragPreview().has_value());
    EXPECT_EQ(c.dragPreview()->position, QPointF(50, 30));

    c.onPointerReleased(QPointF(55, 35), Qt::NoButton, Qt::NoModifier);
    ASSERT_EQ(rec.moves.size(), 1);
    EXPECT_EQ(rec.moves.first().second, QPointF(50, 30));
    EXPECT_FALSE(c.dragPreview().has_value());
    EXPECT_EQ(c.mode(), Interaction::InteractionMode::Idle);
}

TEST(FloorPlanInteractionControllerTests, ModifierRequestsMultiSelect)
{
    FloorPlanInteractionController c;
    setupIdentity(c);
    c.setSlots({makeSlot(QStringLiteral("t1"), 10, 10)});
    Recorder rec(c);

    c.onPointerPressed(QPointF(15, 15), Qt::LeftButton, Qt::ControlModifier);
    c.onPointerReleased(QPointF(15, 15), Qt::NoButton, Qt::ControlModifier);

    ASSERT_EQ(rec.selects.size(), 1);
    EXPECT_TRUE(rec.selects.first().second);
    EXPECT_TRUE(rec.moves.isEmpty());
}

TEST(FloorPlanInteractionControllerTests, BackgroundPanMovesViewport)
{
    FloorPlanInteractionController c;
    setupIdentity(c);
    Recorder rec(c);

    c.onPointerPressed(QPointF(50, 50), Qt::LeftButton, Qt::NoModifier);
    EXPECT_EQ(c.mode(), Interaction::InteractionMode::PanningCanvas);

    c.onPointerMoved(QPointF(60, 50), Qt::LeftButton, Qt::NoModifier);
    EXPECT_EQ(c.viewport(), QRectF(-10, 0, 100, 100));

    // The pointer has not moved on screen since the pan, so nothing more happens.
    c.onPointerMoved(QPointF(60, 50), Qt::LeftButton, Qt::NoModifier);
    EXPECT_EQ(c.viewport(), QRectF(-10, 0, 100, 100));
    EXPECT_EQ(rec.viewports.size(), 1);

    c.onPointerReleased(QPointF(60, 50), Qt::NoButton, Qt::NoModifier);
    EXPECT_TRUE(rec.selects.isEmpty());
}

TEST(FloorPlanInteractionControllerTests, BackgroundClickRequestsClear)
{
    FloorPlanInteractionController c;
    setupIdentity(c);
    Recorder rec(c);

    c.onPointerPressed(QPointF(80, 80), Qt::LeftButton, Qt::NoModifier);
    c.onPointerReleased(QPointF(80, 80), Qt::NoButton, Qt::NoModifier);

    ASSERT_EQ(rec.selects.size(), 1);
    EXPECT_FALSE(rec.selects.first().first.isValid());
}

TEST(FloorPlanInteractionControllerTests, MiddleButtonPansOverSlots)
{
    FloorPlanInteractionController c;
    setupIdentity(c);
    c.setSlots({makeSlot(QStringLiteral("t1"), 10, 10)});
    Recorder rec(c);

    c.onPointerPressed(QPointF(15, 15), Qt::MiddleButton, Qt::NoModifier);
    EXPECT_EQ(c.mode(), Interaction::InteractionMode::PanningCanvas);
    c.onPointerReleased(QPointF(15, 15), Qt::NoButton, Qt::NoModifier);

    EXPECT_TRUE(rec.selects.isEmpty());
}

TEST(FloorPlanInteractionControllerTests, LeaveEndsDrag)
{
    FloorPlanInteractionController c;
    setupIdentity(c);
    c.setSlots({makeSlot(QStringLiteral("t1"), 10, 10)});
    Recorder rec(c);

    c.onPointerPressed(QPointF(15, 15), Qt::LeftButton, Qt::NoModifier);
    c.onPointerMoved(QPointF(25, 15), Qt::LeftButton, Qt::NoModifier);
    c.onPointerLeft();

    EXPECT_EQ(c.mode(), Interaction::InteractionMode::Idle);
    ASSERT_EQ(rec.moves.size(), 1);
    EXPECT_EQ(rec.moves.first().second, QPointF(20, 10));
}

TEST(FloorPlanInteractionControllerTests, RemovingDraggedSlotResetsGesture)
{
    FloorPlanInteractionController c;
    setupIdentity(c);
    c.setSlots({makeSlot(QStringLiteral("t1"), 10, 10)});
    Recorder rec(c);

    c.onPointerPressed(QPointF(15, 15), Qt::LeftButton, Qt::NoModifier);
    c.onPointerMoved(QPointF(30, 30), Qt::LeftButton, Qt::NoModifier);
    c.setSlots({});

    EXPECT_EQ(c.mode(), Interaction::InteractionMode::Idle);
    EXPECT_FALSE(c.dragPreview().has_value());
    c.onPointerReleased(QPointF(30, 30), Qt::NoButton, Qt::NoModifier);
    EXPECT_TRUE(rec.moves.isEmpty());
}

TEST(FloorPlanInteractionControllerTests, UnlaidSurfaceMapsToOrigin)
{
    FloorPlanInteractionController c;
    c.setViewport(QRectF(0, 0, 100, 100));
    EXPECT_EQ(c.surfaceToWorld(QPointF(40, 40)), QPointF(0, 0));
}

TEST(FloorPlanInteractionControllerTests, HandlesNeedExactlyOneSelectedSlot)
{
    FloorPlanInteractionController c;
    setupIdentity(c);
    c.setSlots({makeSlot(QStringLiteral("t1"), 10, 10, 40, 20), makeSlot(QStringLiteral("t2"), 70, 70)});
    EXPECT_TRUE(c.handles().isEmpty());

    c.setSelectedSlotIds({SlotId(QStringLiteral("t1"))});
    const QVector<SlotHandle> handles = c.handles();
    ASSERT_EQ(handles.size(), 5);
    EXPECT_EQ(handles.last().kind, HandleKind::Rotate);
    EXPECT_EQ(handles.last().world, QPointF(30, -14));

    c.setSelectedSlotIds({SlotId(QStringLiteral("t1")), SlotId(QStringLiteral("t2"))});
    EXPECT_TRUE(c.handles().isEmpty());
}

TEST(FloorPlanInteractionControllerTests, CornerDragCommitsNewSize)
{
    FloorPlanInteractionController c;
    setupIdentity(c);
    c.setSlots({makeSlot(QStringLiteral("t1"), 10, 10, 40, 20)});
    c.setSelectedSlotIds({SlotId(QStringLiteral("t1"))});
    Recorder rec(c);

    c.onPointerPressed(QPointF(50, 30), Qt::LeftButton, Qt::NoModifier);
    EXPECT_EQ(c.mode(), Interaction::InteractionMode::ResizingItem);
    EXPECT_TRUE(rec.selects.isEmpty());

    c.onPointerMoved(QPointF(70, 50), Qt::LeftButton, Qt::NoModifier);
    ASSERT_TRUE(c.dragPreview().has_value());
    ASSERT_TRUE(c.dragPreview()->geometry.has_value());
    EXPECT_EQ(c.dragPreview()->geometry->rect, QRectF(10, 10, 60, 40));
    // Handles follow the preview.
    EXPECT_EQ(c.handles().at(2).world, QPointF(70, 50));

    c.onPointerReleased(QPointF(70, 50), Qt::NoButton, Qt::NoModifier);
    ASSERT_EQ(rec.transforms.size(), 1);
    EXPECT_EQ(rec.transforms.first().first, SlotId(QStringLiteral("t1")));
    EXPECT_EQ(rec.transforms.first().second.rect, QRectF(10, 10, 60, 40));
    EXPECT_TRUE(rec.moves.isEmpty());
    EXPECT_FALSE(c.dragPreview().has_value());
    EXPECT_EQ(c.mode(), Interaction::InteractionMode::Idle);
}

TEST(FloorPlanInteractionControllerTests, KnobDragCommitsRotation)
{
    FloorPlanInteractionController c;
    setupIdentity(c);
    c.setSlots({makeSlot(QStringLiteral("t1"), 10, 10, 40, 20)});
    c.setSelectedSlotIds({SlotId(QStringLiteral("t1"))});
    Recorder rec(c);

    c.onPointerPressed(QPointF(30, -14), Qt::LeftButton, Qt::NoModifier);
    EXPECT_EQ(c.mode(), Interaction::InteractionMode::RotatingItem);

    // Centre is (30, 20); pointing right is a quarter turn.
    c.onPointerMoved(QPointF(60, 20), Qt::LeftButton, Qt::NoModifier);
    c.onPointerReleased(QPointF(60, 20), Qt::NoButton, Qt::NoModifier);

    ASSERT_EQ(rec.transforms.size(), 1);
    EXPECT_EQ(rec.transforms.first().second.rotation, 90.0);
    EXPECT_EQ(rec.transforms.first().second.rect, QRectF(10, 10, 40, 20));
}

TEST(FloorPlanInteractionControllerTests, PreviewAppliesGeometryToSlot)
{
    DragPreview preview;
    preview.slotId = SlotId(QStringLiteral("c"));
    SlotGeometry g;
    g.rect = QRectF(1, 2, 30, 30);
    g.rotation = 45.0;
    preview.geometry = g;

    Slot circle = makeSlot(QStringLiteral("c"), 0, 0, 10, 99);
    circle.shape = SlotShape::Circle;
    preview.applyTo(circle);

    EXPECT_EQ(circle.topLeft(), QPointF(1, 2));
    EXPECT_EQ(circle.width, 30.0);
    EXPECT_EQ(circle.height, 99.0);
    EXPECT_EQ(circle.rotation, 45.0);
}
