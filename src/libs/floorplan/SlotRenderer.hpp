// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "floorplan/FloorPlanGlobal.hpp"
#include "floorplan/FloorPlanTypes.hpp"
#include "floorplan/SlotHandles.hpp"

#include <QtCore/QPointF>
#include <QtCore/QRectF>
#include <QtCore/QString>
#include <QtCore/QVector>
#include <QtGui/QColor>
#include <QtGui/QTransform>

#include <optional>

class QPainter;

namespace FloorPlan {

enum class PrimitiveKind : quint8 { Rectangle, Ellipse };

// What one slot looks like, in world units. The rect is unrotated; rotation
// is applied about its centre.
struct FLOORPLAN_EXPORT SlotPrimitive final {
    SlotId id;
    PrimitiveKind kind = PrimitiveKind::Rectangle;
    QRectF rect;
    double rotation = 0.0;
    QColor fill;
    QColor stroke;
    double strokeWidth = 0.0;
    QString label;
    bool selected = false;

    QPointF center() const { return rect.center(); }

    // Primitive-local hit test, honouring rotation and ellipse outline.
    bool contains(const QPointF& worldPos) const;
};

FLOORPLAN_EXPORT QColor statusFillColor(SlotStatus status);

// Null when the geometry cannot be drawn at all (non-finite values).
// Non-positive extents are clamped to the minimum renderable size.
FLOORPLAN_EXPORT std::optional<SlotPrimitive> buildSlotPrimitive(const Slot& slot, bool selected);

// Draw order follows collection order; malformed slots are skipped.
FLOORPLAN_EXPORT QVector<SlotPrimitive> buildSlotScene(const SlotList& slots, const SlotIdSet& selected);

struct FLOORPLAN_EXPORT SlotStyle final
{
    static void drawBackground(QPainter& p, const QRectF& surfaceRect);
    static void drawPrimitive(QPainter& p, const SlotPrimitive& prim, const QTransform& worldToSurface);
    static void drawScene(QPainter& p, const QVector<SlotPrimitive>& scene, const QTransform& worldToSurface);

    // Fixed pixel size, whatever the fit scale.
    static void drawHandles(QPainter& p, const QVector<SlotHandle>& handles, const QTransform& worldToSurface);
};

} // namespace FloorPlan
