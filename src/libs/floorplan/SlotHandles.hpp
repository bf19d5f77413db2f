// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "floorplan/FloorPlanGlobal.hpp"
#include "floorplan/FloorPlanTypes.hpp"

#include <QtCore/QPointF>
#include <QtCore/QRectF>
#include <QtCore/QVector>

namespace FloorPlan {

enum class HandleKind : quint8 { None, TopLeft, TopRight, BottomRight, BottomLeft, Rotate };

FLOORPLAN_EXPORT bool isResizeHandle(HandleKind kind) noexcept;

// Position, size and rotation of one slot as the canvas manipulates it. The
// rect is unrotated; rotation is applied about its centre.
struct FLOORPLAN_EXPORT SlotGeometry final {
    QRectF rect;
    double rotation = 0.0;

    QPointF center() const { return rect.center(); }

    // Circles use their width for both extents.
    static SlotGeometry of(const Slot& slot);

    // x, y, width, height and rotation, as one canvas commit.
    SlotPatch toPatch() const;

    friend bool operator==(const SlotGeometry& a, const SlotGeometry& b)
    {
        return a.rect == b.rect && a.rotation == b.rotation;
    }
    friend bool operator!=(const SlotGeometry& a, const SlotGeometry& b) { return !(a == b); }
};

struct FLOORPLAN_EXPORT SlotHandle final {
    HandleKind kind = HandleKind::None;
    QPointF world;
};

// Four corners plus the rotate knob, which sits knobOffset world units above
// the top edge. Everything follows the slot rotation.
FLOORPLAN_EXPORT QVector<SlotHandle> slotHandles(const SlotGeometry& geometry, double knobOffset);

// Nearest handle within radius, or None.
FLOORPLAN_EXPORT HandleKind hitTestHandle(const QVector<SlotHandle>& handles,
                                          const QPointF& worldPos,
                                          double radius);

// Moves the dragged corner to worldPos while the opposite corner stays put.
// Extents never drop below minExtent. keepSquare grows both extents together.
FLOORPLAN_EXPORT SlotGeometry resizedGeometry(const SlotGeometry& start,
                                              HandleKind handle,
                                              const QPointF& worldPos,
                                              double minExtent,
                                              bool keepSquare = false);

// Rotation that points the knob from center towards worldPos, in [0, 360).
FLOORPLAN_EXPORT double rotationToward(const QPointF& center, const QPointF& worldPos);

} // namespace FloorPlan
