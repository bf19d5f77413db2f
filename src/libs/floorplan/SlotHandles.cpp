// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "floorplan/SlotHandles.hpp"

#include <QtCore/QLineF>
#include <QtGui/QTransform>

#include <algorithm>
#include <cmath>
#include <limits>

namespace FloorPlan {

namespace {

constexpr double kPi = 3.14159265358979323846;

QPointF rotated(const QPointF& v, double degrees)
{
    QTransform xf;
    xf.rotate(degrees);
    return xf.map(v);
}

// Direction from the slot centre to the corner, in the unrotated frame.
QPointF cornerSigns(HandleKind kind)
{
    switch (kind) {
        case HandleKind::TopLeft: return QPointF(-1.0, -1.0);
        case HandleKind::TopRight: return QPointF(1.0, -1.0);
        case HandleKind::BottomRight: return QPointF(1.0, 1.0);
        case HandleKind::BottomLeft: return QPointF(-1.0, 1.0);
        case HandleKind::None:
        case HandleKind::Rotate:
            break;
    }
    return QPointF();
}

QPointF cornerWorld(const SlotGeometry& g, const QPointF& signs)
{
    const QPointF half(signs.x() * g.rect.width() * 0.5, signs.y() * g.rect.height() * 0.5);
    return g.center() + rotated(half, g.rotation);
}

} // namespace

bool isResizeHandle(HandleKind kind) noexcept
{
    switch (kind) {
        case HandleKind::TopLeft:
        case HandleKind::TopRight:
        case HandleKind::BottomRight:
        case HandleKind::BottomLeft:
            return true;
        case HandleKind::None:
        case HandleKind::Rotate:
            break;
    }
    return false;
}

SlotGeometry SlotGeometry::of(const Slot& slot)
{
    SlotGeometry g;
    const double h = slot.shape == SlotShape::Circle ? slot.width : slot.height;
    g.rect = QRectF(slot.x, slot.y, slot.width, h);
    g.rotation = slot.displayRotation();
    return g;
}

SlotPatch SlotGeometry::toPatch() const
{
    SlotPatch patch;
    patch.x = rect.x();
    patch.y = rect.y();
    patch.width = rect.width();
    patch.height = rect.height();
    patch.rotation = rotation;
    return patch;
}

QVector<SlotHandle> slotHandles(const SlotGeometry& geometry, double knobOffset)
{
    QVector<SlotHandle> out;
    out.reserve(5);
    for (HandleKind kind : {HandleKind::TopLeft, HandleKind::TopRight, HandleKind::BottomRight,
                            HandleKind::BottomLeft}) {
        out.push_back(SlotHandle{kind, cornerWorld(geometry, cornerSigns(kind))});
    }

    const QPointF knob(0.0, -geometry.rect.height() * 0.5 - knobOffset);
    out.push_back(SlotHandle{HandleKind::Rotate, geometry.center() + rotated(knob, geometry.rotation)});
    return out;
}

HandleKind hitTestHandle(const QVector<SlotHandle>& handles, const QPointF& worldPos, double radius)
{
    HandleKind best = HandleKind::None;
    double bestDist = std::numeric_limits<double>::max();
    for (const SlotHandle& handle : handles) {
        const double dist = QLineF(handle.world, worldPos).length();
        if (dist <= radius && dist < bestDist) {
            best = handle.kind;
            bestDist = dist;
        }
    }
    return best;
}

SlotGeometry resizedGeometry(const SlotGeometry& start,
                             HandleKind handle,
                             const QPointF& worldPos,
                             double minExtent,
                             bool keepSquare)
{
    if (!isResizeHandle(handle))
        return start;

    const QPointF signs = cornerSigns(handle);
    const QPointF anchor = cornerWorld(start, -signs);
    const QPointF local = rotated(worldPos - anchor, -start.rotation);

    double w = std::max(minExtent, signs.x() * local.x());
    double h = std::max(minExtent, signs.y() * local.y());
    if (keepSquare)
        w = h = std::max(w, h);

    const QPointF half(signs.x() * w * 0.5, signs.y() * h * 0.5);
    const QPointF center = anchor + rotated(half, start.rotation);

    SlotGeometry out;
    out.rect = QRectF(center.x() - w * 0.5, center.y() - h * 0.5, w, h);
    out.rotation = start.rotation;
    return out;
}

double rotationToward(const QPointF& center, const QPointF& worldPos)
{
    const QPointF d = worldPos - center;
    if (d.isNull())
        return 0.0;

    // The knob sits straight above the centre at rotation zero.
    double deg = std::atan2(d.y(), d.x()) * 180.0 / kPi + 90.0;
    // Axis-aligned pointers land on whole degrees despite atan2 rounding.
    if (std::abs(deg - std::round(deg)) < 1e-9)
        deg = std::round(deg);
    deg = std::fmod(deg, 360.0);
    if (deg < 0.0)
        deg += 360.0;
    return deg;
}

} // namespace FloorPlan
