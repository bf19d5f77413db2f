// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "floorplan/SlotRenderer.hpp"

#include "floorplan/FloorPlanConstants.hpp"

#include <QtGui/QFont>
#include <QtGui/QPainter>
#include <QtGui/QPen>

#include <algorithm>
#include <cmath>

namespace FloorPlan {

namespace {

double clampExtent(double v)
{
    return std::max(v, Constants::kMinSlotExtent);
}

QRectF shapeRect(const Slot& slot)
{
    const double w = clampExtent(slot.width);
    const double h = clampExtent(slot.height);

    switch (slot.shape) {
        case SlotShape::Rectangle:
        case SlotShape::LongRectangle:
        case SlotShape::Ellipse:
            return QRectF(slot.x, slot.y, w, h);
        case SlotShape::Circle:
            // Radius follows width; height is ignored.
            return QRectF(slot.x, slot.y, w, w);
    }
    return QRectF(slot.x, slot.y, w, h);
}

PrimitiveKind primitiveKind(SlotShape shape)
{
    switch (shape) {
        case SlotShape::Rectangle:
        case SlotShape::LongRectangle:
            return PrimitiveKind::Rectangle;
        case SlotShape::Circle:
        case SlotShape::Ellipse:
            return PrimitiveKind::Ellipse;
    }
    return PrimitiveKind::Rectangle;
}

} // namespace

bool SlotPrimitive::contains(const QPointF& worldPos) const
{
    if (rect.isEmpty())
        return false;

    QTransform toLocal;
    toLocal.translate(center().x(), center().y());
    toLocal.rotate(rotation);
    toLocal.translate(-center().x(), -center().y());

    bool invertible = false;
    const QPointF local = toLocal.inverted(&invertible).map(worldPos);
    if (!invertible)
        return false;

    switch (kind) {
        case PrimitiveKind::Rectangle:
            return rect.contains(local);
        case PrimitiveKind::Ellipse: {
            const double rx = rect.width() * 0.5;
            const double ry = rect.height() * 0.5;
            const double nx = (local.x() - center().x()) / rx;
            const double ny = (local.y() - center().y()) / ry;
            return nx * nx + ny * ny <= 1.0;
        }
    }
    return false;
}

QColor statusFillColor(SlotStatus status)
{
    switch (status) {
        case SlotStatus::Available: return QColor(Constants::kStatusAvailableFill);
        case SlotStatus::Blocked: return QColor(Constants::kStatusBlockedFill);
        case SlotStatus::Reserved: return QColor(Constants::kStatusReservedFill);
        case SlotStatus::Occupied: return QColor(Constants::kStatusOccupiedFill);
        case SlotStatus::Maintenance: return QColor(Constants::kStatusMaintenanceFill);
    }
    return QColor(Constants::kStatusAvailableFill);
}

std::optional<SlotPrimitive> buildSlotPrimitive(const Slot& slot, bool selected)
{
    if (!slot.hasFiniteGeometry())
        return std::nullopt;

    SlotPrimitive prim;
    prim.id = slot.id;
    prim.kind = primitiveKind(slot.shape);
    prim.rect = shapeRect(slot);
    prim.rotation = slot.displayRotation();
    prim.label = slot.label;
    prim.selected = selected;

    prim.fill = statusFillColor(slot.status);
    if (slot.metadata.color) {
        const QColor custom(*slot.metadata.color);
        if (custom.isValid())
            prim.fill = custom;
    }

    if (selected) {
        prim.stroke = QColor(Constants::kSlotSelectionColor);
        prim.strokeWidth = Constants::kSlotSelectionStrokeWidth;
    } else {
        prim.stroke = QColor(Constants::kSlotStrokeColor);
        prim.strokeWidth = Constants::kSlotStrokeWidth;
    }
    return prim;
}

QVector<SlotPrimitive> buildSlotScene(const SlotList& slots, const SlotIdSet& selected)
{
    QVector<SlotPrimitive> scene;
    scene.reserve(slots.size());
    for (const Slot& slot : slots) {
        auto prim = buildSlotPrimitive(slot, selected.contains(slot.id));
        if (!prim) {
            qCDebug(floorplanlog).noquote() << "Skipping slot with malformed geometry:" << slot.id.value();
            continue;
        }
        scene.push_back(std::move(*prim));
    }
    return scene;
}

void SlotStyle::drawBackground(QPainter& p, const QRectF& surfaceRect)
{
    p.fillRect(surfaceRect, QColor(Constants::kCanvasBackgroundColor));
}

void SlotStyle::drawPrimitive(QPainter& p, const SlotPrimitive& prim, const QTransform& worldToSurface)
{
    p.save();
    p.setRenderHint(QPainter::Antialiasing, true);
    p.setTransform(worldToSurface);

    const QPointF c = prim.center();
    p.translate(c);
    p.rotate(prim.rotation);
    p.translate(-c);

    // Stroke width is in surface pixels regardless of the fit scale.
    QPen pen(prim.stroke);
    pen.setCosmetic(true);
    pen.setWidthF(prim.strokeWidth);
    p.setPen(pen);
    p.setBrush(prim.fill);

    switch (prim.kind) {
        case PrimitiveKind::Rectangle:
            p.drawRect(prim.rect);
            break;
        case PrimitiveKind::Ellipse:
            p.drawEllipse(prim.rect);
            break;
    }

    p.restore();

    if (prim.label.isEmpty())
        return;

    // Labels stay upright and unscaled.
    p.save();
    QFont font = p.font();
    font.setPointSizeF(Constants::kSlotLabelPointSize);
    p.setFont(font);
    p.setPen(QColor(Constants::kSlotLabelColor));
    const QRectF surfaceRect = worldToSurface.mapRect(prim.rect);
    p.drawText(surfaceRect, Qt::AlignCenter | Qt::TextWordWrap, prim.label);
    p.restore();
}

void SlotStyle::drawScene(QPainter& p, const QVector<SlotPrimitive>& scene, const QTransform& worldToSurface)
{
    for (const SlotPrimitive& prim : scene)
        drawPrimitive(p, prim, worldToSurface);
}

void SlotStyle::drawHandles(QPainter& p, const QVector<SlotHandle>& handles, const QTransform& worldToSurface)
{
    if (handles.isEmpty())
        return;

    p.save();
    p.setRenderHint(QPainter::Antialiasing, true);
    QPen pen(QColor(Constants::kSlotSelectionColor));
    pen.setWidthF(1.0);
    p.setPen(pen);
    p.setBrush(QColor(Constants::kHandleFillColor));

    const double half = Constants::kHandleSizePx * 0.5;
    QPointF top;
    QPointF knob;
    bool hasKnob = false;
    int corners = 0;
    for (const SlotHandle& handle : handles) {
        const QPointF at = worldToSurface.map(handle.world);
        if (handle.kind == HandleKind::Rotate) {
            knob = at;
            hasKnob = true;
            continue;
        }
        if (handle.kind == HandleKind::TopLeft || handle.kind == HandleKind::TopRight) {
            top += at * 0.5;
            ++corners;
        }
        p.drawRect(QRectF(at.x() - half, at.y() - half, Constants::kHandleSizePx, Constants::kHandleSizePx));
    }

    if (corners == 2 && hasKnob) {
        p.drawLine(top, knob);
        p.drawEllipse(knob, half, half);
    }
    p.restore();
}

} // namespace FloorPlan
