// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "floorplan/FloorPlanTypes.hpp"

#include "floorplan/FloorPlanConstants.hpp"

#include <cmath>

namespace FloorPlan {

namespace {

bool isFinite(double v)
{
    return std::isfinite(v);
}

std::optional<double> roundedValue(const std::optional<double>& v)
{
    if (!v)
        return std::nullopt;
    return std::round(*v);
}

Utils::Result validateExtents(const std::optional<double>& width, const std::optional<double>& height)
{
    Utils::Result r;
    if (width && (!isFinite(*width) || *width <= 0.0))
        r.addError(QStringLiteral("Width must be greater than zero."));
    if (height && (!isFinite(*height) || *height <= 0.0))
        r.addError(QStringLiteral("Height must be greater than zero."));
    return r;
}

} // namespace

QString toString(SlotType type)
{
    switch (type) {
        case SlotType::Table: return QStringLiteral("table");
        case SlotType::Booth: return QStringLiteral("booth");
        case SlotType::Area: return QStringLiteral("area");
        case SlotType::Decor: return QStringLiteral("decor");
        case SlotType::BarSeat: return QStringLiteral("bar-seat");
        case SlotType::Service: return QStringLiteral("service");
    }
    return QString();
}

QString toString(SlotShape shape)
{
    switch (shape) {
        case SlotShape::Rectangle: return QStringLiteral("rect");
        case SlotShape::LongRectangle: return QStringLiteral("longrect");
        case SlotShape::Circle: return QStringLiteral("circle");
        case SlotShape::Ellipse: return QStringLiteral("ellipse");
    }
    return QString();
}

QString toString(SlotStatus status)
{
    switch (status) {
        case SlotStatus::Available: return QStringLiteral("available");
        case SlotStatus::Blocked: return QStringLiteral("blocked");
        case SlotStatus::Reserved: return QStringLiteral("reserved");
        case SlotStatus::Occupied: return QStringLiteral("occupied");
        case SlotStatus::Maintenance: return QStringLiteral("maintenance");
    }
    return QString();
}

std::optional<SlotType> slotTypeFromString(const QString& text)
{
    const QString key = text.trimmed().toLower();
    for (SlotType type : allSlotTypes()) {
        if (toString(type) == key)
            return type;
    }
    return std::nullopt;
}

std::optional<SlotShape> slotShapeFromString(const QString& text)
{
    const QString key = text.trimmed().toLower();
    for (SlotShape shape : allSlotShapes()) {
        if (toString(shape) == key)
            return shape;
    }
    return std::nullopt;
}

std::optional<SlotStatus> slotStatusFromString(const QString& text)
{
    const QString key = text.trimmed().toLower();
    for (SlotStatus status : allSlotStatuses()) {
        if (toString(status) == key)
            return status;
    }
    return std::nullopt;
}

const QVector<SlotType>& allSlotTypes()
{
    static const QVector<SlotType> kTypes{SlotType::Table, SlotType::Booth, SlotType::Area,
                                          SlotType::Decor, SlotType::BarSeat, SlotType::Service};
    return kTypes;
}

const QVector<SlotShape>& allSlotShapes()
{
    static const QVector<SlotShape> kShapes{SlotShape::Rectangle, SlotShape::LongRectangle,
                                            SlotShape::Circle, SlotShape::Ellipse};
    return kShapes;
}

const QVector<SlotStatus>& allSlotStatuses()
{
    static const QVector<SlotStatus> kStatuses{SlotStatus::Available, SlotStatus::Blocked,
                                               SlotStatus::Reserved, SlotStatus::Occupied,
                                               SlotStatus::Maintenance};
    return kStatuses;
}

bool Slot::hasFiniteGeometry() const noexcept
{
    return isFinite(x) && isFinite(y) && isFinite(width) && isFinite(height) && isFinite(rotation);
}

double Slot::displayRotation() const noexcept
{
    if (!isFinite(rotation))
        return 0.0;
    double r = std::fmod(rotation, 360.0);
    if (r < 0.0)
        r += 360.0;
    if (r >= 360.0)
        r = 0.0;
    return r;
}

QString Slot::displayName() const
{
    return label.isEmpty() ? id.value() : label;
}

bool SlotPatch::isEmpty() const noexcept
{
    return !label && !type && !shape && !x && !y && !width && !height && !rotation && !status
           && !zone && !metadata;
}

bool SlotPatch::touchesTransform() const noexcept
{
    return x || y || width || height || rotation;
}

bool SlotPatch::isTransformOnly() const noexcept
{
    return touchesTransform() && !label && !type && !shape && !status && !zone && !metadata;
}

void SlotPatch::applyTo(Slot& slot) const
{
    if (label)
        slot.label = *label;
    if (type)
        slot.type = *type;
    if (shape)
        slot.shape = *shape;
    if (x)
        slot.x = *x;
    if (y)
        slot.y = *y;
    if (width)
        slot.width = *width;
    if (height)
        slot.height = *height;
    if (rotation)
        slot.rotation = *rotation;
    if (status)
        slot.status = *status;
    if (zone)
        slot.zone = *zone;
    if (metadata)
        slot.metadata = *metadata;
}

SlotPatch SlotPatch::roundedTransform() const
{
    SlotPatch out = *this;
    out.x = roundedValue(x);
    out.y = roundedValue(y);
    out.width = roundedValue(width);
    out.height = roundedValue(height);
    out.rotation = roundedValue(rotation);
    return out;
}

Utils::Result SlotPatch::validate() const
{
    // Extents are checked as they go out on the wire.
    Utils::Result r = validateExtents(roundedValue(width), roundedValue(height));
    if ((x && !isFinite(*x)) || (y && !isFinite(*y)))
        r.addError(QStringLiteral("Position must be a finite value."));
    if (rotation && !isFinite(*rotation))
        r.addError(QStringLiteral("Rotation must be a finite value."));
    return r;
}

SlotPatch SlotPatch::moveTo(const QPointF& topLeft)
{
    SlotPatch patch;
    patch.x = topLeft.x();
    patch.y = topLeft.y();
    return patch;
}

Utils::Result SlotDraft::validate() const
{
    Utils::Result r = validateExtents(width, height);
    if (!isFinite(x) || !isFinite(y))
        r.addError(QStringLiteral("Position must be a finite value."));
    if (!isFinite(rotation))
        r.addError(QStringLiteral("Rotation must be a finite value."));
    return r;
}

Slot SlotDraft::toSlot(SlotId id) const
{
    Slot slot;
    slot.id = std::move(id);
    slot.label = label;
    slot.type = type;
    slot.shape = shape;
    slot.x = x;
    slot.y = y;
    slot.width = width;
    slot.height = height;
    slot.rotation = rotation;
    slot.status = status;
    slot.zone = zone;
    slot.metadata = metadata;
    return slot;
}

bool SlotFilters::matches(const Slot& slot) const
{
    if (isAllZones(zone))
        return true;
    return slot.zone == zone;
}

bool isAllZones(const QString& zone)
{
    return zone.isEmpty() || zone == QLatin1String(Constants::kAllZones);
}

} // namespace FloorPlan
