// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "floorplan/FloorPlanGlobal.hpp"

#include <utils/Result.hpp>

#include <QtCore/QHashFunctions>
#include <QtCore/QMetaType>
#include <QtCore/QPointF>
#include <QtCore/QRectF>
#include <QtCore/QSet>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QVector>

#include <optional>
#include <utility>

namespace FloorPlan {

// Server assigned, opaque. An empty id is never a valid slot.
class SlotId final
{
public:
    SlotId() = default;
    explicit SlotId(QString value) : m_value(std::move(value)) {}

    const QString& value() const noexcept { return m_value; }
    bool isValid() const noexcept { return !m_value.isEmpty(); }

    explicit operator bool() const noexcept { return isValid(); }

    friend bool operator==(const SlotId& a, const SlotId& b) { return a.m_value == b.m_value; }
    friend bool operator!=(const SlotId& a, const SlotId& b) { return a.m_value != b.m_value; }
    friend bool operator<(const SlotId& a, const SlotId& b) { return a.m_value < b.m_value; }

private:
    QString m_value;
};

inline size_t qHash(const SlotId& id, size_t seed = 0) noexcept
{
    return ::qHash(id.value(), seed);
}

using SlotIdSet = QSet<SlotId>;

enum class SlotType : quint8 { Table, Booth, Area, Decor, BarSeat, Service };
enum class SlotShape : quint8 { Rectangle, LongRectangle, Circle, Ellipse };
enum class SlotStatus : quint8 { Available, Blocked, Reserved, Occupied, Maintenance };

FLOORPLAN_EXPORT QString toString(SlotType type);
FLOORPLAN_EXPORT QString toString(SlotShape shape);
FLOORPLAN_EXPORT QString toString(SlotStatus status);

FLOORPLAN_EXPORT std::optional<SlotType> slotTypeFromString(const QString& text);
FLOORPLAN_EXPORT std::optional<SlotShape> slotShapeFromString(const QString& text);
FLOORPLAN_EXPORT std::optional<SlotStatus> slotStatusFromString(const QString& text);

FLOORPLAN_EXPORT const QVector<SlotType>& allSlotTypes();
FLOORPLAN_EXPORT const QVector<SlotShape>& allSlotShapes();
FLOORPLAN_EXPORT const QVector<SlotStatus>& allSlotStatuses();

struct FLOORPLAN_EXPORT SlotMetadata final {
    std::optional<QString> color;
    std::optional<int> capacity;
    std::optional<QString> description;
    std::optional<bool> reservable;

    bool isEmpty() const noexcept { return !color && !capacity && !description && !reservable; }

    friend bool operator==(const SlotMetadata& a, const SlotMetadata& b)
    {
        return a.color == b.color && a.capacity == b.capacity && a.description == b.description
               && a.reservable == b.reservable;
    }
    friend bool operator!=(const SlotMetadata& a, const SlotMetadata& b) { return !(a == b); }
};

struct FLOORPLAN_EXPORT Slot final {
    SlotId id;
    QString label;
    SlotType type = SlotType::Table;
    SlotShape shape = SlotShape::Rectangle;
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;
    double rotation = 0.0;
    SlotStatus status = SlotStatus::Available;
    QString zone;
    SlotMetadata metadata;

    QPointF topLeft() const { return QPointF(x, y); }
    QRectF bounds() const { return QRectF(x, y, width, height); }

    bool hasFiniteGeometry() const noexcept;

    // Backend values outside [0, 360) are tolerated and folded here.
    double displayRotation() const noexcept;

    // Label if present, id otherwise. Used in user facing messages.
    QString displayName() const;

    friend bool operator==(const Slot& a, const Slot& b)
    {
        return a.id == b.id && a.label == b.label && a.type == b.type && a.shape == b.shape
               && a.x == b.x && a.y == b.y && a.width == b.width && a.height == b.height
               && a.rotation == b.rotation && a.status == b.status && a.zone == b.zone
               && a.metadata == b.metadata;
    }
    friend bool operator!=(const Slot& a, const Slot& b) { return !(a == b); }
};

using SlotList = QVector<Slot>;

// Partial update. Only engaged fields are sent and applied.
struct FLOORPLAN_EXPORT SlotPatch final {
    std::optional<QString> label;
    std::optional<SlotType> type;
    std::optional<SlotShape> shape;
    std::optional<double> x;
    std::optional<double> y;
    std::optional<double> width;
    std::optional<double> height;
    std::optional<double> rotation;
    std::optional<SlotStatus> status;
    std::optional<QString> zone;
    std::optional<SlotMetadata> metadata;

    bool isEmpty() const noexcept;
    bool touchesTransform() const noexcept;
    bool isTransformOnly() const noexcept;

    void applyTo(Slot& slot) const;

    // Transform fields rounded to whole world units, as sent on the wire.
    SlotPatch roundedTransform() const;

    Utils::Result validate() const;

    static SlotPatch moveTo(const QPointF& topLeft);

    friend bool operator==(const SlotPatch& a, const SlotPatch& b)
    {
        return a.label == b.label && a.type == b.type && a.shape == b.shape && a.x == b.x
               && a.y == b.y && a.width == b.width && a.height == b.height
               && a.rotation == b.rotation && a.status == b.status && a.zone == b.zone
               && a.metadata == b.metadata;
    }
    friend bool operator!=(const SlotPatch& a, const SlotPatch& b) { return !(a == b); }
};

struct FLOORPLAN_EXPORT SlotUpdate final {
    SlotId id;
    SlotPatch patch;
};

using SlotUpdateList = QVector<SlotUpdate>;

// A slot that does not exist on the server yet.
struct FLOORPLAN_EXPORT SlotDraft final {
    QString label;
    SlotType type = SlotType::Table;
    SlotShape shape = SlotShape::Rectangle;
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;
    double rotation = 0.0;
    SlotStatus status = SlotStatus::Available;
    QString zone;
    SlotMetadata metadata;

    Utils::Result validate() const;
    Slot toSlot(SlotId id) const;
};

struct FLOORPLAN_EXPORT SlotFilters final {
    // Empty or the all-zones sentinel means no zone filter.
    QString zone;

    bool matches(const Slot& slot) const;
};

FLOORPLAN_EXPORT bool isAllZones(const QString& zone);

} // namespace FloorPlan

Q_DECLARE_METATYPE(FloorPlan::SlotId)
Q_DECLARE_METATYPE(FloorPlan::Slot)
