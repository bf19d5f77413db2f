// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "floorplan/FloorPlanGlobal.hpp"
#include "floorplan/FloorPlanTypes.hpp"
#include "floorplan/SlotHandles.hpp"
#include "floorplan/interaction/InteractionTypes.hpp"

#include <QtCore/QObject>
#include <QtCore/QPointF>
#include <QtCore/QRectF>
#include <QtCore/QSizeF>

#include <optional>

namespace FloorPlan {

// Live gesture result, drawn over the slot until the gesture ends. geometry
// is set for resize and rotate, position alone for a move.
struct FLOORPLAN_EXPORT DragPreview final {
    SlotId slotId;
    QPointF position;
    std::optional<SlotGeometry> geometry;

    void applyTo(Slot& slot) const;
};

// Owns the live gesture. Maps surface positions into world space, hit tests,
// runs the state machine and reports the effects as signals. It never
// touches the slot collection or the selection.
class FLOORPLAN_EXPORT FloorPlanInteractionController final : public QObject
{
    Q_OBJECT

public:
    explicit FloorPlanInteractionController(QObject* parent = nullptr);

    void setSlots(const SlotList& slots);
    const SlotList& slots() const noexcept { return m_slots; }

    void setViewport(const QRectF& viewport);
    QRectF viewport() const noexcept { return m_viewport; }

    void setSurfaceSize(const QSizeF& size);
    QSizeF surfaceSize() const noexcept { return m_surfaceSize; }

    // Handles are offered only while exactly one slot is selected.
    void setSelectedSlotIds(const SlotIdSet& ids);
    const SlotId& handleSlotId() const noexcept { return m_handleSlot; }

    // World positions of the handles on the selected slot, empty without one.
    QVector<SlotHandle> handles() const;

    Interaction::InteractionMode mode() const noexcept { return m_state.mode; }
    const Interaction::InteractionState& state() const noexcept { return m_state; }
    const std::optional<DragPreview>& dragPreview() const noexcept { return m_preview; }

    QPointF surfaceToWorld(const QPointF& surfacePos) const;

    // Drops any active gesture without committing.
    void reset();

public slots:
    void onPointerPressed(const QPointF& surfacePos, Qt::MouseButtons buttons, Qt::KeyboardModifiers mods);
    void onPointerMoved(const QPointF& surfacePos, Qt::MouseButtons buttons, Qt::KeyboardModifiers mods);
    void onPointerReleased(const QPointF& surfacePos, Qt::MouseButtons buttons, Qt::KeyboardModifiers mods);
    void onPointerLeft();

signals:
    // An invalid id asks for the selection to be cleared.
    void selectSlotRequested(const FloorPlan::SlotId& id, bool multi);
    void itemMoved(const FloorPlan::SlotId& id, const QPointF& topLeft);
    void itemTransformed(const FloorPlan::SlotId& id, const FloorPlan::SlotGeometry& geometry);
    void viewportChanged(const QRectF& viewport);
    void dragPreviewChanged();
    void modeChanged(FloorPlan::Interaction::InteractionMode mode);

private:
    void dispatch(const Interaction::PointerEvent& event);
    void applyEffect(const Interaction::InteractionEffect& effect);
    void setState(Interaction::InteractionState state);
    void setPreview(std::optional<DragPreview> preview);
    const Slot* findSlot(const SlotId& id) const;
    HandleKind hitHandle(const QPointF& world) const;
    bool isActiveSlotMissing() const;

    SlotList m_slots;
    SlotId m_handleSlot;
    QRectF m_viewport;
    QSizeF m_surfaceSize;
    Interaction::InteractionState m_state;
    std::optional<DragPreview> m_preview;
    bool m_forcePan = false;
};

} // namespace FloorPlan
