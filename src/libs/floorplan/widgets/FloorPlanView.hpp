// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "floorplan/FloorPlanConstants.hpp"
#include "floorplan/FloorPlanGlobal.hpp"
#include "floorplan/FloorPlanTypes.hpp"
#include "floorplan/SlotHandles.hpp"

#include <QtCore/QRectF>
#include <QtWidgets/QWidget>

namespace FloorPlan {

class FloorPlanInteractionController;
class SelectionSynchronizer;

// Draws the slots and forwards pointer input to the interaction controller.
// It only reads what it is given; edits leave through signals.
class FLOORPLAN_EXPORT FloorPlanView final : public QWidget
{
    Q_OBJECT

public:
    explicit FloorPlanView(QWidget* parent = nullptr);
    ~FloorPlanView() override;

    void setSlots(const SlotList& slots);
    const SlotList& slots() const noexcept { return m_slots; }

    void setSelectedSlotIds(const SlotIdSet& ids);
    const SlotIdSet& highlightedSlotIds() const;

    void setViewport(const QRectF& viewport);
    QRectF viewport() const;
    void fitToSlots(double padding = Constants::kDefaultViewportPadding);

    FloorPlanInteractionController* interaction() const noexcept { return m_interaction; }

    QSize sizeHint() const override;

signals:
    void selectSlotRequested(const FloorPlan::SlotId& id, bool multi);
    void itemMoved(const FloorPlan::SlotId& id, const QPointF& topLeft);
    void itemTransformed(const FloorPlan::SlotId& id, const FloorPlan::SlotGeometry& geometry);

protected:
    void paintEvent(QPaintEvent* event) override;
    void resizeEvent(QResizeEvent* event) override;
    void mousePressEvent(QMouseEvent* event) override;
    void mouseMoveEvent(QMouseEvent* event) override;
    void mouseReleaseEvent(QMouseEvent* event) override;
    void leaveEvent(QEvent* event) override;

private:
    SlotList slotsForPaint() const;

    SlotList m_slots;
    SlotIdSet m_pendingSelection;
    FloorPlanInteractionController* m_interaction = nullptr;
    SelectionSynchronizer* m_selectionSync = nullptr;
};

} // namespace FloorPlan
