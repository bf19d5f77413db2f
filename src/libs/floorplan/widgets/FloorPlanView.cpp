// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "floorplan/widgets/FloorPlanView.hpp"

#include "floorplan/FloorPlanTools.hpp"
#include "floorplan/FloorPlanViewport.hpp"
#include "floorplan/SlotRenderer.hpp"
#include "floorplan/controllers/FloorPlanInteractionController.hpp"
#include "floorplan/controllers/SelectionSynchronizer.hpp"

#include <QtGui/QMouseEvent>
#include <QtGui/QPainter>

namespace FloorPlan {

FloorPlanView::FloorPlanView(QWidget* parent)
    : QWidget(parent)
    , m_interaction(new FloorPlanInteractionController(this))
    , m_selectionSync(new SelectionSynchronizer(this))
{
    setObjectName(QStringLiteral("FloorPlanView"));
    setMouseTracking(true);
    setFocusPolicy(Qt::StrongFocus);

    connect(m_interaction, &FloorPlanInteractionController::selectSlotRequested,
            this, &FloorPlanView::selectSlotRequested);
    connect(m_interaction, &FloorPlanInteractionController::itemMoved,
            this, &FloorPlanView::itemMoved);
    connect(m_interaction, &FloorPlanInteractionController::itemTransformed,
            this, &FloorPlanView::itemTransformed);
    connect(m_interaction, &FloorPlanInteractionController::viewportChanged,
            this, [this]() { update(); });
    connect(m_interaction, &FloorPlanInteractionController::dragPreviewChanged,
            this, [this]() { update(); });
    connect(m_selectionSync, &SelectionSynchronizer::highlightChanged,
            this, [this]() {
                m_interaction->setSelectedSlotIds(m_selectionSync->highlighted());
                update();
            });
}

FloorPlanView::~FloorPlanView() = default;

void FloorPlanView::setSlots(const SlotList& slots)
{
    m_slots = slots;
    m_interaction->setSlots(m_slots);
    // Ids that were unknown a moment ago may exist now.
    m_selectionSync->sync(m_pendingSelection, m_slots);
    update();
}

void FloorPlanView::setSelectedSlotIds(const SlotIdSet& ids)
{
    m_pendingSelection = ids;
    m_selectionSync->sync(m_pendingSelection, m_slots);
}

const SlotIdSet& FloorPlanView::highlightedSlotIds() const
{
    return m_selectionSync->highlighted();
}

void FloorPlanView::setViewport(const QRectF& viewport)
{
    m_interaction->setViewport(viewport);
}

QRectF FloorPlanView::viewport() const
{
    return m_interaction->viewport();
}

void FloorPlanView::fitToSlots(double padding)
{
    setViewport(computeInitialViewport(m_slots, padding));
}

QSize FloorPlanView::sizeHint() const
{
    return QSize(800, 600);
}

SlotList FloorPlanView::slotsForPaint() const
{
    const auto& preview = m_interaction->dragPreview();
    if (!preview)
        return m_slots;

    SlotList out = m_slots;
    for (Slot& slot : out) {
        if (slot.id == preview->slotId) {
            preview->applyTo(slot);
            break;
        }
    }
    return out;
}

void FloorPlanView::paintEvent(QPaintEvent* event)
{
    Q_UNUSED(event);

    QPainter p(this);
    SlotStyle::drawBackground(p, rect());

    const auto xf = Tools::worldToSurfaceTransform(viewport(), size());
    if (!xf)
        return;

    const QVector<SlotPrimitive> scene = buildSlotScene(slotsForPaint(), m_selectionSync->highlighted());
    SlotStyle::drawScene(p, scene, *xf);
    SlotStyle::drawHandles(p, m_interaction->handles(), *xf);
}

void FloorPlanView::resizeEvent(QResizeEvent* event)
{
    QWidget::resizeEvent(event);
    m_interaction->setSurfaceSize(size());
}

void FloorPlanView::mousePressEvent(QMouseEvent* event)
{
    m_interaction->onPointerPressed(event->position(), event->buttons(), event->modifiers());
    event->accept();
}

void FloorPlanView::mouseMoveEvent(QMouseEvent* event)
{
    m_interaction->onPointerMoved(event->position(), event->buttons(), event->modifiers());
    event->accept();
}

void FloorPlanView::mouseReleaseEvent(QMouseEvent* event)
{
    m_interaction->onPointerReleased(event->position(), event->buttons(), event->modifiers());
    event->accept();
}

void FloorPlanView::leaveEvent(QEvent* event)
{
    m_interaction->onPointerLeft();
    QWidget::leaveEvent(event);
}

} // namespace FloorPlan
