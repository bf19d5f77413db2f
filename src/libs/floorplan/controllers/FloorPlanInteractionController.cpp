// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "floorplan/controllers/FloorPlanInteractionController.hpp"

#include "floorplan/FloorPlanConstants.hpp"
#include "floorplan/FloorPlanTools.hpp"
#include "floorplan/FloorPlanViewport.hpp"
#include "floorplan/interaction/InteractionStateMachine.hpp"
#include "floorplan/services/SlotHitTestService.hpp"

#include <utils/ScopeGuard.hpp>

#include <QtCore/QLoggingCategory>

#include <exception>

Q_LOGGING_CATEGORY(fpinteractionlog, "floorplan.interaction")

namespace FloorPlan {

namespace {

bool isMultiSelectModifier(Qt::KeyboardModifiers mods)
{
    return mods.testFlag(Qt::ControlModifier) || mods.testFlag(Qt::ShiftModifier)
           || mods.testFlag(Qt::MetaModifier);
}

} // namespace

void DragPreview::applyTo(Slot& slot) const
{
    if (!geometry) {
        slot.x = position.x();
        slot.y = position.y();
        return;
    }
    slot.x = geometry->rect.x();
    slot.y = geometry->rect.y();
    slot.width = geometry->rect.width();
    if (slot.shape != SlotShape::Circle)
        slot.height = geometry->rect.height();
    slot.rotation = geometry->rotation;
}

FloorPlanInteractionController::FloorPlanInteractionController(QObject* parent)
    : QObject(parent)
    , m_viewport(defaultViewport())
{}

void FloorPlanInteractionController::setSlots(const SlotList& slots)
{
    m_slots = slots;

    // The slot under the gesture may have been removed underneath us.
    if (isActiveSlotMissing())
        reset();
}

void FloorPlanInteractionController::setViewport(const QRectF& viewport)
{
    if (m_viewport == viewport)
        return;
    m_viewport = viewport;
    emit viewportChanged(m_viewport);
}

void FloorPlanInteractionController::setSurfaceSize(const QSizeF& size)
{
    m_surfaceSize = size;
}

void FloorPlanInteractionController::setSelectedSlotIds(const SlotIdSet& ids)
{
    m_handleSlot = ids.size() == 1 ? *ids.constBegin() : SlotId{};
}

QVector<SlotHandle> FloorPlanInteractionController::handles() const
{
    const Slot* slot = findSlot(m_handleSlot);
    const double scale = Tools::fitScale(m_viewport, m_surfaceSize);
    if (!slot || scale <= 0.0 || !slot->hasFiniteGeometry())
        return {};

    SlotGeometry geometry = SlotGeometry::of(*slot);
    if (m_preview && m_preview->slotId == slot->id) {
        Slot shown = *slot;
        m_preview->applyTo(shown);
        geometry = SlotGeometry::of(shown);
    }
    return slotHandles(geometry, Constants::kRotateHandleOffsetPx / scale);
}

QPointF FloorPlanInteractionController::surfaceToWorld(const QPointF& surfacePos) const
{
    return Tools::toWorld(surfacePos, m_viewport, m_surfaceSize);
}

void FloorPlanInteractionController::reset()
{
    m_forcePan = false;
    setPreview(std::nullopt);
    setState(Interaction::InteractionState{});
}

void FloorPlanInteractionController::onPointerPressed(const QPointF& surfacePos,
                                                      Qt::MouseButtons buttons,
                                                      Qt::KeyboardModifiers mods)
{
    const bool left = buttons.testFlag(Qt::LeftButton);
    const bool middle = buttons.testFlag(Qt::MiddleButton);
    if (!left && !middle)
        return;

    const QPointF world = surfaceToWorld(surfacePos);

    m_forcePan = middle && !left;

    if (left) {
        const HandleKind handle = hitHandle(world);
        if (handle != HandleKind::None) {
            const Slot* slot = findSlot(m_handleSlot);
            dispatch(Interaction::PointerEvent::pressHandle(world, m_handleSlot, handle, SlotGeometry::of(*slot),
                                                            slot->shape == SlotShape::Circle));
            return;
        }
    }

    // Middle button always pans, even over a slot.
    SlotId hit;
    QPointF origin;
    if (left) {
        hit = Services::hitTestSlot(m_slots, world);
        if (const Slot* slot = findSlot(hit))
            origin = slot->topLeft();
    }

    dispatch(Interaction::PointerEvent::press(world, hit, origin, isMultiSelectModifier(mods)));
}

void FloorPlanInteractionController::onPointerMoved(const QPointF& surfacePos,
                                                    Qt::MouseButtons buttons,
                                                    Qt::KeyboardModifiers mods)
{
    Q_UNUSED(buttons);
    Q_UNUSED(mods);
    if (m_state.isIdle())
        return;
    dispatch(Interaction::PointerEvent::move(surfaceToWorld(surfacePos)));
}

void FloorPlanInteractionController::onPointerReleased(const QPointF& surfacePos,
                                                       Qt::MouseButtons buttons,
                                                       Qt::KeyboardModifiers mods)
{
    Q_UNUSED(buttons);
    Q_UNUSED(mods);
    if (m_state.isIdle())
        return;
    dispatch(Interaction::PointerEvent::release(surfaceToWorld(surfacePos)));
    m_forcePan = false;
}

void FloorPlanInteractionController::onPointerLeft()
{
    if (m_state.isIdle())
        return;
    dispatch(Interaction::PointerEvent::leave());
    m_forcePan = false;
}

void FloorPlanInteractionController::dispatch(const Interaction::PointerEvent& event)
{
    // Whatever happens below, a handler never leaves a half-applied gesture.
    auto resetOnFailure = Utils::makeScopeGuard([this] { reset(); });

    try {
        Interaction::InteractionTransition next = Interaction::transition(m_state, event);
        setState(std::move(next.state));
        for (const Interaction::InteractionEffect& effect : next.effects)
            applyEffect(effect);
        resetOnFailure.dismiss();
    } catch (const std::exception& e) {
        qCWarning(fpinteractionlog).noquote() << "Pointer handling failed, gesture aborted:" << e.what();
    }
}

void FloorPlanInteractionController::applyEffect(const Interaction::InteractionEffect& effect)
{
    using Interaction::EffectKind;

    switch (effect.kind) {
        case EffectKind::Select:
            emit selectSlotRequested(effect.slotId, effect.multiSelect);
            break;
        case EffectKind::ClearSelection:
            if (!m_forcePan)
                emit selectSlotRequested(SlotId{}, false);
            break;
        case EffectKind::PreviewMove:
            setPreview(DragPreview{effect.slotId, effect.position});
            break;
        case EffectKind::CancelPreview:
            setPreview(std::nullopt);
            break;
        case EffectKind::Pan:
            setViewport(panViewport(m_viewport, effect.delta.x(), effect.delta.y()));
            break;
        case EffectKind::CommitMove:
            qCDebug(fpinteractionlog).noquote()
                << "Committing move of" << effect.slotId.value() << "to" << effect.position;
            emit itemMoved(effect.slotId, effect.position);
            setPreview(std::nullopt);
            break;
        case EffectKind::PreviewTransform:
            setPreview(DragPreview{effect.slotId, effect.position, effect.geometry});
            break;
        case EffectKind::CommitTransform:
            qCDebug(fpinteractionlog).noquote()
                << "Committing transform of" << effect.slotId.value() << "to" << effect.geometry.rect
                << "rotation" << effect.geometry.rotation;
            emit itemTransformed(effect.slotId, effect.geometry);
            setPreview(std::nullopt);
            break;
    }
}

void FloorPlanInteractionController::setState(Interaction::InteractionState state)
{
    const Interaction::InteractionMode prev = m_state.mode;
    m_state = std::move(state);
    if (prev != m_state.mode) {
        qCDebug(fpinteractionlog).noquote() << "Interaction" << Interaction::modeName(prev) << "->"
                                            << Interaction::modeName(m_state.mode);
        emit modeChanged(m_state.mode);
    }
}

void FloorPlanInteractionController::setPreview(std::optional<DragPreview> preview)
{
    const bool same = (!m_preview && !preview)
                      || (m_preview && preview && m_preview->slotId == preview->slotId
                          && m_preview->position == preview->position
                          && m_preview->geometry == preview->geometry);
    if (same)
        return;
    m_preview = std::move(preview);
    emit dragPreviewChanged();
}

HandleKind FloorPlanInteractionController::hitHandle(const QPointF& world) const
{
    const double scale = Tools::fitScale(m_viewport, m_surfaceSize);
    if (scale <= 0.0)
        return HandleKind::None;
    return hitTestHandle(handles(), world, Constants::kHandleHitRadiusPx / scale);
}

bool FloorPlanInteractionController::isActiveSlotMissing() const
{
    if (m_state.drag)
        return !findSlot(m_state.drag->slotId);
    if (m_state.transform)
        return !findSlot(m_state.transform->slotId);
    return false;
}

const Slot* FloorPlanInteractionController::findSlot(const SlotId& id) const
{
    if (!id.isValid())
        return nullptr;
    for (const Slot& slot : m_slots) {
        if (slot.id == id)
            return &slot;
    }
    return nullptr;
}

} // namespace FloorPlan
