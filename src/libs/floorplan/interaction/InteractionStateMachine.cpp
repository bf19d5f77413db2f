// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "floorplan/interaction/InteractionStateMachine.hpp"

#include "floorplan/FloorPlanConstants.hpp"

#include <cmath>

namespace FloorPlan::Interaction {

namespace {

InteractionEffect selectEffect(const SlotId& id, bool multi)
{
    InteractionEffect e;
    e.kind = EffectKind::Select;
    e.slotId = id;
    e.multiSelect = multi;
    return e;
}

InteractionEffect positionEffect(EffectKind kind, const SlotId& id, const QPointF& pos)
{
    InteractionEffect e;
    e.kind = kind;
    e.slotId = id;
    e.position = pos;
    return e;
}

InteractionEffect panEffect(const QPointF& delta)
{
    InteractionEffect e;
    e.kind = EffectKind::Pan;
    e.delta = delta;
    return e;
}

InteractionEffect clearSelectionEffect()
{
    InteractionEffect e;
    e.kind = EffectKind::ClearSelection;
    return e;
}

InteractionEffect geometryEffect(EffectKind kind, const SlotId& id, const SlotGeometry& geometry)
{
    InteractionEffect e;
    e.kind = kind;
    e.slotId = id;
    e.position = geometry.rect.topLeft();
    e.geometry = geometry;
    return e;
}

InteractionState idleState()
{
    return InteractionState{};
}

void finishDrag(const DragSession& drag, const QPointF& finalPos, InteractionEffects& effects)
{
    if (finalPos == drag.origin) {
        effects.push_back(positionEffect(EffectKind::CancelPreview, drag.slotId, drag.origin));
        return;
    }
    effects.push_back(positionEffect(EffectKind::CommitMove, drag.slotId, finalPos));
}

QPointF handlePosition(const SlotGeometry& geometry, HandleKind kind)
{
    for (const SlotHandle& handle : slotHandles(geometry, 0.0)) {
        if (handle.kind == kind)
            return handle.world;
    }
    return geometry.center();
}

// Both gestures follow the pointer relative to where it grabbed the handle.
SlotGeometry transformedGeometry(const TransformSession& session, const QPointF& world)
{
    if (world == session.pressWorld)
        return session.origin;

    if (session.handle == HandleKind::Rotate) {
        const QPointF c = session.origin.center();
        double r = session.origin.rotation + rotationToward(c, world) - rotationToward(c, session.pressWorld);
        r = std::fmod(r, 360.0);
        if (r < 0.0)
            r += 360.0;
        SlotGeometry g = session.origin;
        g.rotation = r;
        return g;
    }
    return resizedGeometry(session.origin, session.handle, world - session.grabOffset,
                           Constants::kMinSlotExtent, session.keepSquare);
}

void finishTransform(const TransformSession& session, const SlotGeometry& result, InteractionEffects& effects)
{
    if (result == session.origin) {
        effects.push_back(geometryEffect(EffectKind::CancelPreview, session.slotId, session.origin));
        return;
    }
    effects.push_back(geometryEffect(EffectKind::CommitTransform, session.slotId, result));
}

InteractionTransition onPress(const InteractionState& state, const PointerEvent& event)
{
    InteractionTransition out;

    if (state.drag)
        out.effects.push_back(positionEffect(EffectKind::CancelPreview, state.drag->slotId, state.drag->origin));
    if (state.transform)
        out.effects.push_back(geometryEffect(EffectKind::CancelPreview, state.transform->slotId, state.transform->origin));

    if (event.hitSlot.isValid() && event.hitHandle != HandleKind::None) {
        TransformSession session;
        session.slotId = event.hitSlot;
        session.handle = event.hitHandle;
        session.pressWorld = event.world;
        if (isResizeHandle(event.hitHandle))
            session.grabOffset = event.world - handlePosition(event.hitGeometry, event.hitHandle);
        session.origin = event.hitGeometry;
        session.live = event.hitGeometry;
        session.keepSquare = event.keepSquare;

        out.state.mode = event.hitHandle == HandleKind::Rotate ? InteractionMode::RotatingItem
                                                               : InteractionMode::ResizingItem;
        out.state.transform = session;
        return out;
    }

    if (event.hitSlot.isValid()) {
        DragSession drag;
        drag.slotId = event.hitSlot;
        drag.startWorld = event.world;
        drag.origin = event.hitOrigin;
        drag.offset = event.world - event.hitOrigin;
        drag.livePosition = event.hitOrigin;

        out.state.mode = InteractionMode::DraggingItem;
        out.state.drag = drag;
        out.effects.push_back(selectEffect(event.hitSlot, event.multiSelect));
        return out;
    }

    PanSession pan;
    pan.pressWorld = event.world;
    pan.lastWorld = event.world;
    out.state.mode = InteractionMode::PanningCanvas;
    out.state.pan = pan;
    return out;
}

InteractionTransition onMove(const InteractionState& state, const PointerEvent& event)
{
    InteractionTransition out{state, {}};

    switch (state.mode) {
        case InteractionMode::Idle:
            break;
        case InteractionMode::DraggingItem: {
            if (!state.drag)
                return InteractionTransition{idleState(), {}};
            const QPointF live = event.world - state.drag->offset;
            if (live == state.drag->livePosition)
                break;
            out.state.drag->livePosition = live;
            out.effects.push_back(positionEffect(EffectKind::PreviewMove, state.drag->slotId, live));
            break;
        }
        case InteractionMode::PanningCanvas: {
            if (!state.pan)
                return InteractionTransition{idleState(), {}};
            const QPointF delta = event.world - state.pan->lastWorld;
            if (delta.isNull())
                break;
            out.effects.push_back(panEffect(delta));
            // After the viewport moves by delta the pointer sits over
            // (world - delta) again, which is the grabbed point.
            out.state.pan->lastWorld = event.world - delta;
            out.state.pan->moved = true;
            break;
        }
        case InteractionMode::ResizingItem:
        case InteractionMode::RotatingItem: {
            if (!state.transform)
                return InteractionTransition{idleState(), {}};
            const SlotGeometry live = transformedGeometry(*state.transform, event.world);
            if (live == state.transform->live)
                break;
            out.state.transform->live = live;
            out.effects.push_back(geometryEffect(EffectKind::PreviewTransform, state.transform->slotId, live));
            break;
        }
    }
    return out;
}

InteractionTransition onRelease(const InteractionState& state, const PointerEvent& event)
{
    InteractionTransition out{idleState(), {}};

    switch (state.mode) {
        case InteractionMode::Idle:
            break;
        case InteractionMode::DraggingItem:
            if (state.drag)
                finishDrag(*state.drag, event.world - state.drag->offset, out.effects);
            break;
        case InteractionMode::PanningCanvas:
            if (state.pan && !state.pan->moved && event.world == state.pan->pressWorld)
                out.effects.push_back(clearSelectionEffect());
            break;
        case InteractionMode::ResizingItem:
        case InteractionMode::RotatingItem:
            if (state.transform)
                finishTransform(*state.transform, transformedGeometry(*state.transform, event.world), out.effects);
            break;
    }
    return out;
}

InteractionTransition onLeave(const InteractionState& state)
{
    InteractionTransition out{idleState(), {}};
    if (state.mode == InteractionMode::DraggingItem && state.drag)
        finishDrag(*state.drag, state.drag->livePosition, out.effects);
    else if (state.transform)
        finishTransform(*state.transform, state.transform->live, out.effects);
    return out;
}

} // namespace

InteractionTransition transition(const InteractionState& state, const PointerEvent& event)
{
    switch (event.kind) {
        case PointerEventKind::Press: return onPress(state, event);
        case PointerEventKind::Move: return onMove(state, event);
        case PointerEventKind::Release: return onRelease(state, event);
        case PointerEventKind::Leave: return onLeave(state);
    }
    return InteractionTransition{state, {}};
}

QString modeName(InteractionMode mode)
{
    switch (mode) {
        case InteractionMode::Idle: return QStringLiteral("idle");
        case InteractionMode::DraggingItem: return QStringLiteral("dragging");
        case InteractionMode::PanningCanvas: return QStringLiteral("panning");
        case InteractionMode::ResizingItem: return QStringLiteral("resizing");
        case InteractionMode::RotatingItem: return QStringLiteral("rotating");
    }
    return QString();
}

} // namespace FloorPlan::Interaction
