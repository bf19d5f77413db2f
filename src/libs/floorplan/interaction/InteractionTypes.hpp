// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "floorplan/FloorPlanGlobal.hpp"
#include "floorplan/FloorPlanTypes.hpp"
#include "floorplan/SlotHandles.hpp"

#include <QtCore/QPointF>
#include <QtCore/QVector>

#include <optional>

namespace FloorPlan::Interaction {

enum class InteractionMode : quint8 { Idle, DraggingItem, PanningCanvas, ResizingItem, RotatingItem };

struct FLOORPLAN_EXPORT DragSession final {
    SlotId slotId;
    QPointF startWorld;
    QPointF origin;
    QPointF offset;         // pointer - origin, fixed for the whole drag
    QPointF livePosition;
};

struct FLOORPLAN_EXPORT PanSession final {
    QPointF pressWorld;
    QPointF lastWorld;
    bool moved = false;
};

// Resize or rotate through a selection handle.
struct FLOORPLAN_EXPORT TransformSession final {
    SlotId slotId;
    HandleKind handle = HandleKind::None;
    QPointF pressWorld;
    QPointF grabOffset;     // pointer - grabbed handle, resize only
    SlotGeometry origin;
    SlotGeometry live;
    bool keepSquare = false;
};

struct FLOORPLAN_EXPORT InteractionState final {
    InteractionMode mode = InteractionMode::Idle;
    std::optional<DragSession> drag;
    std::optional<PanSession> pan;
    std::optional<TransformSession> transform;

    bool isIdle() const noexcept { return mode == InteractionMode::Idle; }
};

enum class PointerEventKind : quint8 { Press, Move, Release, Leave };

struct FLOORPLAN_EXPORT PointerEvent final {
    PointerEventKind kind = PointerEventKind::Move;
    QPointF world;
    SlotId hitSlot;         // invalid for background
    QPointF hitOrigin;      // top-left of hitSlot
    bool multiSelect = false;
    HandleKind hitHandle = HandleKind::None;
    SlotGeometry hitGeometry; // geometry of hitSlot when a handle was hit
    bool keepSquare = false;

    static PointerEvent press(const QPointF& world, SlotId hit = {}, QPointF hitOrigin = {}, bool multi = false)
    {
        return PointerEvent{PointerEventKind::Press, world, std::move(hit), hitOrigin, multi};
    }
    static PointerEvent pressHandle(const QPointF& world, SlotId slot, HandleKind handle,
                                    const SlotGeometry& geometry, bool keepSquare = false)
    {
        PointerEvent e{PointerEventKind::Press, world, std::move(slot), geometry.rect.topLeft(), false};
        e.hitHandle = handle;
        e.hitGeometry = geometry;
        e.keepSquare = keepSquare;
        return e;
    }
    static PointerEvent move(const QPointF& world) { return PointerEvent{PointerEventKind::Move, world, {}, {}, false}; }
    static PointerEvent release(const QPointF& world) { return PointerEvent{PointerEventKind::Release, world, {}, {}, false}; }
    static PointerEvent leave() { return PointerEvent{PointerEventKind::Leave, {}, {}, {}, false}; }
};

enum class EffectKind : quint8 {
    Select,
    ClearSelection,
    PreviewMove,
    CancelPreview,
    Pan,
    CommitMove,
    PreviewTransform,
    CommitTransform
};

struct FLOORPLAN_EXPORT InteractionEffect final {
    EffectKind kind = EffectKind::Select;
    SlotId slotId;
    QPointF position;       // PreviewMove / CommitMove
    QPointF delta;          // Pan, world units
    bool multiSelect = false;
    SlotGeometry geometry;  // PreviewTransform / CommitTransform
};

using InteractionEffects = QVector<InteractionEffect>;

struct FLOORPLAN_EXPORT InteractionTransition final {
    InteractionState state;
    InteractionEffects effects;
};

} // namespace FloorPlan::Interaction
