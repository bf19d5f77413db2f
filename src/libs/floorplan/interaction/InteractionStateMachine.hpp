// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "floorplan/FloorPlanGlobal.hpp"
#include "floorplan/interaction/InteractionTypes.hpp"

namespace FloorPlan::Interaction {

// Pure transition function. Pointer positions are world coordinates mapped
// through the viewport that was current when the event arrived.
//
//  Idle          --press(slot)-->          DraggingItem   [Select]
//  Idle          --press(corner handle)--> ResizingItem
//  Idle          --press(rotate handle)--> RotatingItem
//  Idle          --press(background)-->    PanningCanvas
//  DraggingItem  --move-->                 DraggingItem   [PreviewMove]
//  DraggingItem  --release/leave-->        Idle           [CommitMove | CancelPreview]
//  ResizingItem  --move-->                 ResizingItem   [PreviewTransform]
//  RotatingItem  --move-->                 RotatingItem   [PreviewTransform]
//  Resizing/Rotating --release/leave-->    Idle           [CommitTransform | CancelPreview]
//  PanningCanvas --move-->                 PanningCanvas  [Pan]
//  PanningCanvas --release-->              Idle           [ClearSelection if it never moved]
//  PanningCanvas --leave-->                Idle
//
// A press while a session is active terminates that session first: a drag,
// resize or rotation is discarded without committing, a pan simply ends.
FLOORPLAN_EXPORT InteractionTransition transition(const InteractionState& state, const PointerEvent& event);

FLOORPLAN_EXPORT QString modeName(InteractionMode mode);

} // namespace FloorPlan::Interaction
