// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "floorplan/FloorPlanConstants.hpp"
#include "floorplan/FloorPlanGlobal.hpp"
#include "floorplan/FloorPlanTypes.hpp"

#include <QtCore/QRectF>

namespace FloorPlan {

FLOORPLAN_EXPORT QRectF defaultViewport();

// Union of the slot bounds (rotation ignored) grown by padding on every side.
// A zero-extent axis gets an extra 2 * padding, centred, so a single point
// yields a 4 * padding square around it. Non-finite geometry is ignored.
FLOORPLAN_EXPORT QRectF computeInitialViewport(const SlotList& slots,
                                               double padding = Constants::kDefaultViewportPadding);

// Translates opposite to the pointer delta.
FLOORPLAN_EXPORT QRectF panViewport(const QRectF& viewport, double dx, double dy);

} // namespace FloorPlan
