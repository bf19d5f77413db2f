// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "floorplan/FloorPlanGlobal.hpp"
#include "floorplan/FloorPlanTypes.hpp"
#include "floorplan/SlotRenderer.hpp"

#include <QtCore/QPointF>

namespace FloorPlan::Services {

// Topmost (last drawn) slot under the world point, or an invalid id.
FLOORPLAN_EXPORT SlotId hitTestSlot(const QVector<SlotPrimitive>& scene, const QPointF& worldPos);
FLOORPLAN_EXPORT SlotId hitTestSlot(const SlotList& slots, const QPointF& worldPos);

} // namespace FloorPlan::Services
