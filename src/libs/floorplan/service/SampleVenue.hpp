// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "floorplan/FloorPlanGlobal.hpp"
#include "floorplan/FloorPlanTypes.hpp"

namespace FloorPlan::Service {

// A small restaurant floor across three zones, without ids.
FLOORPLAN_EXPORT SlotList sampleVenueSlots();

} // namespace FloorPlan::Service
