// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "floorplan/services/SlotHitTestService.hpp"

namespace FloorPlan::Services {

SlotId hitTestSlot(const QVector<SlotPrimitive>& scene, const QPointF& worldPos)
{
    for (auto it = scene.crbegin(); it != scene.crend(); ++it) {
        if (it->contains(worldPos))
            return it->id;
    }
    return SlotId{};
}

SlotId hitTestSlot(const SlotList& slots, const QPointF& worldPos)
{
    return hitTestSlot(buildSlotScene(slots, SlotIdSet{}), worldPos);
}

} // namespace FloorPlan::Services
