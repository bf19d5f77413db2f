// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "floorplan/FloorPlanGlobal.hpp"
#include "floorplan/FloorPlanTypes.hpp"

#include <QtCore/QObject>

namespace FloorPlan {

class FLOORPLAN_EXPORT SlotSelectionModel final : public QObject
{
    Q_OBJECT

public:
    explicit SlotSelectionModel(QObject* parent = nullptr);

    // Ids not present in slots are dropped.
    static SlotIdSet knownIds(const SlotIdSet& ids, const SlotList& slots);

    // Valid only when exactly one slot is selected.
    SlotId selectedSlot() const;
    const SlotIdSet& selectedSlots() const noexcept { return m_selected; }
    bool isSelected(const SlotId& id) const noexcept { return m_selected.contains(id); }
    bool isEmpty() const noexcept { return m_selected.isEmpty(); }

    void setSelectedSlot(const SlotId& id);
    void setSelectedSlots(const SlotIdSet& ids);
    void addSelectedSlot(const SlotId& id);
    void removeSelectedSlot(const SlotId& id);
    void clearSelectedSlots();

signals:
    void selectedSlotsChanged();
    void selectedSlotChanged(const FloorPlan::SlotId& id);

private:
    SlotIdSet m_selected;
};

} // namespace FloorPlan
