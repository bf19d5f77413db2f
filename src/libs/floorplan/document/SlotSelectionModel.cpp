// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "floorplan/document/SlotSelectionModel.hpp"

namespace FloorPlan {

SlotSelectionModel::SlotSelectionModel(QObject* parent)
    : QObject(parent)
{}

SlotIdSet SlotSelectionModel::knownIds(const SlotIdSet& ids, const SlotList& slots)
{
    if (ids.isEmpty())
        return ids;

    SlotIdSet present;
    present.reserve(slots.size());
    for (const Slot& slot : slots)
        present.insert(slot.id);

    SlotIdSet out;
    for (const SlotId& id : ids) {
        if (present.contains(id))
            out.insert(id);
    }
    return out;
}

SlotId SlotSelectionModel::selectedSlot() const
{
    if (m_selected.size() != 1)
        return SlotId{};
    return *m_selected.constBegin();
}

void SlotSelectionModel::setSelectedSlot(const SlotId& id)
{
    if (!id) {
        clearSelectedSlots();
        return;
    }
    setSelectedSlots(SlotIdSet{id});
}

void SlotSelectionModel::setSelectedSlots(const SlotIdSet& ids)
{
    SlotIdSet next;
    for (const SlotId& id : ids) {
        if (id)
            next.insert(id);
    }

    if (m_selected == next)
        return;

    const SlotId prevSelected = selectedSlot();
    m_selected = std::move(next);
    emit selectedSlotsChanged();

    const SlotId nextSelected = selectedSlot();
    if (prevSelected != nextSelected)
        emit selectedSlotChanged(nextSelected);
}

void SlotSelectionModel::addSelectedSlot(const SlotId& id)
{
    if (!id || m_selected.contains(id))
        return;
    SlotIdSet next = m_selected;
    next.insert(id);
    setSelectedSlots(next);
}

void SlotSelectionModel::removeSelectedSlot(const SlotId& id)
{
    if (!m_selected.contains(id))
        return;
    SlotIdSet next = m_selected;
    next.remove(id);
    setSelectedSlots(next);
}

void SlotSelectionModel::clearSelectedSlots()
{
    if (m_selected.isEmpty())
        return;
    setSelectedSlots(SlotIdSet{});
}

} // namespace FloorPlan
