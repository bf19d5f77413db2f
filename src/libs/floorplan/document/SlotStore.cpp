// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "floorplan/document/SlotStore.hpp"

#include "floorplan/document/SlotSelectionModel.hpp"

#include <QtCore/QLoggingCategory>

#include <algorithm>

Q_LOGGING_CATEGORY(fpstorelog, "floorplan.store")

namespace FloorPlan {

SlotStore::SlotStore(QObject* parent)
    : QObject(parent)
    , m_selection(new SlotSelectionModel(this))
{
    connect(m_selection, &SlotSelectionModel::selectedSlotsChanged, this, [this]() {
        emit selectionChanged(m_selection->selectedSlots());
    });
}

SlotStore::~SlotStore() = default;

const Slot* SlotStore::findSlot(const SlotId& id) const
{
    const int idx = indexOf(id);
    return idx >= 0 ? &m_slots.at(idx) : nullptr;
}

int SlotStore::indexOf(const SlotId& id) const
{
    if (!id)
        return -1;
    for (int i = 0; i < m_slots.size(); ++i) {
        if (m_slots.at(i).id == id)
            return i;
    }
    return -1;
}

const SlotIdSet& SlotStore::selectedIds() const noexcept
{
    return m_selection->selectedSlots();
}

void SlotStore::setSelection(const SlotIdSet& ids)
{
    m_selection->setSelectedSlots(SlotSelectionModel::knownIds(ids, m_slots));
}

void SlotStore::resetSlots(SlotList slots)
{
    m_slots = std::move(slots);
    m_order.clear();
    m_order.reserve(m_slots.size());
    for (int i = 0; i < m_slots.size(); ++i)
        m_order.push_back(m_nextOrderKey++);
    qCDebug(fpstorelog) << "Slot collection reset," << m_slots.size() << "slots";
    emit slotsChanged();
    pruneSelection();
}

void SlotStore::clear()
{
    resetSlots(SlotList{});
}

bool SlotStore::applyPatch(const SlotId& id, const SlotPatch& patch)
{
    const int idx = indexOf(id);
    if (idx < 0)
        return false;

    Slot next = m_slots.at(idx);
    patch.applyTo(next);
    if (next == m_slots.at(idx))
        return true;

    m_slots[idx] = std::move(next);
    emit slotChanged(id);
    emit slotsChanged();
    return true;
}

bool SlotStore::replaceSlot(const Slot& slot)
{
    const int idx = indexOf(slot.id);
    if (idx < 0)
        return false;
    if (m_slots.at(idx) == slot)
        return true;

    m_slots[idx] = slot;
    emit slotChanged(slot.id);
    emit slotsChanged();
    return true;
}

void SlotStore::appendSlot(const Slot& slot)
{
    if (!slot.id) {
        qCWarning(fpstorelog) << "Refusing to insert a slot without an id";
        return;
    }
    if (contains(slot.id)) {
        replaceSlot(slot);
        return;
    }
    insertAt(size(), m_nextOrderKey++, slot);
}

void SlotStore::insertAt(int index, quint64 orderKey, const Slot& slot)
{
    m_slots.insert(index, slot);
    m_order.insert(index, orderKey);
    emit slotsChanged();
}

std::optional<RemovedSlot> SlotStore::removeSlot(const SlotId& id)
{
    const int idx = indexOf(id);
    if (idx < 0)
        return std::nullopt;

    RemovedSlot removed;
    removed.slot = m_slots.at(idx);
    removed.orderKey = m_order.at(idx);
    removed.wasSelected = m_selection->isSelected(id);

    m_slots.removeAt(idx);
    m_order.removeAt(idx);
    emit slotsChanged();
    m_selection->removeSelectedSlot(id);
    return removed;
}

void SlotStore::restoreSlot(const RemovedSlot& removed)
{
    if (!removed.slot.id)
        return;
    if (contains(removed.slot.id)) {
        replaceSlot(removed.slot);
    } else {
        const auto pos = std::lower_bound(m_order.cbegin(), m_order.cend(), removed.orderKey);
        insertAt(static_cast<int>(pos - m_order.cbegin()), removed.orderKey, removed.slot);
    }
    if (removed.wasSelected)
        m_selection->addSelectedSlot(removed.slot.id);
}

void SlotStore::pruneSelection()
{
    const SlotIdSet& current = m_selection->selectedSlots();
    const SlotIdSet known = SlotSelectionModel::knownIds(current, m_slots);
    if (known.size() != current.size())
        m_selection->setSelectedSlots(known);
}

} // namespace FloorPlan
