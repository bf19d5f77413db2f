// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "floorplan/FloorPlanGlobal.hpp"
#include "floorplan/FloorPlanTypes.hpp"
#include "floorplan/document/SlotSelectionModel.hpp"

#include <QtCore/QObject>

#include <optional>

namespace FloorPlan {

// orderKey is the slot's rank in the collection when it was removed. Ranks
// only grow, so restoring by rank puts a slot back between the same
// neighbours whatever else was removed or restored in the meantime.
struct FLOORPLAN_EXPORT RemovedSlot final {
    Slot slot;
    quint64 orderKey = 0;
    bool wasSelected = false;
};

// Canonical slot collection plus the selection over it. Everything that
// mutates either goes through here so views can simply listen.
class FLOORPLAN_EXPORT SlotStore final : public QObject
{
    Q_OBJECT

public:
    explicit SlotStore(QObject* parent = nullptr);
    ~SlotStore() override;

    const SlotList& slots() const noexcept { return m_slots; }
    int size() const noexcept { return static_cast<int>(m_slots.size()); }
    bool isEmpty() const noexcept { return m_slots.isEmpty(); }

    const Slot* findSlot(const SlotId& id) const;
    int indexOf(const SlotId& id) const;
    bool contains(const SlotId& id) const { return indexOf(id) >= 0; }

    SlotSelectionModel& selection() noexcept { return *m_selection; }
    const SlotSelectionModel& selection() const noexcept { return *m_selection; }
    const SlotIdSet& selectedIds() const noexcept;

    // Drops ids that are not in the collection.
    void setSelection(const SlotIdSet& ids);

    void resetSlots(SlotList slots);
    void clear();

    bool applyPatch(const SlotId& id, const SlotPatch& patch);
    bool replaceSlot(const Slot& slot);

    // A slot whose id is already loaded replaces the loaded copy in place.
    void appendSlot(const Slot& slot);

    std::optional<RemovedSlot> removeSlot(const SlotId& id);
    void restoreSlot(const RemovedSlot& removed);

signals:
    void slotsChanged();
    void slotChanged(const FloorPlan::SlotId& id);
    void selectionChanged(const FloorPlan::SlotIdSet& ids);

private:
    void pruneSelection();
    void insertAt(int index, quint64 orderKey, const Slot& slot);

    SlotList m_slots;
    QVector<quint64> m_order;
    quint64 m_nextOrderKey = 0;
    SlotSelectionModel* m_selection = nullptr;
};

} // namespace FloorPlan
