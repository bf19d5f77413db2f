// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "floorplan/controllers/SelectionSynchronizer.hpp"

#include "floorplan/document/SlotSelectionModel.hpp"

namespace FloorPlan {

SelectionSynchronizer::SelectionSynchronizer(QObject* parent)
    : QObject(parent)
{}

SlotIdSet SelectionSynchronizer::applyClick(const SlotIdSet& current, const SlotId& id, bool multi)
{
    if (!id.isValid())
        return SlotIdSet{};

    if (!multi)
        return SlotIdSet{id};

    SlotIdSet next = current;
    if (next.contains(id))
        next.remove(id);
    else
        next.insert(id);
    return next;
}

bool SelectionSynchronizer::sync(const SlotIdSet& selection, const SlotList& slots)
{
    SlotIdSet next = SlotSelectionModel::knownIds(selection, slots);
    if (next == m_highlighted)
        return false;

    m_highlighted = std::move(next);
    emit highlightChanged(m_highlighted);
    return true;
}

} // namespace FloorPlan
