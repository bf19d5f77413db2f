// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "floorplan/FloorPlanGlobal.hpp"
#include "floorplan/FloorPlanTypes.hpp"

#include <QtCore/QObject>

namespace FloorPlan {

// Keeps the renderer's highlight set equal to the externally owned selection,
// and turns clicks into the next selection for the owner to adopt.
class FLOORPLAN_EXPORT SelectionSynchronizer final : public QObject
{
    Q_OBJECT

public:
    explicit SelectionSynchronizer(QObject* parent = nullptr);

    // Plain click replaces, modifier click toggles, invalid id clears.
    static SlotIdSet applyClick(const SlotIdSet& current, const SlotId& id, bool multi);

    const SlotIdSet& highlighted() const noexcept { return m_highlighted; }
    bool isHighlighted(const SlotId& id) const noexcept { return m_highlighted.contains(id); }

    // Returns true when the highlight set changed.
    bool sync(const SlotIdSet& selection, const SlotList& slots);

signals:
    void highlightChanged(const FloorPlan::SlotIdSet& highlighted);

private:
    SlotIdSet m_highlighted;
};

} // namespace FloorPlan
