// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "floorplan/FloorPlanGlobal.hpp"
#include "floorplan/api/SlotServiceTypes.hpp"

#include <QtCore/QObject>

namespace FloorPlan::Api {

// Remote slot CRUD. Every call answers exactly once through its callback,
// asynchronously, on the thread that owns the service.
class FLOORPLAN_EXPORT ISlotService : public QObject
{
    Q_OBJECT

public:
    using QObject::QObject;
    ~ISlotService() override = default;

    virtual void listSlots(const QString& venueId, const SlotFilters& filters, ListSlotsCallback done) = 0;
    virtual void createSlot(const QString& venueId, const SlotDraft& draft, SlotCallback done) = 0;
    virtual void updateSlot(const QString& venueId, const SlotId& id, const SlotPatch& patch, SlotCallback done) = 0;
    virtual void deleteSlot(const QString& venueId, const SlotId& id, DeleteSlotCallback done) = 0;
};

} // namespace FloorPlan::Api
