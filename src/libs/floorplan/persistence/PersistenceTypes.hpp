// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "floorplan/FloorPlanGlobal.hpp"
#include "floorplan/FloorPlanTypes.hpp"
#include "floorplan/api/SlotServiceTypes.hpp"

#include <QtCore/QMetaType>
#include <QtCore/QString>

namespace FloorPlan {

enum class PersistenceOp : quint8 { Create, Update, Delete };

FLOORPLAN_EXPORT QString toString(PersistenceOp op);

struct FLOORPLAN_EXPORT SlotActionFailure final {
    PersistenceOp op = PersistenceOp::Update;
    SlotId slotId;
    QString slotName;           // label, or id when the slot has none
    bool transformOnly = false; // update carried geometry fields only
    Api::SlotServiceError error;

    // Single line suitable for a notification banner.
    QString message() const;
};

} // namespace FloorPlan

Q_DECLARE_METATYPE(FloorPlan::SlotActionFailure)
