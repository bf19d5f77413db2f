// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "floorplan/api/SlotServiceTypes.hpp"

namespace FloorPlan::Api {

QString toString(SlotServiceErrorCode code)
{
    switch (code) {
        case SlotServiceErrorCode::None: return QStringLiteral("none");
        case SlotServiceErrorCode::Transport: return QStringLiteral("transport");
        case SlotServiceErrorCode::Validation: return QStringLiteral("validation");
        case SlotServiceErrorCode::NotFound: return QStringLiteral("not-found");
        case SlotServiceErrorCode::Unknown: return QStringLiteral("unknown");
    }
    return QString();
}

} // namespace FloorPlan::Api
