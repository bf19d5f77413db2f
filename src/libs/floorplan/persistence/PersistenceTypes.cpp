// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "floorplan/persistence/PersistenceTypes.hpp"

namespace FloorPlan {

QString toString(PersistenceOp op)
{
    switch (op) {
        case PersistenceOp::Create: return QStringLiteral("create");
        case PersistenceOp::Update: return QStringLiteral("update");
        case PersistenceOp::Delete: return QStringLiteral("delete");
    }
    return QString();
}

QString SlotActionFailure::message() const
{
    QString text;
    switch (op) {
        case PersistenceOp::Create:
            text = QStringLiteral("Failed to create slot %1").arg(slotName);
            break;
        case PersistenceOp::Update:
            text = transformOnly ? QStringLiteral("Failed to save position/size for slot %1").arg(slotName)
                                 : QStringLiteral("Failed to update slot %1").arg(slotName);
            break;
        case PersistenceOp::Delete:
            text = QStringLiteral("Failed to delete slot %1").arg(slotName);
            break;
    }

    if (!error.message().isEmpty())
        text += QStringLiteral(": %1").arg(error.message());
    return text;
}

} // namespace FloorPlan
