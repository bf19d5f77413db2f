// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "floorplan/FloorPlanGlobal.hpp"
#include "floorplan/FloorPlanTypes.hpp"

#include <utils/Result.hpp>

#include <QtCore/QObject>

#include <optional>

namespace FloorPlan {

struct FLOORPLAN_EXPORT SlotInspectorForm final {
    QString label;
    SlotStatus status = SlotStatus::Available;
    SlotType type = SlotType::Table;
    SlotShape shape = SlotShape::Rectangle;
    double width = 0.0;     // NaN while the field is blank
    double height = 0.0;
    double rotation = 0.0;
    QString zone;
};

// Edit buffer for the single selected slot. Position is shown but not
// editable here; it changes through the canvas.
class FLOORPLAN_EXPORT SlotInspectorModel final : public QObject
{
    Q_OBJECT

public:
    explicit SlotInspectorModel(QObject* parent = nullptr);

    // Passing null clears the form.
    void load(const Slot* slot);
    void clear() { load(nullptr); }

    bool hasSlot() const noexcept { return m_original.has_value(); }
    SlotId slotId() const { return m_original ? m_original->id : SlotId{}; }
    const std::optional<Slot>& original() const noexcept { return m_original; }
    const SlotInspectorForm& form() const noexcept { return m_form; }

    void setLabel(const QString& label);
    void setStatus(SlotStatus status);
    void setType(SlotType type);
    void setShape(SlotShape shape);
    void setWidth(double width);
    void setHeight(double height);
    void setRotation(double rotation);
    void setZone(const QString& zone);

    // Blank or unparsable text leaves the field blank.
    static double parseNumber(const QString& text);

    // Minimal patch against the loaded slot. Blank strings and blank numbers
    // are left out.
    SlotPatch changedFields() const;
    bool hasChanges() const { return !changedFields().isEmpty(); }

    Utils::Result validate() const;

    // Back to the loaded values.
    void revert();

signals:
    void formChanged();
    void slotChanged(const FloorPlan::SlotId& id);

private:
    void touch();

    std::optional<Slot> m_original;
    SlotInspectorForm m_form;
};

} // namespace FloorPlan
