// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "floorplan/inspector/SlotInspectorModel.hpp"

#include <cmath>
#include <limits>

namespace FloorPlan {

namespace {

SlotInspectorForm formFrom(const Slot& slot)
{
    SlotInspectorForm form;
    form.label = slot.label;
    form.status = slot.status;
    form.type = slot.type;
    form.shape = slot.shape;
    form.width = slot.width;
    form.height = slot.height;
    form.rotation = slot.rotation;
    form.zone = slot.zone;
    return form;
}

bool numberChanged(double edited, double original)
{
    return std::isfinite(edited) && edited != original;
}

bool textChanged(const QString& edited, const QString& original)
{
    return !edited.isEmpty() && edited != original;
}

} // namespace

SlotInspectorModel::SlotInspectorModel(QObject* parent)
    : QObject(parent)
{}

void SlotInspectorModel::load(const Slot* slot)
{
    const SlotId prevId = slotId();
    if (slot) {
        m_original = *slot;
        m_form = formFrom(*slot);
    } else {
        m_original.reset();
        m_form = SlotInspectorForm{};
    }

    if (prevId != slotId())
        emit slotChanged(slotId());
    emit formChanged();
}

void SlotInspectorModel::setLabel(const QString& label)
{
    if (m_form.label == label)
        return;
    m_form.label = label;
    touch();
}

void SlotInspectorModel::setStatus(SlotStatus status)
{
    if (m_form.status == status)
        return;
    m_form.status = status;
    touch();
}

void SlotInspectorModel::setType(SlotType type)
{
    if (m_form.type == type)
        return;
    m_form.type = type;
    touch();
}

void SlotInspectorModel::setShape(SlotShape shape)
{
    if (m_form.shape == shape)
        return;
    m_form.shape = shape;
    touch();
}

void SlotInspectorModel::setWidth(double width)
{
    m_form.width = width;
    touch();
}

void SlotInspectorModel::setHeight(double height)
{
    m_form.height = height;
    touch();
}

void SlotInspectorModel::setRotation(double rotation)
{
    m_form.rotation = rotation;
    touch();
}

void SlotInspectorModel::setZone(const QString& zone)
{
    if (m_form.zone == zone)
        return;
    m_form.zone = zone;
    touch();
}

double SlotInspectorModel::parseNumber(const QString& text)
{
    bool ok = false;
    const double v = text.trimmed().toDouble(&ok);
    if (!ok || !std::isfinite(v))
        return std::numeric_limits<double>::quiet_NaN();
    return v;
}

SlotPatch SlotInspectorModel::changedFields() const
{
    SlotPatch patch;
    if (!m_original)
        return patch;

    const Slot& o = *m_original;
    if (textChanged(m_form.label, o.label))
        patch.label = m_form.label;
    if (m_form.status != o.status)
        patch.status = m_form.status;
    if (m_form.type != o.type)
        patch.type = m_form.type;
    if (m_form.shape != o.shape)
        patch.shape = m_form.shape;
    if (numberChanged(m_form.width, o.width))
        patch.width = m_form.width;
    if (numberChanged(m_form.height, o.height))
        patch.height = m_form.height;
    if (numberChanged(m_form.rotation, o.rotation))
        patch.rotation = m_form.rotation;
    if (textChanged(m_form.zone, o.zone))
        patch.zone = m_form.zone;
    return patch;
}

Utils::Result SlotInspectorModel::validate() const
{
    if (!m_original)
        return Utils::Result::failure(QStringLiteral("No slot selected."));
    return changedFields().validate();
}

void SlotInspectorModel::revert()
{
    if (!m_original)
        return;
    m_form = formFrom(*m_original);
    emit formChanged();
}

void SlotInspectorModel::touch()
{
    emit formChanged();
}

} // namespace FloorPlan
