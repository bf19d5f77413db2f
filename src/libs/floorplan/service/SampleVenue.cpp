// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "floorplan/service/SampleVenue.hpp"

namespace FloorPlan::Service {

namespace {

Slot makeSlot(const QString& label, SlotType type, SlotShape shape,
              double x, double y, double w, double h,
              const QString& zone, SlotStatus status = SlotStatus::Available, double rotation = 0.0)
{
    Slot s;
    s.label = label;
    s.type = type;
    s.shape = shape;
    s.x = x;
    s.y = y;
    s.width = w;
    s.height = h;
    s.rotation = rotation;
    s.status = status;
    s.zone = zone;
    return s;
}

} // namespace

SlotList sampleVenueSlots()
{
    SlotList out;

    for (int i = 0; i < 4; ++i) {
        out.push_back(makeSlot(QStringLiteral("T%1").arg(i + 1),
                               SlotType::Table, SlotShape::Rectangle,
                               40.0 + i * 120.0, 40.0, 80.0, 80.0, QStringLiteral("Main"),
                               i == 1 ? SlotStatus::Reserved : SlotStatus::Available));
    }
    out.push_back(makeSlot(QStringLiteral("R1"), SlotType::Table, SlotShape::Circle, 60.0, 180.0, 90.0, 90.0, QStringLiteral("Main")));
    out.push_back(makeSlot(QStringLiteral("R2"), SlotType::Table, SlotShape::Circle, 200.0, 180.0, 90.0, 90.0, QStringLiteral("Main"),
                           SlotStatus::Occupied));
    out.push_back(makeSlot(QStringLiteral("Banquet"), SlotType::Table, SlotShape::LongRectangle, 340.0, 190.0, 180.0, 60.0, QStringLiteral("Main"),
                           SlotStatus::Available, 15.0));

    out.push_back(makeSlot(QStringLiteral("Booth A"), SlotType::Booth, SlotShape::Rectangle, 40.0, 340.0, 120.0, 70.0, QStringLiteral("Patio")));
    out.push_back(makeSlot(QStringLiteral("Booth B"), SlotType::Booth, SlotShape::Rectangle, 190.0, 340.0, 120.0, 70.0, QStringLiteral("Patio"),
                           SlotStatus::Blocked));
    out.push_back(makeSlot(QStringLiteral("Lounge"), SlotType::Area, SlotShape::Ellipse, 340.0, 320.0, 180.0, 110.0, QStringLiteral("Patio")));

    for (int i = 0; i < 5; ++i) {
        out.push_back(makeSlot(QStringLiteral("B%1").arg(i + 1),
                               SlotType::BarSeat, SlotShape::Circle,
                               600.0, 40.0 + i * 50.0, 36.0, 36.0, QStringLiteral("Bar"),
                               i == 4 ? SlotStatus::Maintenance : SlotStatus::Available));
    }
    out.push_back(makeSlot(QStringLiteral("Service"), SlotType::Service, SlotShape::Rectangle, 660.0, 40.0, 40.0, 240.0, QStringLiteral("Bar")));

    return out;
}

} // namespace FloorPlan::Service
