// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "floorplan/FloorPlanSettings.hpp"

#include <QtCore/QSettings>

#include <cmath>

namespace FloorPlan {

namespace {

const QString kVenueKey = QStringLiteral("venue/id");
const QString kZoneKey = QStringLiteral("venue/zone");
const QString kPaddingKey = QStringLiteral("viewport/padding");
const QString kLatencyKey = QStringLiteral("service/latencyMs");
const QString kSeedKey = QStringLiteral("service/seedSampleData");

} // namespace

Utils::Result FloorPlanSettings::validate() const
{
    Utils::Result r;
    if (venueId.trimmed().isEmpty())
        r.addError(QStringLiteral("venue/id must not be empty."));
    if (!std::isfinite(viewportPadding) || viewportPadding < 0.0)
        r.addError(QStringLiteral("viewport/padding must be a non-negative number."));
    if (serviceLatencyMs < 0)
        r.addError(QStringLiteral("service/latencyMs must not be negative."));
    return r;
}

FloorPlanSettings FloorPlanSettings::load(const QSettings& settings)
{
    FloorPlanSettings out;
    out.venueId = settings.value(kVenueKey, out.venueId).toString();
    out.zone = settings.value(kZoneKey, out.zone).toString();

    bool ok = false;
    const double padding = settings.value(kPaddingKey, out.viewportPadding).toDouble(&ok);
    if (ok)
        out.viewportPadding = padding;

    const int latency = settings.value(kLatencyKey, out.serviceLatencyMs).toInt(&ok);
    if (ok)
        out.serviceLatencyMs = latency;

    out.seedSampleData = settings.value(kSeedKey, out.seedSampleData).toBool();
    return out;
}

FloorPlanSettings FloorPlanSettings::loadFile(const QString& iniPath)
{
    QSettings settings(iniPath, QSettings::IniFormat);
    settings.setFallbacksEnabled(false);
    return load(settings);
}

void FloorPlanSettings::save(QSettings& settings) const
{
    settings.setValue(kVenueKey, venueId);
    settings.setValue(kZoneKey, zone);
    settings.setValue(kPaddingKey, viewportPadding);
    settings.setValue(kLatencyKey, serviceLatencyMs);
    settings.setValue(kSeedKey, seedSampleData);
}

} // namespace FloorPlan
