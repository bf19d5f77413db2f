// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "floorplan/FloorPlanConstants.hpp"
#include "floorplan/FloorPlanGlobal.hpp"

#include <utils/Result.hpp>

#include <QtCore/QString>

class QSettings;

namespace FloorPlan {

// Editor configuration. Persisted as INI through QSettings; the demo
// application lets command line options override any key.
struct FLOORPLAN_EXPORT FloorPlanSettings final {
    QString venueId = QStringLiteral("demo-venue");
    QString zone;
    double viewportPadding = Constants::kDefaultViewportPadding;
    int serviceLatencyMs = Constants::kDefaultServiceLatencyMs;
    bool seedSampleData = true;

    Utils::Result validate() const;

    static FloorPlanSettings load(const QSettings& settings);
    static FloorPlanSettings loadFile(const QString& iniPath);
    void save(QSettings& settings) const;
};

} // namespace FloorPlan
