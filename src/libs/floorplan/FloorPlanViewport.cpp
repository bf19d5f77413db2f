// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "floorplan/FloorPlanViewport.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace FloorPlan {

QRectF defaultViewport()
{
    return QRectF(Constants::kDefaultViewportX, Constants::kDefaultViewportY,
                  Constants::kDefaultViewportWidth, Constants::kDefaultViewportHeight);
}

QRectF computeInitialViewport(const SlotList& slots, double padding)
{
    if (!std::isfinite(padding) || padding < 0.0)
        padding = Constants::kDefaultViewportPadding;

    double minX = std::numeric_limits<double>::infinity();
    double minY = std::numeric_limits<double>::infinity();
    double maxX = -std::numeric_limits<double>::infinity();
    double maxY = -std::numeric_limits<double>::infinity();
    bool any = false;

    for (const Slot& slot : slots) {
        if (!slot.hasFiniteGeometry())
            continue;
        const double w = std::max(0.0, slot.width);
        const double h = std::max(0.0, slot.height);
        minX = std::min(minX, slot.x);
        minY = std::min(minY, slot.y);
        maxX = std::max(maxX, slot.x + w);
        maxY = std::max(maxY, slot.y + h);
        any = true;
    }

    if (!any)
        return defaultViewport();

    if (maxX - minX <= 0.0) {
        minX -= padding;
        maxX += padding;
    }
    if (maxY - minY <= 0.0) {
        minY -= padding;
        maxY += padding;
    }

    return QRectF(QPointF(minX - padding, minY - padding),
                  QPointF(maxX + padding, maxY + padding));
}

QRectF panViewport(const QRectF& viewport, double dx, double dy)
{
    if (!std::isfinite(dx) || !std::isfinite(dy))
        return viewport;
    return viewport.translated(-dx, -dy);
}

} // namespace FloorPlan
