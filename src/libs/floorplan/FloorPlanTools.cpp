// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "floorplan/FloorPlanTools.hpp"

#include <algorithm>
#include <cmath>

namespace FloorPlan::Tools {

namespace {

bool isUsableSurface(const QSizeF& size)
{
    return std::isfinite(size.width()) && std::isfinite(size.height())
           && size.width() > 0.0 && size.height() > 0.0;
}

} // namespace

bool isUsableViewport(const QRectF& viewport)
{
    return std::isfinite(viewport.x()) && std::isfinite(viewport.y())
           && std::isfinite(viewport.width()) && std::isfinite(viewport.height())
           && viewport.width() > 0.0 && viewport.height() > 0.0;
}

double fitScale(const QRectF& viewport, const QSizeF& surfaceSize)
{
    if (!isUsableViewport(viewport) || !isUsableSurface(surfaceSize))
        return 0.0;
    return std::min(surfaceSize.width() / viewport.width(),
                    surfaceSize.height() / viewport.height());
}

std::optional<QTransform> worldToSurfaceTransform(const QRectF& viewport, const QSizeF& surfaceSize)
{
    const double s = fitScale(viewport, surfaceSize);
    if (s <= 0.0)
        return std::nullopt;

    const double dx = (surfaceSize.width() - viewport.width() * s) * 0.5 - viewport.x() * s;
    const double dy = (surfaceSize.height() - viewport.height() * s) * 0.5 - viewport.y() * s;
    return QTransform(s, 0.0, 0.0, s, dx, dy);
}

QPointF toWorld(const QPointF& surfacePos, const std::optional<QTransform>& worldToSurface)
{
    if (!worldToSurface)
        return QPointF(0.0, 0.0);

    bool invertible = false;
    const QTransform inv = worldToSurface->inverted(&invertible);
    if (!invertible)
        return QPointF(0.0, 0.0);
    return inv.map(surfacePos);
}

QPointF toWorld(const QPointF& surfacePos, const QRectF& viewport, const QSizeF& surfaceSize)
{
    return toWorld(surfacePos, worldToSurfaceTransform(viewport, surfaceSize));
}

QPointF toSurface(const QPointF& worldPos, const QRectF& viewport, const QSizeF& surfaceSize)
{
    const auto xf = worldToSurfaceTransform(viewport, surfaceSize);
    if (!xf)
        return QPointF(0.0, 0.0);
    return xf->map(worldPos);
}

QRectF resizedViewport(const QRectF& viewport, double factor)
{
    if (!isUsableViewport(viewport) || !std::isfinite(factor) || factor <= 0.0)
        return viewport;

    const QPointF c = viewport.center();
    const double w = viewport.width() * factor;
    const double h = viewport.height() * factor;
    return QRectF(c.x() - w * 0.5, c.y() - h * 0.5, w, h);
}

} // namespace FloorPlan::Tools
