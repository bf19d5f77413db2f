// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "floorplan/FloorPlanGlobal.hpp"

#include <QtCore/QPointF>
#include <QtCore/QRectF>
#include <QtCore/QSizeF>
#include <QtGui/QTransform>

#include <optional>

namespace FloorPlan::Tools {

// -----------------------------------------------------------------------------
// Surface <-> world mapping
//
// The viewport (world rectangle) is fitted into the surface with a uniform
// scale and centred on both axes. Pan is a viewport translation; zoom is a
// viewport resize.
// -----------------------------------------------------------------------------

FLOORPLAN_EXPORT bool isUsableViewport(const QRectF& viewport);

// Null when the surface is not laid out or the viewport is empty.
FLOORPLAN_EXPORT std::optional<QTransform> worldToSurfaceTransform(const QRectF& viewport,
                                                                   const QSizeF& surfaceSize);

FLOORPLAN_EXPORT double fitScale(const QRectF& viewport, const QSizeF& surfaceSize);

// Origin when the transform is missing or singular.
FLOORPLAN_EXPORT QPointF toWorld(const QPointF& surfacePos,
                                 const std::optional<QTransform>& worldToSurface);
FLOORPLAN_EXPORT QPointF toWorld(const QPointF& surfacePos,
                                 const QRectF& viewport,
                                 const QSizeF& surfaceSize);

FLOORPLAN_EXPORT QPointF toSurface(const QPointF& worldPos,
                                   const QRectF& viewport,
                                   const QSizeF& surfaceSize);

// Scales the viewport about its centre. A factor below one zooms in.
FLOORPLAN_EXPORT QRectF resizedViewport(const QRectF& viewport, double factor);

} // namespace FloorPlan::Tools
