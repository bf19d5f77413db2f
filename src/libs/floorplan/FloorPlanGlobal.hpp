// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QtGlobal>
#include <QtCore/QLoggingCategory>

#if defined(FLOORPLAN_BUILD_SHARED) && (FLOORPLAN_BUILD_SHARED == 1)
#	if defined(FLOORPLAN_LIBRARY)
#		define FLOORPLAN_EXPORT Q_DECL_EXPORT
#	else
#		define FLOORPLAN_EXPORT Q_DECL_IMPORT
#	endif
#else
#	define FLOORPLAN_EXPORT
#endif

Q_DECLARE_LOGGING_CATEGORY(floorplanlog)
