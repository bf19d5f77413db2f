// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

namespace FloorPlan::Constants {

inline constexpr char kCanvasBackgroundColor[] = "#f8fafc";

// Viewport
inline constexpr double kDefaultViewportPadding = 50.0;
inline constexpr double kDefaultViewportX = 0.0;
inline constexpr double kDefaultViewportY = 0.0;
inline constexpr double kDefaultViewportWidth = 100.0;
inline constexpr double kDefaultViewportHeight = 100.0;

// Items
inline constexpr double kMinSlotExtent = 1.0;
inline constexpr char kSlotStrokeColor[] = "#666666";
inline constexpr double kSlotStrokeWidth = 1.0;
inline constexpr char kSlotSelectionColor[] = "#3b82f6";
inline constexpr double kSlotSelectionStrokeWidth = 2.0;
inline constexpr char kSlotLabelColor[] = "#111827";
inline constexpr double kSlotLabelPointSize = 9.0;

// Selection handles, surface pixels
inline constexpr double kHandleSizePx = 8.0;
inline constexpr double kHandleHitRadiusPx = 8.0;
inline constexpr double kRotateHandleOffsetPx = 24.0;
inline constexpr char kHandleFillColor[] = "#ffffff";

inline constexpr char kStatusAvailableFill[] = "#ffffff";
inline constexpr char kStatusBlockedFill[] = "#e5e7eb";
inline constexpr char kStatusReservedFill[] = "#fef9c3";
inline constexpr char kStatusOccupiedFill[] = "#fee2e2";
inline constexpr char kStatusMaintenanceFill[] = "#ffedd5";

// Zones
inline constexpr char kAllZones[] = "__ALL__";
inline constexpr char kDefaultZone[] = "Default Zone";

// New slot draft
inline constexpr char kNewSlotLabel[] = "New Slot";
inline constexpr double kNewSlotX = 50.0;
inline constexpr double kNewSlotY = 50.0;
inline constexpr double kNewSlotWidth = 80.0;
inline constexpr double kNewSlotHeight = 80.0;

// Service
inline constexpr int kDefaultServiceLatencyMs = 150;

inline constexpr char kLoadFailedMessage[] = "Could not load slots. Please try refreshing.";
inline constexpr char kSlotCreatedMessage[] = "Slot \"%1\" created successfully.";
inline constexpr char kSlotUpdatedMessage[] = "Slot \"%1\" updated.";
inline constexpr char kSlotDeletedMessage[] = "Slot \"%1\" deleted successfully.";

} // namespace FloorPlan::Constants
