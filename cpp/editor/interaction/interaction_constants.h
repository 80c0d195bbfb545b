#pragma once

/**
 * @file interaction_constants.h
 * @brief Defaults for pointer interaction. ToolConfig starts from these values.
 *
 * Pixel values are CSS pixels on the drawing surface; the tool controller
 * converts them to feet with the current zoom before hit-testing.
 */

namespace interaction_constants {

// =============================================================================
// Pick/Hit-test Tolerances (in screen pixels)
// =============================================================================

/// Slack around fixture bodies and zone edges
constexpr double PICK_TOLERANCE_PX = 4.0;

/// Half-width of a zone resize handle hit square
constexpr double ZONE_HANDLE_SIZE_PX = 6.0;

/// Distance above the top edge of the primary fixture to the rotation handle center
constexpr double ROTATE_HANDLE_OFFSET_PX = 20.0;

/// Radius of rotation handle hit area
constexpr double ROTATE_HANDLE_RADIUS_PX = 8.0;

/// Radius of a wall end grip hit area
constexpr double WALL_GRIP_RADIUS_PX = 8.0;

/// Radius of annotation anchor/label hit areas
constexpr double ANNOTATION_HIT_RADIUS_PX = 10.0;

// =============================================================================
// Drag Thresholds (in screen pixels)
// =============================================================================

/// Movement below this is a click for mouse and pen input
constexpr double DRAG_THRESHOLD_MOUSE_PX = 3.0;

/// Movement below this is a tap for touch input
constexpr double DRAG_THRESHOLD_TOUCH_PX = 10.0;

// =============================================================================
// Tools
// =============================================================================

/// Wheel deltaY to zoom delta
constexpr double WHEEL_ZOOM_FACTOR = 0.001;

/// Annotation label offset from the anchor (feet); the label never goes above y = 0
constexpr double ANNOTATION_LABEL_OFFSET_X_FT = 2.0;
constexpr double ANNOTATION_LABEL_OFFSET_Y_FT = -2.0;

/// Text of a freshly placed annotation
constexpr const char* ANNOTATION_DEFAULT_TEXT = "Note";

/// Touch wall strokes shorter than this (unsnapped, feet) are cancelled
constexpr double WALL_TOUCH_MIN_LENGTH_FT = 0.5;

} // namespace interaction_constants
