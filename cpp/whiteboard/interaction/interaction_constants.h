#pragma once

/**
 * @file interaction_constants.h
 * @brief Centralized constants for the whiteboard interaction system.
 *
 * The browser host mirrors these values; change both sides together.
 */

namespace interaction_constants {

// =============================================================================
// Viewport
// =============================================================================

/// Lower bound for viewport.scale
constexpr float MIN_SCALE = 0.1f;

/// Upper bound for viewport.scale
constexpr float MAX_SCALE = 5.0f;

/// Multiplicative step applied per wheel notch
constexpr float WHEEL_SCALE_FACTOR = 1.05f;

// =============================================================================
// Eraser
// =============================================================================

/// Hit radius around the eraser point (world units)
constexpr float ERASER_RADIUS = 20.0f;

// =============================================================================
// Text Metrics (approximation, no glyph shaping)
// =============================================================================

/// Average glyph advance as a fraction of fontSize
constexpr float TEXT_ADVANCE_FACTOR = 0.6f;

/// Line height as a multiple of fontSize
constexpr float TEXT_LINE_HEIGHT_FACTOR = 1.2f;

// =============================================================================
// Transformer Limits
// =============================================================================

/// Minimum rect width/height and circle radius after a transform
constexpr float MIN_TRANSFORM_SIZE = 5.0f;

/// Minimum text fontSize after a transform
constexpr float MIN_TRANSFORM_FONT_SIZE = 8.0f;

// =============================================================================
// Persistence
// =============================================================================

/// Quiet period before a scheduled save fires (milliseconds)
constexpr double SAVE_DEBOUNCE_MS = 2000.0;

// =============================================================================
// Mouse Buttons (DOM PointerEvent.button)
// =============================================================================

constexpr int BUTTON_PRIMARY = 0;
constexpr int BUTTON_MIDDLE = 1;

} // namespace interaction_constants
