#ifndef WHITEBOARD_VIEWPORT_VIEWPORT_H
#define WHITEBOARD_VIEWPORT_VIEWPORT_H

#include "whiteboard/core/types.h"
#include "whiteboard/interaction/interaction_constants.h"

// Screen = world * scale + (x, y)
struct Viewport {
    float scale = 1.0f;
    float x = 0.0f;
    float y = 0.0f;
};

inline bool operator==(const Viewport& a, const Viewport& b) {
    return a.scale == b.scale && a.x == b.x && a.y == b.y;
}

namespace whiteboard {

struct ScaleLimits {
    float min = interaction_constants::MIN_SCALE;
    float max = interaction_constants::MAX_SCALE;
};

float clampScale(float scale, const ScaleLimits& limits = ScaleLimits{}) noexcept;

Point2 toWorld(const Viewport& viewport, const Point2& screen) noexcept;
Point2 toScreen(const Viewport& viewport, const Point2& world) noexcept;

// Rescales around a screen anchor so the world point under it stays put.
// The scale is clamped before the position is solved.
Viewport zoomAt(const Viewport& viewport, const Point2& anchor, float requestedScale, const ScaleLimits& limits = ScaleLimits{}) noexcept;

// One wheel notch: zoom in when deltaY < 0, out otherwise.
Viewport wheelZoom(
    const Viewport& viewport,
    const Point2& anchor,
    float deltaY,
    float factor = interaction_constants::WHEEL_SCALE_FACTOR,
    const ScaleLimits& limits = ScaleLimits{}) noexcept;

Viewport panBy(const Viewport& viewport, float dx, float dy) noexcept;

} // namespace whiteboard

#endif // WHITEBOARD_VIEWPORT_VIEWPORT_H
