#include "whiteboard/viewport/viewport.h"
#include <algorithm>
#include <cmath>

namespace whiteboard {

float clampScale(float scale, const ScaleLimits& limits) noexcept {
    if (!std::isfinite(scale)) return limits.min;
    return std::max(limits.min, std::min(limits.max, scale));
}

Point2 toWorld(const Viewport& viewport, const Point2& screen) noexcept {
    return Point2{(screen.x - viewport.x) / viewport.scale, (screen.y - viewport.y) / viewport.scale};
}

Point2 toScreen(const Viewport& viewport, const Point2& world) noexcept {
    return Point2{world.x * viewport.scale + viewport.x, world.y * viewport.scale + viewport.y};
}

Viewport zoomAt(const Viewport& viewport, const Point2& anchor, float requestedScale, const ScaleLimits& limits) noexcept {
    const Point2 worldUnderAnchor = toWorld(viewport, anchor);
    const float scale = clampScale(requestedScale, limits);
    Viewport out{};
    out.scale = scale;
    out.x = anchor.x - worldUnderAnchor.x * scale;
    out.y = anchor.y - worldUnderAnchor.y * scale;
    return out;
}

Viewport wheelZoom(const Viewport& viewport, const Point2& anchor, float deltaY, float factor, const ScaleLimits& limits) noexcept {
    const float requested = deltaY < 0.0f ? viewport.scale * factor : viewport.scale / factor;
    return zoomAt(viewport, anchor, requested, limits);
}

Viewport panBy(const Viewport& viewport, float dx, float dy) noexcept {
    return Viewport{viewport.scale, viewport.x + dx, viewport.y + dy};
}

} // namespace whiteboard
