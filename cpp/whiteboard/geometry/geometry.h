#ifndef WHITEBOARD_GEOMETRY_GEOMETRY_H
#define WHITEBOARD_GEOMETRY_GEOMETRY_H

#include "whiteboard/core/types.h"
#include "whiteboard/entity/shape.h"
#include <optional>
#include <string>
#include <vector>

namespace whiteboard {

// World-space bounding box of a shape, always normalized.
// Text uses an approximate advance/line-height model (no glyph metrics).
Box bounds(const Shape& shape);

// Union of bounds over `ids`; ids that do not resolve are skipped.
std::optional<Box> unionBounds(const ShapeMap& shapes, const std::vector<std::string>& ids);

// Inclusive containment.
bool pointInBox(const Point2& p, const Box& box) noexcept;

// Axis-aligned overlap; touching edges overlap.
bool intersects(const Box& shapeBounds, const Box& query) noexcept;

float distance(const Point2& a, const Point2& b) noexcept;

// Box spanning two arbitrary corners.
Box normalizedBox(const Point2& a, const Point2& b) noexcept;

// Box grown by `margin` on every side.
Box expandBox(const Box& box, float margin) noexcept;

} // namespace whiteboard

#endif // WHITEBOARD_GEOMETRY_GEOMETRY_H
