#include "whiteboard/interaction/eraser.h"
#include "whiteboard/core/logging.h"
#include "whiteboard/geometry/geometry.h"
#include <algorithm>

namespace whiteboard {

namespace {

bool anyPointWithin(const Point2* points, std::size_t count, const Point2& world, float radius) {
    for (std::size_t i = 0; i < count; ++i) {
        if (distance(points[i], world) < radius) return true;
    }
    return false;
}

} // namespace

bool eraserHits(const Shape& shape, const Point2& world, float radius) {
    switch (shape.kind()) {
        case ShapeKind::Pen: {
            const auto& pen = std::get<PenShape>(shape.data);
            return anyPointWithin(pen.points.data(), pen.points.size(), world, radius);
        }
        case ShapeKind::Line: {
            const auto& line = std::get<LineShape>(shape.data);
            return anyPointWithin(line.points.data(), line.points.size(), world, radius);
        }
        case ShapeKind::Rect:
        case ShapeKind::Text:
            return pointInBox(world, expandBox(bounds(shape), radius));
        case ShapeKind::Circle: {
            const auto& c = std::get<CircleShape>(shape.data);
            return distance(Point2{c.x, c.y}, world) < c.radius + radius;
        }
    }
    return false;
}

std::vector<std::string> eraserHitTest(const ShapeMap& shapes, const Point2& world, float radius) {
    std::vector<std::string> hits;
    for (const auto& entry : shapes) {
        if (eraserHits(entry.second, world, radius)) {
            hits.push_back(entry.first);
        }
    }
    std::sort(hits.begin(), hits.end());
    return hits;
}

std::size_t eraseAt(Document& doc, const Point2& world, float radius) {
    const std::vector<std::string> hits = eraserHitTest(doc.shapes, world, radius);
    if (hits.empty()) return 0;
    WHITEBOARD_LOG_DEBUG("eraser: removing %zu shape(s) at (%.1f, %.1f)", hits.size(), world.x, world.y);
    return removeShapes(doc, hits);
}

} // namespace whiteboard
