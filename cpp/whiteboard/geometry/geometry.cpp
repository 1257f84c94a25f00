#include "whiteboard/geometry/geometry.h"
#include "whiteboard/interaction/interaction_constants.h"
#include <algorithm>
#include <cmath>
#include <limits>

namespace whiteboard {

namespace {

Box pointsBounds(const Point2* points, std::size_t count) {
    if (count == 0) return Box{0.0f, 0.0f, 0.0f, 0.0f};
    float minX = std::numeric_limits<float>::infinity();
    float minY = std::numeric_limits<float>::infinity();
    float maxX = -std::numeric_limits<float>::infinity();
    float maxY = -std::numeric_limits<float>::infinity();
    for (std::size_t i = 0; i < count; ++i) {
        minX = std::min(minX, points[i].x);
        minY = std::min(minY, points[i].y);
        maxX = std::max(maxX, points[i].x);
        maxY = std::max(maxY, points[i].y);
    }
    return Box{minX, minY, maxX - minX, maxY - minY};
}

// Length in UTF-16 code units, the unit the browser measures strings in.
// Continuation bytes add nothing; a 4-byte sequence is a surrogate pair.
std::size_t textLength(const std::string& text) {
    std::size_t length = 0;
    for (const char ch : text) {
        const unsigned char c = static_cast<unsigned char>(ch);
        if ((c & 0xC0) == 0x80) continue;
        length += (c >= 0xF0) ? 2 : 1;
    }
    return length;
}

} // namespace

Box bounds(const Shape& shape) {
    switch (shape.kind()) {
        case ShapeKind::Pen: {
            const auto& pen = std::get<PenShape>(shape.data);
            return pointsBounds(pen.points.data(), pen.points.size());
        }
        case ShapeKind::Line: {
            const auto& line = std::get<LineShape>(shape.data);
            return pointsBounds(line.points.data(), line.points.size());
        }
        case ShapeKind::Rect: {
            const auto& r = std::get<RectShape>(shape.data);
            return Box{
                std::min(r.x, r.x + r.width),
                std::min(r.y, r.y + r.height),
                std::fabs(r.width),
                std::fabs(r.height)};
        }
        case ShapeKind::Circle: {
            const auto& c = std::get<CircleShape>(shape.data);
            return Box{c.x - c.radius, c.y - c.radius, c.radius * 2.0f, c.radius * 2.0f};
        }
        case ShapeKind::Text: {
            const auto& t = std::get<TextShape>(shape.data);
            const float width = static_cast<float>(textLength(t.text)) * t.fontSize * interaction_constants::TEXT_ADVANCE_FACTOR;
            const float height = t.fontSize * interaction_constants::TEXT_LINE_HEIGHT_FACTOR;
            return Box{t.x, t.y, width, height};
        }
    }
    return Box{0.0f, 0.0f, 0.0f, 0.0f};
}

std::optional<Box> unionBounds(const ShapeMap& shapes, const std::vector<std::string>& ids) {
    if (ids.empty()) return std::nullopt;

    float minX = std::numeric_limits<float>::infinity();
    float minY = std::numeric_limits<float>::infinity();
    float maxX = -std::numeric_limits<float>::infinity();
    float maxY = -std::numeric_limits<float>::infinity();
    bool any = false;

    for (const auto& id : ids) {
        const auto it = shapes.find(id);
        if (it == shapes.end()) continue;
        const Box b = bounds(it->second);
        minX = std::min(minX, b.x);
        minY = std::min(minY, b.y);
        maxX = std::max(maxX, b.x + b.width);
        maxY = std::max(maxY, b.y + b.height);
        any = true;
    }

    if (!any) return std::nullopt;
    return Box{minX, minY, maxX - minX, maxY - minY};
}

bool pointInBox(const Point2& p, const Box& box) noexcept {
    return p.x >= box.x && p.x <= box.x + box.width
        && p.y >= box.y && p.y <= box.y + box.height;
}

bool intersects(const Box& shapeBounds, const Box& query) noexcept {
    return !(shapeBounds.x + shapeBounds.width < query.x
        || shapeBounds.x > query.x + query.width
        || shapeBounds.y + shapeBounds.height < query.y
        || shapeBounds.y > query.y + query.height);
}

float distance(const Point2& a, const Point2& b) noexcept {
    const float dx = a.x - b.x;
    const float dy = a.y - b.y;
    return std::sqrt(dx * dx + dy * dy);
}

Box normalizedBox(const Point2& a, const Point2& b) noexcept {
    return Box{
        std::min(a.x, b.x),
        std::min(a.y, b.y),
        std::fabs(b.x - a.x),
        std::fabs(b.y - a.y)};
}

Box expandBox(const Box& box, float margin) noexcept {
    return Box{box.x - margin, box.y - margin, box.width + margin * 2.0f, box.height + margin * 2.0f};
}

} // namespace whiteboard
