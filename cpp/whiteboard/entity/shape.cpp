#include "whiteboard/entity/shape.h"
#include "whiteboard/core/util.h"
#include <utility>

bool operator==(const PenShape& a, const PenShape& b) {
    return a.points == b.points && a.stroke == b.stroke;
}

bool operator==(const LineShape& a, const LineShape& b) {
    return a.points == b.points && a.stroke == b.stroke;
}

bool operator==(const RectShape& a, const RectShape& b) {
    return a.x == b.x && a.y == b.y && a.width == b.width && a.height == b.height
        && a.fill == b.fill && a.stroke == b.stroke;
}

bool operator==(const CircleShape& a, const CircleShape& b) {
    return a.x == b.x && a.y == b.y && a.radius == b.radius && a.stroke == b.stroke
        && a.strokeWidth == b.strokeWidth && a.fill == b.fill;
}

bool operator==(const TextShape& a, const TextShape& b) {
    return a.x == b.x && a.y == b.y && a.text == b.text && a.fill == b.fill && a.fontSize == b.fontSize;
}

bool operator==(const Shape& a, const Shape& b) {
    return a.id == b.id && a.data == b.data;
}

bool Shape::anchor(Point2& out) const noexcept {
    switch (kind()) {
        case ShapeKind::Rect: {
            const auto& r = std::get<RectShape>(data);
            out = Point2{r.x, r.y};
            return true;
        }
        case ShapeKind::Circle: {
            const auto& c = std::get<CircleShape>(data);
            out = Point2{c.x, c.y};
            return true;
        }
        case ShapeKind::Text: {
            const auto& t = std::get<TextShape>(data);
            out = Point2{t.x, t.y};
            return true;
        }
        case ShapeKind::Pen:
        case ShapeKind::Line:
            return false;
    }
    return false;
}

void Shape::setAnchor(const Point2& p) noexcept {
    switch (kind()) {
        case ShapeKind::Rect: {
            auto& r = std::get<RectShape>(data);
            r.x = p.x;
            r.y = p.y;
            break;
        }
        case ShapeKind::Circle: {
            auto& c = std::get<CircleShape>(data);
            c.x = p.x;
            c.y = p.y;
            break;
        }
        case ShapeKind::Text: {
            auto& t = std::get<TextShape>(data);
            t.x = p.x;
            t.y = p.y;
            break;
        }
        case ShapeKind::Pen:
        case ShapeKind::Line:
            break;
    }
}

bool Shape::pathPoints(std::vector<Point2>& out) const {
    switch (kind()) {
        case ShapeKind::Pen:
            out = std::get<PenShape>(data).points;
            return true;
        case ShapeKind::Line: {
            const auto& line = std::get<LineShape>(data);
            out.assign(line.points.begin(), line.points.end());
            return true;
        }
        case ShapeKind::Rect:
        case ShapeKind::Circle:
        case ShapeKind::Text:
            return false;
    }
    return false;
}

void Shape::setPathPoints(const std::vector<Point2>& points) {
    switch (kind()) {
        case ShapeKind::Pen:
            std::get<PenShape>(data).points = points;
            break;
        case ShapeKind::Line: {
            auto& line = std::get<LineShape>(data);
            if (points.size() >= 2) {
                line.points[0] = points[0];
                line.points[1] = points[1];
            }
            break;
        }
        case ShapeKind::Rect:
        case ShapeKind::Circle:
        case ShapeKind::Text:
            break;
    }
}

void Shape::translate(float dx, float dy) noexcept {
    switch (kind()) {
        case ShapeKind::Pen:
            for (auto& p : std::get<PenShape>(data).points) {
                p.x += dx;
                p.y += dy;
            }
            break;
        case ShapeKind::Line:
            for (auto& p : std::get<LineShape>(data).points) {
                p.x += dx;
                p.y += dy;
            }
            break;
        case ShapeKind::Rect:
        case ShapeKind::Circle:
        case ShapeKind::Text: {
            Point2 a{};
            anchor(a);
            setAnchor(Point2{a.x + dx, a.y + dy});
            break;
        }
    }
}

Shape makePen(std::string id, const Point2& start, std::string stroke) {
    return Shape{std::move(id), PenShape{{start}, std::move(stroke)}};
}

Shape makeLine(std::string id, const Point2& start, std::string stroke) {
    return Shape{std::move(id), LineShape{{start, start}, std::move(stroke)}};
}

Shape makeRect(std::string id, const Point2& origin, std::string fill, std::string stroke) {
    return Shape{std::move(id), RectShape{origin.x, origin.y, 0.0f, 0.0f, std::move(fill), std::move(stroke)}};
}

Shape makeCircle(std::string id, const Point2& center, float radius, std::string stroke, float strokeWidth) {
    return Shape{std::move(id), CircleShape{center.x, center.y, radius, std::move(stroke), strokeWidth, std::string{}}};
}

Shape makeText(std::string id, const Point2& origin, std::string text, std::string fill, float fontSize) {
    return Shape{std::move(id), TextShape{origin.x, origin.y, std::move(text), std::move(fill), fontSize}};
}

std::string ShapeIdAllocator::allocate(const ShapeMap& existing) {
    const std::string stamp = "shape_" + std::to_string(epochMillis()) + "_";
    std::string id;
    do {
        id = stamp + toBase36(++serial_);
    } while (existing.find(id) != existing.end());
    return id;
}
