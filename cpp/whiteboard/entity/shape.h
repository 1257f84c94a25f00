#ifndef WHITEBOARD_ENTITY_SHAPE_H
#define WHITEBOARD_ENTITY_SHAPE_H

#include "whiteboard/core/types.h"
#include <array>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

// Freehand polyline; grows monotonically while drawing.
struct PenShape {
    std::vector<Point2> points;
    std::string stroke;
};

struct LineShape {
    std::array<Point2, 2> points;
    std::string stroke;
};

// width/height may be negative while dragging out the rect.
struct RectShape {
    float x;
    float y;
    float width;
    float height;
    std::string fill;
    std::string stroke;
};

struct CircleShape {
    float x;
    float y;
    float radius;
    std::string stroke;
    float strokeWidth;
    std::string fill;
};

struct TextShape {
    float x;
    float y;
    std::string text;
    std::string fill;
    float fontSize;
};

bool operator==(const PenShape& a, const PenShape& b);
bool operator==(const LineShape& a, const LineShape& b);
bool operator==(const RectShape& a, const RectShape& b);
bool operator==(const CircleShape& a, const CircleShape& b);
bool operator==(const TextShape& a, const TextShape& b);

// Alternative order must match ShapeKind.
using ShapeData = std::variant<PenShape, LineShape, RectShape, CircleShape, TextShape>;

struct Shape {
    std::string id;
    ShapeData data;

    ShapeKind kind() const noexcept { return static_cast<ShapeKind>(data.index()); }

    // True for Pen/Line, whose geometry is a point sequence.
    bool isPath() const noexcept { return kind() == ShapeKind::Pen || kind() == ShapeKind::Line; }

    // Anchor of a box/circle/text shape. Returns false for path shapes.
    bool anchor(Point2& out) const noexcept;
    void setAnchor(const Point2& p) noexcept;

    // Copies path points into `out`. Returns false for anchored shapes.
    bool pathPoints(std::vector<Point2>& out) const;
    void setPathPoints(const std::vector<Point2>& points);

    void translate(float dx, float dy) noexcept;
};

bool operator==(const Shape& a, const Shape& b);
inline bool operator!=(const Shape& a, const Shape& b) { return !(a == b); }

using ShapeMap = std::unordered_map<std::string, Shape>;

Shape makePen(std::string id, const Point2& start, std::string stroke);
Shape makeLine(std::string id, const Point2& start, std::string stroke);
Shape makeRect(std::string id, const Point2& origin, std::string fill, std::string stroke);
Shape makeCircle(std::string id, const Point2& center, float radius, std::string stroke, float strokeWidth);
Shape makeText(std::string id, const Point2& origin, std::string text, std::string fill, float fontSize);

// Allocates document-unique ids of the form shape_<epoch-ms>_<base36 serial>.
class ShapeIdAllocator {
public:
    std::string allocate(const ShapeMap& existing);
    void reset() noexcept { serial_ = 0; }

private:
    std::uint64_t serial_ = 0;
};

#endif // WHITEBOARD_ENTITY_SHAPE_H
