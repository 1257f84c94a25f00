#ifndef WHITEBOARD_CORE_TYPES_H
#define WHITEBOARD_CORE_TYPES_H

#include <cstdint>
#include <string>

// Lightweight value types shared by every whiteboard module.

struct Point2 {
    float x;
    float y;
};

inline bool operator==(const Point2& a, const Point2& b) { return a.x == b.x && a.y == b.y; }
inline bool operator!=(const Point2& a, const Point2& b) { return !(a == b); }

// Axis-aligned box in world units. Width/height are non-negative once normalized.
struct Box {
    float x;
    float y;
    float width;
    float height;
};

inline bool operator==(const Box& a, const Box& b) {
    return a.x == b.x && a.y == b.y && a.width == b.width && a.height == b.height;
}

enum class ShapeKind : std::uint8_t {
    Pen = 0,
    Line = 1,
    Rect = 2,
    Circle = 3,
    Text = 4,
};

enum class Tool : std::uint8_t {
    Select = 0,
    Pen = 1,
    Line = 2,
    Rect = 3,
    Circle = 4,
    Text = 5,
    Eraser = 6,
};

// Exactly one interaction mode is active at a time.
enum class InteractionMode : std::uint8_t {
    Idle = 0,
    Drawing = 1,
    Marquee = 2,
    GroupDrag = 3,
    Pinch = 4,
    MiddlePan = 5,
    CanvasPan = 6,
};

enum class PointerType : std::uint8_t {
    Mouse = 0,
    Pen = 1,
    Touch = 2,
};

enum class BoardError : std::uint32_t {
    Ok = 0,
    NotFound = 1,        // board absent or not owned by caller; redirect, no retry
    Network = 2,         // transient; caller may retry manually
    Validation = 3,      // malformed request or payload; local state untouched
    Unauthenticated = 4, // no current user; redirect to login
};

const char* shapeKindName(ShapeKind kind) noexcept;
bool parseShapeKind(const std::string& name, ShapeKind& out) noexcept;

const char* toolName(Tool tool) noexcept;
bool parseTool(const std::string& name, Tool& out) noexcept;

const char* boardErrorName(BoardError error) noexcept;

// Drawing tools create a shape on pointer-down.
inline bool isDrawingTool(Tool tool) noexcept {
    return tool == Tool::Pen || tool == Tool::Line || tool == Tool::Rect
        || tool == Tool::Circle || tool == Tool::Text;
}

#endif // WHITEBOARD_CORE_TYPES_H
