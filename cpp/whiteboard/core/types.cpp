#include "whiteboard/core/types.h"

const char* shapeKindName(ShapeKind kind) noexcept {
    switch (kind) {
        case ShapeKind::Pen: return "pen";
        case ShapeKind::Line: return "line";
        case ShapeKind::Rect: return "rect";
        case ShapeKind::Circle: return "circle";
        case ShapeKind::Text: return "text";
    }
    return "pen";
}

bool parseShapeKind(const std::string& name, ShapeKind& out) noexcept {
    if (name == "pen") { out = ShapeKind::Pen; return true; }
    if (name == "line") { out = ShapeKind::Line; return true; }
    if (name == "rect") { out = ShapeKind::Rect; return true; }
    if (name == "circle") { out = ShapeKind::Circle; return true; }
    if (name == "text") { out = ShapeKind::Text; return true; }
    return false;
}

const char* toolName(Tool tool) noexcept {
    switch (tool) {
        case Tool::Select: return "select";
        case Tool::Pen: return "pen";
        case Tool::Line: return "line";
        case Tool::Rect: return "rect";
        case Tool::Circle: return "circle";
        case Tool::Text: return "text";
        case Tool::Eraser: return "eraser";
    }
    return "select";
}

bool parseTool(const std::string& name, Tool& out) noexcept {
    if (name == "select") { out = Tool::Select; return true; }
    if (name == "pen") { out = Tool::Pen; return true; }
    if (name == "line") { out = Tool::Line; return true; }
    if (name == "rect") { out = Tool::Rect; return true; }
    if (name == "circle") { out = Tool::Circle; return true; }
    if (name == "text") { out = Tool::Text; return true; }
    if (name == "eraser") { out = Tool::Eraser; return true; }
    return false;
}

const char* boardErrorName(BoardError error) noexcept {
    switch (error) {
        case BoardError::Ok: return "ok";
        case BoardError::NotFound: return "not-found";
        case BoardError::Network: return "network";
        case BoardError::Validation: return "validation";
        case BoardError::Unauthenticated: return "unauthenticated";
    }
    return "unknown";
}
