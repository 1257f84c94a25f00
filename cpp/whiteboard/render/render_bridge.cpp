#include "whiteboard/render/render_bridge.h"
#include "whiteboard/geometry/geometry.h"
#include "whiteboard/history/history_manager.h"
#include <algorithm>
#include <utility>

namespace whiteboard {

bool isDraggable(const Document& doc, const std::string& id) {
    return doc.activeTool == Tool::Select
        && doc.selection.selectedIds.size() == 1
        && doc.selection.selectedIds.front() == id;
}

Scene buildScene(const Document& doc) {
    Scene scene{};
    scene.viewport = doc.viewport;
    scene.activeTool = doc.activeTool;
    scene.editingId = doc.textEditingState.editingId;

    scene.shapes.reserve(doc.shapes.size());
    for (const auto& entry : doc.shapes) {
        const std::string& id = entry.first;
        const bool hidden = doc.textEditingState.editingId && *doc.textEditingState.editingId == id;
        scene.shapes.push_back(ShapeView{&entry.second, doc.isSelected(id), isDraggable(doc, id), hidden});
    }
    std::sort(scene.shapes.begin(), scene.shapes.end(), [](const ShapeView& a, const ShapeView& b) {
        return a.shape->id < b.shape->id;
    });

    if (doc.activeTool == Tool::Select && doc.selection.selectedIds.size() == 1) {
        const Shape* shape = doc.findShape(doc.selection.selectedIds.front());
        if (shape && shape->kind() != ShapeKind::Text) {
            scene.transformerTarget = shape->id;
        }
    }

    if (doc.selection.selectedIds.size() > 1) {
        scene.groupBounds = unionBounds(doc.shapes, doc.selection.selectedIds);
    }

    if (doc.selection.marqueeStart && doc.selection.marqueeEnd) {
        scene.marquee = normalizedBox(*doc.selection.marqueeStart, *doc.selection.marqueeEnd);
    }

    return scene;
}

RenderBridge::RenderBridge(HistoryManager& historyManager, const BoardConfig& config)
    : historyManager_(historyManager), config_(config) {}

bool RenderBridge::onDragEnd(Document& doc, const std::string& id, float x, float y) {
    Shape* shape = doc.findShape(id);
    if (!shape) return false;

    ShapeMap before = doc.shapes;
    if (shape->isPath()) {
        shape->translate(x, y);
    } else {
        shape->setAnchor(Point2{x, y});
    }
    return historyManager_.commit(doc, std::move(before));
}

bool RenderBridge::onTransformEnd(Document& doc, const std::string& id, float x, float y, float scaleX, float scaleY) {
    Shape* shape = doc.findShape(id);
    if (!shape) return false;

    ShapeMap before = doc.shapes;
    switch (shape->kind()) {
        case ShapeKind::Rect: {
            auto& rect = std::get<RectShape>(shape->data);
            rect.x = x;
            rect.y = y;
            rect.width = std::max(config_.minTransformSize, rect.width * scaleX);
            rect.height = std::max(config_.minTransformSize, rect.height * scaleY);
            break;
        }
        case ShapeKind::Circle: {
            auto& circle = std::get<CircleShape>(shape->data);
            circle.x = x;
            circle.y = y;
            circle.radius = std::max(config_.minTransformSize, circle.radius * scaleX);
            break;
        }
        case ShapeKind::Text: {
            auto& text = std::get<TextShape>(shape->data);
            text.x = x;
            text.y = y;
            text.fontSize = std::max(config_.minTransformFontSize, text.fontSize * scaleX);
            break;
        }
        case ShapeKind::Pen:
        case ShapeKind::Line:
            // Path geometry is not resized by the transformer.
            break;
    }
    return historyManager_.commit(doc, std::move(before));
}

bool RenderBridge::onStageDragEnd(Document& doc, float x, float y) {
    if (doc.viewport.x == x && doc.viewport.y == y) return false;
    doc.viewport.x = x;
    doc.viewport.y = y;
    return true;
}

} // namespace whiteboard
