#include "whiteboard/document/document.h"
#include <algorithm>
#include <unordered_set>

bool Document::isSelected(const std::string& id) const {
    return std::find(selection.selectedIds.begin(), selection.selectedIds.end(), id) != selection.selectedIds.end();
}

const Shape* Document::findShape(const std::string& id) const {
    const auto it = shapes.find(id);
    return it == shapes.end() ? nullptr : &it->second;
}

Shape* Document::findShape(const std::string& id) {
    const auto it = shapes.find(id);
    return it == shapes.end() ? nullptr : &it->second;
}

namespace whiteboard {

std::size_t removeShapes(Document& doc, const std::vector<std::string>& ids) {
    std::size_t removed = 0;
    for (const auto& id : ids) {
        removed += doc.shapes.erase(id);
    }
    if (removed > 0) {
        pruneDanglingReferences(doc);
    }
    return removed;
}

void pruneDanglingReferences(Document& doc) {
    auto& selected = doc.selection.selectedIds;
    selected.erase(
        std::remove_if(selected.begin(), selected.end(), [&](const std::string& id) {
            return doc.shapes.find(id) == doc.shapes.end();
        }),
        selected.end());

    for (auto it = doc.dragState.shapeSnapshots.begin(); it != doc.dragState.shapeSnapshots.end();) {
        if (doc.shapes.find(it->first) == doc.shapes.end()) {
            it = doc.dragState.shapeSnapshots.erase(it);
        } else {
            ++it;
        }
    }

    if (doc.drawingState.currentShapeId && doc.shapes.find(*doc.drawingState.currentShapeId) == doc.shapes.end()) {
        doc.drawingState.currentShapeId.reset();
        if (doc.mode == InteractionMode::Drawing) {
            doc.mode = InteractionMode::Idle;
        }
    }

    if (doc.textEditingState.editingId) {
        const Shape* shape = doc.findShape(*doc.textEditingState.editingId);
        if (!shape || shape->kind() != ShapeKind::Text) {
            doc.textEditingState.editingId.reset();
        }
    }
}

void resetInteraction(Document& doc) {
    doc.mode = InteractionMode::Idle;
    doc.selection.marqueeStart.reset();
    doc.selection.marqueeEnd.reset();
    doc.dragState = DragState{};
    doc.drawingState = DrawingState{};
}

void normalizeDocument(Document& doc, const ScaleLimits& limits) {
    doc.viewport.scale = clampScale(doc.viewport.scale, limits);
    resetInteraction(doc);
    // No editor overlay is open on a freshly loaded board.
    doc.textEditingState.editingId.reset();

    std::unordered_set<std::string> seen;
    auto& selected = doc.selection.selectedIds;
    selected.erase(
        std::remove_if(selected.begin(), selected.end(), [&](const std::string& id) {
            return !seen.insert(id).second;
        }),
        selected.end());

    pruneDanglingReferences(doc);
}

} // namespace whiteboard
