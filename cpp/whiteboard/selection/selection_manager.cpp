#include "whiteboard/selection/selection_manager.h"
#include "whiteboard/geometry/geometry.h"
#include <algorithm>

void SelectionManager::setSelection(Document& doc, const std::vector<std::string>& ids, Mode mode) {
    auto& selected = doc.selection.selectedIds;
    const std::vector<std::string> before = selected;

    if (mode == Mode::Replace) {
        selected.clear();
    }

    for (const auto& id : ids) {
        if (doc.shapes.find(id) == doc.shapes.end()) continue;
        const auto it = std::find(selected.begin(), selected.end(), id);
        switch (mode) {
            case Mode::Replace:
            case Mode::Add:
                if (it == selected.end()) selected.push_back(id);
                break;
            case Mode::Remove:
                if (it != selected.end()) selected.erase(it);
                break;
            case Mode::Toggle:
                if (it != selected.end()) {
                    selected.erase(it);
                } else {
                    selected.push_back(id);
                }
                break;
        }
    }

    if (selected != before) {
        generation_++;
    }
}

void SelectionManager::clearSelection(Document& doc) {
    if (doc.selection.selectedIds.empty()) return;
    doc.selection.selectedIds.clear();
    generation_++;
}

void SelectionManager::selectByClick(Document& doc, const std::string& id, bool shift) {
    if (doc.activeTool != Tool::Select) return;
    if (doc.shapes.find(id) == doc.shapes.end()) return;
    setSelection(doc, {id}, shift ? Mode::Toggle : Mode::Replace);
}

std::vector<std::string> SelectionManager::queryMarquee(const Document& doc, const Box& box) const {
    std::vector<std::string> ids;
    for (const auto& entry : doc.shapes) {
        if (whiteboard::intersects(whiteboard::bounds(entry.second), box)) {
            ids.push_back(entry.first);
        }
    }
    // Map iteration order is unspecified; keep results stable for callers.
    std::sort(ids.begin(), ids.end());
    return ids;
}

void SelectionManager::beginMarquee(Document& doc, const Point2& world, bool shift) {
    doc.mode = InteractionMode::Marquee;
    doc.selection.marqueeStart = world;
    doc.selection.marqueeEnd = world;
    if (!shift) {
        clearSelection(doc);
    }
}

void SelectionManager::updateMarquee(Document& doc, const Point2& world) {
    if (doc.mode != InteractionMode::Marquee || !doc.selection.marqueeStart) return;
    doc.selection.marqueeEnd = world;
}

void SelectionManager::finishMarquee(Document& doc, bool shift) {
    if (doc.mode != InteractionMode::Marquee) return;

    const std::optional<Box> box = marqueeBox(doc);
    if (box) {
        const std::vector<std::string> hits = queryMarquee(doc, *box);
        setSelection(doc, hits, shift ? Mode::Add : Mode::Replace);
    }

    doc.selection.marqueeStart.reset();
    doc.selection.marqueeEnd.reset();
    doc.mode = InteractionMode::Idle;
}

std::optional<Box> SelectionManager::marqueeBox(const Document& doc) const {
    if (!doc.selection.marqueeStart || !doc.selection.marqueeEnd) return std::nullopt;
    return whiteboard::normalizedBox(*doc.selection.marqueeStart, *doc.selection.marqueeEnd);
}

std::optional<Box> SelectionManager::groupBounds(const Document& doc) const {
    return whiteboard::unionBounds(doc.shapes, doc.selection.selectedIds);
}

bool SelectionManager::canBeginGroupDrag(const Document& doc, const Point2& world) const {
    if (doc.activeTool != Tool::Select) return false;
    if (doc.selection.selectedIds.size() < 2) return false;
    const std::optional<Box> box = groupBounds(doc);
    return box && whiteboard::pointInBox(world, *box);
}

void SelectionManager::beginGroupDrag(Document& doc, const Point2& world) {
    DragState drag{};
    drag.startPoint = world;
    for (const auto& id : doc.selection.selectedIds) {
        const Shape* shape = doc.findShape(id);
        if (!shape) continue;

        DragSnapshot snap{};
        if (shape->pathPoints(snap.points)) {
            snap.isPath = true;
        } else {
            Point2 anchor{};
            shape->anchor(anchor);
            snap.x = anchor.x;
            snap.y = anchor.y;
        }
        drag.shapeSnapshots.emplace(id, std::move(snap));
    }
    doc.dragState = std::move(drag);
    doc.mode = InteractionMode::GroupDrag;
}

void SelectionManager::updateGroupDrag(Document& doc, const Point2& world) {
    if (doc.mode != InteractionMode::GroupDrag || !doc.dragState.startPoint) return;

    const float dx = world.x - doc.dragState.startPoint->x;
    const float dy = world.y - doc.dragState.startPoint->y;

    for (const auto& id : doc.selection.selectedIds) {
        Shape* shape = doc.findShape(id);
        const auto snapIt = doc.dragState.shapeSnapshots.find(id);
        if (!shape || snapIt == doc.dragState.shapeSnapshots.end()) continue;

        const DragSnapshot& snap = snapIt->second;
        if (snap.isPath && shape->isPath()) {
            std::vector<Point2> moved = snap.points;
            for (auto& p : moved) {
                p.x += dx;
                p.y += dy;
            }
            shape->setPathPoints(moved);
        } else if (!snap.isPath && !shape->isPath()) {
            shape->setAnchor(Point2{snap.x + dx, snap.y + dy});
        }
    }
}

void SelectionManager::endGroupDrag(Document& doc) {
    doc.dragState = DragState{};
    if (doc.mode == InteractionMode::GroupDrag) {
        doc.mode = InteractionMode::Idle;
    }
}
