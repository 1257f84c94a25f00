#include "whiteboard/interaction/interaction_session.h"
#include "whiteboard/core/logging.h"
#include "whiteboard/geometry/geometry.h"
#include "whiteboard/history/history_manager.h"
#include "whiteboard/interaction/eraser.h"
#include "whiteboard/selection/selection_manager.h"
#include "whiteboard/viewport/viewport.h"
#include <cmath>
#include <utility>
#include <vector>

namespace {
    inline bool isCanvasTarget(const PointerInput& input) {
        return input.targetId.empty();
    }

    inline Point2 midpoint(const Point2& a, const Point2& b) {
        return Point2{(a.x + b.x) * 0.5f, (a.y + b.y) * 0.5f};
    }
}

InteractionSession::InteractionSession(HistoryManager& historyManager, SelectionManager& selectionManager, const BoardConfig& config)
    : historyManager_(historyManager), selectionManager_(selectionManager), config_(config)
{
    pointers_.reserve(4);
}

void InteractionSession::reset() {
    pointers_.clear();
    primaryPointerId_.reset();
    pinch_ = PinchState{};
    idAllocator_.reset();
}

Point2 InteractionSession::worldOf(const Document& doc, const PointerInput& input) const {
    return whiteboard::toWorld(doc.viewport, Point2{input.screenX, input.screenY});
}

bool InteractionSession::isPrimary(const PointerInput& input) const noexcept {
    return primaryPointerId_ && *primaryPointerId_ == input.pointerId;
}

// ==============================================================================
// Pointer Down
// ==============================================================================

bool InteractionSession::pointerDown(Document& doc, const PointerInput& input) {
    pointers_[input.pointerId] = ActivePointer{input.type, Point2{input.screenX, input.screenY}};

    // Clicking away from the editor blurs it.
    const bool blurred = endTextEdit(doc);
    return beginGesture(doc, input) || blurred;
}

bool InteractionSession::beginGesture(Document& doc, const PointerInput& input) {
    const bool twoTouches = pointers_.size() == 2 && [this]() {
        for (const auto& entry : pointers_) {
            if (entry.second.type != PointerType::Touch) return false;
        }
        return true;
    }();

    if (doc.mode != InteractionMode::Idle) {
        // A second finger turns any single-finger gesture into a pinch.
        if (twoTouches && doc.mode != InteractionMode::MiddlePan && doc.mode != InteractionMode::Pinch) {
            finishActiveInteraction(doc);
            return beginPinch(doc);
        }
        return false;
    }

    // --- MIDDLE MOUSE PAN ---
    if (input.button == interaction_constants::BUTTON_MIDDLE) {
        doc.mode = InteractionMode::MiddlePan;
        primaryPointerId_ = input.pointerId;
        return true;
    }

    // --- PINCH ZOOM (2 touches) ---
    if (pointers_.size() == 2) {
        if (twoTouches) {
            return beginPinch(doc);
        }
        return false;
    }

    const Point2 world = worldOf(doc, input);

    // --- GROUP BOUNDING BOX DRAG ---
    if (selectionManager_.canBeginGroupDrag(doc, world)) {
        historyManager_.discardEntry();
        historyManager_.beginEntry(doc);
        selectionManager_.beginGroupDrag(doc, world);
        primaryPointerId_ = input.pointerId;
        return true;
    }

    // --- ERASER ---
    if (doc.activeTool == Tool::Eraser) {
        historyManager_.discardEntry();
        historyManager_.beginEntry(doc);
        doc.mode = InteractionMode::Drawing;
        doc.drawingState.currentShapeId.reset();
        primaryPointerId_ = input.pointerId;
        if (whiteboard::eraseAt(doc, world, config_.eraserRadius) > 0) {
            historyManager_.invalidateRedo(doc);
        }
        return true;
    }

    // --- SELECT ---
    if (doc.activeTool == Tool::Select) {
        if (!isCanvasTarget(input)) {
            // Shape clicks arrive through shapeClick().
            return false;
        }
        primaryPointerId_ = input.pointerId;
        if (input.type == PointerType::Mouse && input.button == interaction_constants::BUTTON_PRIMARY) {
            selectionManager_.beginMarquee(doc, world, input.shift);
            return true;
        }
        doc.mode = InteractionMode::CanvasPan;
        if (!input.shift) {
            selectionManager_.clearSelection(doc);
        }
        return true;
    }

    // --- DRAWING TOOLS ---
    if (!isDrawingTool(doc.activeTool)) return false;
    primaryPointerId_ = input.pointerId;
    return beginDrawing(doc, world);
}

bool InteractionSession::beginPinch(Document& doc) {
    std::vector<Point2> screens;
    screens.reserve(2);
    for (const auto& entry : pointers_) {
        screens.push_back(entry.second.screen);
    }
    pinch_.lastCenter = midpoint(screens[0], screens[1]);
    pinch_.lastDistance = whiteboard::distance(screens[0], screens[1]);
    primaryPointerId_.reset();
    doc.mode = InteractionMode::Pinch;
    WHITEBOARD_LOG_DEBUG("pinch: baseline distance %.1f", pinch_.lastDistance);
    return true;
}

bool InteractionSession::beginDrawing(Document& doc, const Point2& world) {
    const std::string id = idAllocator_.allocate(doc.shapes);

    if (doc.activeTool == Tool::Text) {
        // Text is placed with one click and committed immediately.
        ShapeMap before = doc.shapes;
        doc.shapes.emplace(id, makeText(id, world, config_.textPlaceholder, config_.textFill, config_.textFontSize));
        historyManager_.commit(doc, std::move(before));
        doc.activeTool = Tool::Select;
        primaryPointerId_.reset();
        return true;
    }

    historyManager_.discardEntry();
    historyManager_.beginEntry(doc);

    switch (doc.activeTool) {
        case Tool::Pen:
            doc.shapes.emplace(id, makePen(id, world, config_.penStroke));
            break;
        case Tool::Line:
            doc.shapes.emplace(id, makeLine(id, world, config_.lineStroke));
            break;
        case Tool::Rect:
            doc.shapes.emplace(id, makeRect(id, world, config_.rectFill, config_.rectStroke));
            break;
        case Tool::Circle:
            doc.shapes.emplace(id, makeCircle(id, world, config_.circleInitialRadius, config_.circleStroke, config_.circleStrokeWidth));
            break;
        case Tool::Select:
        case Tool::Text:
        case Tool::Eraser:
            historyManager_.discardEntry();
            primaryPointerId_.reset();
            return false;
    }

    historyManager_.invalidateRedo(doc);
    doc.mode = InteractionMode::Drawing;
    doc.drawingState.currentShapeId = id;
    return true;
}

// ==============================================================================
// Pointer Move
// ==============================================================================

bool InteractionSession::pointerMove(Document& doc, const PointerInput& input) {
    const auto it = pointers_.find(input.pointerId);
    if (it == pointers_.end()) {
        return false; // hover
    }
    const Point2 previous = it->second.screen;
    it->second.screen = Point2{input.screenX, input.screenY};

    switch (doc.mode) {
        case InteractionMode::MiddlePan:
        case InteractionMode::CanvasPan: {
            if (!isPrimary(input)) return false;
            const float dx = input.screenX - previous.x;
            const float dy = input.screenY - previous.y;
            if (dx == 0.0f && dy == 0.0f) return false;
            doc.viewport = whiteboard::panBy(doc.viewport, dx, dy);
            return true;
        }
        case InteractionMode::GroupDrag:
            if (!isPrimary(input)) return false;
            selectionManager_.updateGroupDrag(doc, worldOf(doc, input));
            return true;
        case InteractionMode::Pinch:
            return updatePinch(doc);
        case InteractionMode::Marquee:
            if (!isPrimary(input)) return false;
            selectionManager_.updateMarquee(doc, worldOf(doc, input));
            return true;
        case InteractionMode::Drawing:
            if (!isPrimary(input)) return false;
            return updateDrawing(doc, worldOf(doc, input));
        case InteractionMode::Idle:
            return false;
    }
    return false;
}

bool InteractionSession::updatePinch(Document& doc) {
    if (pointers_.size() != 2) return false;

    std::vector<Point2> screens;
    screens.reserve(2);
    for (const auto& entry : pointers_) {
        screens.push_back(entry.second.screen);
    }
    const Point2 center = midpoint(screens[0], screens[1]);
    const float dist = whiteboard::distance(screens[0], screens[1]);

    bool changed = false;
    if (pinch_.lastDistance > 0.0f) {
        const float dx = center.x - pinch_.lastCenter.x;
        const float dy = center.y - pinch_.lastCenter.y;
        const float requested = doc.viewport.scale * (dist / pinch_.lastDistance);
        const whiteboard::ScaleLimits limits{config_.minScale, config_.maxScale};

        Viewport next = whiteboard::zoomAt(doc.viewport, pinch_.lastCenter, requested, limits);
        next.x += dx;
        next.y += dy;
        changed = !(next == doc.viewport);
        doc.viewport = next;
    }

    pinch_.lastCenter = center;
    pinch_.lastDistance = dist;
    return changed;
}

bool InteractionSession::updateDrawing(Document& doc, const Point2& world) {
    if (doc.activeTool == Tool::Eraser && !doc.drawingState.currentShapeId) {
        if (whiteboard::eraseAt(doc, world, config_.eraserRadius) == 0) return false;
        historyManager_.invalidateRedo(doc);
        return true;
    }

    if (!doc.drawingState.currentShapeId) return false;
    Shape* shape = doc.findShape(*doc.drawingState.currentShapeId);
    if (!shape) return false;

    switch (shape->kind()) {
        case ShapeKind::Pen:
            std::get<PenShape>(shape->data).points.push_back(world);
            break;
        case ShapeKind::Line:
            std::get<LineShape>(shape->data).points[1] = world;
            break;
        case ShapeKind::Rect: {
            auto& rect = std::get<RectShape>(shape->data);
            rect.width = world.x - rect.x;
            rect.height = world.y - rect.y;
            break;
        }
        case ShapeKind::Circle: {
            auto& circle = std::get<CircleShape>(shape->data);
            circle.radius = whiteboard::distance(Point2{circle.x, circle.y}, world);
            break;
        }
        case ShapeKind::Text:
            return false;
    }
    return true;
}

// ==============================================================================
// Pointer Up
// ==============================================================================

bool InteractionSession::pointerUp(Document& doc, const PointerInput& input) {
    bool changed = false;

    switch (doc.mode) {
        case InteractionMode::MiddlePan:
        case InteractionMode::CanvasPan:
            if (isPrimary(input)) {
                doc.mode = InteractionMode::Idle;
                primaryPointerId_.reset();
                changed = true;
            }
            break;
        case InteractionMode::GroupDrag:
            if (isPrimary(input)) {
                selectionManager_.endGroupDrag(doc);
                historyManager_.commitEntry(doc);
                primaryPointerId_.reset();
                changed = true;
            }
            break;
        case InteractionMode::Marquee:
            if (isPrimary(input)) {
                selectionManager_.finishMarquee(doc, input.shift);
                primaryPointerId_.reset();
                changed = true;
            }
            break;
        case InteractionMode::Drawing:
            if (isPrimary(input)) {
                changed = endDrawing(doc);
                primaryPointerId_.reset();
            }
            break;
        case InteractionMode::Pinch:
            pinch_ = PinchState{};
            doc.mode = InteractionMode::Idle;
            changed = true;
            break;
        case InteractionMode::Idle:
            break;
    }

    pointers_.erase(input.pointerId);
    return changed;
}

bool InteractionSession::pointerCancel(Document& doc, const PointerInput& input) {
    PointerInput cancelled = input;
    cancelled.shift = false;
    return pointerUp(doc, cancelled);
}

bool InteractionSession::endDrawing(Document& doc) {
    const Tool tool = doc.activeTool;
    doc.drawingState.currentShapeId.reset();
    doc.mode = InteractionMode::Idle;
    historyManager_.commitEntry(doc);

    // Line, rect and circle are one-shot shapes.
    if (tool == Tool::Line || tool == Tool::Rect || tool == Tool::Circle) {
        doc.activeTool = Tool::Select;
    }
    return true;
}

void InteractionSession::finishActiveInteraction(Document& doc) {
    switch (doc.mode) {
        case InteractionMode::Drawing:
            endDrawing(doc);
            break;
        case InteractionMode::GroupDrag:
            selectionManager_.endGroupDrag(doc);
            historyManager_.commitEntry(doc);
            break;
        case InteractionMode::Marquee:
            doc.selection.marqueeStart.reset();
            doc.selection.marqueeEnd.reset();
            doc.mode = InteractionMode::Idle;
            break;
        case InteractionMode::MiddlePan:
        case InteractionMode::CanvasPan:
        case InteractionMode::Pinch:
            doc.mode = InteractionMode::Idle;
            break;
        case InteractionMode::Idle:
            break;
    }
    primaryPointerId_.reset();
}

// ==============================================================================
// Wheel / Keyboard
// ==============================================================================

bool InteractionSession::wheel(Document& doc, const WheelInput& input) {
    const whiteboard::ScaleLimits limits{config_.minScale, config_.maxScale};
    const Viewport next = whiteboard::wheelZoom(
        doc.viewport, Point2{input.screenX, input.screenY}, input.deltaY, config_.wheelScaleFactor, limits);
    if (next == doc.viewport) return false;
    doc.viewport = next;
    return true;
}

bool InteractionSession::keyDown(Document& doc, const KeyInput& input) {
    if (doc.textEditingState.editingId) {
        if (input.key == "Escape") {
            return endTextEdit(doc);
        }
        return false;
    }

    if (input.ctrl && input.key == "z" && !input.shift) {
        return undo(doc);
    }
    if (input.ctrl && input.key == "y") {
        return redo(doc);
    }
    if ((input.key == "Backspace" || input.key == "Delete") && !doc.selection.selectedIds.empty()) {
        return deleteSelection(doc);
    }
    if (input.key == "t" || input.key == "T") {
        return setTool(doc, Tool::Text);
    }
    if (input.key == "e" || input.key == "E") {
        return setTool(doc, Tool::Eraser);
    }
    return false;
}

// ==============================================================================
// Commands
// ==============================================================================

bool InteractionSession::shapeClick(Document& doc, const std::string& id, bool shift) {
    if (doc.activeTool != Tool::Select) return false;
    const std::vector<std::string> before = doc.selection.selectedIds;
    selectionManager_.selectByClick(doc, id, shift);
    return doc.selection.selectedIds != before;
}

bool InteractionSession::setTool(Document& doc, Tool tool) {
    if (doc.activeTool == tool) return false;
    if (doc.mode == InteractionMode::Drawing || doc.mode == InteractionMode::Marquee || doc.mode == InteractionMode::GroupDrag) {
        finishActiveInteraction(doc);
    }
    doc.activeTool = tool;
    return true;
}

bool InteractionSession::undo(Document& doc) {
    if (!historyManager_.canUndo(doc)) return false;
    if (doc.mode != InteractionMode::Idle && doc.mode != InteractionMode::Pinch) {
        whiteboard::resetInteraction(doc);
        primaryPointerId_.reset();
    }
    // An unfinished gesture is abandoned, not recorded.
    historyManager_.rollbackEntry(doc);
    historyManager_.undo(doc);
    return true;
}

bool InteractionSession::redo(Document& doc) {
    if (!historyManager_.canRedo(doc)) return false;
    if (doc.mode != InteractionMode::Idle && doc.mode != InteractionMode::Pinch) {
        whiteboard::resetInteraction(doc);
        primaryPointerId_.reset();
    }
    // An unfinished gesture is abandoned, not recorded.
    historyManager_.rollbackEntry(doc);
    historyManager_.redo(doc);
    return true;
}

bool InteractionSession::deleteSelection(Document& doc) {
    if (doc.selection.selectedIds.empty()) return false;
    ShapeMap before = doc.shapes;
    const std::vector<std::string> ids = doc.selection.selectedIds;
    whiteboard::removeShapes(doc, ids);
    selectionManager_.clearSelection(doc);
    historyManager_.commit(doc, std::move(before));
    return true;
}

bool InteractionSession::clearBoard(Document& doc) {
    if (doc.mode != InteractionMode::Idle) {
        finishActiveInteraction(doc);
    }
    ShapeMap before = doc.shapes;
    doc.shapes.clear();
    selectionManager_.clearSelection(doc);
    whiteboard::pruneDanglingReferences(doc);
    return historyManager_.commit(doc, std::move(before));
}

bool InteractionSession::resetView(Document& doc) {
    const Viewport home{};
    if (doc.viewport == home) return false;
    doc.viewport = home;
    return true;
}

// ==============================================================================
// Text Editing
// ==============================================================================

bool InteractionSession::beginTextEdit(Document& doc, const std::string& id) {
    const Shape* shape = doc.findShape(id);
    if (!shape || shape->kind() != ShapeKind::Text) return false;
    if (doc.textEditingState.editingId == id) return false;
    if (doc.textEditingState.editingId) {
        endTextEdit(doc);
    }
    doc.textEditingState.editingId = id;
    selectionManager_.clearSelection(doc);
    historyManager_.discardEntry();
    historyManager_.beginEntry(doc);
    return true;
}

bool InteractionSession::changeText(Document& doc, const std::string& id, const std::string& text) {
    Shape* shape = doc.findShape(id);
    if (!shape || shape->kind() != ShapeKind::Text) return false;
    auto& textShape = std::get<TextShape>(shape->data);
    if (textShape.text == text) return false;
    textShape.text = text;
    historyManager_.invalidateRedo(doc);
    return true;
}

bool InteractionSession::endTextEdit(Document& doc) {
    if (!doc.textEditingState.editingId) return false;
    doc.textEditingState.editingId.reset();
    historyManager_.commitEntry(doc);
    return true;
}
