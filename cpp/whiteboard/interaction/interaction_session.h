#pragma once

#include "whiteboard/core/config.h"
#include "whiteboard/document/document.h"
#include "whiteboard/entity/shape.h"
#include "whiteboard/interaction/interaction_types.h"
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

class HistoryManager;
class SelectionManager;

// Tool state machine. Interprets input events against Document::activeTool
// and Document::mode and mutates the document in place.
//
// Every handler returns true when it changed the document, so the caller can
// skip notifying subscribers and scheduling a save for no-op events.
class InteractionSession {
public:
    InteractionSession(HistoryManager& historyManager, SelectionManager& selectionManager, const BoardConfig& config);

    // ==============================================================================
    // Pointer / Wheel / Keyboard
    // ==============================================================================
    bool pointerDown(Document& doc, const PointerInput& input);
    bool pointerMove(Document& doc, const PointerInput& input);
    bool pointerUp(Document& doc, const PointerInput& input);
    bool pointerCancel(Document& doc, const PointerInput& input);
    bool wheel(Document& doc, const WheelInput& input);
    bool keyDown(Document& doc, const KeyInput& input);

    // ==============================================================================
    // Commands
    // ==============================================================================
    bool shapeClick(Document& doc, const std::string& id, bool shift);
    bool setTool(Document& doc, Tool tool);
    bool undo(Document& doc);
    bool redo(Document& doc);
    bool deleteSelection(Document& doc);
    bool clearBoard(Document& doc);
    bool resetView(Document& doc);

    // ==============================================================================
    // Text Editing
    // ==============================================================================
    bool beginTextEdit(Document& doc, const std::string& id);
    bool changeText(Document& doc, const std::string& id, const std::string& text);
    bool endTextEdit(Document& doc);

    // Drops pointer tracking and gesture baselines (board load / unmount).
    void reset();

    std::size_t activePointerCount() const noexcept { return pointers_.size(); }

private:
    struct ActivePointer {
        PointerType type;
        Point2 screen;
    };

    struct PinchState {
        Point2 lastCenter{0.0f, 0.0f};
        float lastDistance = 0.0f;
    };

    // Pointer-down dispatch once the pointer is tracked.
    bool beginGesture(Document& doc, const PointerInput& input);
    bool beginPinch(Document& doc);
    bool updatePinch(Document& doc);
    bool beginDrawing(Document& doc, const Point2& world);
    bool updateDrawing(Document& doc, const Point2& world);
    bool endDrawing(Document& doc);
    // Closes whatever gesture is running so another one can take over.
    void finishActiveInteraction(Document& doc);

    Point2 worldOf(const Document& doc, const PointerInput& input) const;
    bool isPrimary(const PointerInput& input) const noexcept;

    HistoryManager& historyManager_;
    SelectionManager& selectionManager_;
    const BoardConfig& config_;
    ShapeIdAllocator idAllocator_;

    std::unordered_map<std::int32_t, ActivePointer> pointers_;
    std::optional<std::int32_t> primaryPointerId_;
    PinchState pinch_;
};
