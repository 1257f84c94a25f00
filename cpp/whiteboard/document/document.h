#ifndef WHITEBOARD_DOCUMENT_DOCUMENT_H
#define WHITEBOARD_DOCUMENT_DOCUMENT_H

#include "whiteboard/core/types.h"
#include "whiteboard/entity/shape.h"
#include "whiteboard/viewport/viewport.h"
#include <deque>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

struct SelectionState {
    std::vector<std::string> selectedIds; // unique, in selection order
    std::optional<Point2> marqueeStart;
    std::optional<Point2> marqueeEnd;
};

// Pre-drag geometry of one shape: its point sequence for Pen/Line, or its anchor.
struct DragSnapshot {
    bool isPath = false;
    std::vector<Point2> points;
    float x = 0.0f;
    float y = 0.0f;
};

struct DragState {
    std::optional<Point2> startPoint;
    std::unordered_map<std::string, DragSnapshot> shapeSnapshots;
};

struct DrawingState {
    std::optional<std::string> currentShapeId;
};

struct TextEditingState {
    std::optional<std::string> editingId;
};

// Only the shape collection is versioned. future.front() is the next redo.
struct History {
    std::vector<ShapeMap> past;
    std::deque<ShapeMap> future;
};

// The complete board state. Owned by DocumentStore; mutated only through it.
struct Document {
    ShapeMap shapes;
    Tool activeTool = Tool::Select;
    Viewport viewport;
    InteractionMode mode = InteractionMode::Idle;
    SelectionState selection;
    DragState dragState;
    DrawingState drawingState;
    TextEditingState textEditingState;
    History history;

    // Persisted flags are projections of `mode`.
    bool isMarqueeSelecting() const noexcept { return mode == InteractionMode::Marquee; }
    bool isGroupDragging() const noexcept { return mode == InteractionMode::GroupDrag; }
    bool isDrawing() const noexcept { return mode == InteractionMode::Drawing; }

    bool isSelected(const std::string& id) const;
    const Shape* findShape(const std::string& id) const;
    Shape* findShape(const std::string& id);
};

namespace whiteboard {

// Removes `ids` from the shape map and every reference to them.
// Returns the number of shapes actually removed.
std::size_t removeShapes(Document& doc, const std::vector<std::string>& ids);

// Drops selection/drawing/editing references to shapes that no longer exist.
// Leaves Drawing mode when the tracked shape is gone.
void pruneDanglingReferences(Document& doc);

// Resets every transient interaction field and returns to Idle.
void resetInteraction(Document& doc);

// Brings a loaded document in line with the invariants: clamped scale,
// no transient interaction, no dangling references.
void normalizeDocument(Document& doc, const whiteboard::ScaleLimits& limits = whiteboard::ScaleLimits{});

} // namespace whiteboard

#endif // WHITEBOARD_DOCUMENT_DOCUMENT_H
