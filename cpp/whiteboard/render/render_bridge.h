#ifndef WHITEBOARD_RENDER_RENDER_BRIDGE_H
#define WHITEBOARD_RENDER_RENDER_BRIDGE_H

#include "whiteboard/core/config.h"
#include "whiteboard/document/document.h"
#include <optional>
#include <string>
#include <vector>

class HistoryManager;

namespace whiteboard {

// Per-shape record handed to the painter.
struct ShapeView {
    const Shape* shape;
    bool selected;
    bool draggable;   // select tool, exactly one shape selected, and it is this one
    bool hidden;      // text currently open in the editor overlay
};

struct Scene {
    std::vector<ShapeView> shapes;          // sorted by id for stable paint order
    std::optional<std::string> transformerTarget;
    std::optional<Box> groupBounds;         // only when >=2 shapes are selected
    std::optional<Box> marquee;
    Viewport viewport;
    Tool activeTool = Tool::Select;
    std::optional<std::string> editingId;
};

// The returned views point into `doc.shapes`; rebuild after every mutation.
Scene buildScene(const Document& doc);

bool isDraggable(const Document& doc, const std::string& id);

// Folds the painter's drag/transform callbacks into single committed mutations.
class RenderBridge {
public:
    RenderBridge(HistoryManager& historyManager, const BoardConfig& config);

    // Node dragged to (x, y). Anchored shapes move their anchor; path shapes
    // are translated by the node offset.
    bool onDragEnd(Document& doc, const std::string& id, float x, float y);

    // Transformer released with the node at (x, y) and the given scale factors.
    bool onTransformEnd(Document& doc, const std::string& id, float x, float y, float scaleX, float scaleY);

    // Whole-canvas drag finished at stage position (x, y).
    bool onStageDragEnd(Document& doc, float x, float y);

private:
    HistoryManager& historyManager_;
    const BoardConfig& config_;
};

} // namespace whiteboard

#endif // WHITEBOARD_RENDER_RENDER_BRIDGE_H
