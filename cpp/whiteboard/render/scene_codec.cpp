#include "whiteboard/render/scene_codec.h"
#include "whiteboard/persistence/board_codec.h"

using nlohmann::json;

namespace whiteboard {

namespace {

json boxJson(const std::optional<Box>& box) {
    if (!box) return nullptr;
    return json{
        {"x", box->x},
        {"y", box->y},
        {"width", box->width},
        {"height", box->height},
    };
}

} // namespace

json buildSceneJson(const Scene& scene) {
    json shapes = json::array();
    for (const ShapeView& view : scene.shapes) {
        json entry = buildShapeJson(*view.shape);
        entry["selected"] = view.selected;
        entry["draggable"] = view.draggable;
        entry["hidden"] = view.hidden;
        shapes.push_back(std::move(entry));
    }

    json out;
    out["shapes"] = std::move(shapes);
    out["transformerTarget"] = scene.transformerTarget ? json(*scene.transformerTarget) : json(nullptr);
    out["groupBounds"] = boxJson(scene.groupBounds);
    out["marquee"] = boxJson(scene.marquee);
    out["viewport"] = json{{"scale", scene.viewport.scale}, {"x", scene.viewport.x}, {"y", scene.viewport.y}};
    out["activeTool"] = toolName(scene.activeTool);
    out["editingId"] = scene.editingId ? json(*scene.editingId) : json(nullptr);
    return out;
}

} // namespace whiteboard
