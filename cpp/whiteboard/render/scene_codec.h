#ifndef WHITEBOARD_RENDER_SCENE_CODEC_H
#define WHITEBOARD_RENDER_SCENE_CODEC_H

#include "whiteboard/render/render_bridge.h"
#include <nlohmann/json.hpp>

namespace whiteboard {

// Flattens a Scene for a JavaScript painter. Each shape entry is the stored
// shape record plus "selected", "draggable" and "hidden" flags.
nlohmann::json buildSceneJson(const Scene& scene);

} // namespace whiteboard

#endif // WHITEBOARD_RENDER_SCENE_CODEC_H
