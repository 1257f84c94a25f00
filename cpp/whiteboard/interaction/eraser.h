#pragma once

#include "whiteboard/document/document.h"
#include "whiteboard/interaction/interaction_constants.h"
#include <string>
#include <vector>

namespace whiteboard {

// True when an eraser of `radius` centered at `world` touches `shape`.
bool eraserHits(const Shape& shape, const Point2& world, float radius = interaction_constants::ERASER_RADIUS);

// Ids of every shape hit at `world`, sorted.
std::vector<std::string> eraserHitTest(const ShapeMap& shapes, const Point2& world, float radius = interaction_constants::ERASER_RADIUS);

// Removes every hit shape in one batch. Returns the number removed.
std::size_t eraseAt(Document& doc, const Point2& world, float radius = interaction_constants::ERASER_RADIUS);

} // namespace whiteboard
