#ifndef WHITEBOARD_PERSISTENCE_BOARD_CODEC_H
#define WHITEBOARD_PERSISTENCE_BOARD_CODEC_H

#include "whiteboard/core/types.h"
#include "whiteboard/document/document.h"
#include <nlohmann/json.hpp>
#include <string>

namespace whiteboard {

// Board-state blob exchanged with the persistence service. Field names follow
// the service's stored schema (camelCase, flat [x0, y0, x1, y1, ...] point arrays).

nlohmann::json buildShapeJson(const Shape& shape);
nlohmann::json buildShapesJson(const ShapeMap& shapes);

// Compact JSON text. Invalid UTF-8 in strings is replaced with U+FFFD
// instead of throwing.
std::string dumpJson(const nlohmann::json& value);

// Serializes the whole document, including tool/selection/viewport/history.
nlohmann::json buildBoardState(const Document& doc);
std::string buildBoardStateText(const Document& doc);

// Parse a board-state blob into `out`.
// Returns BoardError::Ok on success, BoardError::Validation on a malformed blob;
// `message` receives a description of the first problem found.
BoardError parseShapes(const nlohmann::json& src, ShapeMap& out, std::string& message);
BoardError parseBoardState(const nlohmann::json& src, Document& out, std::string& message);
BoardError parseBoardStateText(const std::string& text, Document& out, std::string& message);

} // namespace whiteboard

#endif // WHITEBOARD_PERSISTENCE_BOARD_CODEC_H
