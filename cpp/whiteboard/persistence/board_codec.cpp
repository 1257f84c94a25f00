#include "whiteboard/persistence/board_codec.h"
#include "whiteboard/core/logging.h"
#include <stdexcept>
#include <utility>

using nlohmann::json;

namespace whiteboard {

namespace {

json pointsJson(const Point2* points, std::size_t count) {
    json flat = json::array();
    for (std::size_t i = 0; i < count; ++i) {
        flat.push_back(points[i].x);
        flat.push_back(points[i].y);
    }
    return flat;
}

json pointJson(const std::optional<Point2>& p) {
    if (!p) return nullptr;
    return json{{"x", p->x}, {"y", p->y}};
}

json optionalString(const std::optional<std::string>& s) {
    if (!s) return nullptr;
    return *s;
}

std::vector<Point2> parsePoints(const json& flat, const std::string& id) {
    if (!flat.is_array() || flat.size() % 2 != 0) {
        throw std::invalid_argument("shape " + id + ": points must be an even-length array");
    }
    std::vector<Point2> points;
    points.reserve(flat.size() / 2);
    for (std::size_t i = 0; i < flat.size(); i += 2) {
        points.push_back(Point2{flat.at(i).get<float>(), flat.at(i + 1).get<float>()});
    }
    return points;
}

std::optional<Point2> parsePoint(const json& src) {
    if (src.is_null()) return std::nullopt;
    return Point2{src.at("x").get<float>(), src.at("y").get<float>()};
}

std::optional<std::string> parseOptionalString(const json& src) {
    if (src.is_null()) return std::nullopt;
    return src.get<std::string>();
}

Shape parseShape(const std::string& key, const json& src) {
    ShapeKind kind{};
    const std::string type = src.at("type").get<std::string>();
    if (!parseShapeKind(type, kind)) {
        throw std::invalid_argument("shape " + key + ": unknown type '" + type + "'");
    }

    switch (kind) {
        case ShapeKind::Pen: {
            PenShape pen{parsePoints(src.at("points"), key), src.value("stroke", std::string{"#ffffff"})};
            return Shape{key, std::move(pen)};
        }
        case ShapeKind::Line: {
            const std::vector<Point2> points = parsePoints(src.at("points"), key);
            if (points.size() != 2) {
                throw std::invalid_argument("shape " + key + ": line needs exactly two points");
            }
            LineShape line{{points[0], points[1]}, src.value("stroke", std::string{"#ffffff"})};
            return Shape{key, std::move(line)};
        }
        case ShapeKind::Rect: {
            RectShape rect{
                src.at("x").get<float>(),
                src.at("y").get<float>(),
                src.at("width").get<float>(),
                src.at("height").get<float>(),
                src.value("fill", std::string{"transparent"}),
                src.value("stroke", std::string{"#80f20d"})};
            return Shape{key, std::move(rect)};
        }
        case ShapeKind::Circle: {
            CircleShape circle{
                src.at("x").get<float>(),
                src.at("y").get<float>(),
                src.at("radius").get<float>(),
                src.value("stroke", std::string{"#00f3ff"}),
                src.value("strokeWidth", 3.0f),
                src.value("fill", std::string{})};
            return Shape{key, std::move(circle)};
        }
        case ShapeKind::Text: {
            TextShape text{
                src.at("x").get<float>(),
                src.at("y").get<float>(),
                src.at("text").get<std::string>(),
                src.value("fill", std::string{"#ffffff"}),
                src.value("fontSize", 24.0f)};
            return Shape{key, std::move(text)};
        }
    }
    throw std::invalid_argument("shape " + key + ": unhandled type");
}

ShapeMap parseShapeMap(const json& src) {
    if (!src.is_object()) {
        throw std::invalid_argument("shapes must be an object keyed by id");
    }
    ShapeMap shapes;
    shapes.reserve(src.size());
    for (auto it = src.begin(); it != src.end(); ++it) {
        shapes.emplace(it.key(), parseShape(it.key(), it.value()));
    }
    return shapes;
}

InteractionMode parseMode(const json& src) {
    const bool drawing = src.contains("drawingState") && src.at("drawingState").value("isDrawing", false);
    const bool dragging = src.contains("dragState") && src.at("dragState").value("isGroupDragging", false);
    const bool marquee = src.contains("selection") && src.at("selection").value("isMarqueeSelecting", false);
    if (drawing) return InteractionMode::Drawing;
    if (dragging) return InteractionMode::GroupDrag;
    if (marquee) return InteractionMode::Marquee;
    return InteractionMode::Idle;
}

} // namespace

json buildShapeJson(const Shape& shape) {
    json out{{"id", shape.id}, {"type", shapeKindName(shape.kind())}};
    switch (shape.kind()) {
        case ShapeKind::Pen: {
            const auto& pen = std::get<PenShape>(shape.data);
            out["points"] = pointsJson(pen.points.data(), pen.points.size());
            out["stroke"] = pen.stroke;
            break;
        }
        case ShapeKind::Line: {
            const auto& line = std::get<LineShape>(shape.data);
            out["points"] = pointsJson(line.points.data(), line.points.size());
            out["stroke"] = line.stroke;
            break;
        }
        case ShapeKind::Rect: {
            const auto& rect = std::get<RectShape>(shape.data);
            out["x"] = rect.x;
            out["y"] = rect.y;
            out["width"] = rect.width;
            out["height"] = rect.height;
            out["fill"] = rect.fill;
            out["stroke"] = rect.stroke;
            break;
        }
        case ShapeKind::Circle: {
            const auto& circle = std::get<CircleShape>(shape.data);
            out["x"] = circle.x;
            out["y"] = circle.y;
            out["radius"] = circle.radius;
            out["stroke"] = circle.stroke;
            out["strokeWidth"] = circle.strokeWidth;
            if (!circle.fill.empty()) out["fill"] = circle.fill;
            break;
        }
        case ShapeKind::Text: {
            const auto& text = std::get<TextShape>(shape.data);
            out["x"] = text.x;
            out["y"] = text.y;
            out["text"] = text.text;
            out["fill"] = text.fill;
            out["fontSize"] = text.fontSize;
            break;
        }
    }
    return out;
}

json buildShapesJson(const ShapeMap& shapes) {
    json out = json::object();
    for (const auto& entry : shapes) {
        out[entry.first] = buildShapeJson(entry.second);
    }
    return out;
}

json buildBoardState(const Document& doc) {
    json snapshots = json::object();
    for (const auto& entry : doc.dragState.shapeSnapshots) {
        const DragSnapshot& snap = entry.second;
        if (snap.isPath) {
            snapshots[entry.first] = json{{"points", pointsJson(snap.points.data(), snap.points.size())}};
        } else {
            snapshots[entry.first] = json{{"x", snap.x}, {"y", snap.y}};
        }
    }

    json past = json::array();
    for (const auto& shapes : doc.history.past) past.push_back(buildShapesJson(shapes));
    json future = json::array();
    for (const auto& shapes : doc.history.future) future.push_back(buildShapesJson(shapes));

    return json{
        {"shapes", buildShapesJson(doc.shapes)},
        {"activeTool", toolName(doc.activeTool)},
        {"viewport", {{"scale", doc.viewport.scale}, {"x", doc.viewport.x}, {"y", doc.viewport.y}}},
        {"selection", {
            {"selectedIds", doc.selection.selectedIds},
            {"isMarqueeSelecting", doc.isMarqueeSelecting()},
            {"marqueeStart", pointJson(doc.selection.marqueeStart)},
            {"marqueeEnd", pointJson(doc.selection.marqueeEnd)},
        }},
        {"dragState", {
            {"isGroupDragging", doc.isGroupDragging()},
            {"startPoint", pointJson(doc.dragState.startPoint)},
            {"shapeSnapshots", std::move(snapshots)},
        }},
        {"drawingState", {
            {"isDrawing", doc.isDrawing()},
            {"currentShapeId", optionalString(doc.drawingState.currentShapeId)},
        }},
        {"textEditingState", {{"editingId", optionalString(doc.textEditingState.editingId)}}},
        {"history", {{"past", std::move(past)}, {"future", std::move(future)}}},
    };
}

std::string dumpJson(const json& value) {
    return value.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string buildBoardStateText(const Document& doc) {
    return dumpJson(buildBoardState(doc));
}

BoardError parseShapes(const json& src, ShapeMap& out, std::string& message) {
    try {
        out = parseShapeMap(src);
    } catch (const json::exception& e) {
        message = e.what();
        return BoardError::Validation;
    } catch (const std::invalid_argument& e) {
        message = e.what();
        return BoardError::Validation;
    }
    return BoardError::Ok;
}

BoardError parseBoardState(const json& src, Document& out, std::string& message) {
    if (!src.is_object()) {
        message = "board state must be an object";
        return BoardError::Validation;
    }

    Document doc{};
    try {
        if (src.contains("shapes")) {
            doc.shapes = parseShapeMap(src.at("shapes"));
        }

        if (src.contains("activeTool")) {
            const std::string tool = src.at("activeTool").get<std::string>();
            if (!parseTool(tool, doc.activeTool)) {
                message = "unknown activeTool '" + tool + "'";
                return BoardError::Validation;
            }
        }

        if (src.contains("viewport")) {
            const json& vp = src.at("viewport");
            doc.viewport.scale = vp.value("scale", 1.0f);
            doc.viewport.x = vp.value("x", 0.0f);
            doc.viewport.y = vp.value("y", 0.0f);
        }

        doc.mode = parseMode(src);

        if (src.contains("selection")) {
            const json& sel = src.at("selection");
            if (sel.contains("selectedIds")) {
                doc.selection.selectedIds = sel.at("selectedIds").get<std::vector<std::string>>();
            }
            if (sel.contains("marqueeStart")) doc.selection.marqueeStart = parsePoint(sel.at("marqueeStart"));
            if (sel.contains("marqueeEnd")) doc.selection.marqueeEnd = parsePoint(sel.at("marqueeEnd"));
        }

        if (src.contains("dragState")) {
            const json& drag = src.at("dragState");
            if (drag.contains("startPoint")) doc.dragState.startPoint = parsePoint(drag.at("startPoint"));
            if (drag.contains("shapeSnapshots")) {
                const json& snaps = drag.at("shapeSnapshots");
                for (auto it = snaps.begin(); it != snaps.end(); ++it) {
                    DragSnapshot snap{};
                    if (it.value().contains("points")) {
                        snap.isPath = true;
                        snap.points = parsePoints(it.value().at("points"), it.key());
                    } else {
                        snap.x = it.value().at("x").get<float>();
                        snap.y = it.value().at("y").get<float>();
                    }
                    doc.dragState.shapeSnapshots.emplace(it.key(), std::move(snap));
                }
            }
        }

        if (src.contains("drawingState") && src.at("drawingState").contains("currentShapeId")) {
            doc.drawingState.currentShapeId = parseOptionalString(src.at("drawingState").at("currentShapeId"));
        }

        if (src.contains("textEditingState") && src.at("textEditingState").contains("editingId")) {
            doc.textEditingState.editingId = parseOptionalString(src.at("textEditingState").at("editingId"));
        }

        if (src.contains("history")) {
            const json& history = src.at("history");
            if (history.contains("past")) {
                for (const auto& shapes : history.at("past")) doc.history.past.push_back(parseShapeMap(shapes));
            }
            if (history.contains("future")) {
                for (const auto& shapes : history.at("future")) doc.history.future.push_back(parseShapeMap(shapes));
            }
        }
    } catch (const json::exception& e) {
        message = e.what();
        return BoardError::Validation;
    } catch (const std::invalid_argument& e) {
        message = e.what();
        return BoardError::Validation;
    }

    out = std::move(doc);
    return BoardError::Ok;
}

BoardError parseBoardStateText(const std::string& text, Document& out, std::string& message) {
    const json parsed = json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        message = "board state is not valid JSON";
        WHITEBOARD_LOG_WARN("%s", message.c_str());
        return BoardError::Validation;
    }
    return parseBoardState(parsed, out, message);
}

} // namespace whiteboard
