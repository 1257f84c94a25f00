#ifdef EMSCRIPTEN
#include <emscripten/bind.h>
#include <emscripten/emscripten.h>
#include <emscripten/val.h>
#endif

#include "whiteboard/engine.h"
#include "whiteboard/persistence/board_codec.h"
#include "whiteboard/render/scene_codec.h"

#ifdef EMSCRIPTEN
#include <cstdint>
#include <memory>
#include <unordered_map>
#include <utility>

namespace {

// Forwards repository calls to a JS object exposing
//   loadBoard(boardId, requestId) and saveBoard(boardId, boardJson, requestId).
// The JS side answers through BoardHost.completeLoad / completeSave.
class JsBoardRepository : public BoardRepository {
public:
    explicit JsBoardRepository(emscripten::val host) : host_(std::move(host)) {}

    void loadBoard(const std::string& boardId, LoadCallback done) override {
        const std::uint32_t requestId = nextRequestId_++;
        pendingLoads_.emplace(requestId, std::move(done));
        host_.call<void>("loadBoard", boardId, requestId);
    }

    void saveBoard(const std::string& boardId, const nlohmann::json& board, SaveCallback done) override {
        const std::uint32_t requestId = nextRequestId_++;
        pendingSaves_.emplace(requestId, std::move(done));
        host_.call<void>("saveBoard", boardId, whiteboard::dumpJson(board), requestId);
    }

    bool completeLoad(std::uint32_t requestId, std::uint32_t status, const std::string& message, const std::string& boardText) {
        auto it = pendingLoads_.find(requestId);
        if (it == pendingLoads_.end()) return false;
        LoadCallback done = std::move(it->second);
        pendingLoads_.erase(it);

        LoadBoardResult result;
        result.error = static_cast<BoardError>(status);
        result.message = message;
        if (result.error == BoardError::Ok && !boardText.empty()) {
            nlohmann::json parsed = nlohmann::json::parse(boardText, nullptr, false);
            if (parsed.is_discarded()) {
                result.error = BoardError::Validation;
                result.message = "board state is not valid JSON";
            } else {
                result.board = std::move(parsed);
            }
        }
        done(std::move(result));
        return true;
    }

    bool completeSave(std::uint32_t requestId, std::uint32_t status, const std::string& message) {
        auto it = pendingSaves_.find(requestId);
        if (it == pendingSaves_.end()) return false;
        SaveCallback done = std::move(it->second);
        pendingSaves_.erase(it);

        SaveBoardResult result;
        result.error = static_cast<BoardError>(status);
        result.message = message;
        done(std::move(result));
        return true;
    }

private:
    emscripten::val host_;
    std::uint32_t nextRequestId_ = 1;
    std::unordered_map<std::uint32_t, LoadCallback> pendingLoads_;
    std::unordered_map<std::uint32_t, SaveCallback> pendingSaves_;
};

// Reads host.currentUser(): null/undefined, or { id, email }.
class JsAuthProvider : public AuthProvider {
public:
    explicit JsAuthProvider(emscripten::val host) : host_(std::move(host)) {}

    std::optional<UserInfo> currentUser() override {
        emscripten::val user = host_.call<emscripten::val>("currentUser");
        if (user.isNull() || user.isUndefined()) return std::nullopt;
        UserInfo info;
        info.id = user["id"].as<std::string>();
        if (!user["email"].isUndefined() && !user["email"].isNull()) {
            info.email = user["email"].as<std::string>();
        }
        return info;
    }

private:
    emscripten::val host_;
};

// Owns the JS adapters alongside the engine so their lifetimes match.
class BoardHost {
public:
    explicit BoardHost(emscripten::val host)
        : repository_(host), auth_(host), engine_(repository_, auth_) {}

    BoardEngine& engine() { return engine_; }

    std::uint32_t mount(const std::string& boardId) { return static_cast<std::uint32_t>(engine_.mount(boardId)); }
    void unmount() { engine_.unmount(); }

    bool completeLoad(std::uint32_t requestId, std::uint32_t status, const std::string& message, const std::string& boardText) {
        return repository_.completeLoad(requestId, status, message, boardText);
    }
    bool completeSave(std::uint32_t requestId, std::uint32_t status, const std::string& message) {
        return repository_.completeSave(requestId, status, message);
    }

    std::string sceneJson() const { return whiteboard::dumpJson(whiteboard::buildSceneJson(engine_.scene())); }
    std::string documentJson() const { return whiteboard::buildBoardStateText(engine_.document()); }

    std::uint32_t lastError() const { return static_cast<std::uint32_t>(engine_.lastError()); }
    std::string lastErrorMessage() const { return engine_.lastErrorMessage(); }
    std::uint32_t redirect() const { return static_cast<std::uint32_t>(engine_.redirect()); }
    bool isLoading() const { return engine_.store().isLoading(); }
    bool isSaving() const { return engine_.store().isSaving(); }

private:

    JsBoardRepository repository_;
    JsAuthProvider auth_;
    BoardEngine engine_;
};

} // namespace

EMSCRIPTEN_BINDINGS(whiteboard_module) {
    emscripten::enum_<Tool>("Tool")
        .value("Select", Tool::Select)
        .value("Pen", Tool::Pen)
        .value("Line", Tool::Line)
        .value("Rect", Tool::Rect)
        .value("Circle", Tool::Circle)
        .value("Text", Tool::Text)
        .value("Eraser", Tool::Eraser);

    emscripten::enum_<PointerType>("PointerType")
        .value("Mouse", PointerType::Mouse)
        .value("Pen", PointerType::Pen)
        .value("Touch", PointerType::Touch);

    emscripten::value_object<PointerInput>("PointerInput")
        .field("pointerId", &PointerInput::pointerId)
        .field("type", &PointerInput::type)
        .field("button", &PointerInput::button)
        .field("screenX", &PointerInput::screenX)
        .field("screenY", &PointerInput::screenY)
        .field("shift", &PointerInput::shift)
        .field("targetId", &PointerInput::targetId);

    emscripten::value_object<WheelInput>("WheelInput")
        .field("screenX", &WheelInput::screenX)
        .field("screenY", &WheelInput::screenY)
        .field("deltaY", &WheelInput::deltaY);

    emscripten::value_object<KeyInput>("KeyInput")
        .field("key", &KeyInput::key)
        .field("ctrl", &KeyInput::ctrl)
        .field("shift", &KeyInput::shift);

    emscripten::class_<BoardHost>("BoardHost")
        .constructor<emscripten::val>()
        .function("mount", &BoardHost::mount)
        .function("unmount", &BoardHost::unmount)
        .function("completeLoad", &BoardHost::completeLoad)
        .function("completeSave", &BoardHost::completeSave)
        .function("sceneJson", &BoardHost::sceneJson)
        .function("documentJson", &BoardHost::documentJson)
        .function("lastError", &BoardHost::lastError)
        .function("lastErrorMessage", &BoardHost::lastErrorMessage)
        .function("redirect", &BoardHost::redirect)
        .function("isLoading", &BoardHost::isLoading)
        .function("isSaving", &BoardHost::isSaving)
        // Input
        .function("pointerDown", emscripten::optional_override([](BoardHost& self, const PointerInput& in) { return self.engine().pointerDown(in); }))
        .function("pointerMove", emscripten::optional_override([](BoardHost& self, const PointerInput& in) { return self.engine().pointerMove(in); }))
        .function("pointerUp", emscripten::optional_override([](BoardHost& self, const PointerInput& in) { return self.engine().pointerUp(in); }))
        .function("pointerCancel", emscripten::optional_override([](BoardHost& self, const PointerInput& in) { return self.engine().pointerCancel(in); }))
        .function("wheel", emscripten::optional_override([](BoardHost& self, const WheelInput& in) { return self.engine().wheel(in); }))
        .function("keyDown", emscripten::optional_override([](BoardHost& self, const KeyInput& in) { return self.engine().keyDown(in); }))
        // Commands
        .function("shapeClick", emscripten::optional_override([](BoardHost& self, const std::string& id, bool shift) { return self.engine().shapeClick(id, shift); }))
        .function("setTool", emscripten::optional_override([](BoardHost& self, Tool tool) { return self.engine().setTool(tool); }))
        .function("undo", emscripten::optional_override([](BoardHost& self) { return self.engine().undo(); }))
        .function("redo", emscripten::optional_override([](BoardHost& self) { return self.engine().redo(); }))
        .function("canUndo", emscripten::optional_override([](BoardHost& self) { return self.engine().canUndo(); }))
        .function("canRedo", emscripten::optional_override([](BoardHost& self) { return self.engine().canRedo(); }))
        .function("deleteSelection", emscripten::optional_override([](BoardHost& self) { return self.engine().deleteSelection(); }))
        .function("clearBoard", emscripten::optional_override([](BoardHost& self) { return self.engine().clearBoard(); }))
        .function("resetView", emscripten::optional_override([](BoardHost& self) { return self.engine().resetView(); }))
        .function("beginTextEdit", emscripten::optional_override([](BoardHost& self, const std::string& id) { return self.engine().beginTextEdit(id); }))
        .function("changeText", emscripten::optional_override([](BoardHost& self, const std::string& id, const std::string& text) { return self.engine().changeText(id, text); }))
        .function("endTextEdit", emscripten::optional_override([](BoardHost& self) { return self.engine().endTextEdit(); }))
        // Painter callbacks
        .function("dragEnd", emscripten::optional_override([](BoardHost& self, const std::string& id, float x, float y) { return self.engine().dragEnd(id, x, y); }))
        .function("transformEnd", emscripten::optional_override([](BoardHost& self, const std::string& id, float x, float y, float sx, float sy) { return self.engine().transformEnd(id, x, y, sx, sy); }))
        .function("stageDragEnd", emscripten::optional_override([](BoardHost& self, float x, float y) { return self.engine().stageDragEnd(x, y); }))
        .function("tick", emscripten::optional_override([](BoardHost& self) { return self.engine().tick(); }))
        .function("flush", emscripten::optional_override([](BoardHost& self) { self.engine().flush(); }));
}
#endif
