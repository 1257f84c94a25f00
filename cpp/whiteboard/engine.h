#pragma once

#include "whiteboard/core/config.h"
#include "whiteboard/core/types.h"
#include "whiteboard/core/util.h"
#include "whiteboard/document/document.h"
#include "whiteboard/history/history_manager.h"
#include "whiteboard/interaction/interaction_session.h"
#include "whiteboard/interaction/interaction_types.h"
#include "whiteboard/persistence/board_repository.h"
#include "whiteboard/render/render_bridge.h"
#include "whiteboard/selection/selection_manager.h"
#include "whiteboard/session/auth_provider.h"
#include "whiteboard/store/document_store.h"

#include <cstdint>
#include <optional>
#include <string>

// Editor facade. Owns the document store and the managers that mutate it,
// and routes every host event through DocumentStore::dispatch so that each
// accepted change notifies subscribers and schedules an autosave.
class BoardEngine {
public:
    // Where the host should navigate after a failed mount or load.
    enum class Redirect : std::uint8_t {
        None = 0,
        Login = 1,
        BoardList = 2,
    };

    BoardEngine(BoardRepository& repository, AuthProvider& auth, BoardConfig config = BoardConfig{},
                DocumentStore::Clock clock = DocumentStore::Clock{});

    BoardEngine(const BoardEngine&) = delete;
    BoardEngine& operator=(const BoardEngine&) = delete;

    // Checks the session once and starts loading `boardId`.
    // Returns Unauthenticated without touching the store when nobody is signed in,
    // Validation for an unusable id.
    BoardError mount(const std::string& boardId);
    void unmount();
    bool isMounted() const noexcept { return mounted_; }

    const Document& document() const noexcept { return store_.get(); }
    DocumentStore& store() noexcept { return store_; }
    const DocumentStore& store() const noexcept { return store_; }
    const BoardConfig& config() const noexcept { return config_; }
    const std::optional<UserInfo>& currentUser() const noexcept { return user_; }

    whiteboard::Scene scene() const;

    BoardError lastError() const noexcept;
    std::string lastErrorMessage() const;
    Redirect redirect() const noexcept;

    // ==============================================================================
    // Input
    // ==============================================================================
    bool pointerDown(const PointerInput& input);
    bool pointerMove(const PointerInput& input);
    bool pointerUp(const PointerInput& input);
    bool pointerCancel(const PointerInput& input);
    bool wheel(const WheelInput& input);
    bool keyDown(const KeyInput& input);

    // ==============================================================================
    // Commands
    // ==============================================================================
    bool shapeClick(const std::string& id, bool shift);
    bool setTool(Tool tool);
    bool undo();
    bool redo();
    bool canUndo() const;
    bool canRedo() const;
    bool deleteSelection();
    bool clearBoard();
    bool resetView();

    bool beginTextEdit(const std::string& id);
    bool changeText(const std::string& id, const std::string& text);
    bool endTextEdit();

    // Painter callbacks
    bool dragEnd(const std::string& id, float x, float y);
    bool transformEnd(const std::string& id, float x, float y, float scaleX, float scaleY);
    bool stageDragEnd(float x, float y);

    // Fires the autosave when due. Call from the host frame loop.
    bool tick();
    // Saves immediately, skipping the debounce.
    void flush();

private:
    void resetSessionState();

    BoardConfig config_;
    HistoryManager historyManager_;
    SelectionManager selectionManager_;
    InteractionSession session_;
    whiteboard::RenderBridge renderBridge_;
    DocumentStore store_;
    AuthProvider& auth_;

    std::optional<UserInfo> user_;
    BoardError mountError_ = BoardError::Ok;
    bool mounted_ = false;
};
