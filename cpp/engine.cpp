// engine.cpp holds the BoardEngine facade; the rules live in the managers it owns.
#include "whiteboard/engine.h"

#include "whiteboard/core/logging.h"
#include <utility>

BoardEngine::BoardEngine(BoardRepository& repository, AuthProvider& auth, BoardConfig config, DocumentStore::Clock clock)
    : config_(std::move(config)),
      historyManager_(),
      selectionManager_(),
      session_(historyManager_, selectionManager_, config_),
      renderBridge_(historyManager_, config_),
      store_(repository, config_, std::move(clock)),
      auth_(auth) {}

void BoardEngine::resetSessionState() {
    session_.reset();
    historyManager_.reset();
}

BoardError BoardEngine::mount(const std::string& boardId) {
    if (mounted_) unmount();

    user_ = auth_.currentUser();
    if (!user_) {
        WHITEBOARD_LOG_WARN("mount of %s refused: no signed-in user", boardId.c_str());
        mountError_ = BoardError::Unauthenticated;
        return mountError_;
    }
    if (boardId.empty() || boardId == "undefined" || boardId == "null") {
        mountError_ = BoardError::Validation;
        return mountError_;
    }

    mountError_ = BoardError::Ok;
    mounted_ = true;
    resetSessionState();
    store_.reset();
    store_.load(boardId);
    return BoardError::Ok;
}

void BoardEngine::unmount() {
    if (!mounted_) return;
    // A pending autosave is dropped with the store state, matching a torn-down timer.
    resetSessionState();
    store_.reset();
    mounted_ = false;
}

whiteboard::Scene BoardEngine::scene() const {
    return whiteboard::buildScene(store_.get());
}

BoardError BoardEngine::lastError() const noexcept {
    if (mountError_ != BoardError::Ok) return mountError_;
    return store_.lastError();
}

std::string BoardEngine::lastErrorMessage() const {
    if (mountError_ != BoardError::Ok) return boardErrorName(mountError_);
    return store_.lastErrorMessage();
}

BoardEngine::Redirect BoardEngine::redirect() const noexcept {
    switch (lastError()) {
        case BoardError::Unauthenticated:
            return Redirect::Login;
        case BoardError::NotFound:
            return Redirect::BoardList;
        default:
            return Redirect::None;
    }
}

bool BoardEngine::pointerDown(const PointerInput& input) {
    return store_.dispatch([&](Document& doc) { return session_.pointerDown(doc, input); });
}

bool BoardEngine::pointerMove(const PointerInput& input) {
    return store_.dispatch([&](Document& doc) { return session_.pointerMove(doc, input); });
}

bool BoardEngine::pointerUp(const PointerInput& input) {
    return store_.dispatch([&](Document& doc) { return session_.pointerUp(doc, input); });
}

bool BoardEngine::pointerCancel(const PointerInput& input) {
    return store_.dispatch([&](Document& doc) { return session_.pointerCancel(doc, input); });
}

bool BoardEngine::wheel(const WheelInput& input) {
    return store_.dispatch([&](Document& doc) { return session_.wheel(doc, input); });
}

bool BoardEngine::keyDown(const KeyInput& input) {
    return store_.dispatch([&](Document& doc) { return session_.keyDown(doc, input); });
}

bool BoardEngine::shapeClick(const std::string& id, bool shift) {
    return store_.dispatch([&](Document& doc) { return session_.shapeClick(doc, id, shift); });
}

bool BoardEngine::setTool(Tool tool) {
    return store_.dispatch([&](Document& doc) { return session_.setTool(doc, tool); });
}

bool BoardEngine::undo() {
    return store_.dispatch([&](Document& doc) { return session_.undo(doc); });
}

bool BoardEngine::redo() {
    return store_.dispatch([&](Document& doc) { return session_.redo(doc); });
}

bool BoardEngine::canUndo() const {
    return historyManager_.canUndo(store_.get());
}

bool BoardEngine::canRedo() const {
    return historyManager_.canRedo(store_.get());
}

bool BoardEngine::deleteSelection() {
    return store_.dispatch([&](Document& doc) { return session_.deleteSelection(doc); });
}

bool BoardEngine::clearBoard() {
    return store_.dispatch([&](Document& doc) { return session_.clearBoard(doc); });
}

bool BoardEngine::resetView() {
    return store_.dispatch([&](Document& doc) { return session_.resetView(doc); });
}

bool BoardEngine::beginTextEdit(const std::string& id) {
    return store_.dispatch([&](Document& doc) { return session_.beginTextEdit(doc, id); });
}

bool BoardEngine::changeText(const std::string& id, const std::string& text) {
    return store_.dispatch([&](Document& doc) { return session_.changeText(doc, id, text); });
}

bool BoardEngine::endTextEdit() {
    return store_.dispatch([&](Document& doc) { return session_.endTextEdit(doc); });
}

bool BoardEngine::dragEnd(const std::string& id, float x, float y) {
    return store_.dispatch([&](Document& doc) { return renderBridge_.onDragEnd(doc, id, x, y); });
}

bool BoardEngine::transformEnd(const std::string& id, float x, float y, float scaleX, float scaleY) {
    return store_.dispatch([&](Document& doc) { return renderBridge_.onTransformEnd(doc, id, x, y, scaleX, scaleY); });
}

bool BoardEngine::stageDragEnd(float x, float y) {
    return store_.dispatch([&](Document& doc) { return renderBridge_.onStageDragEnd(doc, x, y); });
}

bool BoardEngine::tick() {
    return store_.pumpTimers();
}

void BoardEngine::flush() {
    store_.save();
}
