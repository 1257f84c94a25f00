#include "whiteboard/store/document_store.h"

#include "whiteboard/core/logging.h"
#include "whiteboard/persistence/board_codec.h"
#include "whiteboard/viewport/viewport.h"
#include <algorithm>

namespace {

Document emptyDocument() {
    return Document{};
}

} // namespace

DocumentStore::DocumentStore(BoardRepository& repository, const BoardConfig& config, Clock clock)
    : repository_(repository),
      config_(config),
      clock_(clock ? std::move(clock) : Clock(&emscripten_get_now)),
      epoch_(std::make_shared<std::uint32_t>(0)) {}

DocumentStore::~DocumentStore() = default;

void DocumentStore::update(const Transform& transform) {
    const std::size_t pastSize = doc_.history.past.size();
    const std::size_t futureSize = doc_.history.future.size();
    ShapeMap before;
    if (futureSize > 0) before = doc_.shapes;

    doc_ = transform(std::move(doc_));

    // A raw shape edit that bypassed the history manager still invalidates redo.
    if (futureSize > 0 && doc_.history.past.size() == pastSize
        && doc_.history.future.size() == futureSize && doc_.shapes != before) {
        doc_.history.future.clear();
    }
    notify();
    debouncedSave();
}

bool DocumentStore::dispatch(const Mutator& mutator) {
    if (!mutator(doc_)) return false;
    notify();
    debouncedSave();
    return true;
}

std::uint32_t DocumentStore::subscribe(Listener listener) {
    const std::uint32_t token = nextListenerToken_++;
    listeners_.emplace_back(token, std::move(listener));
    return token;
}

void DocumentStore::unsubscribe(std::uint32_t token) {
    listeners_.erase(
        std::remove_if(listeners_.begin(), listeners_.end(), [token](const auto& entry) { return entry.first == token; }),
        listeners_.end());
}

void DocumentStore::notify() {
    // Copy so a listener may unsubscribe itself.
    const auto listeners = listeners_;
    for (const auto& entry : listeners) {
        if (entry.second) entry.second(doc_);
    }
}

void DocumentStore::setError(BoardError error, std::string message) {
    lastError_ = error;
    lastErrorMessage_ = std::move(message);
}

void DocumentStore::clearError() {
    setError(BoardError::Ok, {});
}

void DocumentStore::load(const std::string& boardId) {
    loading_ = true;
    clearError();
    saveDeadline_.reset();

    std::weak_ptr<std::uint32_t> alive = epoch_;
    const std::uint32_t epoch = *epoch_;
    const std::uint32_t serial = ++loadSerial_;
    WHITEBOARD_LOG_DEBUG("load board %s", boardId.c_str());

    repository_.loadBoard(boardId, [this, alive, epoch, serial, boardId](LoadBoardResult result) {
        auto token = alive.lock();
        if (!token || *token != epoch || serial != loadSerial_) {
            WHITEBOARD_LOG_DEBUG("dropping stale load of %s", boardId.c_str());
            return;
        }
        finishLoad(boardId, std::move(result));
    });
}

void DocumentStore::finishLoad(const std::string& boardId, LoadBoardResult&& result) {
    loading_ = false;

    switch (result.error) {
        case BoardError::Ok:
            break;
        case BoardError::NotFound:
            WHITEBOARD_LOG_WARN("board %s not found", boardId.c_str());
            boardId_.clear();
            setError(BoardError::NotFound, result.message.empty() ? "Board not found" : std::move(result.message));
            doc_ = emptyDocument();
            notify();
            return;
        default:
            WHITEBOARD_LOG_WARN("load of %s failed: %s", boardId.c_str(), result.message.c_str());
            setError(result.error, std::move(result.message));
            doc_ = emptyDocument();
            notify();
            return;
    }

    boardId_ = boardId;

    Document loaded = emptyDocument();
    if (result.board && !result.board->is_null()) {
        std::string message;
        const BoardError err = whiteboard::parseBoardState(*result.board, loaded, message);
        if (err != BoardError::Ok) {
            WHITEBOARD_LOG_WARN("board %s has unreadable state: %s", boardId.c_str(), message.c_str());
            // The stored blob must not be overwritten by the empty fallback.
            boardId_.clear();
            setError(err, std::move(message));
            loaded = emptyDocument();
        }
    }
    whiteboard::normalizeDocument(loaded, whiteboard::ScaleLimits{config_.minScale, config_.maxScale});

    doc_ = std::move(loaded);
    notify();
}

void DocumentStore::save() {
    saveDeadline_.reset();
    if (boardId_.empty()) return;

    const nlohmann::json blob = whiteboard::buildBoardState(doc_);
    clearError();
    ++savesInFlight_;

    std::weak_ptr<std::uint32_t> alive = epoch_;
    const std::uint32_t epoch = *epoch_;
    const std::string boardId = boardId_;
    WHITEBOARD_LOG_DEBUG("save board %s", boardId.c_str());

    repository_.saveBoard(boardId, blob, [this, alive, epoch, boardId](SaveBoardResult result) {
        auto token = alive.lock();
        if (!token || *token != epoch) return;
        if (savesInFlight_ > 0) --savesInFlight_;
        if (result.error != BoardError::Ok) {
            // The in-memory document stays authoritative; the next edit retries.
            WHITEBOARD_LOG_WARN("save of %s failed: %s", boardId.c_str(), result.message.c_str());
            setError(result.error, std::move(result.message));
        }
    });
}

void DocumentStore::debouncedSave() {
    saveDeadline_ = clock_() + config_.saveDebounceMs;
}

bool DocumentStore::pumpTimers() {
    if (!saveDeadline_ || clock_() < *saveDeadline_) return false;
    save();
    return true;
}

void DocumentStore::reset() {
    ++*epoch_;
    saveDeadline_.reset();
    savesInFlight_ = 0;
    loading_ = false;
    boardId_.clear();
    clearError();
    doc_ = emptyDocument();
    notify();
}
