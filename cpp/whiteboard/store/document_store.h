#pragma once

#include "whiteboard/core/config.h"
#include "whiteboard/core/types.h"
#include "whiteboard/core/util.h"
#include "whiteboard/document/document.h"
#include "whiteboard/persistence/board_repository.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// Single owner of the Document. All mutation goes through update()/dispatch();
// every accepted change notifies subscribers and restarts the save debounce.
//
// Single-threaded: the host calls pumpTimers() from its frame loop and the
// repository completes requests on the same thread.
class DocumentStore {
public:
    using Transform = std::function<Document(Document)>;
    using Mutator = std::function<bool(Document&)>;
    using Listener = std::function<void(const Document&)>;
    using Clock = std::function<double()>; // milliseconds, monotonic

    DocumentStore(BoardRepository& repository, const BoardConfig& config, Clock clock = Clock{});
    ~DocumentStore();

    DocumentStore(const DocumentStore&) = delete;
    DocumentStore& operator=(const DocumentStore&) = delete;

    const Document& get() const noexcept { return doc_; }

    // doc = transform(doc), then notify and schedule a save. A transform that
    // edits shapes without touching history clears the redo stack.
    void update(const Transform& transform);

    // In-place variant; notifies and schedules a save only when `mutator` returns true.
    bool dispatch(const Mutator& mutator);

    std::uint32_t subscribe(Listener listener);
    void unsubscribe(std::uint32_t token);

    // Replaces the document with the stored board (or an empty one).
    void load(const std::string& boardId);

    // Sends the whole document now. No-op without a board id.
    void save();

    // Restarts the debounce deadline; the save fires from pumpTimers().
    void debouncedSave();

    // Fires the pending save when its deadline has passed. Returns true if it fired.
    bool pumpTimers();

    bool hasPendingSave() const noexcept { return saveDeadline_.has_value(); }

    // Cancels timers, forgets the board and empties the document.
    void reset();

    const std::string& boardId() const noexcept { return boardId_; }
    void setBoardId(std::string boardId) { boardId_ = std::move(boardId); }

    BoardError lastError() const noexcept { return lastError_; }
    const std::string& lastErrorMessage() const noexcept { return lastErrorMessage_; }
    void clearError();

    bool isLoading() const noexcept { return loading_; }
    bool isSaving() const noexcept { return savesInFlight_ > 0; }

private:
    void notify();
    void setError(BoardError error, std::string message);
    void finishLoad(const std::string& boardId, LoadBoardResult&& result);

    BoardRepository& repository_;
    const BoardConfig& config_;
    Clock clock_;

    Document doc_;
    std::string boardId_;

    std::optional<double> saveDeadline_;
    std::uint32_t savesInFlight_ = 0;
    bool loading_ = false;

    BoardError lastError_ = BoardError::Ok;
    std::string lastErrorMessage_;

    std::vector<std::pair<std::uint32_t, Listener>> listeners_;
    std::uint32_t nextListenerToken_ = 1;

    // Requests completing after reset() or destruction are dropped.
    std::shared_ptr<std::uint32_t> epoch_;
    // Only the newest load may replace the document.
    std::uint32_t loadSerial_ = 0;
};
