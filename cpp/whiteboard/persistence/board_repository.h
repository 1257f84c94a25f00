#pragma once

#include "whiteboard/core/types.h"
#include <nlohmann/json.hpp>
#include <functional>
#include <optional>
#include <string>

// Result of fetching a board. `board` is empty when the board exists but has
// no stored state yet.
struct LoadBoardResult {
    BoardError error = BoardError::Ok;
    std::optional<nlohmann::json> board;
    std::string message;
};

struct SaveBoardResult {
    BoardError error = BoardError::Ok;
    std::optional<nlohmann::json> board; // server echo, unused by the store
    std::string message;
};

// Remote persistence collaborator. Calls are asynchronous: implementations
// invoke `done` exactly once, possibly after the call returns.
class BoardRepository {
public:
    using LoadCallback = std::function<void(LoadBoardResult)>;
    using SaveCallback = std::function<void(SaveBoardResult)>;

    virtual ~BoardRepository() = default;

    virtual void loadBoard(const std::string& boardId, LoadCallback done) = 0;

    // Full replace of the stored board state.
    virtual void saveBoard(const std::string& boardId, const nlohmann::json& board, SaveCallback done) = 0;
};
