#include "tests/whiteboard_test_common.h"
#include <memory>

using namespace whiteboard_test;
using nlohmann::json;

namespace {

class DocumentStoreTest : public ::testing::Test {
protected:
    Document withRect(Document doc, const std::string& id) {
        addShape(doc, rectShape(id, 0.0f, 0.0f, 10.0f, 10.0f));
        return doc;
    }

    FakeClock clock;
    FakeRepository repo;
    BoardConfig config;
    DocumentStore store{repo, config, clock.fn()};
};

} // namespace

TEST_F(DocumentStoreTest, BurstOfDebouncedSavesSendsOne) {
    store.setBoardId("b1");
    for (int i = 0; i < 5; ++i) {
        clock.now = 400.0 * i;
        store.debouncedSave();
        EXPECT_FALSE(store.pumpTimers());
    }
    clock.now = 1600.0 + 1999.0;
    EXPECT_FALSE(store.pumpTimers());
    clock.now = 3600.0;
    EXPECT_TRUE(store.pumpTimers());
    EXPECT_FALSE(store.pumpTimers());

    ASSERT_EQ(repo.saves.size(), 1u);
    EXPECT_EQ(repo.saves[0].boardId, "b1");
}

TEST_F(DocumentStoreTest, UpdateNotifiesAndSchedulesSave) {
    int notified = 0;
    store.subscribe([&](const Document& doc) {
        ++notified;
        EXPECT_EQ(doc.shapes.size(), 1u);
    });

    store.update([this](Document doc) { return withRect(std::move(doc), "a"); });
    EXPECT_EQ(notified, 1);
    EXPECT_TRUE(store.hasPendingSave());
    EXPECT_EQ(store.get().shapes.count("a"), 1u);
}

TEST_F(DocumentStoreTest, UpdateAfterUndoClearsRedo) {
    store.update([](Document doc) {
        doc.history.future.push_back(ShapeMap{});
        return doc;
    });
    ASSERT_EQ(store.get().history.future.size(), 1u);

    store.update([](Document doc) {
        doc.viewport.x = 10.0f;
        return doc;
    });
    EXPECT_EQ(store.get().history.future.size(), 1u);

    store.update([this](Document doc) { return withRect(std::move(doc), "a"); });
    EXPECT_TRUE(store.get().history.future.empty());
}

TEST_F(DocumentStoreTest, DispatchWithoutChangeIsSilent) {
    int notified = 0;
    const std::uint32_t token = store.subscribe([&](const Document&) { ++notified; });

    EXPECT_FALSE(store.dispatch([](Document&) { return false; }));
    EXPECT_EQ(notified, 0);
    EXPECT_FALSE(store.hasPendingSave());

    EXPECT_TRUE(store.dispatch([](Document& doc) {
        doc.activeTool = Tool::Pen;
        return true;
    }));
    EXPECT_EQ(notified, 1);

    store.unsubscribe(token);
    store.dispatch([](Document& doc) {
        doc.activeTool = Tool::Rect;
        return true;
    });
    EXPECT_EQ(notified, 1);
}

TEST_F(DocumentStoreTest, SaveWithoutBoardIdDoesNothing) {
    store.update([this](Document doc) { return withRect(std::move(doc), "a"); });
    clock.now = 5000.0;
    EXPECT_TRUE(store.pumpTimers());
    EXPECT_TRUE(repo.saves.empty());
    EXPECT_FALSE(store.isSaving());
}

TEST_F(DocumentStoreTest, SaveSendsWholeDocument) {
    store.setBoardId("b1");
    store.update([this](Document doc) { return withRect(std::move(doc), "a"); });
    store.save();

    ASSERT_EQ(repo.saves.size(), 1u);
    const json& board = repo.saves[0].board;
    EXPECT_TRUE(board.at("shapes").contains("a"));
    EXPECT_EQ(board.at("activeTool").get<std::string>(), "select");
    EXPECT_TRUE(board.contains("history"));
    EXPECT_FALSE(store.hasPendingSave());
    EXPECT_TRUE(store.isSaving());

    repo.completeSave(0, BoardError::Ok);
    EXPECT_FALSE(store.isSaving());
    EXPECT_EQ(store.lastError(), BoardError::Ok);
}

TEST_F(DocumentStoreTest, FailedSaveKeepsLocalState) {
    store.setBoardId("b1");
    store.update([this](Document doc) { return withRect(std::move(doc), "a"); });
    store.save();
    repo.completeSave(0, BoardError::Network, "offline");

    EXPECT_EQ(store.lastError(), BoardError::Network);
    EXPECT_EQ(store.lastErrorMessage(), "offline");
    EXPECT_EQ(store.get().shapes.count("a"), 1u);
    EXPECT_EQ(store.boardId(), "b1");
}

TEST_F(DocumentStoreTest, LoadReplacesAndNormalizesDocument) {
    int notified = 0;
    store.subscribe([&](const Document&) { ++notified; });

    store.load("b1");
    EXPECT_TRUE(store.isLoading());
    ASSERT_EQ(repo.loads.size(), 1u);
    EXPECT_EQ(repo.loads[0].boardId, "b1");

    repo.completeLoad(0, BoardError::Ok, json::parse(R"({
        "shapes": {"p": {"id": "p", "type": "pen", "points": [0, 0, 5, 5], "stroke": "#ffffff"}},
        "viewport": {"scale": 50, "x": 0, "y": 0},
        "drawingState": {"isDrawing": true, "currentShapeId": "p"},
        "selection": {"selectedIds": ["p", "gone"]}
    })"));

    EXPECT_FALSE(store.isLoading());
    EXPECT_EQ(store.boardId(), "b1");
    EXPECT_EQ(store.lastError(), BoardError::Ok);
    EXPECT_EQ(notified, 1);
    EXPECT_EQ(store.get().shapes.size(), 1u);
    EXPECT_FLOAT_EQ(store.get().viewport.scale, 5.0f);
    EXPECT_EQ(store.get().mode, InteractionMode::Idle);
    EXPECT_FALSE(store.get().drawingState.currentShapeId.has_value());
    EXPECT_EQ(store.get().selection.selectedIds, (std::vector<std::string>{"p"}));
    EXPECT_FALSE(store.hasPendingSave());
}

TEST_F(DocumentStoreTest, LoadWithoutStoredStateIsEmpty) {
    store.update([this](Document doc) { return withRect(std::move(doc), "stale"); });
    store.load("b1");
    repo.completeLoad(0, BoardError::Ok, json(nullptr));
    EXPECT_TRUE(store.get().shapes.empty());
    EXPECT_EQ(store.boardId(), "b1");

    store.load("b2");
    repo.completeLoad(1, BoardError::Ok);
    EXPECT_TRUE(store.get().shapes.empty());
    EXPECT_EQ(store.boardId(), "b2");
}

TEST_F(DocumentStoreTest, NotFoundClearsBoardId) {
    store.setBoardId("old");
    store.load("b1");
    repo.completeLoad(0, BoardError::NotFound);

    EXPECT_EQ(store.lastError(), BoardError::NotFound);
    EXPECT_EQ(store.lastErrorMessage(), "Board not found");
    EXPECT_TRUE(store.boardId().empty());

    store.save();
    EXPECT_TRUE(repo.saves.empty());
}

TEST_F(DocumentStoreTest, NetworkFailureFallsBackToEmpty) {
    store.update([this](Document doc) { return withRect(std::move(doc), "a"); });
    store.load("b1");
    repo.completeLoad(0, BoardError::Network, std::nullopt, "timeout");

    EXPECT_EQ(store.lastError(), BoardError::Network);
    EXPECT_EQ(store.lastErrorMessage(), "timeout");
    EXPECT_TRUE(store.get().shapes.empty());
    EXPECT_FALSE(store.isLoading());
}

TEST_F(DocumentStoreTest, MalformedBoardIsValidationError) {
    store.load("b1");
    repo.completeLoad(0, BoardError::Ok, json::parse(R"({"shapes": {"a": {"type": "blob"}}})"));

    EXPECT_EQ(store.lastError(), BoardError::Validation);
    EXPECT_FALSE(store.lastErrorMessage().empty());
    EXPECT_TRUE(store.get().shapes.empty());
    EXPECT_TRUE(store.boardId().empty());
}

TEST_F(DocumentStoreTest, EditAfterMalformedLoadDoesNotOverwriteBoard) {
    store.load("b1");
    repo.completeLoad(0, BoardError::Ok, json::parse(R"({"shapes": {
        "keep": {"type": "rect", "x": 0, "y": 0, "width": 10, "height": 10},
        "new": {"type": "arrow"}}})"));
    ASSERT_EQ(store.lastError(), BoardError::Validation);

    EXPECT_TRUE(store.dispatch([](Document& doc) {
        doc.activeTool = Tool::Pen;
        return true;
    }));
    clock.now = 5000.0;
    store.pumpTimers();
    EXPECT_TRUE(repo.saves.empty());
    EXPECT_FALSE(store.isSaving());
}

TEST_F(DocumentStoreTest, LaterLoadSupersedesEarlierOne) {
    store.load("b1");
    store.load("b2");
    repo.completeLoad(0, BoardError::Ok, json::parse(R"({"shapes": {"a": {"type": "circle", "x": 0, "y": 0, "radius": 1}}})"));
    EXPECT_TRUE(store.get().shapes.empty());
    EXPECT_TRUE(store.isLoading());

    repo.completeLoad(1, BoardError::Ok);
    EXPECT_EQ(store.boardId(), "b2");
    EXPECT_FALSE(store.isLoading());
}

TEST_F(DocumentStoreTest, SaveReplyStillCountsAfterNewLoad) {
    store.setBoardId("b1");
    store.save();
    store.load("b1");

    repo.completeSave(0, BoardError::Validation, "bad blob");
    EXPECT_FALSE(store.isSaving());
    EXPECT_EQ(store.lastError(), BoardError::Validation);
}

TEST_F(DocumentStoreTest, ResetDropsTimersAndLateReplies) {
    store.setBoardId("b1");
    store.update([this](Document doc) { return withRect(std::move(doc), "a"); });
    store.save();
    store.load("b2");

    store.reset();
    EXPECT_FALSE(store.hasPendingSave());
    EXPECT_TRUE(store.get().shapes.empty());
    EXPECT_TRUE(store.boardId().empty());

    repo.completeSave(0, BoardError::Network);
    repo.completeLoad(0, BoardError::Ok, json::parse(R"({"shapes": {"a": {"type": "circle", "x": 0, "y": 0, "radius": 1}}})"));
    EXPECT_EQ(store.lastError(), BoardError::Ok);
    EXPECT_TRUE(store.get().shapes.empty());
    EXPECT_TRUE(store.boardId().empty());

    clock.now = 10000.0;
    EXPECT_FALSE(store.pumpTimers());
}

TEST(DocumentStoreLifetimeTest, RepliesAfterDestructionAreDropped) {
    FakeClock clock;
    FakeRepository repo;
    BoardConfig config;
    auto store = std::make_unique<DocumentStore>(repo, config, clock.fn());
    store->setBoardId("b1");
    store->save();
    store->load("b1");
    store.reset();

    repo.completeSave(0, BoardError::Ok);
    repo.completeLoad(0, BoardError::Ok);
    SUCCEED();
}
