#include "tests/whiteboard_test_common.h"

using namespace whiteboard_test;

namespace {
void commitNewRect(HistoryManager& history, Document& doc, const std::string& id) {
    ShapeMap before = doc.shapes;
    addShape(doc, rectShape(id, 0.0f, 0.0f, 10.0f, 10.0f));
    ASSERT_TRUE(history.commit(doc, std::move(before)));
}
} // namespace

TEST(HistoryTest, UndoRedoSequence) {
    HistoryManager history;
    Document doc;
    addShape(doc, rectShape("base", 0.0f, 0.0f, 5.0f, 5.0f));
    const ShapeMap initial = doc.shapes;

    constexpr int kSteps = 5;
    for (int i = 0; i < kSteps; ++i) {
        commitNewRect(history, doc, "s" + std::to_string(i));
    }
    const ShapeMap after = doc.shapes;
    EXPECT_EQ(doc.history.past.size(), static_cast<std::size_t>(kSteps));

    for (int i = 0; i < kSteps; ++i) history.undo(doc);
    EXPECT_EQ(doc.shapes, initial);
    EXPECT_FALSE(history.canUndo(doc));

    for (int i = 0; i < kSteps; ++i) history.redo(doc);
    EXPECT_EQ(doc.shapes, after);
    EXPECT_FALSE(history.canRedo(doc));
}

TEST(HistoryTest, CommitAfterUndoClearsFuture) {
    HistoryManager history;
    Document doc;
    commitNewRect(history, doc, "a");
    commitNewRect(history, doc, "b");

    history.undo(doc);
    EXPECT_TRUE(history.canRedo(doc));

    commitNewRect(history, doc, "c");
    EXPECT_FALSE(history.canRedo(doc));
    EXPECT_EQ(doc.history.past.size(), 2u);
}

TEST(HistoryTest, UnchangedCommitPushesNothing) {
    HistoryManager history;
    Document doc;
    addShape(doc, rectShape("a", 0.0f, 0.0f, 10.0f, 10.0f));
    EXPECT_FALSE(history.commit(doc, doc.shapes));
    EXPECT_TRUE(doc.history.past.empty());

    EXPECT_TRUE(history.beginEntry(doc));
    EXPECT_FALSE(history.commitEntry(doc));
    EXPECT_TRUE(doc.history.past.empty());
}

TEST(HistoryTest, TransactionFoldsIntoOneEntry) {
    HistoryManager history;
    Document doc;
    addShape(doc, rectShape("a", 0.0f, 0.0f, 10.0f, 10.0f));
    const ShapeMap before = doc.shapes;

    EXPECT_TRUE(history.beginEntry(doc));
    EXPECT_FALSE(history.beginEntry(doc));
    for (int i = 1; i <= 3; ++i) {
        std::get<RectShape>(doc.shapes.at("a").data).x = static_cast<float>(i);
    }
    EXPECT_TRUE(history.commitEntry(doc));
    EXPECT_FALSE(history.isTransactionActive());
    ASSERT_EQ(doc.history.past.size(), 1u);

    history.undo(doc);
    EXPECT_EQ(doc.shapes, before);
}

TEST(HistoryTest, UndoClearsSelectionAndDanglingReferences) {
    HistoryManager history;
    Document doc;
    commitNewRect(history, doc, "a");
    doc.selection.selectedIds = {"a"};

    history.undo(doc);
    EXPECT_TRUE(doc.shapes.empty());
    EXPECT_TRUE(doc.selection.selectedIds.empty());
    EXPECT_EQ(doc.history.future.size(), 1u);
}

TEST(HistoryTest, UndoOnEmptyPastIsNoop) {
    HistoryManager history;
    Document doc;
    addShape(doc, rectShape("a", 0.0f, 0.0f, 10.0f, 10.0f));
    const std::uint32_t generation = history.getGeneration();

    history.undo(doc);
    history.redo(doc);
    EXPECT_EQ(doc.shapes.size(), 1u);
    EXPECT_EQ(history.getGeneration(), generation);
}

TEST(HistoryTest, InvalidateRedoDropsFutureOnly) {
    HistoryManager history;
    Document doc;
    commitNewRect(history, doc, "a");
    commitNewRect(history, doc, "b");
    history.undo(doc);

    history.invalidateRedo(doc);
    EXPECT_TRUE(doc.history.future.empty());
    EXPECT_EQ(doc.history.past.size(), 1u);
}
