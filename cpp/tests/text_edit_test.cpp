#include "tests/whiteboard_test_common.h"

using namespace whiteboard_test;

namespace {
const std::string& textOf(const Document& doc, const std::string& id) {
    return std::get<TextShape>(doc.shapes.at(id).data).text;
}
} // namespace

TEST(TextEditTest, OnlyTextShapesEnterEditMode) {
    SessionHarness h;
    addShape(h.doc, rectShape("r", 0.0f, 0.0f, 10.0f, 10.0f));
    addShape(h.doc, textShape("t", 0.0f, 0.0f, "hi"));
    h.doc.selection.selectedIds = {"r", "t"};

    EXPECT_FALSE(h.session.beginTextEdit(h.doc, "r"));
    EXPECT_FALSE(h.session.beginTextEdit(h.doc, "missing"));
    EXPECT_TRUE(h.session.beginTextEdit(h.doc, "t"));
    EXPECT_EQ(h.doc.textEditingState.editingId, std::optional<std::string>("t"));
    EXPECT_TRUE(h.doc.selection.selectedIds.empty());
    EXPECT_FALSE(h.session.beginTextEdit(h.doc, "t"));
}

TEST(TextEditTest, EditSessionIsOneHistoryEntry) {
    SessionHarness h;
    addShape(h.doc, textShape("t", 0.0f, 0.0f, "hi"));

    h.session.beginTextEdit(h.doc, "t");
    EXPECT_TRUE(h.session.changeText(h.doc, "t", "hello"));
    EXPECT_TRUE(h.session.changeText(h.doc, "t", "hello world"));
    EXPECT_FALSE(h.session.changeText(h.doc, "t", "hello world"));
    EXPECT_TRUE(h.session.endTextEdit(h.doc));

    EXPECT_EQ(textOf(h.doc, "t"), "hello world");
    ASSERT_EQ(h.doc.history.past.size(), 1u);
    h.session.undo(h.doc);
    EXPECT_EQ(textOf(h.doc, "t"), "hi");
}

TEST(TextEditTest, EscapeWithoutChangesAddsNoEntry) {
    SessionHarness h;
    addShape(h.doc, textShape("t", 0.0f, 0.0f, "hi"));

    h.session.beginTextEdit(h.doc, "t");
    EXPECT_TRUE(h.session.keyDown(h.doc, key("Escape")));
    EXPECT_TRUE(h.doc.history.past.empty());
}

TEST(TextEditTest, PointerDownOnCanvasBlursEditor) {
    SessionHarness h;
    addShape(h.doc, textShape("t", 0.0f, 0.0f, "hi"));
    h.session.beginTextEdit(h.doc, "t");
    h.session.changeText(h.doc, "t", "x");

    EXPECT_TRUE(h.session.pointerDown(h.doc, mouse(500.0f, 500.0f)));
    EXPECT_FALSE(h.doc.textEditingState.editingId.has_value());
    EXPECT_EQ(h.doc.history.past.size(), 1u);
    EXPECT_EQ(h.doc.mode, InteractionMode::Marquee);
}

TEST(TextEditTest, PointerDownOnShapeStillReportsBlur) {
    SessionHarness h;
    addShape(h.doc, textShape("t", 0.0f, 0.0f, "hi"));
    h.session.beginTextEdit(h.doc, "t");

    EXPECT_TRUE(h.session.pointerDown(h.doc, mouse(1.0f, 1.0f, 1, false, "t")));
    EXPECT_FALSE(h.doc.textEditingState.editingId.has_value());
    EXPECT_EQ(h.doc.mode, InteractionMode::Idle);
}

TEST(TextEditTest, SwitchingEditorsCommitsPreviousEdit) {
    SessionHarness h;
    addShape(h.doc, textShape("t1", 0.0f, 0.0f, "one"));
    addShape(h.doc, textShape("t2", 0.0f, 50.0f, "two"));

    h.session.beginTextEdit(h.doc, "t1");
    h.session.changeText(h.doc, "t1", "uno");
    EXPECT_TRUE(h.session.beginTextEdit(h.doc, "t2"));

    EXPECT_EQ(h.doc.textEditingState.editingId, std::optional<std::string>("t2"));
    EXPECT_EQ(h.doc.history.past.size(), 1u);
}

TEST(TextEditTest, ChangingTextClearsRedo) {
    SessionHarness h;
    addShape(h.doc, textShape("t", 0.0f, 0.0f, "hi"));
    h.doc.activeTool = Tool::Rect;
    h.drag(mouse(100.0f, 100.0f), {{120.0f, 120.0f}});
    h.session.undo(h.doc);
    ASSERT_FALSE(h.doc.history.future.empty());

    h.session.beginTextEdit(h.doc, "t");
    h.session.changeText(h.doc, "t", "changed");
    EXPECT_TRUE(h.doc.history.future.empty());
}
