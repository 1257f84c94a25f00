#include "tests/whiteboard_test_common.h"
#include "whiteboard/geometry/geometry.h"

using namespace whiteboard_test;

TEST(GeometryTest, EmptyPenHasZeroBoxAtOrigin) {
    const Shape pen{"p", PenShape{{}, "#ffffff"}};
    EXPECT_EQ(whiteboard::bounds(pen), (Box{0.0f, 0.0f, 0.0f, 0.0f}));
}

TEST(GeometryTest, NegativeRectIsNormalized) {
    const Box box = whiteboard::bounds(rectShape("r", 10.0f, 10.0f, -4.0f, -6.0f));
    EXPECT_EQ(box, (Box{6.0f, 4.0f, 4.0f, 6.0f}));
}

TEST(GeometryTest, CircleAndLineBounds) {
    EXPECT_EQ(whiteboard::bounds(circleShape("c", 5.0f, 5.0f, 2.0f)), (Box{3.0f, 3.0f, 4.0f, 4.0f}));

    Shape line = makeLine("l", Point2{10.0f, 0.0f}, "#ffffff");
    std::get<LineShape>(line.data).points[1] = Point2{0.0f, 5.0f};
    EXPECT_EQ(whiteboard::bounds(line), (Box{0.0f, 0.0f, 10.0f, 5.0f}));
}

TEST(GeometryTest, TextBoundsUseApproximateMetrics) {
    const Box box = whiteboard::bounds(textShape("t", 1.0f, 2.0f, "abcd", 10.0f));
    EXPECT_FLOAT_EQ(box.x, 1.0f);
    EXPECT_FLOAT_EQ(box.y, 2.0f);
    EXPECT_FLOAT_EQ(box.width, 4.0f * 10.0f * interaction_constants::TEXT_ADVANCE_FACTOR);
    EXPECT_FLOAT_EQ(box.height, 10.0f * interaction_constants::TEXT_LINE_HEIGHT_FACTOR);
}

TEST(GeometryTest, TextBoundsCountCharactersNotBytes) {
    const float ascii = whiteboard::bounds(textShape("a", 0.0f, 0.0f, "ab", 10.0f)).width;
    // "\u65e5\u672c" is two characters in six UTF-8 bytes.
    const float cjk = whiteboard::bounds(textShape("b", 0.0f, 0.0f, "\xE6\x97\xA5\xE6\x9C\xAC", 10.0f)).width;
    EXPECT_FLOAT_EQ(cjk, ascii);

    // Outside the BMP a character takes two UTF-16 units, as in the browser.
    const float emoji = whiteboard::bounds(textShape("c", 0.0f, 0.0f, "\xF0\x9F\x98\x80", 10.0f)).width;
    EXPECT_FLOAT_EQ(emoji, ascii);
}

TEST(GeometryTest, UnionBoundsSkipsUnknownIds) {
    ShapeMap shapes;
    shapes.emplace("a", rectShape("a", 0.0f, 0.0f, 10.0f, 10.0f));
    shapes.emplace("b", circleShape("b", 20.0f, 20.0f, 5.0f));

    const auto box = whiteboard::unionBounds(shapes, {"a", "missing", "b"});
    ASSERT_TRUE(box.has_value());
    EXPECT_EQ(*box, (Box{0.0f, 0.0f, 25.0f, 25.0f}));

    EXPECT_FALSE(whiteboard::unionBounds(shapes, {"missing"}).has_value());
    EXPECT_FALSE(whiteboard::unionBounds(shapes, {}).has_value());
}

TEST(GeometryTest, PointInBoxIsInclusive) {
    const Box box{0.0f, 0.0f, 10.0f, 10.0f};
    EXPECT_TRUE(whiteboard::pointInBox(Point2{10.0f, 10.0f}, box));
    EXPECT_TRUE(whiteboard::pointInBox(Point2{0.0f, 5.0f}, box));
    EXPECT_FALSE(whiteboard::pointInBox(Point2{10.5f, 5.0f}, box));
}

TEST(GeometryTest, TouchingBoxesIntersect) {
    const Box a{0.0f, 0.0f, 10.0f, 10.0f};
    EXPECT_TRUE(whiteboard::intersects(a, Box{10.0f, 0.0f, 5.0f, 5.0f}));
    EXPECT_FALSE(whiteboard::intersects(a, Box{11.0f, 0.0f, 5.0f, 5.0f}));
    EXPECT_FALSE(whiteboard::intersects(a, Box{0.0f, -6.0f, 5.0f, 5.0f}));
}

TEST(GeometryTest, NormalizedAndExpandedBoxes) {
    EXPECT_EQ(whiteboard::normalizedBox(Point2{10.0f, 20.0f}, Point2{0.0f, 5.0f}), (Box{0.0f, 5.0f, 10.0f, 15.0f}));
    EXPECT_EQ(whiteboard::expandBox(Box{0.0f, 0.0f, 10.0f, 10.0f}, 2.0f), (Box{-2.0f, -2.0f, 14.0f, 14.0f}));
    EXPECT_FLOAT_EQ(whiteboard::distance(Point2{0.0f, 0.0f}, Point2{3.0f, 4.0f}), 5.0f);
}
