#include "tests/whiteboard_test_common.h"
#include "whiteboard/viewport/viewport.h"
#include <cmath>
#include <limits>

namespace {
void expectNear(const Point2& a, const Point2& b, float eps = 1e-3f) {
    EXPECT_NEAR(a.x, b.x, eps);
    EXPECT_NEAR(a.y, b.y, eps);
}
} // namespace

TEST(ViewportTest, ClampScale) {
    EXPECT_FLOAT_EQ(whiteboard::clampScale(0.01f), 0.1f);
    EXPECT_FLOAT_EQ(whiteboard::clampScale(10.0f), 5.0f);
    EXPECT_FLOAT_EQ(whiteboard::clampScale(2.0f), 2.0f);
    EXPECT_FLOAT_EQ(whiteboard::clampScale(std::numeric_limits<float>::quiet_NaN()), 0.1f);
    EXPECT_FLOAT_EQ(whiteboard::clampScale(3.0f, whiteboard::ScaleLimits{0.5f, 2.0f}), 2.0f);
}

TEST(ViewportTest, ScreenWorldRoundTrip) {
    const Viewport vp{2.5f, 30.0f, -12.0f};
    const Point2 samples[] = {{0.0f, 0.0f}, {123.0f, 456.0f}, {-40.0f, 17.5f}};
    for (const Point2& p : samples) {
        expectNear(whiteboard::toScreen(vp, whiteboard::toWorld(vp, p)), p);
    }
    expectNear(whiteboard::toScreen(vp, Point2{10.0f, 10.0f}), Point2{55.0f, 13.0f});
}

TEST(ViewportTest, ZoomAtKeepsWorldPointUnderAnchor) {
    const Viewport vp{1.0f, 10.0f, 20.0f};
    const Point2 anchor{200.0f, 150.0f};
    const Point2 before = whiteboard::toWorld(vp, anchor);

    const Viewport zoomed = whiteboard::zoomAt(vp, anchor, 2.0f);
    EXPECT_FLOAT_EQ(zoomed.scale, 2.0f);
    expectNear(whiteboard::toWorld(zoomed, anchor), before);
}

TEST(ViewportTest, ZoomAtClampsBeforeSolvingPosition) {
    const Viewport vp{1.0f, 0.0f, 0.0f};
    const Point2 anchor{80.0f, 60.0f};
    const Viewport zoomed = whiteboard::zoomAt(vp, anchor, 100.0f);
    EXPECT_FLOAT_EQ(zoomed.scale, 5.0f);
    expectNear(whiteboard::toWorld(zoomed, anchor), whiteboard::toWorld(vp, anchor));
}

TEST(ViewportTest, WheelZoomDirection) {
    const Viewport vp{};
    const Point2 anchor{100.0f, 100.0f};

    const Viewport in = whiteboard::wheelZoom(vp, anchor, -120.0f);
    EXPECT_FLOAT_EQ(in.scale, 1.05f);
    expectNear(whiteboard::toWorld(in, anchor), anchor);

    const Viewport out = whiteboard::wheelZoom(vp, anchor, 120.0f);
    EXPECT_FLOAT_EQ(out.scale, 1.0f / 1.05f);
    expectNear(whiteboard::toWorld(out, anchor), anchor);
}

TEST(ViewportTest, PanByKeepsScale) {
    const Viewport moved = whiteboard::panBy(Viewport{2.0f, 1.0f, 1.0f}, 10.0f, -5.0f);
    EXPECT_EQ(moved, (Viewport{2.0f, 11.0f, -4.0f}));
}
