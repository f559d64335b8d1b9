#include <gtest/gtest.h>

#include "DragController.hpp"

namespace
{
    DragController::Limits screen(int w, int h)
    {
        DragController::Limits limits = {};
        limits.screenSize             = glm::ivec2(w, h);
        limits.minSize                = glm::ivec2(50, 50);
        return limits;
    }

    OverlayGeometry rect(int x, int y, int w, int h)
    {
        return OverlayGeometry{glm::ivec2(x, y), glm::ivec2(w, h)};
    }
} // namespace

TEST(DragController, IdleControllerIsInactive)
{
    DragController drag;
    EXPECT_FALSE(drag.active());
    EXPECT_FALSE(drag.end());
}

TEST(DragController, RectMoveFollowsCursor)
{
    DragController drag;
    drag.beginMove(OverlayKind::Rect, glm::ivec2(100, 100), rect(10, 20, 200, 100));

    EXPECT_TRUE(drag.active());
    EXPECT_EQ(drag.mode(), DragController::Mode::Move);
    EXPECT_EQ(drag.update(glm::ivec2(130, 90), screen(1920, 1080)), rect(40, 10, 200, 100));

    EXPECT_TRUE(drag.end());
    EXPECT_FALSE(drag.active());
}

TEST(DragController, RectMoveClampsToScreen)
{
    DragController drag;
    drag.beginMove(OverlayKind::Rect, glm::ivec2(0, 0), rect(10, 10, 200, 100));

    EXPECT_EQ(drag.update(glm::ivec2(-500, -500), screen(800, 600)), rect(0, 0, 200, 100));
    EXPECT_EQ(drag.update(glm::ivec2(5000, 5000), screen(800, 600)), rect(600, 500, 200, 100));
}

TEST(DragController, RectLargerThanScreenPinsToOrigin)
{
    DragController drag;
    drag.beginMove(OverlayKind::Rect, glm::ivec2(0, 0), rect(0, 0, 1000, 700));

    EXPECT_EQ(drag.update(glm::ivec2(50, 50), screen(800, 600)), rect(0, 0, 1000, 700));
}

TEST(DragController, ResizeRespectsMinimumAndScreen)
{
    DragController drag;
    drag.beginResize(glm::ivec2(300, 200), rect(100, 100, 200, 100));
    EXPECT_EQ(drag.mode(), DragController::Mode::Resize);

    EXPECT_EQ(drag.update(glm::ivec2(320, 230), screen(800, 600)), rect(100, 100, 220, 130));
    EXPECT_EQ(drag.update(glm::ivec2(0, 0), screen(800, 600)), rect(100, 100, 50, 50));
    EXPECT_EQ(drag.update(glm::ivec2(5000, 5000), screen(800, 600)), rect(100, 100, 700, 500));
}

TEST(DragController, PointMoveKeepsWindowAndPointOnScreen)
{
    DragController::Limits limits = screen(800, 600);
    limits.windowSize             = 100;
    limits.pointRadius            = 8;

    DragController drag;
    drag.beginMove(OverlayKind::Point, glm::ivec2(0, 0), OverlayGeometry{glm::ivec2(400, 300), glm::ivec2(0)});

    EXPECT_EQ(drag.update(glm::ivec2(10, -20), limits).pos, glm::ivec2(410, 280));

    // The 100px window stops at the screen edge, so the point stops 50px in.
    EXPECT_EQ(drag.update(glm::ivec2(-1000, -1000), limits).pos, glm::ivec2(50, 50));
    EXPECT_EQ(drag.update(glm::ivec2(1000, 1000), limits).pos, glm::ivec2(750, 550));
    EXPECT_EQ(drag.update(glm::ivec2(10, 10), limits).size, glm::ivec2(0));
}

TEST(DragController, ResizeHandleHitTest)
{
    const glm::ivec2 size(200, 100);

    EXPECT_TRUE(DragController::inResizeHandle(glm::ivec2(195, 95), size, 10));
    EXPECT_TRUE(DragController::inResizeHandle(glm::ivec2(190, 90), size, 10));
    EXPECT_FALSE(DragController::inResizeHandle(glm::ivec2(189, 95), size, 10));
    EXPECT_FALSE(DragController::inResizeHandle(glm::ivec2(10, 10), size, 10));
}
