#include <gtest/gtest.h>
#include "mask_history.hpp"
#include "brush.hpp"
#include "test_support.hpp"

using namespace cutout;

namespace
{
    // One stroke: snapshot, then a single stamp
    void strokeAt(MaskHistory& h, MaskBuffer& live, double x, double y)
    {
        h.beginStroke(live);
        stamp(live, x, y, 2, BrushMode::Erase);
    }
}

TEST(MaskHistory, UndoingEveryStrokeRestoresTheOriginal)
{
    MaskBuffer live(30, 30, 255);
    const MaskBuffer original = live.clone();
    MaskHistory h(50);
    h.reset(live);

    const int n = 7;
    for (int i = 0; i < n; ++i) strokeAt(h, live, 3 + 3 * i, 4 + 2 * i);
    EXPECT_NE(live, original);
    EXPECT_EQ(h.undoSteps(), std::size_t(n));

    for (int i = 0; i < n; ++i) EXPECT_TRUE(h.undo(live));
    EXPECT_EQ(live, original);
    EXPECT_FALSE(h.canUndo());
}

TEST(MaskHistory, UndoAtTheFloorIsANoOp)
{
    MaskBuffer live(5, 5, 255);
    MaskHistory h;
    h.reset(live);
    live.set(0, 0, 1);
    const MaskBuffer before = live.clone();
    EXPECT_FALSE(h.undo(live));
    EXPECT_EQ(live, before);
    EXPECT_FALSE(h.redo(live));
}

TEST(MaskHistory, KeepsOnlyTheNewestFiftySteps)
{
    // One pixel per stroke so every state is distinguishable
    MaskBuffer live(60, 1, 255);
    const MaskBuffer original = live.clone();
    MaskHistory h(50);
    h.reset(live);

    for (int i = 0; i < 51; ++i)
    {
        h.beginStroke(live);
        live.set(i, 0, 0);
    }
    EXPECT_EQ(h.undoSteps(), std::size_t(50));

    int undone = 0;
    while (h.undo(live)) ++undone;
    EXPECT_EQ(undone, 50);

    // The state before the first stroke is gone; oldest reachable is after stroke 1
    EXPECT_NE(live, original);
    EXPECT_EQ(live.at(0, 0), 0);
    EXPECT_EQ(live.at(1, 0), 255);
}

TEST(MaskHistory, NewStrokeInvalidatesRedo)
{
    MaskBuffer live(20, 20, 255);
    MaskHistory h;
    h.reset(live);
    strokeAt(h, live, 5, 5);
    ASSERT_TRUE(h.undo(live));
    EXPECT_TRUE(h.canRedo());

    strokeAt(h, live, 15, 15);
    EXPECT_FALSE(h.canRedo());
    const MaskBuffer after = live.clone();
    EXPECT_FALSE(h.redo(live));
    EXPECT_EQ(live, after);
}

TEST(MaskHistory, RedoReappliesTheUndoneStroke)
{
    MaskBuffer live(20, 20, 255);
    MaskHistory h;
    h.reset(live);
    strokeAt(h, live, 10, 10);
    const MaskBuffer edited = live.clone();

    ASSERT_TRUE(h.undo(live));
    EXPECT_EQ(live, MaskBuffer(20, 20, 255));
    ASSERT_TRUE(h.redo(live));
    EXPECT_EQ(live, edited);
    EXPECT_EQ(h.undoSteps(), std::size_t(1));
    EXPECT_EQ(h.redoStackSize(), std::size_t(0));
}

TEST(MaskHistory, SnapshotOfAnotherSizeIsRejectedWithoutChanges)
{
    MaskBuffer live(10, 10, 255);
    MaskHistory h;
    h.reset(live);
    strokeAt(h, live, 5, 5);

    MaskBuffer other(4, 4, 255);
    EXPECT_EQ(cutout_test::errorKindOf([&]{ h.undo(other); }), ErrorKind::DimensionMismatch);
    EXPECT_EQ(h.undoSteps(), std::size_t(1));
    EXPECT_TRUE(h.undo(live));
}

TEST(MaskHistory, PeekShowsTheNextRestoreWithoutMovingStacks)
{
    MaskBuffer live(10, 10, 255);
    MaskHistory h;
    h.reset(live);
    EXPECT_EQ(h.peekUndo(), nullptr);
    EXPECT_EQ(h.peekRedo(), nullptr);

    strokeAt(h, live, 5, 5);
    ASSERT_NE(h.peekUndo(), nullptr);
    EXPECT_EQ(*h.peekUndo(), MaskBuffer(10, 10, 255));
    EXPECT_EQ(h.undoSteps(), std::size_t(1));

    const MaskBuffer edited = live.clone();
    ASSERT_TRUE(h.undo(live));
    ASSERT_NE(h.peekRedo(), nullptr);
    EXPECT_EQ(*h.peekRedo(), edited);
    EXPECT_EQ(h.redoStackSize(), std::size_t(1));
}
