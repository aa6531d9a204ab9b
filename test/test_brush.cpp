#include <gtest/gtest.h>
#include <opencv2/core.hpp>
#include <limits>
#include "brush.hpp"
#include "pixel_buffer.hpp"
#include "test_support.hpp"

using namespace cutout;
using cutout_test::errorKindOf;

TEST(Brush, EraseTouchesExactlyTheDisc)
{
    MaskBuffer mask(50, 50, 255);
    const double cx = 25, cy = 25, r = 5;
    int covered = stamp(mask, cx, cy, r, BrushMode::Erase);

    int zeros = 0;
    for (int y = 0; y < mask.height(); ++y)
    {
        for (int x = 0; x < mask.width(); ++x)
        {
            double d2 = (x - cx) * (x - cx) + (y - cy) * (y - cy);
            if (d2 <= r * r) { EXPECT_EQ(mask.at(x, y), 0) << x << "," << y; ++zeros; }
            else EXPECT_EQ(mask.at(x, y), 255) << x << "," << y;
        }
    }
    EXPECT_EQ(covered, zeros);
}

TEST(Brush, StampIsIdempotent)
{
    MaskBuffer mask(40, 40, 255);
    mask.set(3, 3, 17);
    stamp(mask, 12.5, 20.25, 7.3, BrushMode::Erase);
    MaskBuffer once = mask.clone();
    stamp(mask, 12.5, 20.25, 7.3, BrushMode::Erase);
    EXPECT_EQ(mask, once);
}

TEST(Brush, RestoreSetsFullyVisible)
{
    MaskBuffer mask(20, 20, 0);
    stamp(mask, 10, 10, 3, BrushMode::Restore);
    EXPECT_EQ(mask.at(10, 10), 255);
    EXPECT_EQ(mask.at(13, 10), 255);
    EXPECT_EQ(mask.at(14, 10), 0);
}

TEST(Brush, DiscIsClippedAtTheEdges)
{
    MaskBuffer mask(10, 10, 255);
    int covered = stamp(mask, 0, 0, 2, BrushMode::Erase);
    // Quarter disc: (0,0) (1,0) (2,0) (0,1) (1,1) (0,2)
    EXPECT_EQ(covered, 6);
    EXPECT_EQ(mask.at(0, 0), 0);
    EXPECT_EQ(mask.at(2, 1), 255);

    MaskBuffer before = mask.clone();
    EXPECT_EQ(stamp(mask, -100, -100, 5, BrushMode::Erase), 0);
    EXPECT_EQ(stamp(mask, 1e12, 5, 5, BrushMode::Erase), 0);
    EXPECT_EQ(mask, before);
}

TEST(Brush, ZeroRadiusHitsOnlyTheCenterSample)
{
    MaskBuffer mask(5, 5, 255);
    EXPECT_EQ(stamp(mask, 2, 2, 0, BrushMode::Erase), 1);
    EXPECT_EQ(mask.at(2, 2), 0);
    EXPECT_EQ(mask.at(1, 2), 255);
}

TEST(Brush, RejectsBadGeometry)
{
    MaskBuffer mask(5, 5, 255);
    EXPECT_EQ(errorKindOf([&]{ stamp(mask, 2, 2, -1, BrushMode::Erase); }), ErrorKind::InvalidGeometry);
    const double nan = std::numeric_limits<double>::quiet_NaN();
    EXPECT_EQ(errorKindOf([&]{ stamp(mask, nan, 2, 3, BrushMode::Erase); }), ErrorKind::InvalidGeometry);
    EXPECT_EQ(mask, MaskBuffer(5, 5, 255));
}

TEST(Brush, ModeNamesMatchStrokeScriptKeywords)
{
    EXPECT_STREQ(brushModeName(BrushMode::Erase), "erase");
    EXPECT_STREQ(brushModeName(BrushMode::Restore), "restore");
}
