#include <gtest/gtest.h>
#include <variant>
#include "compositor.hpp"
#include "test_support.hpp"

using namespace cutout;
using namespace cutout_test;

TEST(Compositor, RedForegroundOverGreenColor)
{
    PixelBuffer source = solid(2, 2, kRed);
    MaskBuffer mask(2, 2, 255);
    mask.set(1, 0, 0);
    mask.set(0, 1, 0);

    PixelBuffer out = composite(source, mask, SolidColorBackground{kGreen});
    EXPECT_EQ(out.at(0, 0), kRed);
    EXPECT_EQ(out.at(1, 0), kGreen);
    EXPECT_EQ(out.at(0, 1), kGreen);
    EXPECT_EQ(out.at(1, 1), kRed);
}

TEST(Compositor, TransparentExportCarriesTheMaskAsAlpha)
{
    PixelBuffer source = solid(3, 1, Rgba{10, 20, 30, 255});
    MaskBuffer mask(3, 1, 255);
    mask.set(1, 0, 0);
    mask.set(2, 0, 100);

    PixelBuffer out = composite(source, mask, TransparentBackground{});
    EXPECT_EQ(out.at(0, 0), (Rgba{10, 20, 30, 255}));
    EXPECT_EQ(out.at(1, 0), (Rgba{10, 20, 30, 0}));
    EXPECT_EQ(out.at(2, 0), (Rgba{10, 20, 30, 100}));
}

TEST(Compositor, PartialAlphaBlendsOverOpaqueBackground)
{
    PixelBuffer source = solid(1, 1, kRed);
    MaskBuffer mask(1, 1, 128);
    PixelBuffer out = composite(source, mask, SolidColorBackground{kWhite});
    EXPECT_EQ(out.at(0, 0), (Rgba{255, 127, 127, 255}));
}

TEST(Compositor, TransparentPreviewShowsCheckerboardWhereMaskIsZero)
{
    CheckerStyle style;
    PixelBuffer source = solid(25, 25, kRed);
    MaskBuffer mask(25, 25, 0);
    PixelBuffer out = renderPreview(source, mask, TransparentBackground{}, style);

    for (int y = 0; y < 25; ++y)
        for (int x = 0; x < 25; ++x)
        {
            const bool even = ((x / style.tileSize) + (y / style.tileSize)) % 2 == 0;
            ASSERT_EQ(out.at(x, y), even ? style.even : style.odd) << x << "," << y;
        }
}

TEST(Compositor, TransparentPreviewShowsSourceWhereMaskIsFull)
{
    PixelBuffer source = solid(4, 4, kBlue);
    MaskBuffer mask(4, 4, 255);
    PixelBuffer out = renderPreview(source, mask, TransparentBackground{});
    EXPECT_EQ(out.at(3, 3), kBlue);
}

TEST(Compositor, ImageBackgroundIsCoverFitted)
{
    // 100x50, left half red, right half blue
    PixelBuffer bg = solid(100, 50, kRed);
    bg.mat().colRange(50, 100).setTo(cv::Scalar(255, 0, 0, 255));

    PixelBuffer source = solid(200, 200, kGreen);
    MaskBuffer mask(200, 200, 0);
    PixelBuffer out = composite(source, mask, ImageBackground{bg});
    ASSERT_EQ(out.width(), 200);
    ASSERT_EQ(out.height(), 200);
    EXPECT_EQ(out.at(10, 100), kRed);
    EXPECT_EQ(out.at(190, 100), kBlue);
}

TEST(Compositor, MaskOfAnotherSizeIsRejected)
{
    PixelBuffer source = solid(2, 2, kRed);
    MaskBuffer mask(3, 3, 255);
    EXPECT_EQ(errorKindOf([&]{ composite(source, mask, TransparentBackground{}); }), ErrorKind::DimensionMismatch);
}

TEST(Compositor, ComparisonSplitsAtTheGivenFraction)
{
    PixelBuffer before = solid(4, 2, kRed);
    PixelBuffer after = solid(4, 2, kBlue);
    PixelBuffer out = renderComparison(before, after, 0.5);
    EXPECT_EQ(out.at(0, 0), kRed);
    EXPECT_EQ(out.at(1, 1), kRed);
    EXPECT_EQ(out.at(2, 0), kBlue);
    EXPECT_EQ(out.at(3, 1), kBlue);

    EXPECT_EQ(renderComparison(before, after, 0.0).at(0, 0), kBlue);
    EXPECT_EQ(renderComparison(before, after, 2.0).at(3, 0), kRed);
}

TEST(Compositor, WorkingSizeDownsamplesLargeImages)
{
    PixelBuffer big = solid(1200, 800, kGreen);
    PixelBuffer w = toWorkingSize(big, 600);
    EXPECT_EQ(w.width(), 600);
    EXPECT_EQ(w.height(), 400);
    EXPECT_EQ(w.at(300, 200), kGreen);

    PixelBuffer small = solid(30, 20, kGreen);
    EXPECT_EQ(toWorkingSize(small, 600).size(), small.size());
}

TEST(Compositor, FitBackgroundCoverFitsImagesOnce)
{
    PixelBuffer bg = solid(100, 50, kRed);
    bg.mat().colRange(50, 100).setTo(cv::Scalar(255, 0, 0, 255));

    BackgroundSpec fitted = fitBackground(ImageBackground{bg}, cv::Size(200, 200));
    ASSERT_TRUE(std::holds_alternative<ImageBackground>(fitted));
    const PixelBuffer& img = std::get<ImageBackground>(fitted).image;
    ASSERT_EQ(img.size(), cv::Size(200, 200));
    EXPECT_EQ(img.at(10, 100), kRed);
    EXPECT_EQ(img.at(190, 100), kBlue);

    // Already canvas-sized: painting is a plain copy
    PixelBuffer painted = paintBackground(fitted, 200, 200);
    EXPECT_EQ(painted.at(10, 100), kRed);

    BackgroundSpec flat = fitBackground(SolidColorBackground{kGreen}, cv::Size(5, 5));
    EXPECT_TRUE(std::holds_alternative<SolidColorBackground>(flat));
    EXPECT_EQ(errorKindOf([]{ fitBackground(ImageBackground{}, cv::Size(5, 5)); }), ErrorKind::DecodeFailure);
}
