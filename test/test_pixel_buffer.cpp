#include <gtest/gtest.h>
#include <opencv2/core.hpp>
#include "pixel_buffer.hpp"
#include "test_support.hpp"

using namespace cutout;
using cutout_test::errorKindOf;

TEST(PixelBuffer, FillsAndReadsBackRgba)
{
    PixelBuffer buf(4, 3, Rgba{10, 20, 30, 40});
    EXPECT_EQ(buf.width(), 4);
    EXPECT_EQ(buf.height(), 3);
    EXPECT_EQ(buf.at(3, 2), (Rgba{10, 20, 30, 40}));

    buf.set(1, 1, Rgba{1, 2, 3, 4});
    EXPECT_EQ(buf.at(1, 1), (Rgba{1, 2, 3, 4}));
    // Stored BGRA for OpenCV
    cv::Vec4b raw = buf.mat().at<cv::Vec4b>(1, 1);
    EXPECT_EQ(raw, cv::Vec4b(3, 2, 1, 4));
}

TEST(PixelBuffer, OutOfBoundsAccessThrows)
{
    PixelBuffer buf(2, 2);
    EXPECT_EQ(errorKindOf([&]{ buf.at(2, 0); }), ErrorKind::OutOfBounds);
    EXPECT_EQ(errorKindOf([&]{ buf.at(0, -1); }), ErrorKind::OutOfBounds);
    EXPECT_EQ(errorKindOf([&]{ buf.set(-1, 0, Rgba{}); }), ErrorKind::OutOfBounds);
}

TEST(PixelBuffer, NonPositiveSizeIsInvalidGeometry)
{
    EXPECT_EQ(errorKindOf([]{ PixelBuffer(0, 5); }), ErrorKind::InvalidGeometry);
    EXPECT_EQ(errorKindOf([]{ MaskBuffer(5, -1); }), ErrorKind::InvalidGeometry);
}

TEST(PixelBuffer, CopiesDoNotSharePixels)
{
    PixelBuffer a(2, 2, Rgba{0, 0, 0, 255});
    PixelBuffer b = a;
    a.set(0, 0, Rgba{9, 9, 9, 9});
    EXPECT_EQ(b.at(0, 0), (Rgba{0, 0, 0, 255}));
}

TEST(PixelBuffer, FromMatConvertsBgrAndGray)
{
    cv::Mat bgr(2, 2, CV_8UC3, cv::Scalar(10, 20, 30));
    PixelBuffer p = PixelBuffer::fromMat(bgr);
    EXPECT_EQ(p.at(0, 0), (Rgba{30, 20, 10, 255}));

    cv::Mat gray(1, 1, CV_8UC1, cv::Scalar(77));
    EXPECT_EQ(PixelBuffer::fromMat(gray).at(0, 0), (Rgba{77, 77, 77, 255}));
}

TEST(PixelBuffer, FromMatRejectsEmptyAndWideDepth)
{
    EXPECT_EQ(errorKindOf([]{ PixelBuffer::fromMat(cv::Mat()); }), ErrorKind::DecodeFailure);
    cv::Mat wide(2, 2, CV_16UC3, cv::Scalar(0));
    EXPECT_EQ(errorKindOf([&]{ PixelBuffer::fromMat(wide); }), ErrorKind::DecodeFailure);
}

TEST(MaskBuffer, SeededFromAlphaChannel)
{
    PixelBuffer seg(3, 1, Rgba{5, 5, 5, 255});
    seg.set(1, 0, Rgba{5, 5, 5, 0});
    seg.set(2, 0, Rgba{5, 5, 5, 128});
    MaskBuffer m = MaskBuffer::fromAlpha(seg);
    EXPECT_EQ(m.at(0, 0), 255);
    EXPECT_EQ(m.at(1, 0), 0);
    EXPECT_EQ(m.at(2, 0), 128);
}

TEST(MaskBuffer, AssignRequiresMatchingSize)
{
    MaskBuffer live(4, 4, 255);
    MaskBuffer other(4, 4, 0);
    live.assign(other);
    EXPECT_EQ(live, other);

    MaskBuffer wrong(3, 4, 0);
    EXPECT_EQ(errorKindOf([&]{ live.assign(wrong); }), ErrorKind::DimensionMismatch);
}

TEST(MaskBuffer, EqualityIsByteForByte)
{
    MaskBuffer a(5, 5, 255);
    MaskBuffer b(5, 5, 255);
    EXPECT_EQ(a, b);
    b.set(4, 4, 254);
    EXPECT_NE(a, b);
    EXPECT_NE(a, MaskBuffer(5, 4, 255));
}
