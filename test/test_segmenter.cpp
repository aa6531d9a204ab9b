#include <gtest/gtest.h>
#include <opencv2/imgcodecs.hpp>
#include <cstdio>
#include <filesystem>
#include <string>
#include "segmenter.hpp"
#include "test_support.hpp"

using namespace cutout;
namespace fs = std::filesystem;

namespace
{
    class SegmenterTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
            dir_ = fs::temp_directory_path() / (std::string("cutout_test_") + info->name());
            fs::remove_all(dir_);
            fs::create_directories(dir_);
        }
        void TearDown() override { fs::remove_all(dir_); }

        std::string write(const std::string& name, const cv::Mat& img)
        {
            std::string p = (dir_ / name).string();
            EXPECT_TRUE(cv::imwrite(p, img));
            return p;
        }

        fs::path dir_;
    };
}

TEST(Segmenter, SidecarSitsNextToTheSource)
{
    EXPECT_EQ(segmentedSidecarPath("/photos/car.jpg"), (fs::path("/photos") / "car_segmented.png").string());
}

TEST_F(SegmenterTest, DecodeReportsMissingFiles)
{
    PixelBuffer out;
    std::string error;
    EXPECT_FALSE(decodeImage((dir_ / "nope.png").string(), out, error));
    EXPECT_FALSE(error.empty());
    EXPECT_TRUE(out.empty());
}

TEST_F(SegmenterTest, DecodeKeepsAlpha)
{
    cv::Mat rgba(4, 6, CV_8UC4, cv::Scalar(10, 20, 30, 40));
    std::string p = write("a.png", rgba);
    PixelBuffer out;
    std::string error;
    ASSERT_TRUE(decodeImage(p, out, error)) << error;
    EXPECT_EQ(out.width(), 6);
    EXPECT_EQ(out.height(), 4);
    EXPECT_EQ(out.at(0, 0), (Rgba{30, 20, 10, 40}));
}

TEST_F(SegmenterTest, PrefersTheSidecarResult)
{
    std::string src = write("car.png", cv::Mat(20, 40, CV_8UC3, cv::Scalar(1, 2, 3)));
    write("car_segmented.png", cv::Mat(20, 40, CV_8UC4, cv::Scalar(1, 2, 3, 0)));

    LoadRequest req;
    req.sourcePath = src;
    LoadedImages images;
    LoadFailure failure;
    EditorSettings settings;
    settings.segmenterScript = (dir_ / "missing_script.py").string();
    ASSERT_TRUE(prepareLoad(req, settings, images, failure)) << failure.message;
    EXPECT_EQ(images.source.size(), cv::Size(40, 20));
    EXPECT_EQ(images.segmented.at(0, 0).a, 0);
}

TEST_F(SegmenterTest, ExplicitSegmentationPathWins)
{
    std::string src = write("car.png", cv::Mat(20, 40, CV_8UC3, cv::Scalar(1, 2, 3)));
    write("car_segmented.png", cv::Mat(20, 40, CV_8UC4, cv::Scalar(1, 2, 3, 0)));
    std::string other = write("other.png", cv::Mat(20, 40, CV_8UC4, cv::Scalar(1, 2, 3, 200)));

    LoadRequest req;
    req.sourcePath = src;
    req.segmentedPath = other;
    LoadedImages images;
    LoadFailure failure;
    ASSERT_TRUE(prepareLoad(req, EditorSettings(), images, failure)) << failure.message;
    EXPECT_EQ(images.segmented.at(5, 5).a, 200);
}

TEST_F(SegmenterTest, FailsWithoutAnySegmentationSource)
{
    std::string src = write("car.png", cv::Mat(20, 40, CV_8UC3, cv::Scalar(1, 2, 3)));
    LoadRequest req;
    req.sourcePath = src;
    LoadedImages images;
    LoadFailure failure;
    EditorSettings settings;
    settings.segmenterScript = (dir_ / "missing_script.py").string();
    EXPECT_FALSE(prepareLoad(req, settings, images, failure));
    EXPECT_EQ(failure.kind, ErrorKind::DecodeFailure);
    EXPECT_FALSE(failure.message.empty());
}

TEST_F(SegmenterTest, UndecodableSourceFails)
{
    std::string bogus = (dir_ / "broken.png").string();
    {
        std::FILE* f = std::fopen(bogus.c_str(), "w");
        ASSERT_NE(f, nullptr);
        std::fputs("not an image", f);
        std::fclose(f);
    }
    LoadRequest req;
    req.sourcePath = bogus;
    LoadedImages images;
    LoadFailure failure;
    EXPECT_FALSE(prepareLoad(req, EditorSettings(), images, failure));
    EXPECT_EQ(failure.kind, ErrorKind::DecodeFailure);
}
