#include "pixel_buffer.hpp"
#include "util/EditorError.hpp"

#include <opencv2/imgproc.hpp>
#include <string>

namespace cutout {

namespace
{
    std::string describe(int x, int y, const cv::Mat& m)
    {
        return "(" + std::to_string(x) + "," + std::to_string(y) + ") outside " +
               std::to_string(m.cols) + "x" + std::to_string(m.rows);
    }

    void requirePositive(int width, int height)
    {
        if (width <= 0 || height <= 0)
            throw EditorError(ErrorKind::InvalidGeometry,
                              "buffer size " + std::to_string(width) + "x" + std::to_string(height));
    }
}

// ---- PixelBuffer ------------------------------------------------------------

PixelBuffer::PixelBuffer(int width, int height, Rgba fill)
{
    requirePositive(width, height);
    mat_.create(height, width, CV_8UC4);
    this->fill(fill);
}

PixelBuffer PixelBuffer::fromMat(const cv::Mat& img)
{
    if (img.empty()) throw EditorError(ErrorKind::DecodeFailure, "empty image");
    if (img.depth() != CV_8U)
        throw EditorError(ErrorKind::DecodeFailure, "unsupported depth " + std::to_string(img.depth()));

    PixelBuffer out;
    switch (img.channels())
    {
        case 1: cv::cvtColor(img, out.mat_, cv::COLOR_GRAY2BGRA); break;
        case 3: cv::cvtColor(img, out.mat_, cv::COLOR_BGR2BGRA); break;
        case 4: out.mat_ = img.clone(); break;
        default:
            throw EditorError(ErrorKind::DecodeFailure, "unsupported channel count " + std::to_string(img.channels()));
    }
    return out;
}

void PixelBuffer::checkBounds(int x, int y) const
{
    if (!contains(x, y)) throw EditorError(ErrorKind::OutOfBounds, describe(x, y, mat_));
}

Rgba PixelBuffer::at(int x, int y) const
{
    checkBounds(x, y);
    const cv::Vec4b& p = mat_.at<cv::Vec4b>(y, x);
    return Rgba{p[2], p[1], p[0], p[3]};
}

void PixelBuffer::set(int x, int y, const Rgba& px)
{
    checkBounds(x, y);
    mat_.at<cv::Vec4b>(y, x) = cv::Vec4b(px.b, px.g, px.r, px.a);
}

void PixelBuffer::fill(const Rgba& px)
{
    mat_.setTo(cv::Scalar(px.b, px.g, px.r, px.a));
}

PixelBuffer PixelBuffer::clone() const
{
    return PixelBuffer(*this);
}

// ---- MaskBuffer -------------------------------------------------------------

MaskBuffer::MaskBuffer(int width, int height, std::uint8_t fill)
{
    requirePositive(width, height);
    mat_.create(height, width, CV_8UC1);
    mat_.setTo(cv::Scalar(fill));
}

MaskBuffer MaskBuffer::fromAlpha(const PixelBuffer& segmented)
{
    if (segmented.empty()) throw EditorError(ErrorKind::DecodeFailure, "empty segmentation result");
    MaskBuffer out;
    cv::extractChannel(segmented.mat(), out.mat_, 3);
    return out;
}

void MaskBuffer::checkBounds(int x, int y) const
{
    if (!contains(x, y)) throw EditorError(ErrorKind::OutOfBounds, describe(x, y, mat_));
}

std::uint8_t MaskBuffer::at(int x, int y) const
{
    checkBounds(x, y);
    return mat_.at<uchar>(y, x);
}

void MaskBuffer::set(int x, int y, std::uint8_t v)
{
    checkBounds(x, y);
    mat_.at<uchar>(y, x) = v;
}

void MaskBuffer::fill(std::uint8_t v)
{
    mat_.setTo(cv::Scalar(v));
}

MaskBuffer MaskBuffer::clone() const
{
    return MaskBuffer(*this);
}

void MaskBuffer::assign(const MaskBuffer& other)
{
    if (other.size() != size())
        throw EditorError(ErrorKind::DimensionMismatch, "mask snapshot size differs from live mask");
    other.mat_.copyTo(mat_);
}

bool MaskBuffer::operator==(const MaskBuffer& o) const
{
    if (mat_.size() != o.mat_.size()) return false;
    if (mat_.empty()) return true;
    return cv::countNonZero(mat_ != o.mat_) == 0;
}

}
