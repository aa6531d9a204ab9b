#include "util/ImageOps.hpp"
#include "util/EditorError.hpp"

#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>

using cutout::EditorError;
using cutout::ErrorKind;

namespace util {

cv::Point2d mapDisplayToBuffer(const cv::Point2d& displayPt, const cv::Size2d& displaySize, const cv::Size& bufferSize)
{
    if (displaySize.width <= 0.0 || displaySize.height <= 0.0)
        throw EditorError(ErrorKind::InvalidGeometry, "display surface has no rendered size");
    if (bufferSize.width <= 0 || bufferSize.height <= 0)
        throw EditorError(ErrorKind::InvalidGeometry, "empty buffer");
    double scaleX = bufferSize.width / displaySize.width;
    double scaleY = bufferSize.height / displaySize.height;
    return cv::Point2d(displayPt.x * scaleX, displayPt.y * scaleY);
}

cv::Size workingSize(const cv::Size& native, int maxDim)
{
    if (native.width <= 0 || native.height <= 0)
        throw EditorError(ErrorKind::InvalidGeometry, "empty image");
    if (maxDim <= 0 || (native.width <= maxDim && native.height <= maxDim)) return native;
    if (native.width > native.height)
    {
        int h = static_cast<int>(double(native.height) / native.width * maxDim);
        return cv::Size(maxDim, std::max(1, h));
    }
    int w = static_cast<int>(double(native.width) / native.height * maxDim);
    return cv::Size(std::max(1, w), maxDim);
}

cv::Mat fitToWorkingSize(const cv::Mat& img, int maxDim)
{
    cv::Size target = workingSize(img.size(), maxDim);
    if (target == img.size()) return img.clone();
    cv::Mat dst; cv::resize(img, dst, target, 0, 0, cv::INTER_AREA);
    return dst;
}

cv::Size fitWithin(const cv::Size& img, const cv::Size& avail)
{
    if (img.width <= 0 || img.height <= 0) return cv::Size(1, 1);
    double sx = double(std::max(1, avail.width)) / img.width;
    double sy = double(std::max(1, avail.height)) / img.height;
    double s = std::min(sx, sy);
    return cv::Size(std::max(1, int(img.width * s)), std::max(1, int(img.height * s)));
}

CoverFit coverFitPlacement(const cv::Size& src, const cv::Size& canvas)
{
    if (src.width <= 0 || src.height <= 0 || canvas.width <= 0 || canvas.height <= 0)
        throw EditorError(ErrorKind::InvalidGeometry, "cover-fit needs non-empty source and canvas");
    CoverFit fit;
    fit.scale = std::max(double(canvas.width) / src.width, double(canvas.height) / src.height);
    // Round, but never below the canvas so the crop stays inside the scaled image
    fit.scaled.width = std::max(canvas.width, int(std::lround(src.width * fit.scale)));
    fit.scaled.height = std::max(canvas.height, int(std::lround(src.height * fit.scale)));
    fit.crop = cv::Rect((fit.scaled.width - canvas.width) / 2,
                        (fit.scaled.height - canvas.height) / 2,
                        canvas.width, canvas.height);
    return fit;
}

cv::Mat coverFit(const cv::Mat& img, const cv::Size& canvas)
{
    CoverFit fit = coverFitPlacement(img.size(), canvas);
    cv::Mat scaled;
    int interp = fit.scale < 1.0 ? cv::INTER_AREA : cv::INTER_LINEAR;
    cv::resize(img, scaled, fit.scaled, 0, 0, interp);
    return scaled(fit.crop).clone();
}

cv::Mat makeCheckerboard(const cv::Size& size, int tile, const cv::Scalar& even, const cv::Scalar& odd)
{
    if (tile <= 0) throw EditorError(ErrorKind::InvalidGeometry, "checker tile must be positive");
    cv::Mat board(size, CV_8UC4, even);
    for (int y = 0; y < size.height; y += tile)
    {
        for (int x = 0; x < size.width; x += tile)
        {
            if (((x / tile) + (y / tile)) % 2 == 0) continue;
            cv::Rect r(x, y, std::min(tile, size.width - x), std::min(tile, size.height - y));
            board(r).setTo(odd);
        }
    }
    return board;
}

bool parseHexColor(const std::string& hex, cv::Scalar& bgra)
{
    std::string s = (!hex.empty() && hex[0] == '#') ? hex.substr(1) : hex;
    if (s.size() != 6) return false;
    for (char c : s) if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
    unsigned long v = std::stoul(s, nullptr, 16);
    int r = int((v >> 16) & 0xFF), g = int((v >> 8) & 0xFF), b = int(v & 0xFF);
    bgra = cv::Scalar(b, g, r, 255); // OpenCV uses BGR
    return true;
}

}
