#pragma once
#include <opencv2/core.hpp>
#include <string>

namespace util {

// Display-space point -> buffer-space point. displaySize must be the surface's
// current rendered size; throws InvalidGeometry for non-positive sizes.
cv::Point2d mapDisplayToBuffer(const cv::Point2d& displayPt, const cv::Size2d& displaySize, const cv::Size& bufferSize);

// Proportional size whose long edge is at most maxDim (unchanged if already within)
cv::Size workingSize(const cv::Size& native, int maxDim);

// Downsample to workingSize() with INTER_AREA; returns a clone when no resize is needed
cv::Mat fitToWorkingSize(const cv::Mat& img, int maxDim);

// Largest size with the image's aspect ratio that fits inside avail (never below 1x1)
cv::Size fitWithin(const cv::Size& img, const cv::Size& avail);

struct CoverFit
{
    double scale {1.0};
    cv::Size scaled;  // source size after scaling, covers the canvas
    cv::Rect crop;    // canvas-sized window into the scaled image, centered
};

// scale = max(canvasW/srcW, canvasH/srcH), centered crop, no letterboxing
CoverFit coverFitPlacement(const cv::Size& src, const cv::Size& canvas);

// Scales and crops img so it exactly covers a canvas of the given size
cv::Mat coverFit(const cv::Mat& img, const cv::Size& canvas);

// Two-tone BGRA checkerboard; tile (tx,ty) uses `even` when (tx+ty) is even
cv::Mat makeCheckerboard(const cv::Size& size, int tile, const cv::Scalar& even, const cv::Scalar& odd);

// "#RRGGBB" or "RRGGBB" -> opaque BGRA scalar; false on malformed input
bool parseHexColor(const std::string& hex, cv::Scalar& bgra);

}
