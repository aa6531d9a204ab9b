#include "brush.hpp"
#include "pixel_buffer.hpp"
#include "util/EditorError.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace cutout {

int stamp(MaskBuffer& mask, double centerX, double centerY, double radius, BrushMode mode)
{
    if (radius < 0.0 || !std::isfinite(radius))
        throw EditorError(ErrorKind::InvalidGeometry, "brush radius " + std::to_string(radius));
    if (!std::isfinite(centerX) || !std::isfinite(centerY))
        throw EditorError(ErrorKind::InvalidGeometry, "brush center is not finite");
    if (mask.empty()) return 0;

    const uchar value = (mode == BrushMode::Erase) ? 0 : 255;
    const double r2 = radius * radius;

    // Bounding box of the disc, clipped to the mask
    const double w = mask.width(), h = mask.height();
    int x0 = int(std::clamp(std::floor(centerX - radius), 0.0, w));
    int x1 = int(std::clamp(std::ceil(centerX + radius), -1.0, w - 1));
    int y0 = int(std::clamp(std::floor(centerY - radius), 0.0, h));
    int y1 = int(std::clamp(std::ceil(centerY + radius), -1.0, h - 1));

    int covered = 0;
    cv::Mat& m = mask.mat();
    for (int y = y0; y <= y1; ++y)
    {
        uchar* row = m.ptr<uchar>(y);
        double dy = y - centerY;
        for (int x = x0; x <= x1; ++x)
        {
            double dx = x - centerX;
            if (dx * dx + dy * dy <= r2) { row[x] = value; ++covered; }
        }
    }
    return covered;
}

}
