#include "compositor.hpp"
#include "util/EditorError.hpp"
#include "util/ImageOps.hpp"

#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <string>

namespace cutout {

namespace
{
    // Lets std::visit take a set of lambdas
    template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
    template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

    cv::Scalar toScalar(const Rgba& c) { return cv::Scalar(c.b, c.g, c.r, c.a); }

    void requireSameSize(const cv::Size& a, const cv::Size& b, const char* what)
    {
        if (a != b)
            throw EditorError(ErrorKind::DimensionMismatch,
                              std::string(what) + ": " + std::to_string(a.width) + "x" + std::to_string(a.height) +
                              " vs " + std::to_string(b.width) + "x" + std::to_string(b.height));
    }
}

PixelBuffer applyAlpha(const PixelBuffer& source, const MaskBuffer& mask)
{
    requireSameSize(source.size(), mask.size(), "mask vs source");
    PixelBuffer out = source.clone();
    cv::insertChannel(mask.mat(), out.mat(), 3);
    return out;
}

PixelBuffer renderCheckerboard(int width, int height, const CheckerStyle& style)
{
    PixelBuffer out(width, height);
    out.mat() = util::makeCheckerboard(cv::Size(width, height), style.tileSize,
                                       toScalar(style.even), toScalar(style.odd));
    return out;
}

void blendOver(const PixelBuffer& foreground, PixelBuffer& destination)
{
    requireSameSize(foreground.size(), destination.size(), "foreground vs destination");
    const cv::Mat& fg = foreground.mat();
    cv::Mat& dst = destination.mat();
    for (int y = 0; y < dst.rows; ++y)
    {
        const cv::Vec4b* f = fg.ptr<cv::Vec4b>(y);
        cv::Vec4b* d = dst.ptr<cv::Vec4b>(y);
        for (int x = 0; x < dst.cols; ++x)
        {
            const int fa = f[x][3];
            if (fa == 255) { d[x] = f[x]; continue; }
            if (fa == 0) continue;
            const int da = d[x][3];
            if (da == 255)
            {
                // Opaque backdrop: integer blend, exact at a = 0 and a = 255
                for (int c = 0; c < 3; ++c)
                    d[x][c] = uchar((f[x][c] * fa + d[x][c] * (255 - fa) + 127) / 255);
                continue;
            }
            const double a = fa / 255.0, b = da / 255.0;
            const double outA = a + b * (1.0 - a);
            for (int c = 0; c < 3; ++c)
            {
                double v = (f[x][c] * a + d[x][c] * b * (1.0 - a)) / outA;
                d[x][c] = cv::saturate_cast<uchar>(std::lround(v));
            }
            d[x][3] = cv::saturate_cast<uchar>(std::lround(outA * 255.0));
        }
    }
}

PixelBuffer paintBackground(const BackgroundSpec& bg, int width, int height)
{
    return std::visit(overloaded{
        [&](const TransparentBackground&) {
            return PixelBuffer(width, height, Rgba{0, 0, 0, 0});
        },
        [&](const SolidColorBackground& s) {
            return PixelBuffer(width, height, s.color);
        },
        [&](const ImageBackground& i) {
            if (i.image.empty())
                throw EditorError(ErrorKind::DecodeFailure, "image background has no pixels");
            if (i.image.size() == cv::Size(width, height)) return i.image.clone();
            PixelBuffer out;
            out.mat() = util::coverFit(i.image.mat(), cv::Size(width, height));
            return out;
        },
    }, bg);
}

BackgroundSpec fitBackground(const BackgroundSpec& bg, const cv::Size& canvas)
{
    const auto* image = std::get_if<ImageBackground>(&bg);
    if (!image) return bg;
    if (image->image.empty())
        throw EditorError(ErrorKind::DecodeFailure, "image background has no pixels");
    ImageBackground fitted;
    fitted.image.mat() = util::coverFit(image->image.mat(), canvas);
    return fitted;
}

PixelBuffer composite(const PixelBuffer& source, const MaskBuffer& mask, const BackgroundSpec& bg)
{
    PixelBuffer foreground = applyAlpha(source, mask);
    if (isTransparent(bg)) return foreground;
    PixelBuffer out = paintBackground(bg, source.width(), source.height());
    blendOver(foreground, out);
    return out;
}

PixelBuffer renderPreview(const PixelBuffer& source, const MaskBuffer& mask, const BackgroundSpec& bg,
                          const CheckerStyle& style)
{
    if (!isTransparent(bg)) return composite(source, mask, bg);
    PixelBuffer out = renderCheckerboard(source.width(), source.height(), style);
    blendOver(applyAlpha(source, mask), out);
    return out;
}

PixelBuffer renderComparison(const PixelBuffer& before, const PixelBuffer& after, double split)
{
    requireSameSize(before.size(), after.size(), "comparison halves");
    PixelBuffer out = after.clone();
    int splitX = int(std::lround(std::clamp(split, 0.0, 1.0) * before.width()));
    if (splitX > 0)
    {
        cv::Rect left(0, 0, splitX, before.height());
        before.mat()(left).copyTo(out.mat()(left));
    }
    return out;
}

PixelBuffer toWorkingSize(const PixelBuffer& img, int maxDim)
{
    if (img.empty()) throw EditorError(ErrorKind::DecodeFailure, "empty image");
    PixelBuffer out;
    out.mat() = util::fitToWorkingSize(img.mat(), maxDim);
    return out;
}

}
