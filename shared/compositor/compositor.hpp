/*========================  compositor.hpp  ========================

   Builds what the user sees and what gets exported.
   --------------------------------------------------------------------
   • applyAlpha():      source pixels with the mask as their alpha
   • renderCheckerboard(): transparency backdrop, fixed tile size
   • fitBackground():   cover-fit an image background to the canvas up front
   • composite():       background (flat / cover-fit image) + foreground "over"
   • renderPreview():   composite(), or checkerboard + foreground when transparent
   • toWorkingSize():   proportional downsample bounding per-stroke cost

=====================================================================*/
#pragma once
#include "pixel_buffer.hpp"
#include "models/Background.hpp"

namespace cutout {

struct CheckerStyle
{
    int tileSize {10};
    Rgba even {0xE0, 0xE0, 0xE0, 0xFF};
    Rgba odd {0xFF, 0xFF, 0xFF, 0xFF};
};

// Copy of source whose alpha is the mask sample at the same (x,y). Sizes must agree.
PixelBuffer applyAlpha(const PixelBuffer& source, const MaskBuffer& mask);

PixelBuffer renderCheckerboard(int width, int height, const CheckerStyle& style = CheckerStyle());

// Straight-alpha "over": dst = fg*a + dst*(1-a) per channel. Sizes must agree.
void blendOver(const PixelBuffer& foreground, PixelBuffer& destination);

// Background alone at the given size; Transparent yields fully transparent pixels
PixelBuffer paintBackground(const BackgroundSpec& bg, int width, int height);

// Image backgrounds cover-fit once to `canvas`, so later paints are a plain copy
BackgroundSpec fitBackground(const BackgroundSpec& bg, const cv::Size& canvas);

// Export result: foreground with transparency, or foreground over the background
PixelBuffer composite(const PixelBuffer& source, const MaskBuffer& mask, const BackgroundSpec& bg);

// Display result: like composite() but transparent regions show the checkerboard
PixelBuffer renderPreview(const PixelBuffer& source, const MaskBuffer& mask, const BackgroundSpec& bg,
                          const CheckerStyle& style = CheckerStyle());

// `before` left of column split*width, `after` from there on. split is clamped to [0,1].
PixelBuffer renderComparison(const PixelBuffer& before, const PixelBuffer& after, double split);

// Downsample so the long edge is at most maxDim, aspect preserved
PixelBuffer toWorkingSize(const PixelBuffer& img, int maxDim);

}
