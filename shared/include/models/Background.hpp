/**
 * @file Background.hpp
 * What the refined foreground is composited against. Exactly one kind is
 * active at a time; switching never touches the mask.
 */
#pragma once
#include <variant>
#include "pixel_buffer.hpp"

namespace cutout {

struct TransparentBackground {};

struct SolidColorBackground
{
    Rgba color {255, 255, 255, 255};
};

struct ImageBackground
{
    PixelBuffer image; // any size; the session stores it cover-fitted to the working canvas
};

using BackgroundSpec = std::variant<TransparentBackground, SolidColorBackground, ImageBackground>;

inline bool isTransparent(const BackgroundSpec& bg)
{
    return std::holds_alternative<TransparentBackground>(bg);
}

}
