/**
 * @file BrushMode.hpp
 * Brush modes and the ephemeral brush state driven by pointer input.
 */
#pragma once

namespace cutout {

enum class BrushMode
{
    Erase = 0,   // mask sample -> 0
    Restore = 1, // mask sample -> 255
};

struct BrushState
{
    BrushMode mode {BrushMode::Erase};
    double radius {15.0};
    bool isActive {false};
};

inline const char* brushModeName(BrushMode m)
{
    return m == BrushMode::Erase ? "erase" : "restore";
}

}
