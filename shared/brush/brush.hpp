#pragma once
#include "models/BrushMode.hpp"

namespace cutout {

class MaskBuffer;

/**
 * @brief Solid disc fill on the mask: every sample with
 *        dx*dx + dy*dy <= radius*radius becomes 0 (Erase) or 255 (Restore).
 *        The disc is clipped to the mask; a negative radius throws InvalidGeometry.
 * @return number of mask samples covered by the disc
 */
int stamp(MaskBuffer& mask, double centerX, double centerY, double radius, BrushMode mode);

}
