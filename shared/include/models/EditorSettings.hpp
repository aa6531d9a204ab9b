/**
 * @file EditorSettings.hpp
 * Tunable policy for the cutout editor, shared by the wxWidgets UI and the CLI.
 */
#pragma once
#include <array>
#include <string>
#include "models/BrushMode.hpp"

namespace cutout {

struct EditorSettings
{
    // Working resolution: sources whose long edge exceeds this are downsampled
    int maxWorkingDimension {600};

    // Undo steps kept above the pre-edit floor entry
    int historyLimit {50};

    // Transparency preview
    int checkerTileSize {10};

    // Brush (size is a diameter in buffer pixels)
    int brushSize {30};
    int minBrushSize {5};
    int maxBrushSize {100};
    BrushMode brushMode {BrushMode::Erase};

    // External segmentation collaborator; empty = CUTOUT_SEGMENT_SCRIPT or default path
    std::string segmenterScript;

    double brushRadius() const { return brushSize / 2.0; }
};

// Quick-pick colors offered for SolidColor backgrounds
inline const std::array<const char*, 15> kPresetBackgroundColors = {
    "#FFFFFF", "#000000", "#FF0000", "#00FF00", "#0000FF",
    "#FFFF00", "#FF00FF", "#00FFFF", "#808080", "#FFA500",
    "#800080", "#008080", "#FFC0CB", "#A52A2A", "#F5F5DC"
};

}
