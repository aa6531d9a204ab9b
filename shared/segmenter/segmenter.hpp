#pragma once
#include <cstdint>
#include <string>
#include "pixel_buffer.hpp"
#include "models/EditorSettings.hpp"
#include "util/EditorError.hpp"

// Boundary to the external segmentation model. Nothing here performs inference:
// the segmented RGBA result is either a sidecar file next to the source or the
// output of an external script (CUTOUT_SEGMENT_SCRIPT, python3).

namespace cutout {

struct LoadRequest
{
    std::uint64_t generation {0};
    std::string sourcePath;
    std::string segmentedPath; // empty = sidecar, then external script
};

struct LoadedImages
{
    PixelBuffer source;
    PixelBuffer segmented;
};

struct LoadFailure
{
    ErrorKind kind {ErrorKind::DecodeFailure};
    std::string message;
};

// Decodes any OpenCV-readable image (alpha preserved). False + message on failure.
bool decodeImage(const std::string& path, PixelBuffer& out, std::string& error);

// "<dir>/<stem>_segmented.png"
std::string segmentedSidecarPath(const std::string& sourcePath);

// Runs the external segmentation script; writes an RGBA PNG to outPath. Returns true on success.
bool runSegmenter(const std::string& inPath, const std::string& outPath, const EditorSettings& settings);

// Resolves and decodes source + segmentation for a load. Safe to call off the UI thread.
bool prepareLoad(const LoadRequest& request, const EditorSettings& settings, LoadedImages& out, LoadFailure& failure);

}
