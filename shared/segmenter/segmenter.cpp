#include "segmenter.hpp"
#include <opencv2/imgcodecs.hpp>
#include <filesystem>
#include <cstdlib>
#include <iostream>

namespace cutout {

namespace
{
    bool fileExists(const std::string& p) { return std::filesystem::exists(p); }

    std::string scriptPathFor(const EditorSettings& settings)
    {
        if (!settings.segmenterScript.empty()) return settings.segmenterScript;
        const char* scriptEnv = std::getenv("CUTOUT_SEGMENT_SCRIPT");
        return scriptEnv ? std::string(scriptEnv) : std::string("scripts/segment_foreground.py");
    }

    std::string scriptOutputPath(const std::string& sourcePath)
    {
        std::filesystem::path in(sourcePath);
        return (std::filesystem::temp_directory_path() /
                ("cutout_" + in.stem().string() + "_segmented.png")).string();
    }
}

bool decodeImage(const std::string& path, PixelBuffer& out, std::string& error)
{
    cv::Mat img = cv::imread(path, cv::IMREAD_UNCHANGED);
    if (img.empty()) { error = "cannot decode: " + path; return false; }
    if (img.depth() != CV_8U)
    {
        // 16-bit PNG/TIFF: scale down to 8 bits per channel
        cv::Mat eight; img.convertTo(eight, CV_8U, 1.0 / 257.0);
        img = eight;
    }
    try
    {
        out = PixelBuffer::fromMat(img);
    }
    catch (const EditorError& e)
    {
        error = path + ": " + e.what();
        return false;
    }
    return true;
}

std::string segmentedSidecarPath(const std::string& sourcePath)
{
    std::filesystem::path in(sourcePath);
    return (in.parent_path() / (in.stem().string() + "_segmented.png")).string();
}

bool runSegmenter(const std::string& inPath, const std::string& outPath, const EditorSettings& settings)
{
    const std::string scriptPath = scriptPathFor(settings);
    if (!fileExists(scriptPath))
    {
        std::cerr << "[runSegmenter] segmentation script not found at '" << scriptPath << "'.\n";
        return false;
    }
    std::filesystem::path outDir = std::filesystem::path(outPath).parent_path();
    if (!outDir.empty()) std::filesystem::create_directories(outDir);
    std::string cmd = "python3 \"" + scriptPath + "\" --input \"" + inPath + "\" --output \"" + outPath + "\"";
    int rc = std::system(cmd.c_str());
    if (rc == 0 && fileExists(outPath)) return true;
    std::cerr << "[runSegmenter] script failed (rc=" << rc << ") or output missing: " << outPath << "\n";
    return false;
}

bool prepareLoad(const LoadRequest& request, const EditorSettings& settings, LoadedImages& out, LoadFailure& failure)
{
    std::string error;
    if (!decodeImage(request.sourcePath, out.source, error))
    {
        failure = {ErrorKind::DecodeFailure, error};
        return false;
    }

    std::string segPath = request.segmentedPath;
    if (segPath.empty())
    {
        const std::string sidecar = segmentedSidecarPath(request.sourcePath);
        if (fileExists(sidecar))
        {
            segPath = sidecar;
        }
        else
        {
            segPath = scriptOutputPath(request.sourcePath);
            if (!runSegmenter(request.sourcePath, segPath, settings))
            {
                failure = {ErrorKind::DecodeFailure, "no segmentation result for " + request.sourcePath};
                return false;
            }
        }
    }

    if (!decodeImage(segPath, out.segmented, error))
    {
        failure = {ErrorKind::DecodeFailure, error};
        return false;
    }
    return true;
}

}
