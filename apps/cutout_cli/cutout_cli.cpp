// Scripted cutout editor: load a source + segmentation, replay brush strokes, export
// Build via CMake target: cutout_cli

#include <opencv2/imgcodecs.hpp>
#include <exception>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "mask_session.hpp"
#include "segmenter.hpp"
#include "util/ImageOps.hpp"

using namespace cutout;

static void usage(const char* argv0)
{
    std::cerr << "Usage: " << argv0 << " --input <image> [--segmented <rgba.png>] [--output <out.png>]\n"
              << "       [--background transparent|#RRGGBB|<image>] [--strokes <file>]\n"
              << "       [--max-dim N] [--history N] [--brush N]\n";
}

static bool parseBackground(const std::string& arg, BackgroundSpec& out)
{
    if (arg.empty() || arg == "transparent")
    {
        out = TransparentBackground{};
        return true;
    }
    if (arg[0] == '#')
    {
        cv::Scalar bgra;
        if (!util::parseHexColor(arg, bgra)) { std::cerr << "[cutout_cli] bad color: " << arg << "\n"; return false; }
        SolidColorBackground solid;
        solid.color = Rgba{(std::uint8_t)bgra[2], (std::uint8_t)bgra[1], (std::uint8_t)bgra[0], 255};
        out = solid;
        return true;
    }
    ImageBackground bg;
    std::string error;
    if (!decodeImage(arg, bg.image, error)) { std::cerr << "[cutout_cli] " << error << "\n"; return false; }
    out = std::move(bg);
    return true;
}

// One command per line, coordinates in buffer pixels:
//   mode erase|restore, size N, down x y, move x y, up, undo, redo, reset
static bool replayStrokes(MaskSession& session, const std::string& path)
{
    std::ifstream in(path);
    if (!in) { std::cerr << "[strokes] cannot open " << path << "\n"; return false; }
    std::string line;
    int lineNo = 0;
    while (std::getline(in, line))
    {
        ++lineNo;
        std::istringstream ss(line);
        std::string cmd;
        if (!(ss >> cmd) || cmd[0] == '#') continue;

        bool ok = true;
        if (cmd == "mode")
        {
            std::string m; ss >> m;
            if (m == brushModeName(BrushMode::Erase)) session.setBrushMode(BrushMode::Erase);
            else if (m == brushModeName(BrushMode::Restore)) session.setBrushMode(BrushMode::Restore);
            else ok = false;
        }
        else if (cmd == "size")
        {
            int n = 0;
            ok = static_cast<bool>(ss >> n);
            if (ok) session.setBrushSize(n);
        }
        else if (cmd == "down" || cmd == "move")
        {
            double x = 0, y = 0;
            ok = static_cast<bool>(ss >> x >> y);
            if (ok) ok = cmd == "down" ? session.beginStroke({x, y}) : session.continueStroke({x, y});
        }
        else if (cmd == "up") session.endStroke();
        else if (cmd == "undo") { if (!session.undo()) std::cerr << "[strokes] line " << lineNo << ": nothing to undo\n"; }
        else if (cmd == "redo") { if (!session.redo()) std::cerr << "[strokes] line " << lineNo << ": nothing to redo\n"; }
        else if (cmd == "reset") session.resetMask();
        else ok = false;

        if (!ok)
        {
            std::cerr << "[strokes] line " << lineNo << ": cannot apply '" << line << "'\n";
            return false;
        }
    }
    session.endStroke();
    return true;
}

int main(int argc, char** argv)
{
    std::string inputPath, segmentedPath, outputPath, background, strokesPath;
    EditorSettings settings;

    try
    {
        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];
            auto next = [&]() -> std::string {
                if (i + 1 >= argc) throw std::invalid_argument("missing value for " + arg);
                return argv[++i];
            };
            if (arg == "--input") inputPath = next();
            else if (arg == "--segmented") segmentedPath = next();
            else if (arg == "--output") outputPath = next();
            else if (arg == "--background") background = next();
            else if (arg == "--strokes") strokesPath = next();
            else if (arg == "--max-dim") settings.maxWorkingDimension = std::stoi(next());
            else if (arg == "--history") settings.historyLimit = std::stoi(next());
            else if (arg == "--brush") settings.brushSize = std::stoi(next());
            else throw std::invalid_argument("unknown option " + arg);
        }
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        usage(argv[0]);
        return 1;
    }
    if (inputPath.empty() || settings.maxWorkingDimension <= 0 || settings.historyLimit <= 0)
    {
        usage(argv[0]);
        return 1;
    }

    MaskSession session(settings);
    LoadRequest req;
    req.generation = session.beginLoad();
    req.sourcePath = inputPath;
    req.segmentedPath = segmentedPath;

    LoadedImages images;
    LoadFailure failure;
    if (!prepareLoad(req, settings, images, failure))
    {
        session.failLoad(req.generation, failure.kind, failure.message);
        std::cerr << "Error: " << failure.message << "\n";
        return 1;
    }
    if (!session.completeLoad(req.generation, images.source, images.segmented))
    {
        std::cerr << "Error: " << (session.lastError() ? session.lastError()->message : std::string("load failed")) << "\n";
        return 1;
    }

    BackgroundSpec bg;
    if (!parseBackground(background, bg)) return 1;
    try
    {
        session.setBackground(std::move(bg));
        if (!strokesPath.empty() && !replayStrokes(session, strokesPath)) return 1;
    }
    catch (const EditorError& e)
    {
        std::cerr << "[cutout_cli] " << e.what() << "\n";
        return 1;
    }

    if (outputPath.empty()) outputPath = session.suggestedExportName();
    PixelBuffer out;
    bool saved = false;
    try
    {
        out = session.exportComposite();
        saved = cv::imwrite(outputPath, out.mat());
    }
    catch (const EditorError& e)
    {
        std::cerr << "[cutout_cli] " << e.what() << "\n";
    }
    catch (const cv::Exception& e)
    {
        std::cerr << "[cutout_cli] " << e.what() << "\n";
    }
    if (!saved) { std::cerr << "Error: could not write " << outputPath << "\n"; return 1; }

    std::cout << "Saved (" << out.width() << "x" << out.height() << ", " << session.undoSteps()
              << " undo steps) to " << outputPath << "\n";
    return 0;
}
