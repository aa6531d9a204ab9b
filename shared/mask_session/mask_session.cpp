#include "mask_session.hpp"
#include "brush.hpp"
#include "util/ImageOps.hpp"

#include <opencv2/core.hpp>
#include <algorithm>
#include <cmath>
#include <exception>
#include <iostream>
#include <utility>
#include <variant>

namespace cutout {

const char* sessionStateName(SessionState s)
{
    switch (s)
    {
        case SessionState::Idle: return "Idle";
        case SessionState::StrokeActive: return "StrokeActive";
        case SessionState::Undoing: return "Undoing";
        case SessionState::Redoing: return "Redoing";
    }
    return "Unknown";
}

MaskSession::MaskSession(EditorSettings settings)
    : settings_(std::move(settings)),
      history_(static_cast<std::size_t>(std::max(1, settings_.historyLimit))),
      brushSize_(settings_.brushSize)
{
    checker_.tileSize = std::max(1, settings_.checkerTileSize);
    brush_.mode = settings_.brushMode;
    setBrushSize(settings_.brushSize);
}

// ---- loading ------------------------------------------------------------------

std::uint64_t MaskSession::beginLoad()
{
    endStroke();
    ++generation_;
    loading_ = true;
    lastError_.reset();
    return generation_;
}

bool MaskSession::completeLoad(std::uint64_t generation, const PixelBuffer& source, const PixelBuffer& segmented)
{
    if (generation != generation_)
    {
        std::cerr << "[MaskSession] discarding stale load " << generation << " (current " << generation_ << ")\n";
        return false;
    }
    loading_ = false;

    PixelBuffer preview;
    try
    {
        PixelBuffer src = toWorkingSize(source, settings_.maxWorkingDimension);
        PixelBuffer seg = toWorkingSize(segmented, settings_.maxWorkingDimension);
        if (seg.size() != src.size())
        {
            throw EditorError(ErrorKind::DimensionMismatch,
                              "segmentation " + std::to_string(seg.width()) + "x" + std::to_string(seg.height()) +
                              " vs source " + std::to_string(src.width()) + "x" + std::to_string(src.height()));
        }
        MaskBuffer mask = MaskBuffer::fromAlpha(seg);
        preview = renderPreview(src, mask, TransparentBackground{}, checker_);

        // Nothing below can fail; the previous session is replaced wholesale
        source_ = std::move(src);
        initialMask_ = mask;
        mask_ = std::move(mask);
        history_.reset(mask_);
        background_ = TransparentBackground{};
        state_ = SessionState::Idle;
        brush_.isActive = false;
        lastError_.reset();
    }
    catch (const EditorError& e)
    {
        lastError_ = SessionError{e.kind(), e.what()};
        std::cerr << "[MaskSession] load " << generation << " failed: " << e.what() << "\n";
        return false;
    }
    catch (const cv::Exception& e)
    {
        lastError_ = SessionError{ErrorKind::DecodeFailure, e.what()};
        std::cerr << "[MaskSession] load " << generation << " failed: " << e.what() << "\n";
        return false;
    }

    publish(std::move(preview));
    return true;
}

void MaskSession::failLoad(std::uint64_t generation, ErrorKind kind, const std::string& message)
{
    if (generation != generation_)
    {
        std::cerr << "[MaskSession] ignoring failure of stale load " << generation << "\n";
        return;
    }
    loading_ = false;
    lastError_ = SessionError{kind, message};
    std::cerr << "[MaskSession] load " << generation << " failed (" << errorKindName(kind) << "): " << message << "\n";
}

// ---- pointer input --------------------------------------------------------------

bool MaskSession::pointerDown(const cv::Point2d& displayPt, const cv::Size2d& displaySize)
{
    if (!acceptsInput()) return false;
    return beginStroke(util::mapDisplayToBuffer(displayPt, displaySize, source_.size()));
}

bool MaskSession::pointerMove(const cv::Point2d& displayPt, const cv::Size2d& displaySize)
{
    if (state_ != SessionState::StrokeActive) return false;
    return continueStroke(util::mapDisplayToBuffer(displayPt, displaySize, source_.size()));
}

void MaskSession::pointerUp()
{
    endStroke();
}

void MaskSession::pointerLeave()
{
    endStroke();
}

// ---- stroke primitives ----------------------------------------------------------

bool MaskSession::beginStroke(const cv::Point2d& bufferPt)
{
    if (!acceptsInput()) return false;
    if (!std::isfinite(bufferPt.x) || !std::isfinite(bufferPt.y))
        throw EditorError(ErrorKind::InvalidGeometry, "stroke point is not finite");
    endStroke();
    state_ = SessionState::StrokeActive;
    brush_.isActive = true;
    try
    {
        applyStamp(bufferPt, true);
    }
    catch (const std::exception& e)
    {
        std::cerr << "[MaskSession] stroke not started: " << e.what() << "\n";
        endStroke();
        throw;
    }
    return true;
}

bool MaskSession::continueStroke(const cv::Point2d& bufferPt)
{
    if (state_ != SessionState::StrokeActive) return false;
    applyStamp(bufferPt, false);
    return true;
}

void MaskSession::endStroke()
{
    if (state_ != SessionState::StrokeActive) return;
    state_ = SessionState::Idle;
    brush_.isActive = false;
}

void MaskSession::applyStamp(const cv::Point2d& bufferPt, bool firstOfStroke)
{
    // Stamp a copy; history and the live mask only move once the preview exists
    MaskBuffer next = mask_.clone();
    stamp(next, bufferPt.x, bufferPt.y, brush_.radius, brush_.mode);
    PixelBuffer preview = renderPreview(source_, next, background_, checker_);

    if (firstOfStroke) history_.beginStroke(mask_);
    mask_ = std::move(next);
    publish(std::move(preview));
}

// ---- history --------------------------------------------------------------------

bool MaskSession::undo()
{
    return stepHistory(SessionState::Undoing);
}

bool MaskSession::redo()
{
    return stepHistory(SessionState::Redoing);
}

bool MaskSession::stepHistory(SessionState step)
{
    if (!acceptsInput()) return false;
    endStroke();
    const bool backwards = step == SessionState::Undoing;
    const MaskBuffer* target = backwards ? history_.peekUndo() : history_.peekRedo();
    if (!target) return false;

    PixelBuffer preview;
    try
    {
        preview = renderPreview(source_, *target, background_, checker_);
    }
    catch (const std::exception& e)
    {
        std::cerr << "[MaskSession] " << sessionStateName(step) << " aborted: " << e.what() << "\n";
        throw;
    }

    state_ = step;
    try
    {
        if (backwards) history_.undo(mask_);
        else history_.redo(mask_);
        publish(std::move(preview));
    }
    catch (...)
    {
        state_ = SessionState::Idle;
        throw;
    }
    state_ = SessionState::Idle;
    return true;
}

bool MaskSession::resetMask()
{
    if (!acceptsInput()) return false;
    endStroke();
    PixelBuffer preview = renderPreview(source_, initialMask_, background_, checker_);
    history_.beginStroke(mask_);
    mask_.assign(initialMask_);
    publish(std::move(preview));
    return true;
}

void MaskSession::clear()
{
    ++generation_; // supersedes any in-flight load
    loading_ = false;
    source_ = PixelBuffer();
    mask_ = MaskBuffer();
    initialMask_ = MaskBuffer();
    preview_ = PixelBuffer();
    history_.clear();
    background_ = TransparentBackground{};
    state_ = SessionState::Idle;
    brush_.isActive = false;
    lastError_.reset();
    if (onRedraw_) onRedraw_(preview_);
}

// ---- brush / background -----------------------------------------------------------

void MaskSession::setBrushMode(BrushMode mode)
{
    brush_.mode = mode;
}

void MaskSession::setBrushSize(int size)
{
    brushSize_ = std::clamp(size, settings_.minBrushSize, std::max(settings_.minBrushSize, settings_.maxBrushSize));
    brush_.radius = brushSize_ / 2.0;
}

void MaskSession::setBackground(BackgroundSpec bg)
{
    const auto* image = std::get_if<ImageBackground>(&bg);
    if (image && image->image.empty())
        throw EditorError(ErrorKind::DecodeFailure, "image background has no pixels");
    if (!hasImage())
    {
        background_ = std::move(bg);
        return;
    }

    BackgroundSpec fitted = fitBackground(bg, source_.size());
    PixelBuffer preview = renderPreview(source_, mask_, fitted, checker_);
    background_ = std::move(fitted);
    publish(std::move(preview));
}

// ---- output ------------------------------------------------------------------------

PixelBuffer MaskSession::exportComposite() const
{
    if (!hasImage()) throw EditorError(ErrorKind::NoImage, "nothing to export");
    return composite(source_, mask_, background_);
}

std::string MaskSession::suggestedExportName() const
{
    if (std::holds_alternative<SolidColorBackground>(background_)) return "background-replaced-color.png";
    if (std::holds_alternative<ImageBackground>(background_)) return "background-replaced-image.png";
    return "background-removed-edited.png";
}

void MaskSession::publish(PixelBuffer preview)
{
    preview_ = std::move(preview);
    if (onRedraw_) onRedraw_(preview_);
}

}
