/*========================  mask_session.hpp  ========================

   Single owner of an editing session.
   --------------------------------------------------------------------
   • owns source image, live mask, history, brush and background
   • pointer state machine: Idle -> StrokeActive -> Idle
   • every stamp / undo / redo / reset / background change recomposites
     synchronously and then fires the redraw callback
   • the new preview is rendered before anything is committed; an
     operation that throws leaves mask, history and background as they were
   • loads are keyed by a generation counter; stale completions are dropped

=====================================================================*/
#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "pixel_buffer.hpp"
#include "mask_history.hpp"
#include "compositor.hpp"
#include "models/Background.hpp"
#include "models/BrushMode.hpp"
#include "models/EditorSettings.hpp"
#include "util/EditorError.hpp"

namespace cutout {

enum class SessionState
{
    Idle,
    StrokeActive,
    Undoing,
    Redoing,
};

struct SessionError
{
    ErrorKind kind;
    std::string message;
};

class MaskSession
{
public:
    using RedrawCallback = std::function<void(const PixelBuffer& preview)>;

    explicit MaskSession(EditorSettings settings = EditorSettings());

    // ---- loading --------------------------------------------------------
    // Starts a load and returns its generation; any earlier in-flight load is superseded
    std::uint64_t beginLoad();
    // Installs source + segmentation for `generation`. Returns false (state kept) for
    // stale generations, dimension mismatches and undecodable input.
    bool completeLoad(std::uint64_t generation, const PixelBuffer& source, const PixelBuffer& segmented);
    // Reports a failed load; ignored if `generation` is stale
    void failLoad(std::uint64_t generation, ErrorKind kind, const std::string& message);

    bool isLoading() const { return loading_; }
    bool hasImage() const { return !source_.empty(); }
    std::uint64_t generation() const { return generation_; }
    const std::optional<SessionError>& lastError() const { return lastError_; }

    // ---- pointer input (display space) ----------------------------------
    bool pointerDown(const cv::Point2d& displayPt, const cv::Size2d& displaySize);
    bool pointerMove(const cv::Point2d& displayPt, const cv::Size2d& displaySize);
    void pointerUp();
    void pointerLeave();

    // ---- stroke primitives (buffer space) --------------------------------
    bool beginStroke(const cv::Point2d& bufferPt);
    bool continueStroke(const cv::Point2d& bufferPt);
    void endStroke();

    // ---- history ----------------------------------------------------------
    bool undo();
    bool redo();
    bool canUndo() const { return history_.canUndo(); }
    bool canRedo() const { return history_.canRedo(); }
    std::size_t undoSteps() const { return history_.undoSteps(); }
    std::size_t redoSteps() const { return history_.redoStackSize(); }

    // Back to the segmentation result, recorded as an undoable step
    bool resetMask();
    // Discards every entity; the session returns to empty
    void clear();

    // ---- brush / background -------------------------------------------------
    void setBrushMode(BrushMode mode);
    // Diameter in buffer pixels, clamped to the configured range
    void setBrushSize(int size);
    int brushSize() const { return brushSize_; }
    const BrushState& brush() const { return brush_; }

    void setBackground(BackgroundSpec bg);
    const BackgroundSpec& background() const { return background_; }

    // ---- output --------------------------------------------------------------
    const PixelBuffer& preview() const { return preview_; }
    // Throws NoImage when nothing is loaded
    PixelBuffer exportComposite() const;
    std::string suggestedExportName() const;

    const PixelBuffer& source() const { return source_; }
    const MaskBuffer& mask() const { return mask_; }
    const MaskBuffer& initialMask() const { return initialMask_; }
    SessionState state() const { return state_; }
    const EditorSettings& settings() const { return settings_; }

    void setRedrawCallback(RedrawCallback cb) { onRedraw_ = std::move(cb); }

private:
    bool acceptsInput() const { return hasImage() && !loading_; }
    void applyStamp(const cv::Point2d& bufferPt, bool firstOfStroke);
    bool stepHistory(SessionState step);
    // Makes an already rendered preview live and fires the redraw callback
    void publish(PixelBuffer preview);

    EditorSettings settings_;
    CheckerStyle checker_;

    PixelBuffer source_;
    MaskBuffer mask_;
    MaskBuffer initialMask_;
    MaskHistory history_;
    BackgroundSpec background_ {TransparentBackground{}};
    BrushState brush_;
    int brushSize_;
    SessionState state_ {SessionState::Idle};
    PixelBuffer preview_;

    std::uint64_t generation_ {0};
    bool loading_ {false};
    std::optional<SessionError> lastError_;

    RedrawCallback onRedraw_;
};

const char* sessionStateName(SessionState s);

}
