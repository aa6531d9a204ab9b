/*========================  mask_history.hpp  ========================

   Bounded undo/redo over full mask snapshots.
   --------------------------------------------------------------------
   • undo stack: bottom entry is the floor (pre-edit state, or the oldest
     surviving snapshot after eviction); entries above it are undo steps
   • at most `limit` undo steps; pushing beyond evicts the oldest first
   • redo stack is cleared whenever a new stroke begins
   • undo/redo at the boundary return false and change nothing

=====================================================================*/
#pragma once
#include <cstddef>
#include <deque>
#include "pixel_buffer.hpp"

namespace cutout {

class MaskHistory
{
public:
    explicit MaskHistory(std::size_t limit = 50);

    // Start a session: drop both stacks and keep `baseline` as the floor entry
    void reset(const MaskBuffer& baseline);
    void clear();

    // Snapshot the live mask before the first stamp of a stroke; clears redo
    void beginStroke(const MaskBuffer& live);

    // Restore the previous snapshot into `live`; false when only the floor remains
    bool undo(MaskBuffer& live);
    // Re-apply the most recently undone snapshot into `live`; false when redo is empty
    bool redo(MaskBuffer& live);

    bool canUndo() const { return undo_.size() > 1; }
    bool canRedo() const { return !redo_.empty(); }

    // Snapshot the next undo()/redo() would restore; nullptr at the boundary
    const MaskBuffer* peekUndo() const { return canUndo() ? &undo_.back() : nullptr; }
    const MaskBuffer* peekRedo() const { return canRedo() ? &redo_.back() : nullptr; }

    std::size_t undoSteps() const { return undo_.empty() ? 0 : undo_.size() - 1; }
    std::size_t redoStackSize() const { return redo_.size(); }

private:
    void pushUndo(const MaskBuffer& snapshot);
    void pushRedo(const MaskBuffer& snapshot);

    std::size_t limit_;
    std::deque<MaskBuffer> undo_;
    std::deque<MaskBuffer> redo_;
};

}
