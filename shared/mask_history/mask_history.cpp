#include "mask_history.hpp"
#include "util/EditorError.hpp"
#include <algorithm>
#include <iostream>
#include <utility>

namespace cutout {

MaskHistory::MaskHistory(std::size_t limit)
    : limit_(std::max<std::size_t>(1, limit))
{
}

void MaskHistory::reset(const MaskBuffer& baseline)
{
    undo_.clear();
    redo_.clear();
    undo_.push_back(baseline.clone());
}

void MaskHistory::clear()
{
    undo_.clear();
    redo_.clear();
}

void MaskHistory::pushUndo(const MaskBuffer& snapshot)
{
    undo_.push_back(snapshot.clone());
    // floor + limit_ steps; FIFO eviction keeps the newest
    while (undo_.size() > limit_ + 1) undo_.pop_front();
}

void MaskHistory::pushRedo(const MaskBuffer& snapshot)
{
    redo_.push_back(snapshot.clone());
    while (redo_.size() > limit_) redo_.pop_front();
}

void MaskHistory::beginStroke(const MaskBuffer& live)
{
    if (undo_.empty())
    {
        // Stroke without reset(): the live mask is the pre-edit state
        std::cerr << "[MaskHistory] beginStroke before reset; seeding floor from live mask\n";
        undo_.push_back(live.clone());
    }
    pushUndo(live);
    redo_.clear();
}

namespace
{
    void requireSameSize(const MaskBuffer& snapshot, const MaskBuffer& live)
    {
        if (snapshot.size() != live.size())
            throw EditorError(ErrorKind::DimensionMismatch, "history snapshot does not match the live mask");
    }
}

bool MaskHistory::undo(MaskBuffer& live)
{
    if (undo_.size() <= 1) return false;
    requireSameSize(undo_.back(), live);
    MaskBuffer previous = std::move(undo_.back());
    undo_.pop_back();
    pushRedo(live);
    live.assign(previous);
    return true;
}

bool MaskHistory::redo(MaskBuffer& live)
{
    if (redo_.empty()) return false;
    requireSameSize(redo_.back(), live);
    MaskBuffer next = std::move(redo_.back());
    redo_.pop_back();
    pushUndo(live);
    live.assign(next);
    return true;
}

}
