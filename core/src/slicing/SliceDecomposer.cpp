#include "b2h5/core/slicing/SliceDecomposer.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace b2h5
{

SliceDecomposer::SliceDecomposer(
    const DatasetDescriptor& desc, const Selection& selection)
    : chunkShape_(desc.chunkShape), start_(selection.start)
{
    const std::size_t rank = desc.rank();
    if (!desc.chunked() || chunkShape_.size() != rank) {
        throw std::invalid_argument("SliceDecomposer: dataset is not chunked");
    }
    if (selection.rank() != rank || selection.count.size() != rank) {
        throw std::invalid_argument(
            "SliceDecomposer: selection rank " + std::to_string(selection.rank()) +
            " does not match dataset rank " + std::to_string(rank));
    }
    if (!selection.unitStep()) {
        throw std::invalid_argument("SliceDecomposer: selection step must be 1");
    }

    stop_.resize(rank);
    firstChunk_.resize(rank);
    lastChunk_.resize(rank);
    empty_ = selection.isEmpty();

    for (std::size_t i = 0; i < rank; ++i) {
        if (chunkShape_[i] == 0) {
            throw std::invalid_argument("SliceDecomposer: zero chunk extent");
        }
        stop_[i] = start_[i] + selection.count[i];
        if (!empty_ && stop_[i] > desc.shape[i]) {
            throw std::invalid_argument(
                "SliceDecomposer: selection exceeds dataset extent on axis " +
                std::to_string(i));
        }
        if (!empty_) {
            firstChunk_[i] = start_[i] / chunkShape_[i];
            lastChunk_[i] = (stop_[i] - 1) / chunkShape_[i];
        }
    }
}

bool SliceDecomposer::makeItem(
    const std::vector<std::size_t>& gridPos, WorkItem& out) const
{
    const std::size_t rank = gridPos.size();
    out.chunkCoord.resize(rank);
    out.chunkBox.start.resize(rank);
    out.chunkBox.shape.resize(rank);
    out.outputBox.start.resize(rank);
    out.outputBox.shape.resize(rank);

    for (std::size_t i = 0; i < rank; ++i) {
        const std::size_t c = gridPos[i] * chunkShape_[i];
        const std::size_t lo = std::max(start_[i], c);
        const std::size_t hi = std::min(stop_[i], c + chunkShape_[i]);
        if (hi <= lo) {
            return false;
        }
        out.chunkCoord[i] = c;
        out.chunkBox.start[i] = lo - c;
        out.chunkBox.shape[i] = hi - lo;
        out.outputBox.start[i] = lo - start_[i];
        out.outputBox.shape[i] = hi - lo;
    }
    return true;
}

std::size_t SliceDecomposer::candidateCount() const noexcept
{
    if (empty_) {
        return 0;
    }
    std::size_t n = 1;
    for (std::size_t i = 0; i < firstChunk_.size(); ++i) {
        n *= lastChunk_[i] - firstChunk_[i] + 1;
    }
    return n;
}

std::vector<WorkItem> SliceDecomposer::collect() const
{
    std::vector<WorkItem> items;
    items.reserve(candidateCount());
    for (auto it = begin(); it != end(); ++it) {
        items.push_back(*it);
    }
    return items;
}

// --- iterator ---

SliceDecomposer::iterator::iterator(const SliceDecomposer* owner)
    : owner_(owner), gridPos_(owner->firstChunk_), done_(owner->empty_)
{
    // A rank-0 selection has no chunk grid to walk
    if (gridPos_.empty()) {
        done_ = true;
    }
    settle();
}

bool SliceDecomposer::iterator::stepGrid()
{
    for (std::size_t axis = gridPos_.size(); axis > 0; --axis) {
        auto i = axis - 1;
        if (++gridPos_[i] <= owner_->lastChunk_[i]) {
            return true;
        }
        gridPos_[i] = owner_->firstChunk_[i];
    }
    return false;
}

void SliceDecomposer::iterator::settle()
{
    while (!done_) {
        if (owner_->makeItem(gridPos_, item_)) {
            return;
        }
        if (!stepGrid()) {
            done_ = true;
        }
    }
}

SliceDecomposer::iterator& SliceDecomposer::iterator::operator++()
{
    if (done_) {
        return *this;
    }
    if (!stepGrid()) {
        done_ = true;
        return *this;
    }
    settle();
    return *this;
}

}  // namespace b2h5
