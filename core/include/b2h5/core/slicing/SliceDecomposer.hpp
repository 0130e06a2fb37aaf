#pragma once

#include <cstddef>
#include <iterator>
#include <vector>

#include "b2h5/core/types/DatasetSource.hpp"
#include "b2h5/core/types/Selection.hpp"

namespace b2h5
{

/** @brief An axis-aligned box: start offset and extent per axis */
struct Box {
    std::vector<std::size_t> start;
    std::vector<std::size_t> shape;

    bool operator==(const Box& other) const = default;
};

/**
 * @brief One chunk's contribution to a slice read.
 *
 * chunkBox is relative to the chunk origin, outputBox to the selection
 * start; both have the same shape.
 */
struct WorkItem {
    std::vector<std::size_t> chunkCoord;
    Box chunkBox;
    Box outputBox;
};

/**
 * @brief Maps a unit-step selection onto the chunk grid.
 *
 * Produces one WorkItem per chunk intersecting
 * [start, start + count) on every axis, lazily and in C order over the
 * chunk grid. The output boxes of all items tile [0, count) exactly.
 * Produces nothing when any axis of the selection is empty.
 */
class SliceDecomposer
{
public:
    /**
     * @throws std::invalid_argument if the dataset is not chunked, ranks
     *         differ, a step is not 1, or the selection leaves the dataset
     */
    SliceDecomposer(const DatasetDescriptor& desc, const Selection& selection);

    class iterator
    {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = WorkItem;
        using difference_type = std::ptrdiff_t;
        using pointer = const WorkItem*;
        using reference = const WorkItem&;

        iterator() = default;

        reference operator*() const { return item_; }
        pointer operator->() const { return &item_; }
        iterator& operator++();
        iterator operator++(int)
        {
            auto tmp = *this;
            ++*this;
            return tmp;
        }

        bool operator==(const iterator& other) const noexcept
        {
            return done_ == other.done_ && (done_ || gridPos_ == other.gridPos_);
        }
        bool operator!=(const iterator& other) const noexcept
        {
            return !(*this == other);
        }

    private:
        friend class SliceDecomposer;
        explicit iterator(const SliceDecomposer* owner);

        // Moves to the next non-degenerate candidate at or after gridPos_
        void settle();
        bool stepGrid();

        const SliceDecomposer* owner_ = nullptr;
        std::vector<std::size_t> gridPos_;
        WorkItem item_;
        bool done_ = true;
    };

    iterator begin() const { return iterator(this); }
    iterator end() const { return iterator(); }

    /** @brief All work items, materialized */
    std::vector<WorkItem> collect() const;

    /** @brief Number of candidate chunks on the grid (before filtering) */
    std::size_t candidateCount() const noexcept;

private:
    std::vector<std::size_t> chunkShape_;
    std::vector<std::size_t> start_;
    std::vector<std::size_t> stop_;
    std::vector<std::size_t> firstChunk_;  // grid index, inclusive
    std::vector<std::size_t> lastChunk_;   // grid index, inclusive
    bool empty_ = false;

    // Fills @p out for the chunk at grid index @p gridPos; false if the
    // intersection is empty on any axis
    bool makeItem(const std::vector<std::size_t>& gridPos, WorkItem& out) const;
};

}  // namespace b2h5
