#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace b2h5
{

/** @brief A bare integer index; drops its axis from the result */
struct Index {
    std::int64_t value = 0;
};

/** @brief A start:stop:step range; missing bounds take numpy defaults */
struct Range {
    std::optional<std::int64_t> start;
    std::optional<std::int64_t> stop;
    std::optional<std::int64_t> step;
};

/** @brief Stands for as many full ranges as needed to reach the rank */
struct Ellipsis {
};

using IndexTerm = std::variant<Index, Range, Ellipsis>;

/**
 * @brief An index expression such as `[2:4, ::2, 5, ...]`.
 *
 * An empty expression selects the whole dataset.
 */
using SliceExpr = std::vector<IndexTerm>;

// Builders
inline IndexTerm idx(std::int64_t i) { return Index{i}; }
inline IndexTerm range(std::int64_t start, std::int64_t stop) { return Range{start, stop, std::nullopt}; }
inline IndexTerm range(
    std::optional<std::int64_t> start,
    std::optional<std::int64_t> stop,
    std::optional<std::int64_t> step)
{
    return Range{start, stop, step};
}
inline IndexTerm all() { return Range{}; }
inline IndexTerm ellipsis() { return Ellipsis{}; }

/**
 * @brief Parse a textual index expression.
 *
 * Terms are separated by commas. Each term is an integer, `...`, or a
 * `start:stop[:step]` range where any part may be omitted (`:`, `2:`,
 * `::2`). Surrounding brackets are optional.
 *
 * @throws std::invalid_argument on malformed input
 */
SliceExpr parseSliceExpr(const std::string& text);

/** @brief Render an expression back to text (for logging) */
std::string toString(const SliceExpr& expr);

/**
 * @brief A normalized selection over a dataset.
 *
 * For each axis, `start`, `count` (memory shape) and `step`; `dropped`
 * marks axes indexed by a bare integer. `outputShape` is `count` without
 * the dropped axes.
 */
struct Selection {
    std::vector<std::size_t> start;
    std::vector<std::size_t> count;
    std::vector<std::size_t> step;
    std::vector<bool> dropped;
    std::vector<std::size_t> outputShape;

    std::size_t rank() const noexcept { return start.size(); }

    /** @brief True if any axis selects nothing */
    bool isEmpty() const noexcept;

    /** @brief True if every axis has step 1 */
    bool unitStep() const noexcept;

    /** @brief Number of selected elements */
    std::size_t numElements() const noexcept;

    bool operator==(const Selection& other) const = default;
};

/**
 * @brief Normalize an index expression against a dataset shape.
 *
 * Follows numpy/h5py rules: negative values count from the end, range
 * bounds clip to the extent, integer indices must be in range.
 *
 * @throws std::out_of_range for an integer index outside its axis
 * @throws std::invalid_argument for a step below 1, more than one
 *         ellipsis, or more terms than dimensions
 */
Selection normalizeSelection(
    const std::vector<std::size_t>& shape, const SliceExpr& expr);

}  // namespace b2h5
