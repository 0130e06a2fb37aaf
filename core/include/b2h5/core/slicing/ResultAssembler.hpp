#pragma once

#include "b2h5/core/slicing/ChunkPayloadReader.hpp"
#include "b2h5/core/slicing/SliceDecomposer.hpp"
#include "b2h5/core/types/NDArray.hpp"
#include "b2h5/core/types/Selection.hpp"

namespace b2h5
{

/**
 * @brief Builds the result of one slice read from per-chunk parts.
 *
 * The output buffer has the selection's memory shape. Each place() call
 * writes one WorkItem's output box; boxes of different items never
 * overlap, so concurrent place() calls for distinct items are safe.
 */
class ResultAssembler
{
public:
    /**
     * @param selection Normalized selection being read
     * @param type Element type of the result
     */
    ResultAssembler(const Selection& selection, const ElementType& type);

    /**
     * @brief Copy one chunk's part into its output box
     * @throws DataIntegrityError if the part does not fill the box exactly
     * @throws std::invalid_argument if the part cannot convert to the
     *         result type
     */
    void place(const WorkItem& item, const ChunkSlice& part);

    /** @brief Hand over the buffer reshaped to the output shape */
    SliceResult finish() &&;

    /** @brief Result for a selection with an empty axis; reads nothing */
    static SliceResult empty(const Selection& selection, const ElementType& type);

    /** @brief Reshape a memory-shaped buffer to the selection's output */
    static SliceResult reshape(NDArray buffer, const Selection& selection);

private:
    const Selection& selection_;
    NDArray buffer_;
};

}  // namespace b2h5
