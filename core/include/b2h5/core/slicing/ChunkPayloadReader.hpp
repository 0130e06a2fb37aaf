#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <vector>

#include "b2h5/core/slicing/SliceDecomposer.hpp"
#include "b2h5/core/types/ElementType.hpp"

namespace b2h5
{

/**
 * @brief A typed, C-ordered region extracted from one chunk payload.
 */
struct ChunkSlice {
    ElementType type;
    std::vector<std::size_t> shape;
    std::vector<std::uint8_t> bytes;
};

/**
 * @brief Reads regions of Blosc2 NDim (b2nd) chunk payloads directly.
 *
 * The payload of an HDF5 chunk written through the Blosc2 filter is a
 * b2nd frame stored at the chunk's byte offset in the file. Only the
 * blocks overlapping the requested region are decompressed.
 *
 * Stateless apart from one-time Blosc2 initialization; safe to call from
 * several threads at once since each call opens its own frame handle.
 */
class ChunkPayloadReader
{
public:
    ChunkPayloadReader();

    /**
     * @brief Read a region of the chunk payload at @p byteOffset
     * @param path File holding the payload
     * @param byteOffset Offset of the b2nd frame in @p path
     * @param chunkBox Region to read, relative to the chunk origin
     * @param datasetType Element type recorded for the dataset
     * @return Region reinterpreted as @p datasetType where the payload is opaque
     * @throws StorageError if the frame cannot be opened or decompressed
     * @throws SizeMismatchError if an opaque payload does not split into
     *         whole elements of @p datasetType
     * @throws DataIntegrityError if the payload contradicts the dataset
     */
    ChunkSlice read(
        const std::filesystem::path& path,
        std::uint64_t byteOffset,
        const Box& chunkBox,
        const ElementType& datasetType) const;

    /**
     * @brief Reinterpret an opaque slice as @p target
     *
     * Non-opaque slices are returned unchanged.
     *
     * @throws SizeMismatchError if the byte count is not a multiple of the
     *         target element size
     * @throws DataIntegrityError if the resulting element count does not
     *         fit the slice shape
     */
    static ChunkSlice reinterpret(ChunkSlice slice, const ElementType& target);

    /**
     * @brief Check a slice against the dataset type and requested box
     *
     * @throws DataIntegrityError on type mismatch, rank mismatch, or any
     *         extent larger than requested
     */
    static void validate(
        const ChunkSlice& slice,
        const ElementType& datasetType,
        const Box& chunkBox,
        const std::vector<std::size_t>& chunkCoord,
        std::uint64_t byteOffset);

    /** @brief Initialize the blosc2 library (thread-safe) */
    static void initBlosc();
};

}  // namespace b2h5
