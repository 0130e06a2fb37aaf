#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <vector>

#include "b2h5/core/types/ElementType.hpp"
#include "b2h5/core/types/NDArray.hpp"
#include "b2h5/core/types/Selection.hpp"

namespace b2h5
{

/** @brief HDF5 filter id registered for Blosc2 */
inline constexpr unsigned kBlosc2FilterId = 32026;

enum class ExtentType { Simple, Scalar, Null };

enum class OpenMode { ReadOnly, ReadWrite };

/**
 * @brief Immutable description of an open dataset.
 */
struct DatasetDescriptor {
    std::vector<std::size_t> shape;
    std::vector<std::size_t> chunkShape;  // empty when not chunked
    ExtentType extent = ExtentType::Simple;
    ElementType dtype;
    std::vector<unsigned> filters;  // filter pipeline ids, in order
    std::filesystem::path path;
    OpenMode mode = OpenMode::ReadOnly;

    std::size_t rank() const noexcept { return shape.size(); }
    bool chunked() const noexcept { return !chunkShape.empty(); }
};

/**
 * @brief Host storage seam consumed by the slicing engine.
 *
 * Implementations own the open dataset. Calls may come from several
 * threads; implementations serialize internally where the backing
 * library is not reentrant.
 */
class IDatasetSource
{
public:
    virtual ~IDatasetSource() = default;

    virtual const DatasetDescriptor& descriptor() const = 0;

    /**
     * @brief Byte offset in the file of the chunk starting at @p chunkCoord
     * @param chunkCoord Absolute start offset of the chunk on each axis
     */
    virtual std::uint64_t chunkByteOffset(
        const std::vector<std::size_t>& chunkCoord) const = 0;

    /**
     * @brief Read a selection through the storage layer's own pipeline
     *
     * Supports any positive step. Returns an array of the selection's
     * memory shape (count) holding elements of @p type.
     */
    virtual NDArray readGeneric(
        const Selection& selection, const ElementType& type) const = 0;
};

}  // namespace b2h5
