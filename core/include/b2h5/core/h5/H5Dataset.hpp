#pragma once

#include <hdf5.h>

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

#include "b2h5/core/types/DatasetSource.hpp"

namespace b2h5
{

/**
 * @brief Owning wrapper for an HDF5 identifier.
 *
 * Closes the id with the matching H5*close function on destruction.
 */
class H5Id
{
public:
    using Closer = herr_t (*)(hid_t);

    H5Id() = default;
    H5Id(hid_t id, Closer close) noexcept : id_(id), close_(close) {}

    H5Id(const H5Id&) = delete;
    H5Id& operator=(const H5Id&) = delete;

    H5Id(H5Id&& other) noexcept : id_(other.id_), close_(other.close_)
    {
        other.id_ = H5I_INVALID_HID;
    }
    H5Id& operator=(H5Id&& other) noexcept
    {
        if (this != &other) {
            reset();
            id_ = other.id_;
            close_ = other.close_;
            other.id_ = H5I_INVALID_HID;
        }
        return *this;
    }

    ~H5Id() { reset(); }

    hid_t get() const noexcept { return id_; }
    bool valid() const noexcept { return id_ >= 0; }

    void reset() noexcept
    {
        if (id_ >= 0 && close_ != nullptr) {
            close_(id_);
        }
        id_ = H5I_INVALID_HID;
    }

private:
    hid_t id_ = H5I_INVALID_HID;
    Closer close_ = nullptr;
};

/**
 * @brief IDatasetSource over a dataset in an HDF5 file.
 *
 * Keeps the file and dataset open for its lifetime. HDF5 calls are
 * serialized with an internal mutex.
 */
class H5Dataset : public IDatasetSource
{
public:
    /**
     * @param path HDF5 file
     * @param datasetName Absolute path of the dataset in the file
     * @throws StorageError if the file or dataset cannot be opened
     */
    H5Dataset(
        const std::filesystem::path& path,
        const std::string& datasetName,
        OpenMode mode = OpenMode::ReadOnly);

    H5Dataset(const H5Dataset&) = delete;
    H5Dataset& operator=(const H5Dataset&) = delete;

    const DatasetDescriptor& descriptor() const override { return desc_; }

    const std::string& name() const noexcept { return name_; }

    /**
     * @throws StorageError if the chunk is not allocated in the file
     * @throws DataIntegrityError if the chunk was stored with its Blosc2
     *         filter skipped
     */
    std::uint64_t chunkByteOffset(
        const std::vector<std::size_t>& chunkCoord) const override;

    /** @brief Hyperslab read converting to @p type via HDF5 */
    NDArray readGeneric(
        const Selection& selection, const ElementType& type) const override;

    /** @brief Number of allocated chunks */
    std::size_t numChunks() const;

private:
    void loadDescriptor();
    H5Id memoryType(const ElementType& type) const;

    std::string name_;
    DatasetDescriptor desc_;
    H5Id file_;
    H5Id dataset_;
    mutable std::mutex mutex_;
};

/** @brief Element type of an HDF5 datatype; Unknown if unsupported */
ElementType elementTypeFromH5(hid_t type);

}  // namespace b2h5
