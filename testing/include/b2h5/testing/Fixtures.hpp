#pragma once

/**
 * @file
 *
 * Shared fixtures for the slicing tests: b2nd payload encoding, a
 * temporary directory, and an in-memory dataset whose chunks live as
 * b2nd frames in a real file.
 */

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "b2h5/core/types/DatasetSource.hpp"
#include "b2h5/core/types/NDArray.hpp"

namespace b2h5::testing
{

/** @brief Fresh directory under the system temp path, removed on destruction */
class TempDir
{
public:
    TempDir();
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const noexcept { return path_; }
    std::filesystem::path operator/(const std::string& name) const { return path_ / name; }

private:
    std::filesystem::path path_;
};

/**
 * @brief Encode an array as a contiguous b2nd frame.
 *
 * @param dtype b2nd dtype string recorded in the frame; the b2nd default
 *        (no recorded structure) when null
 * @param codec {"cname": ..., "clevel": ...}
 */
std::vector<std::uint8_t> encodeB2nd(
    const NDArray& array,
    const char* dtype,
    const nlohmann::json& codec = {{"cname", "zstd"}, {"clevel", 5}});

/** @brief numpy-style dtype string recorded for payloads of @p type */
std::string payloadDtype(const ElementType& type);

/** @brief Origins of all chunks of a grid over @p shape, in C order */
std::vector<std::vector<std::size_t>> chunkOrigins(
    const std::vector<std::size_t>& shape, const std::vector<std::size_t>& chunkShape);

/**
 * @brief The chunk of @p data starting at @p origin
 *
 * Zero-padded to @p chunkShape at the dataset edge, or cut to the
 * in-extent part when @p trim is set.
 */
NDArray extractChunk(
    const NDArray& data,
    const std::vector<std::size_t>& origin,
    const std::vector<std::size_t>& chunkShape,
    bool trim = false);

/** @brief Array of @p shape with element i equal to i (converted to T) */
template <typename T>
NDArray iota(const std::vector<std::size_t>& shape, const ElementType& type)
{
    std::vector<T> values(shapeProduct(shape));
    for (std::size_t i = 0; i < values.size(); ++i) {
        values[i] = static_cast<T>(i);
    }
    return NDArray::fromVector(values, shape, type);
}

/**
 * @brief IDatasetSource keeping its elements in memory and its chunks as
 *        b2nd frames in a file.
 *
 * The chunk-direct path reads the frames; the generic path reads the
 * in-memory array directly, so both can be compared.
 */
class MemoryDataset : public IDatasetSource
{
public:
    struct Options {
        // dtype recorded in every payload; payloadDtype(type) when unset,
        // the b2nd default when set to ""
        std::optional<std::string> payloadDtype;
        // write edge chunks with only their in-extent part
        bool trimEdgeChunks = false;
        nlohmann::json codec = {{"cname", "zstd"}, {"clevel", 5}};
        std::vector<unsigned> filters{kBlosc2FilterId};
        ExtentType extent = ExtentType::Simple;
        OpenMode mode = OpenMode::ReadOnly;
    };

    /**
     * @param file Where the chunk frames are written (overwritten)
     * @param data Dataset contents
     * @param chunkShape Chunk grid; no frames are written when empty
     */
    MemoryDataset(
        const std::filesystem::path& file,
        NDArray data,
        std::vector<std::size_t> chunkShape,
        Options options);

    MemoryDataset(
        const std::filesystem::path& file, NDArray data, std::vector<std::size_t> chunkShape)
        : MemoryDataset(file, std::move(data), std::move(chunkShape), Options{})
    {
    }

    const DatasetDescriptor& descriptor() const override { return desc_; }
    std::uint64_t chunkByteOffset(const std::vector<std::size_t>& chunkCoord) const override;
    NDArray readGeneric(const Selection& selection, const ElementType& type) const override;

    const NDArray& data() const noexcept { return data_; }

    /** @brief Descriptor edits for eligibility tests */
    DatasetDescriptor& mutableDescriptor() noexcept { return desc_; }

    /**
     * @brief Store a different payload for the chunk at @p chunkCoord
     * @param dtype As for encodeB2nd()
     */
    void replaceChunk(
        const std::vector<std::size_t>& chunkCoord, const NDArray& payload, const char* dtype);

    /** @brief Store raw bytes as the payload of the chunk at @p chunkCoord */
    void replaceChunkBytes(
        const std::vector<std::size_t>& chunkCoord, const std::vector<std::uint8_t>& bytes);

    /** @brief Called with each chunk coordinate before its offset is returned */
    void setOffsetHook(std::function<void(const std::vector<std::size_t>&)> hook)
    {
        hook_ = std::move(hook);
    }

    std::uint64_t offsetLookups() const noexcept { return offsetLookups_.load(); }
    std::uint64_t genericReads() const noexcept { return genericReads_.load(); }

private:
    std::uint64_t append(const std::vector<std::uint8_t>& bytes);

    NDArray data_;
    DatasetDescriptor desc_;
    std::map<std::vector<std::size_t>, std::uint64_t> offsets_;
    std::function<void(const std::vector<std::size_t>&)> hook_;
    mutable std::mutex mutex_;
    mutable std::atomic<std::uint64_t> offsetLookups_{0};
    mutable std::atomic<std::uint64_t> genericReads_{0};
};

}  // namespace b2h5::testing
