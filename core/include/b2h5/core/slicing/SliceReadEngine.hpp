#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <variant>

#include "b2h5/core/slicing/ChunkPayloadReader.hpp"
#include "b2h5/core/slicing/Eligibility.hpp"
#include "b2h5/core/types/DatasetSource.hpp"
#include "b2h5/core/types/NDArray.hpp"
#include "b2h5/core/types/Selection.hpp"
#include "b2h5/core/util/Config.hpp"

namespace b2h5
{

/**
 * @brief Chunk-direct slice reading for Blosc2-compressed datasets.
 *
 * One read runs Check -> Decompose -> Read x N -> Assemble -> Reshape.
 * Ineligibility is returned as a value; integrity and storage failures
 * are thrown and abort the read without producing a result.
 */
class SliceReadEngine
{
public:
    explicit SliceReadEngine(EngineConfig config = {});

    SliceReadEngine(const SliceReadEngine&) = delete;
    SliceReadEngine& operator=(const SliceReadEngine&) = delete;

    const EngineConfig& config() const noexcept { return config_; }

    /** @brief Run every eligibility check for @p expr on @p source */
    EligibilityResult checkEligible(
        const IDatasetSource& source, const SliceExpr& expr) const;

    /** @brief As above, with a cached dataset-level verdict */
    EligibilityResult checkEligible(
        const IDatasetSource& source,
        const SliceExpr& expr,
        const std::optional<Ineligible>& datasetVerdict) const;

    /**
     * @brief Read an eligible selection chunk by chunk
     *
     * The caller must have established eligibility. With more than one
     * configured thread, chunks are read and placed in parallel.
     *
     * @param type Result element type; the dataset type if unset
     * @param stop Requests cooperative cancellation
     * @throws ReadCancelled if @p stop was triggered
     * @throws DataIntegrityError, SizeMismatchError, StorageError
     */
    SliceResult readSelection(
        const IDatasetSource& source,
        const Selection& selection,
        const std::optional<ElementType>& type = std::nullopt,
        std::stop_token stop = {}) const;

    /**
     * @brief Check, then read; returns the Ineligible verdict instead of
     *        reading when the chunk-direct path does not apply
     */
    std::variant<SliceResult, Ineligible> tryRead(
        const IDatasetSource& source,
        const SliceExpr& expr,
        const std::optional<ElementType>& type = std::nullopt,
        std::stop_token stop = {}) const;

    /** @brief Chunk payloads read since construction */
    std::uint64_t chunksRead() const noexcept { return chunksRead_.load(); }

private:
    EngineConfig config_;
    ChunkPayloadReader reader_;
    mutable std::atomic<std::uint64_t> chunksRead_{0};
};

/**
 * @brief Dataset handle reading through the chunk-direct path when it can.
 *
 * Wraps any IDatasetSource. read() serves eligible requests with a
 * SliceReadEngine and everything else with the source's generic read;
 * both produce identical results. The dataset-level eligibility verdict
 * is computed once per handle.
 */
class B2Dataset
{
public:
    struct Stats {
        std::uint64_t optimizedReads{0};
        std::uint64_t fallbackReads{0};
        std::uint64_t chunksRead{0};
    };

    /** @brief Reads from a B2Dataset converting to another element type */
    class AsType
    {
    public:
        AsType(const B2Dataset& dataset, const ElementType& type)
            : dataset_(dataset), type_(type)
        {
        }

        const ElementType& type() const noexcept { return type_; }

        SliceResult read(const SliceExpr& expr, std::stop_token stop = {}) const
        {
            return dataset_.read(expr, type_, std::move(stop));
        }

    private:
        const B2Dataset& dataset_;
        ElementType type_;
    };

    explicit B2Dataset(std::shared_ptr<IDatasetSource> source, EngineConfig config = {});

    B2Dataset(const B2Dataset&) = delete;
    B2Dataset& operator=(const B2Dataset&) = delete;

    const IDatasetSource& source() const noexcept { return *source_; }
    const DatasetDescriptor& descriptor() const { return source_->descriptor(); }
    const std::vector<std::size_t>& shape() const { return descriptor().shape; }
    const std::vector<std::size_t>& chunks() const { return descriptor().chunkShape; }
    const ElementType& dtype() const { return descriptor().dtype; }

    /** @brief Whether whole-dataset reads currently take the chunk-direct path */
    bool isFastAccess() const;

    /** @brief Eligibility of @p expr, using the cached dataset verdict */
    EligibilityResult checkEligible(const SliceExpr& expr) const;

    /**
     * @brief Read a slice (array, or scalar when every axis is an index)
     * @param type Result element type; the dataset type if unset
     * @throws std::out_of_range, std::invalid_argument for bad expressions
     * @throws DataIntegrityError, SizeMismatchError, StorageError,
     *         ReadCancelled
     */
    SliceResult read(
        const SliceExpr& expr,
        const std::optional<ElementType>& type = std::nullopt,
        std::stop_token stop = {}) const;

    /** @brief A view converting results to @p type */
    AsType astype(const ElementType& type) const { return AsType(*this, type); }

    Stats stats() const;
    void resetStats();

private:
    const std::optional<Ineligible>& datasetVerdict() const;

    std::shared_ptr<IDatasetSource> source_;
    SliceReadEngine engine_;

    mutable std::once_flag verdictOnce_;
    mutable std::optional<Ineligible> verdict_;

    mutable std::atomic<std::uint64_t> optimizedReads_{0};
    mutable std::atomic<std::uint64_t> fallbackReads_{0};
    std::atomic<std::uint64_t> chunksReadBase_{0};
};

}  // namespace b2h5
