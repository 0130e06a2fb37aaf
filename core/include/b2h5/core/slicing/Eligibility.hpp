#pragma once

#include <optional>
#include <string>
#include <variant>

#include "b2h5/core/types/DatasetSource.hpp"
#include "b2h5/core/types/Selection.hpp"

namespace b2h5
{

enum class IneligibleReason {
    DisabledByConfig,
    UnsupportedDatasetLayout,
    UnsupportedCodec,
    ForeignByteOrder,
    PlatformLockConflict,
    NonUnitStepSelection
};

/** @brief Stable identifier, e.g. "non-unit-step-selection" */
std::string toString(IneligibleReason reason);

/** @brief The chunk-direct path may be used with this selection */
struct Eligible {
    Selection selection;
};

/** @brief The chunk-direct path may not be used; read generically instead */
struct Ineligible {
    IneligibleReason reason;
    std::string message;
};

using EligibilityResult = std::variant<Eligible, Ineligible>;

/**
 * @brief Dataset-level checks (layout, chunking, codec, byte order, lock).
 *
 * Depends only on immutable dataset metadata, so the result may be cached
 * for the lifetime of the open dataset. Does not consult the global
 * configuration flag.
 */
std::optional<Ineligible> checkDatasetEligible(const DatasetDescriptor& desc);

/** @brief Selection-level check (unit step on every axis) */
std::optional<Ineligible> checkSelectionEligible(const Selection& selection);

/**
 * @brief All checks, in order: configuration, dataset, selection.
 *
 * @throws std::out_of_range, std::invalid_argument if @p expr does not
 *         normalize against the dataset shape
 */
EligibilityResult checkEligible(const DatasetDescriptor& desc, const SliceExpr& expr);

/**
 * @brief As above, reusing a cached result of checkDatasetEligible()
 */
EligibilityResult checkEligible(
    const DatasetDescriptor& desc,
    const SliceExpr& expr,
    const std::optional<Ineligible>& datasetVerdict);

}  // namespace b2h5
