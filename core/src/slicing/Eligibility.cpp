#include "b2h5/core/slicing/Eligibility.hpp"

#include <algorithm>

#include "b2h5/core/util/Config.hpp"

namespace b2h5
{

std::string toString(IneligibleReason reason)
{
    switch (reason) {
        case IneligibleReason::DisabledByConfig:
            return "disabled-by-config";
        case IneligibleReason::UnsupportedDatasetLayout:
            return "unsupported-dataset-layout";
        case IneligibleReason::UnsupportedCodec:
            return "unsupported-codec";
        case IneligibleReason::ForeignByteOrder:
            return "foreign-byte-order";
        case IneligibleReason::PlatformLockConflict:
            return "platform-lock-conflict";
        case IneligibleReason::NonUnitStepSelection:
            return "non-unit-step-selection";
    }
    return "unknown";
}

std::optional<Ineligible> checkDatasetEligible(const DatasetDescriptor& desc)
{
    if (desc.extent != ExtentType::Simple) {
        return Ineligible{
            IneligibleReason::UnsupportedDatasetLayout,
            "dataset extent is scalar or null"};
    }
    if (!desc.chunked() || desc.chunkShape.size() != desc.rank()) {
        return Ineligible{
            IneligibleReason::UnsupportedDatasetLayout, "dataset is not chunked"};
    }
    // Compression-parameter metadata is unreliable with plugin filters;
    // only the filter id is trusted.
    if (std::find(desc.filters.begin(), desc.filters.end(), kBlosc2FilterId) ==
        desc.filters.end()) {
        return Ineligible{
            IneligibleReason::UnsupportedCodec,
            "dataset is not compressed with Blosc2 (filter " +
                std::to_string(kBlosc2FilterId) + ")"};
    }
    if (!desc.dtype.nativeOrder) {
        return Ineligible{
            IneligibleReason::ForeignByteOrder,
            "dataset element type " + dtypeToString(desc.dtype) +
                " is not in native byte order"};
    }
#ifdef _WIN32
    // Reopening the file by path conflicts with the writer's exclusive lock
    if (desc.mode != OpenMode::ReadOnly) {
        return Ineligible{
            IneligibleReason::PlatformLockConflict,
            "file is open for writing and the platform locks it exclusively"};
    }
#endif
    return std::nullopt;
}

std::optional<Ineligible> checkSelectionEligible(const Selection& selection)
{
    if (!selection.unitStep()) {
        return Ineligible{
            IneligibleReason::NonUnitStepSelection,
            "selection has a step other than 1"};
    }
    return std::nullopt;
}

EligibilityResult checkEligible(const DatasetDescriptor& desc, const SliceExpr& expr)
{
    return checkEligible(desc, expr, checkDatasetEligible(desc));
}

EligibilityResult checkEligible(
    const DatasetDescriptor& desc,
    const SliceExpr& expr,
    const std::optional<Ineligible>& datasetVerdict)
{
    if (forceGenericPath()) {
        return Ineligible{
            IneligibleReason::DisabledByConfig,
            "chunk-direct slicing disabled by configuration"};
    }
    if (datasetVerdict) {
        return *datasetVerdict;
    }

    auto selection = normalizeSelection(desc.shape, expr);
    if (auto bad = checkSelectionEligible(selection)) {
        return *bad;
    }
    return Eligible{std::move(selection)};
}

}  // namespace b2h5
