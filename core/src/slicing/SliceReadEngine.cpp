#include "b2h5/core/slicing/SliceReadEngine.hpp"

#include <atomic>
#include <cstdint>
#include <exception>
#include <stdexcept>
#include <utility>

#include "b2h5/core/slicing/Errors.hpp"
#include "b2h5/core/slicing/ResultAssembler.hpp"
#include "b2h5/core/slicing/SliceDecomposer.hpp"
#include "b2h5/core/util/Logging.hpp"

namespace b2h5
{

// --- SliceReadEngine ---

SliceReadEngine::SliceReadEngine(EngineConfig config) : config_(config)
{
}

EligibilityResult SliceReadEngine::checkEligible(
    const IDatasetSource& source, const SliceExpr& expr) const
{
    return b2h5::checkEligible(source.descriptor(), expr);
}

EligibilityResult SliceReadEngine::checkEligible(
    const IDatasetSource& source,
    const SliceExpr& expr,
    const std::optional<Ineligible>& datasetVerdict) const
{
    return b2h5::checkEligible(source.descriptor(), expr, datasetVerdict);
}

SliceResult SliceReadEngine::readSelection(
    const IDatasetSource& source,
    const Selection& selection,
    const std::optional<ElementType>& type,
    std::stop_token stop) const
{
    const auto& desc = source.descriptor();
    const ElementType outType = type.value_or(desc.dtype);
    if (!canConvert(desc.dtype, outType)) {
        throw std::invalid_argument(
            "SliceReadEngine: cannot read " + dtypeToString(desc.dtype) +
            " data as " + dtypeToString(outType));
    }

    if (selection.isEmpty()) {
        return ResultAssembler::empty(selection, outType);
    }

    SliceDecomposer decomposer(desc, selection);
    ResultAssembler assembler(selection, outType);

    auto process = [&](const WorkItem& item) {
        const auto offset = source.chunkByteOffset(item.chunkCoord);
        auto part = reader_.read(desc.path, offset, item.chunkBox, desc.dtype);
        ChunkPayloadReader::validate(part, desc.dtype, item.chunkBox, item.chunkCoord, offset);
        assembler.place(item, part);
        chunksRead_.fetch_add(1, std::memory_order_relaxed);
    };

    if (config_.numThreads <= 1) {
        for (const auto& item : decomposer) {
            if (stop.stop_requested()) {
                throw ReadCancelled();
            }
            process(item);
        }
    } else {
        const auto items = decomposer.collect();
        const auto n = static_cast<std::int64_t>(items.size());
        std::exception_ptr firstError;
        std::atomic<bool> failed{false};

        // Output boxes are disjoint, so parts are placed without locking
        #pragma omp parallel for schedule(dynamic, 1) num_threads(config_.numThreads)
        for (std::int64_t i = 0; i < n; ++i) {
            if (failed.load(std::memory_order_relaxed)) {
                continue;
            }
            try {
                if (stop.stop_requested()) {
                    throw ReadCancelled();
                }
                process(items[static_cast<std::size_t>(i)]);
            } catch (...) {
                #pragma omp critical(b2h5_read_error)
                {
                    if (!firstError) {
                        firstError = std::current_exception();
                    }
                }
                failed.store(true, std::memory_order_relaxed);
            }
        }

        if (firstError) {
            std::rethrow_exception(firstError);
        }
    }

    Logger()->trace(
        "chunk-direct read of {} at {} done",
        shapeToString(selection.count), shapeToString(selection.start));
    return std::move(assembler).finish();
}

std::variant<SliceResult, Ineligible> SliceReadEngine::tryRead(
    const IDatasetSource& source,
    const SliceExpr& expr,
    const std::optional<ElementType>& type,
    std::stop_token stop) const
{
    auto verdict = checkEligible(source, expr);
    if (auto* no = std::get_if<Ineligible>(&verdict)) {
        return *no;
    }
    return readSelection(
        source, std::get<Eligible>(verdict).selection, type, std::move(stop));
}

// --- B2Dataset ---

B2Dataset::B2Dataset(std::shared_ptr<IDatasetSource> source, EngineConfig config)
    : source_(std::move(source)), engine_(config)
{
    if (!source_) {
        throw std::invalid_argument("B2Dataset: null dataset source");
    }
}

const std::optional<Ineligible>& B2Dataset::datasetVerdict() const
{
    std::call_once(verdictOnce_, [this]() {
        verdict_ = checkDatasetEligible(source_->descriptor());
        if (verdict_) {
            Logger()->debug(
                "dataset {} not eligible for chunk-direct slicing: {}",
                source_->descriptor().path.string(), toString(verdict_->reason));
        }
    });
    return verdict_;
}

bool B2Dataset::isFastAccess() const
{
    return !forceGenericPath() && !datasetVerdict().has_value();
}

EligibilityResult B2Dataset::checkEligible(const SliceExpr& expr) const
{
    return engine_.checkEligible(*source_, expr, datasetVerdict());
}

SliceResult B2Dataset::read(
    const SliceExpr& expr,
    const std::optional<ElementType>& type,
    std::stop_token stop) const
{
    auto verdict = checkEligible(expr);
    if (auto* ok = std::get_if<Eligible>(&verdict)) {
        auto result = engine_.readSelection(*source_, ok->selection, type, std::move(stop));
        optimizedReads_.fetch_add(1, std::memory_order_relaxed);
        return result;
    }

    const auto& no = std::get<Ineligible>(verdict);
    Logger()->debug(
        "generic read of {}: {} ({})", toString(expr), toString(no.reason), no.message);

    const auto& desc = source_->descriptor();
    auto selection = normalizeSelection(desc.shape, expr);
    if (stop.stop_requested()) {
        throw ReadCancelled();
    }
    auto buffer = source_->readGeneric(selection, type.value_or(desc.dtype));
    fallbackReads_.fetch_add(1, std::memory_order_relaxed);
    return ResultAssembler::reshape(std::move(buffer), selection);
}

B2Dataset::Stats B2Dataset::stats() const
{
    Stats s;
    s.optimizedReads = optimizedReads_.load();
    s.fallbackReads = fallbackReads_.load();
    // Base first, so a concurrent reset cannot push it past the total
    const auto base = chunksReadBase_.load();
    s.chunksRead = engine_.chunksRead() - base;
    return s;
}

void B2Dataset::resetStats()
{
    optimizedReads_.store(0);
    fallbackReads_.store(0);
    chunksReadBase_.store(engine_.chunksRead());
}

}  // namespace b2h5
