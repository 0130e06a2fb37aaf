#include "b2h5/core/slicing/ChunkPayloadReader.hpp"

#include <b2nd.h>
#include <blosc2.h>

#include <algorithm>
#include <cstring>
#include <memory>
#include <mutex>
#include <string>

#include "b2h5/core/slicing/Errors.hpp"
#include "b2h5/core/types/NDArray.hpp"
#include "b2h5/core/util/Logging.hpp"

namespace b2h5
{

namespace
{
std::once_flag bloscInitFlag;

struct B2ndArrayDeleter {
    void operator()(b2nd_array_t* array) const noexcept { b2nd_free(array); }
};
using B2ndArrayPtr = std::unique_ptr<b2nd_array_t, B2ndArrayDeleter>;

std::string where(const std::filesystem::path& path, std::uint64_t offset)
{
    return path.string() + " @ " + std::to_string(offset);
}

// The element type the payload records, or an opaque item when it records
// none (the b2nd default dtype is a placeholder, not a description)
ElementType recordedType(const b2nd_array_t* array)
{
    const auto itemsize = static_cast<std::size_t>(array->sc->typesize);
    if (array->dtype == nullptr || array->dtype_format != 0 ||
        std::strcmp(array->dtype, B2ND_DEFAULT_DTYPE) == 0) {
        return ElementType::opaque(itemsize);
    }
    auto t = dtypeFromString(array->dtype);
    if (!t.valid() || t.size != itemsize) {
        return ElementType::opaque(itemsize);
    }
    return t;
}
}  // namespace

void ChunkPayloadReader::initBlosc()
{
    std::call_once(bloscInitFlag, []() { blosc2_init(); });
}

ChunkPayloadReader::ChunkPayloadReader()
{
    initBlosc();
}

ChunkSlice ChunkPayloadReader::read(
    const std::filesystem::path& path,
    std::uint64_t byteOffset,
    const Box& chunkBox,
    const ElementType& datasetType) const
{
    b2nd_array_t* raw = nullptr;
    int rc = b2nd_open_offset(
        path.string().c_str(), &raw, static_cast<std::int64_t>(byteOffset));
    if (rc < 0 || raw == nullptr) {
        throw StorageError(
            "ChunkPayloadReader: cannot open b2nd frame at " +
            where(path, byteOffset) + ": " + print_error(rc));
    }
    B2ndArrayPtr array(raw);

    const std::size_t rank = chunkBox.start.size();
    if (static_cast<std::size_t>(array->ndim) != rank) {
        throw DataIntegrityError(
            "ChunkPayloadReader: payload at " + where(path, byteOffset) +
            " has rank " + std::to_string(array->ndim) + ", expected " +
            std::to_string(rank));
    }

    // Clip the request to the payload extent; a short result is rejected
    // when it is placed into the output.
    std::vector<std::int64_t> start(rank), stop(rank), bufShape(rank);
    ChunkSlice slice;
    slice.type = recordedType(array.get());
    slice.shape.resize(rank);
    bool nothing = false;
    for (std::size_t i = 0; i < rank; ++i) {
        const auto extent = array->shape[i];
        start[i] = std::min<std::int64_t>(
            static_cast<std::int64_t>(chunkBox.start[i]), extent);
        stop[i] = std::min<std::int64_t>(
            static_cast<std::int64_t>(chunkBox.start[i] + chunkBox.shape[i]), extent);
        bufShape[i] = stop[i] - start[i];
        slice.shape[i] = static_cast<std::size_t>(bufShape[i]);
        nothing = nothing || bufShape[i] == 0;
    }

    slice.bytes.resize(shapeProduct(slice.shape) * slice.type.size);
    if (!nothing) {
        rc = b2nd_get_slice_cbuffer(
            array.get(),
            start.data(),
            stop.data(),
            slice.bytes.data(),
            bufShape.data(),
            static_cast<std::int64_t>(slice.bytes.size()));
        if (rc < 0) {
            throw StorageError(
                "ChunkPayloadReader: cannot decompress region of " +
                where(path, byteOffset) + ": " + print_error(rc));
        }
    }

    Logger()->trace(
        "read {} of chunk payload {} ({} bytes)",
        shapeToString(slice.shape), where(path, byteOffset), slice.bytes.size());

    return reinterpret(std::move(slice), datasetType);
}

ChunkSlice ChunkPayloadReader::reinterpret(ChunkSlice slice, const ElementType& target)
{
    if (!slice.type.isOpaque()) {
        return slice;
    }
    if (target.size == 0 || slice.bytes.size() % target.size != 0) {
        throw SizeMismatchError(
            "ChunkPayloadReader: opaque payload of " +
            std::to_string(slice.bytes.size()) +
            " bytes is not a whole number of " + std::to_string(target.size) +
            "-byte elements");
    }
    const std::size_t elements = slice.bytes.size() / target.size;
    if (elements != shapeProduct(slice.shape)) {
        throw DataIntegrityError(
            "ChunkPayloadReader: opaque payload items of " +
            std::to_string(slice.type.size) + " bytes do not match " +
            std::to_string(target.size) + "-byte dataset elements");
    }
    slice.type = target;
    return slice;
}

void ChunkPayloadReader::validate(
    const ChunkSlice& slice,
    const ElementType& datasetType,
    const Box& chunkBox,
    const std::vector<std::size_t>& chunkCoord,
    std::uint64_t byteOffset)
{
    bool bad = slice.type != datasetType ||
               slice.shape.size() != chunkBox.shape.size();
    for (std::size_t i = 0; !bad && i < slice.shape.size(); ++i) {
        bad = slice.shape[i] > chunkBox.shape[i];
    }
    if (bad) {
        auto msg = "Invalid shape/dtype of chunk covering coordinate " +
                   shapeToString(chunkCoord) + " (offset " +
                   std::to_string(byteOffset) + "): expected <= " +
                   shapeToString(chunkBox.shape) + "/" +
                   dtypeToString(datasetType) + ", got " +
                   shapeToString(slice.shape) + "/" + dtypeToString(slice.type);
        Logger()->error("{}", msg);
        throw DataIntegrityError(msg);
    }
}

}  // namespace b2h5
