#include "b2h5/testing/Fixtures.hpp"

#include <b2nd.h>
#include <blosc2.h>

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <random>
#include <stdexcept>

#include "b2h5/core/slicing/ChunkPayloadReader.hpp"
#include "b2h5/core/slicing/Errors.hpp"

namespace fs = std::filesystem;

namespace b2h5::testing
{

// --- TempDir ---

TempDir::TempDir()
{
    std::random_device rd;
    std::uniform_int_distribution<std::uint64_t> dist;
    for (int attempt = 0; attempt < 16; ++attempt) {
        auto candidate =
            fs::temp_directory_path() / ("b2h5-test-" + std::to_string(dist(rd)));
        if (fs::create_directory(candidate)) {
            path_ = candidate;
            return;
        }
    }
    throw std::runtime_error("TempDir: cannot create a temporary directory");
}

TempDir::~TempDir()
{
    std::error_code ec;
    fs::remove_all(path_, ec);
}

// --- b2nd encoding ---

std::vector<std::uint8_t> encodeB2nd(
    const NDArray& array, const char* dtype, const nlohmann::json& codec)
{
    ChunkPayloadReader::initBlosc();

    const std::string cname = codec.value("cname", std::string("zstd"));
    blosc2_cparams cparams = BLOSC2_CPARAMS_DEFAULTS;
    cparams.typesize = static_cast<int32_t>(array.type().size);
    cparams.compcode = blosc2_compname_to_compcode(cname.c_str());
    cparams.clevel = codec.value("clevel", 5);
    cparams.nthreads = 1;
    blosc2_dparams dparams = BLOSC2_DPARAMS_DEFAULTS;
    dparams.nthreads = 1;

    blosc2_storage storage = BLOSC2_STORAGE_DEFAULTS;
    storage.contiguous = true;
    storage.cparams = &cparams;
    storage.dparams = &dparams;

    const auto rank = array.ndim();
    std::vector<int64_t> shape(array.shape().begin(), array.shape().end());
    std::vector<int32_t> inner(rank);
    for (std::size_t i = 0; i < rank; ++i) {
        inner[i] = static_cast<int32_t>(std::max<std::size_t>(array.shape()[i], 1));
    }

    std::string dtypeBuf = dtype != nullptr ? dtype : "";
    b2nd_context_t* ctx = b2nd_create_ctx(
        &storage,
        static_cast<int8_t>(rank),
        shape.data(),
        inner.data(),
        inner.data(),
        dtype != nullptr ? dtypeBuf.data() : nullptr,
        0,
        nullptr,
        0);
    if (ctx == nullptr) {
        throw std::runtime_error("encodeB2nd: cannot create b2nd context");
    }

    b2nd_array_t* b2 = nullptr;
    int rc = b2nd_from_cbuffer(ctx, &b2, array.data(), static_cast<int64_t>(array.nbytes()));
    b2nd_free_ctx(ctx);
    if (rc < 0) {
        throw std::runtime_error(
            std::string("encodeB2nd: b2nd_from_cbuffer failed: ") + print_error(rc));
    }

    std::uint8_t* frame = nullptr;
    int64_t frameLen = 0;
    bool needsFree = false;
    rc = b2nd_to_cframe(b2, &frame, &frameLen, &needsFree);
    if (rc < 0) {
        b2nd_free(b2);
        throw std::runtime_error(
            std::string("encodeB2nd: b2nd_to_cframe failed: ") + print_error(rc));
    }
    std::vector<std::uint8_t> out(frame, frame + frameLen);
    if (needsFree) {
        std::free(frame);
    }
    b2nd_free(b2);
    return out;
}

std::string payloadDtype(const ElementType& type)
{
    return dtypeToString(type);
}

// --- chunk grid ---

std::vector<std::vector<std::size_t>> chunkOrigins(
    const std::vector<std::size_t>& shape, const std::vector<std::size_t>& chunkShape)
{
    std::vector<std::vector<std::size_t>> origins;
    const auto rank = shape.size();
    if (rank == 0 || chunkShape.size() != rank ||
        std::find(shape.begin(), shape.end(), 0) != shape.end() ||
        std::find(chunkShape.begin(), chunkShape.end(), 0) != chunkShape.end()) {
        return origins;
    }

    std::vector<std::size_t> origin(rank, 0);
    while (true) {
        origins.push_back(origin);
        std::size_t axis = rank;
        while (axis > 0) {
            --axis;
            origin[axis] += chunkShape[axis];
            if (origin[axis] < shape[axis]) {
                break;
            }
            origin[axis] = 0;
            if (axis == 0) {
                return origins;
            }
        }
    }
}

NDArray extractChunk(
    const NDArray& data,
    const std::vector<std::size_t>& origin,
    const std::vector<std::size_t>& chunkShape,
    bool trim)
{
    const auto rank = data.ndim();
    std::vector<std::size_t> extent(rank), payloadShape(rank);
    for (std::size_t i = 0; i < rank; ++i) {
        extent[i] = std::min(chunkShape[i], data.shape()[i] - origin[i]);
        payloadShape[i] = trim ? extent[i] : chunkShape[i];
    }
    NDArray chunk(data.type(), payloadShape);
    copyRegion(
        data.data(), data.type(), data.shape(), origin,
        chunk.data(), chunk.type(), payloadShape,
        std::vector<std::size_t>(rank, 0), extent);
    return chunk;
}

// --- MemoryDataset ---

MemoryDataset::MemoryDataset(
    const fs::path& file, NDArray data, std::vector<std::size_t> chunkShape, Options options)
    : data_(std::move(data))
{
    desc_.shape = options.extent == ExtentType::Simple ? data_.shape()
                                                       : std::vector<std::size_t>{};
    desc_.chunkShape = std::move(chunkShape);
    desc_.extent = options.extent;
    desc_.dtype = data_.type();
    desc_.filters = options.filters;
    desc_.path = file;
    desc_.mode = options.mode;

    {
        std::ofstream out(file, std::ios::binary | std::ios::trunc);
        // Leading bytes so no payload starts at offset 0
        out.write("B2H5TEST", 8);
        if (!out) {
            throw std::runtime_error("MemoryDataset: cannot write " + file.string());
        }
    }

    const auto& shape = desc_.shape;
    const auto rank = shape.size();
    if (!desc_.chunked() || rank == 0 || desc_.chunkShape.size() != rank ||
        std::find(shape.begin(), shape.end(), 0) != shape.end()) {
        return;
    }

    std::string dtypeStr = options.payloadDtype.value_or(payloadDtype(desc_.dtype));
    const char* dtype = dtypeStr.empty() ? nullptr : dtypeStr.c_str();

    for (const auto& origin : chunkOrigins(shape, desc_.chunkShape)) {
        auto chunk = extractChunk(data_, origin, desc_.chunkShape, options.trimEdgeChunks);
        offsets_[origin] = append(encodeB2nd(chunk, dtype, options.codec));
    }
}

std::uint64_t MemoryDataset::append(const std::vector<std::uint8_t>& bytes)
{
    std::lock_guard<std::mutex> lock(mutex_);
    const auto offset = static_cast<std::uint64_t>(fs::file_size(desc_.path));
    std::ofstream out(desc_.path, std::ios::binary | std::ios::app);
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!out) {
        throw std::runtime_error("MemoryDataset: cannot append to " + desc_.path.string());
    }
    return offset;
}

void MemoryDataset::replaceChunk(
    const std::vector<std::size_t>& chunkCoord, const NDArray& payload, const char* dtype)
{
    replaceChunkBytes(chunkCoord, encodeB2nd(payload, dtype));
}

void MemoryDataset::replaceChunkBytes(
    const std::vector<std::size_t>& chunkCoord, const std::vector<std::uint8_t>& bytes)
{
    auto offset = append(bytes);
    std::lock_guard<std::mutex> lock(mutex_);
    offsets_[chunkCoord] = offset;
}

std::uint64_t MemoryDataset::chunkByteOffset(const std::vector<std::size_t>& chunkCoord) const
{
    offsetLookups_.fetch_add(1);
    if (hook_) {
        hook_(chunkCoord);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = offsets_.find(chunkCoord);
    if (it == offsets_.end()) {
        throw StorageError(
            "MemoryDataset: no chunk stored at " + shapeToString(chunkCoord));
    }
    return it->second;
}

NDArray MemoryDataset::readGeneric(const Selection& selection, const ElementType& type) const
{
    genericReads_.fetch_add(1);
    if (!canConvert(data_.type(), type)) {
        throw std::invalid_argument(
            "MemoryDataset: cannot read " + dtypeToString(data_.type()) + " as " +
            dtypeToString(type));
    }

    NDArray out(type, selection.count);
    if (selection.isEmpty()) {
        return out;
    }
    const auto rank = selection.rank();
    if (rank == 0) {
        convertElements(data_.data(), data_.type(), out.data(), type, 1);
        return out;
    }

    const auto strides = data_.strides();
    const auto srcSize = data_.type().size;
    std::vector<std::size_t> pos(rank, 0);
    std::uint8_t* dst = out.data();
    for (std::size_t n = 0; n < out.size(); ++n) {
        std::size_t src = 0;
        for (std::size_t i = 0; i < rank; ++i) {
            src += (selection.start[i] + pos[i] * selection.step[i]) * strides[i];
        }
        convertElements(data_.data() + src * srcSize, data_.type(), dst, type, 1);
        dst += type.size;

        for (std::size_t axis = rank; axis > 0; --axis) {
            if (++pos[axis - 1] < selection.count[axis - 1]) {
                break;
            }
            pos[axis - 1] = 0;
        }
    }
    return out;
}

}  // namespace b2h5::testing
