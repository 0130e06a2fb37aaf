#include "b2h5/core/h5/H5Dataset.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

#include "b2h5/core/slicing/Errors.hpp"
#include "b2h5/core/util/Logging.hpp"

namespace b2h5
{

namespace
{

hid_t nativeTypeId(Dtype dtype)
{
    switch (dtype) {
        case Dtype::Int8:
            return H5T_NATIVE_INT8;
        case Dtype::Int16:
            return H5T_NATIVE_INT16;
        case Dtype::Int32:
            return H5T_NATIVE_INT32;
        case Dtype::Int64:
            return H5T_NATIVE_INT64;
        case Dtype::UInt8:
            return H5T_NATIVE_UINT8;
        case Dtype::UInt16:
            return H5T_NATIVE_UINT16;
        case Dtype::UInt32:
            return H5T_NATIVE_UINT32;
        case Dtype::UInt64:
            return H5T_NATIVE_UINT64;
        case Dtype::Float32:
            return H5T_NATIVE_FLOAT;
        case Dtype::Float64:
            return H5T_NATIVE_DOUBLE;
        default:
            return H5I_INVALID_HID;
    }
}

Dtype integerDtype(std::size_t size, bool isSigned)
{
    switch (size) {
        case 1:
            return isSigned ? Dtype::Int8 : Dtype::UInt8;
        case 2:
            return isSigned ? Dtype::Int16 : Dtype::UInt16;
        case 4:
            return isSigned ? Dtype::Int32 : Dtype::UInt32;
        case 8:
            return isSigned ? Dtype::Int64 : Dtype::UInt64;
        default:
            return Dtype::Unknown;
    }
}

// Type part of a field signature for an HDF5 member type
std::string memberSignature(hid_t type, bool& native)
{
    if (H5Tget_class(type) == H5T_ARRAY) {
        const int ndims = H5Tget_array_ndims(type);
        std::vector<hsize_t> dims(ndims > 0 ? static_cast<std::size_t>(ndims) : 0);
        H5Tget_array_dims2(type, dims.data());
        std::string shape;
        for (auto d : dims) {
            shape += (shape.empty() ? "" : ",") + std::to_string(d);
        }
        H5Id base(H5Tget_super(type), H5Tclose);
        return memberSignature(base.get(), native) + "(" + shape + ")";
    }
    auto t = elementTypeFromH5(type);
    native = native && t.nativeOrder;
    return fieldSignature(t);
}

// Field signature of a compound type; clears @p native if any member is
// stored in foreign byte order
std::string compoundFields(hid_t type, bool& native)
{
    std::string fields;
    const int n = H5Tget_nmembers(type);
    for (int i = 0; i < n; ++i) {
        const auto index = static_cast<unsigned>(i);
        char* raw = H5Tget_member_name(type, index);
        std::string name = raw != nullptr ? raw : "";
        if (raw != nullptr) {
            H5free_memory(raw);
        }
        H5Id member(H5Tget_member_type(type, index), H5Tclose);
        fields += (fields.empty() ? "" : ";") + name + ":" +
                  std::to_string(H5Tget_member_offset(type, index)) + ":" +
                  memberSignature(member.get(), native);
    }
    return fields;
}

}  // namespace

ElementType elementTypeFromH5(hid_t type)
{
    const std::size_t size = H5Tget_size(type);
    ElementType t;
    switch (H5Tget_class(type)) {
        case H5T_INTEGER:
            t = ElementType::native(integerDtype(size, H5Tget_sign(type) == H5T_SGN_2));
            break;
        case H5T_FLOAT:
            t = ElementType::native(
                size == 4 ? Dtype::Float32 : size == 8 ? Dtype::Float64 : Dtype::Unknown);
            break;
        case H5T_COMPOUND: {
            bool native = true;
            t = ElementType::compound(size, compoundFields(type, native));
            t.nativeOrder = native;
            return t;
        }
        case H5T_OPAQUE:
            t = ElementType::opaque(size);
            break;
        default:
            t.size = size;
            return t;
    }
    if (!t.valid()) {
        t.size = size;
        return t;
    }

    const H5T_order_t order = H5Tget_order(type);
    t.nativeOrder = order == H5T_ORDER_NONE || order == H5Tget_order(H5T_NATIVE_INT);
    return t;
}

H5Dataset::H5Dataset(
    const std::filesystem::path& path, const std::string& datasetName, OpenMode mode)
    : name_(datasetName)
{
    const unsigned flags = mode == OpenMode::ReadWrite ? H5F_ACC_RDWR : H5F_ACC_RDONLY;
    file_ = H5Id(H5Fopen(path.string().c_str(), flags, H5P_DEFAULT), H5Fclose);
    if (!file_.valid()) {
        throw StorageError("H5Dataset: cannot open HDF5 file " + path.string());
    }
    dataset_ = H5Id(H5Dopen2(file_.get(), datasetName.c_str(), H5P_DEFAULT), H5Dclose);
    if (!dataset_.valid()) {
        throw StorageError(
            "H5Dataset: cannot open dataset " + datasetName + " in " + path.string());
    }

    desc_.path = path;
    desc_.mode = mode;
    loadDescriptor();

    Logger()->debug(
        "opened {}:{} shape {} chunks {} dtype {}",
        path.string(), datasetName, shapeToString(desc_.shape),
        shapeToString(desc_.chunkShape), dtypeToString(desc_.dtype));
}

void H5Dataset::loadDescriptor()
{
    H5Id space(H5Dget_space(dataset_.get()), H5Sclose);
    if (!space.valid()) {
        throw StorageError("H5Dataset: cannot get dataspace of " + name_);
    }
    switch (H5Sget_simple_extent_type(space.get())) {
        case H5S_SIMPLE:
            desc_.extent = ExtentType::Simple;
            break;
        case H5S_SCALAR:
            desc_.extent = ExtentType::Scalar;
            break;
        case H5S_NULL:
            desc_.extent = ExtentType::Null;
            break;
        default:
            throw StorageError("H5Dataset: unknown dataspace class for " + name_);
    }

    const int rank = H5Sget_simple_extent_ndims(space.get());
    if (rank < 0) {
        throw StorageError("H5Dataset: cannot get rank of " + name_);
    }
    std::vector<hsize_t> dims(static_cast<std::size_t>(rank));
    if (rank > 0 && H5Sget_simple_extent_dims(space.get(), dims.data(), nullptr) < 0) {
        throw StorageError("H5Dataset: cannot get extent of " + name_);
    }
    desc_.shape.assign(dims.begin(), dims.end());

    H5Id type(H5Dget_type(dataset_.get()), H5Tclose);
    if (!type.valid()) {
        throw StorageError("H5Dataset: cannot get datatype of " + name_);
    }
    desc_.dtype = elementTypeFromH5(type.get());

    H5Id dcpl(H5Dget_create_plist(dataset_.get()), H5Pclose);
    if (!dcpl.valid()) {
        throw StorageError("H5Dataset: cannot get creation properties of " + name_);
    }
    if (H5Pget_layout(dcpl.get()) == H5D_CHUNKED && rank > 0) {
        std::vector<hsize_t> chunk(static_cast<std::size_t>(rank));
        if (H5Pget_chunk(dcpl.get(), rank, chunk.data()) != rank) {
            throw StorageError("H5Dataset: cannot get chunk shape of " + name_);
        }
        desc_.chunkShape.assign(chunk.begin(), chunk.end());
    }

    const int nfilters = H5Pget_nfilters(dcpl.get());
    for (int i = 0; i < nfilters; ++i) {
        unsigned flags = 0;
        unsigned filterConfig = 0;
        std::size_t nelmts = 0;
        H5Z_filter_t id = H5Pget_filter2(
            dcpl.get(), static_cast<unsigned>(i), &flags, &nelmts, nullptr, 0,
            nullptr, &filterConfig);
        if (id < 0) {
            throw StorageError("H5Dataset: cannot get filter " + std::to_string(i) +
                               " of " + name_);
        }
        desc_.filters.push_back(static_cast<unsigned>(id));
    }
}

std::uint64_t H5Dataset::chunkByteOffset(const std::vector<std::size_t>& chunkCoord) const
{
    if (chunkCoord.size() != desc_.rank()) {
        throw std::invalid_argument(
            "H5Dataset: chunk coordinate " + shapeToString(chunkCoord) +
            " does not match rank of " + name_);
    }
    std::vector<hsize_t> offset(chunkCoord.begin(), chunkCoord.end());
    unsigned filterMask = 0;
    haddr_t addr = HADDR_UNDEF;
    hsize_t size = 0;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (H5Dget_chunk_info_by_coord(
                dataset_.get(), offset.data(), &filterMask, &addr, &size) < 0) {
            throw StorageError(
                "H5Dataset: cannot get chunk info at " + shapeToString(chunkCoord) +
                " in " + name_);
        }
    }

    if (addr == HADDR_UNDEF) {
        throw StorageError(
            "H5Dataset: chunk at " + shapeToString(chunkCoord) + " of " + name_ +
            " is not allocated");
    }
    auto pos = std::find(desc_.filters.begin(), desc_.filters.end(), kBlosc2FilterId);
    if (pos != desc_.filters.end() &&
        (filterMask & (1u << (pos - desc_.filters.begin()))) != 0) {
        throw DataIntegrityError(
            "H5Dataset: chunk at " + shapeToString(chunkCoord) + " of " + name_ +
            " was stored without its Blosc2 filter");
    }
    return static_cast<std::uint64_t>(addr);
}

H5Id H5Dataset::memoryType(const ElementType& type) const
{
    if (type.isNumeric()) {
        H5Id t(H5Tcopy(nativeTypeId(type.dtype)), H5Tclose);
        if (t.valid() && !type.nativeOrder) {
            const bool little = H5Tget_order(H5T_NATIVE_INT) == H5T_ORDER_LE;
            if (H5Tset_order(t.get(), little ? H5T_ORDER_BE : H5T_ORDER_LE) < 0) {
                throw StorageError("H5Dataset: cannot set byte order of memory type");
            }
        }
        return t;
    }
    if (type != desc_.dtype) {
        throw std::invalid_argument(
            "H5Dataset: cannot read " + dtypeToString(desc_.dtype) + " data as " +
            dtypeToString(type));
    }
    // Records and blobs are read with the file layout
    return H5Id(H5Dget_type(dataset_.get()), H5Tclose);
}

NDArray H5Dataset::readGeneric(const Selection& selection, const ElementType& type) const
{
    if (!canConvert(desc_.dtype, type)) {
        throw std::invalid_argument(
            "H5Dataset: cannot read " + dtypeToString(desc_.dtype) + " data as " +
            dtypeToString(type));
    }
    if (desc_.extent == ExtentType::Null) {
        throw StorageError("H5Dataset: " + name_ + " has a null dataspace");
    }
    if (selection.rank() != desc_.rank()) {
        throw std::invalid_argument(
            "H5Dataset: selection rank does not match " + name_);
    }

    NDArray out(type, selection.count);
    if (selection.isEmpty()) {
        return out;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    H5Id memType = memoryType(type);
    if (!memType.valid()) {
        throw StorageError("H5Dataset: no memory type for " + dtypeToString(type));
    }

    herr_t status = 0;
    if (desc_.rank() == 0) {
        status = H5Dread(
            dataset_.get(), memType.get(), H5S_ALL, H5S_ALL, H5P_DEFAULT, out.data());
    } else {
        const auto rank = static_cast<int>(desc_.rank());
        std::vector<hsize_t> start(selection.start.begin(), selection.start.end());
        std::vector<hsize_t> stride(selection.step.begin(), selection.step.end());
        std::vector<hsize_t> count(selection.count.begin(), selection.count.end());

        H5Id fileSpace(H5Dget_space(dataset_.get()), H5Sclose);
        H5Id memSpace(H5Screate_simple(rank, count.data(), nullptr), H5Sclose);
        if (!fileSpace.valid() || !memSpace.valid() ||
            H5Sselect_hyperslab(
                fileSpace.get(), H5S_SELECT_SET, start.data(), stride.data(),
                count.data(), nullptr) < 0) {
            throw StorageError("H5Dataset: cannot select hyperslab in " + name_);
        }
        status = H5Dread(
            dataset_.get(), memType.get(), memSpace.get(), fileSpace.get(),
            H5P_DEFAULT, out.data());
    }
    if (status < 0) {
        throw StorageError("H5Dataset: read from " + name_ + " failed");
    }
    return out;
}

std::size_t H5Dataset::numChunks() const
{
    if (!desc_.chunked()) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    hsize_t n = 0;
    if (H5Dget_num_chunks(dataset_.get(), H5S_ALL, &n) < 0) {
        throw StorageError("H5Dataset: cannot count chunks of " + name_);
    }
    return static_cast<std::size_t>(n);
}

}  // namespace b2h5
