#include "b2h5/core/types/NDArray.hpp"

#include <string>
#include <utility>

namespace b2h5
{

std::size_t shapeProduct(const std::vector<std::size_t>& shape) noexcept
{
    std::size_t n = 1;
    for (auto s : shape) {
        n *= s;
    }
    return n;
}

std::string shapeToString(const std::vector<std::size_t>& shape)
{
    std::string s = "(";
    for (std::size_t i = 0; i < shape.size(); ++i) {
        if (i > 0) {
            s += ", ";
        }
        s += std::to_string(shape[i]);
    }
    if (shape.size() == 1) {
        s += ",";
    }
    return s + ")";
}

// --- NDArray ---

NDArray::NDArray(const ElementType& type, shape_type shape)
    : type_(type), shape_(std::move(shape))
{
    data_.resize(shapeProduct(shape_) * type_.size);
}

NDArray::NDArray(
    const ElementType& type, shape_type shape, std::vector<std::uint8_t> bytes)
    : type_(type), shape_(std::move(shape)), data_(std::move(bytes))
{
    if (data_.size() != shapeProduct(shape_) * type_.size) {
        throw std::invalid_argument(
            "NDArray: buffer of " + std::to_string(data_.size()) +
            " bytes does not hold " + std::to_string(shapeProduct(shape_)) +
            " elements of " + std::to_string(type_.size) + " bytes");
    }
}

NDArray::size_type NDArray::size() const noexcept
{
    return shapeProduct(shape_);
}

NDArray::shape_type NDArray::strides() const
{
    shape_type s(shape_.size(), 1);
    for (std::size_t i = shape_.size(); i > 1; --i) {
        s[i - 2] = s[i - 1] * shape_[i - 1];
    }
    return s;
}

void NDArray::reshape(const shape_type& shape)
{
    if (shapeProduct(shape) != size()) {
        throw std::invalid_argument("NDArray::reshape: element count differs");
    }
    shape_ = shape;
}

NDArray::size_type NDArray::linearIndex(const shape_type& index) const
{
    if (index.size() != shape_.size()) {
        throw std::out_of_range("NDArray: index rank does not match array rank");
    }
    size_type linear = 0;
    for (std::size_t i = 0; i < index.size(); ++i) {
        if (index[i] >= shape_[i]) {
            throw std::out_of_range(
                "NDArray: index " + std::to_string(index[i]) +
                " out of range for axis " + std::to_string(i));
        }
        linear = linear * shape_[i] + index[i];
    }
    return linear;
}

// --- Scalar ---

Scalar::Scalar(const ElementType& type, std::vector<std::uint8_t> bytes)
    : type_(type), bytes_(std::move(bytes))
{
    if (bytes_.size() != type_.size) {
        throw std::invalid_argument("Scalar: byte count does not match element size");
    }
}

// --- copyRegion ---

void copyRegion(
    const std::uint8_t* src,
    const ElementType& srcType,
    const std::vector<std::size_t>& srcShape,
    const std::vector<std::size_t>& srcStart,
    std::uint8_t* dst,
    const ElementType& dstType,
    const std::vector<std::size_t>& dstShape,
    const std::vector<std::size_t>& dstStart,
    const std::vector<std::size_t>& extent)
{
    const std::size_t rank = extent.size();
    if (srcShape.size() != rank || srcStart.size() != rank ||
        dstShape.size() != rank || dstStart.size() != rank) {
        throw std::invalid_argument("copyRegion: rank mismatch");
    }
    if (rank == 0) {
        convertElements(src, srcType, dst, dstType, 1);
        return;
    }
    for (auto e : extent) {
        if (e == 0) {
            return;
        }
    }

    // Offsets of the innermost run start, in elements
    auto offsetOf = [rank](const std::vector<std::size_t>& shape,
                           const std::vector<std::size_t>& start,
                           const std::vector<std::size_t>& pos) {
        std::size_t linear = 0;
        for (std::size_t i = 0; i < rank; ++i) {
            linear = linear * shape[i] + start[i] + pos[i];
        }
        return linear;
    };

    const std::size_t run = extent[rank - 1];
    std::vector<std::size_t> pos(rank, 0);
    while (true) {
        convertElements(
            src + offsetOf(srcShape, srcStart, pos) * srcType.size,
            srcType,
            dst + offsetOf(dstShape, dstStart, pos) * dstType.size,
            dstType,
            run);

        // Advance the odometer over all axes but the last
        std::size_t axis = rank - 1;
        while (axis > 0) {
            --axis;
            if (++pos[axis] < extent[axis]) {
                break;
            }
            pos[axis] = 0;
            if (axis == 0) {
                return;
            }
        }
        if (rank == 1) {
            return;
        }
    }
}

}  // namespace b2h5
