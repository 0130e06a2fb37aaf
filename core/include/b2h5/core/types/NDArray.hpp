#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "b2h5/core/types/ElementType.hpp"

namespace b2h5
{

/**
 * @brief N-dimensional array with row-major (C) memory layout.
 *
 * Elements are stored as raw bytes described by an ElementType, so one
 * class covers numeric, compound and opaque data. Typed access checks that
 * the requested C++ type has the element's byte size.
 *
 * Memory layout: Row-major (last index varies fastest). A rank-0 array
 * holds exactly one element.
 */
class NDArray
{
public:
    using size_type = std::size_t;
    using shape_type = std::vector<size_type>;

    /** @brief Default constructor - creates an empty 1-D array of unknown type */
    NDArray() = default;

    /**
     * @brief Construct array with given type and shape
     * @param type Element type
     * @param shape Extent of each dimension
     */
    NDArray(const ElementType& type, shape_type shape);

    /**
     * @brief Construct array taking ownership of existing bytes
     * @throws std::invalid_argument if the byte count does not match
     */
    NDArray(const ElementType& type, shape_type shape, std::vector<std::uint8_t> bytes);

    NDArray(const NDArray& other) = default;
    NDArray(NDArray&& other) noexcept = default;
    NDArray& operator=(const NDArray& other) = default;
    NDArray& operator=(NDArray&& other) noexcept = default;
    ~NDArray() = default;

    const ElementType& type() const noexcept { return type_; }
    const shape_type& shape() const noexcept { return shape_; }
    size_type ndim() const noexcept { return shape_.size(); }

    /** @brief Number of elements (product of the shape) */
    size_type size() const noexcept;

    size_type nbytes() const noexcept { return data_.size(); }
    bool empty() const noexcept { return size() == 0; }

    /** @brief Row-major strides in elements */
    shape_type strides() const;

    std::uint8_t* data() noexcept { return data_.data(); }
    const std::uint8_t* data() const noexcept { return data_.data(); }

    template <typename T>
    T* dataAs()
    {
        checkElementSize(sizeof(T));
        return reinterpret_cast<T*>(data_.data());
    }

    template <typename T>
    const T* dataAs() const
    {
        checkElementSize(sizeof(T));
        return reinterpret_cast<const T*>(data_.data());
    }

    /** @brief Element access by multi-index */
    template <typename T>
    T at(const shape_type& index) const
    {
        checkElementSize(sizeof(T));
        T value;
        std::memcpy(&value, data_.data() + linearIndex(index) * type_.size, sizeof(T));
        return value;
    }

    /** @brief Copy of all elements as a flat vector */
    template <typename T>
    std::vector<T> toVector() const
    {
        checkElementSize(sizeof(T));
        std::vector<T> out(size());
        if (!out.empty()) {
            std::memcpy(out.data(), data_.data(), data_.size());
        }
        return out;
    }

    /**
     * @brief Change the shape without touching the data
     * @throws std::invalid_argument if the element count differs
     */
    void reshape(const shape_type& shape);

    /** @brief Linear element index of a multi-index (bounds checked) */
    size_type linearIndex(const shape_type& index) const;

    bool operator==(const NDArray& other) const noexcept
    {
        return type_ == other.type_ && shape_ == other.shape_ &&
               data_ == other.data_;
    }
    bool operator!=(const NDArray& other) const noexcept
    {
        return !(*this == other);
    }

    /** @brief Build an array from a typed vector */
    template <typename T>
    static NDArray fromVector(
        const std::vector<T>& values, shape_type shape, const ElementType& type)
    {
        if (type.size != sizeof(T)) {
            throw std::invalid_argument("NDArray::fromVector: element size mismatch");
        }
        std::vector<std::uint8_t> bytes(values.size() * sizeof(T));
        if (!bytes.empty()) {
            std::memcpy(bytes.data(), values.data(), bytes.size());
        }
        return NDArray(type, std::move(shape), std::move(bytes));
    }

private:
    ElementType type_;
    shape_type shape_{0};
    std::vector<std::uint8_t> data_;

    void checkElementSize(std::size_t size) const
    {
        if (size != type_.size) {
            throw std::invalid_argument("NDArray: element size mismatch");
        }
    }
};

/**
 * @brief A single element returned when every axis was indexed by an integer.
 */
class Scalar
{
public:
    Scalar() = default;
    Scalar(const ElementType& type, std::vector<std::uint8_t> bytes);

    const ElementType& type() const noexcept { return type_; }
    const std::vector<std::uint8_t>& bytes() const noexcept { return bytes_; }

    template <typename T>
    T as() const
    {
        if (sizeof(T) != bytes_.size()) {
            throw std::invalid_argument("Scalar::as: element size mismatch");
        }
        T value;
        std::memcpy(&value, bytes_.data(), sizeof(T));
        return value;
    }

    bool operator==(const Scalar& other) const noexcept
    {
        return type_ == other.type_ && bytes_ == other.bytes_;
    }
    bool operator!=(const Scalar& other) const noexcept
    {
        return !(*this == other);
    }

private:
    ElementType type_;
    std::vector<std::uint8_t> bytes_;
};

/** @brief Result of a slice read: an array, or a bare scalar */
using SliceResult = std::variant<NDArray, Scalar>;

/**
 * @brief Copy an N-d box between two C-order buffers.
 *
 * Copies the box of the given @p extent starting at @p srcStart in a
 * buffer of shape @p srcShape into the box starting at @p dstStart in a
 * buffer of shape @p dstShape, converting elements from @p srcType to
 * @p dstType. All shapes, starts and extents must have the same rank.
 */
void copyRegion(
    const std::uint8_t* src,
    const ElementType& srcType,
    const std::vector<std::size_t>& srcShape,
    const std::vector<std::size_t>& srcStart,
    std::uint8_t* dst,
    const ElementType& dstType,
    const std::vector<std::size_t>& dstShape,
    const std::vector<std::size_t>& dstStart,
    const std::vector<std::size_t>& extent);

/** @brief Product of a shape, 1 for rank 0 */
std::size_t shapeProduct(const std::vector<std::size_t>& shape) noexcept;

/** @brief Render a shape as "(3, 4)" */
std::string shapeToString(const std::vector<std::size_t>& shape);

}  // namespace b2h5
