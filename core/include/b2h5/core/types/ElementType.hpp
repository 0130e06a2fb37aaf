#pragma once

#include <cstddef>
#include <string>
#include <utility>

namespace b2h5
{

/**
 * @brief Element class of a dataset or payload.
 *
 * Compound covers structured (record) types handled as fixed-size byte
 * records. Opaque marks an undifferentiated byte blob whose structure was
 * not recorded by the storage layer.
 */
enum class Dtype {
    Int8,
    Int16,
    Int32,
    Int64,
    UInt8,
    UInt16,
    UInt32,
    UInt64,
    Float32,
    Float64,
    Compound,
    Opaque,
    Unknown
};

/**
 * @brief Element type descriptor: class, byte size and byte order.
 */
struct ElementType {
    Dtype dtype = Dtype::Unknown;
    std::size_t size = 0;
    bool nativeOrder = true;
    // Compound only: "name:offset:type" per field, ';'-separated, with
    // nested records as "[...]" and subarrays suffixed "(d0,d1)". Empty when
    // the layout is unknown.
    std::string fields;

    /** @brief Native-order type for a numeric dtype */
    static ElementType native(Dtype dtype);

    /** @brief Native-order compound record of the given size and fields */
    static ElementType compound(std::size_t size, std::string fields = {});

    /** @brief Opaque blob of the given item size */
    static ElementType opaque(std::size_t size);

    bool isNumeric() const noexcept;
    bool isOpaque() const noexcept { return dtype == Dtype::Opaque; }
    bool valid() const noexcept { return dtype != Dtype::Unknown && size > 0; }

    bool operator==(const ElementType& other) const noexcept
    {
        return dtype == other.dtype && size == other.size &&
               nativeOrder == other.nativeOrder && fields == other.fields;
    }
    bool operator!=(const ElementType& other) const noexcept
    {
        return !(*this == other);
    }
};

/** @brief Size in bytes of a numeric dtype, 0 for record/blob types */
std::size_t dtypeSize(Dtype dtype);

/**
 * @brief Render as a numpy-style type string (e.g. "<i8", "|u1", "|V12")
 */
std::string dtypeToString(const ElementType& type);

/**
 * @brief Type part of a compound field entry in ElementType::fields
 * @param dims Subarray dimensions as "d0,d1", empty for a scalar field
 */
std::string fieldSignature(const ElementType& type, const std::string& dims = {});

/**
 * @brief Parse a numpy-style type string.
 *
 * Accepts simple type strings ("<f4", ">u2", "|i1", "=i8", "i8", "|V12")
 * and structured descriptions as written by b2nd
 * ("[('f0', '<i4'), ('f1', '<f8')]"), which become Compound of the summed
 * field size with the field signature in ElementType::fields. Unnamed
 * padding fields add to the size and offsets only. Returns an Unknown type
 * for anything else.
 */
ElementType dtypeFromString(const std::string& s);

/**
 * @brief Convert @p count elements between types.
 *
 * Identical types are copied bytewise. Numeric types convert per element
 * like a static_cast, except that NaN or out-of-range floats become the
 * integer target's minimum and floats too large for a narrower float
 * become infinity. Any other combination throws std::invalid_argument.
 */
void convertElements(
    const void* src,
    const ElementType& srcType,
    void* dst,
    const ElementType& dstType,
    std::size_t count);

/** @brief Whether convertElements() supports the pair */
bool canConvert(const ElementType& from, const ElementType& to) noexcept;

}  // namespace b2h5
