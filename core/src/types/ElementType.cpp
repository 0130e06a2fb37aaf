#include "b2h5/core/types/ElementType.hpp"

#include <bit>
#include <cctype>
#include <cstdint>
#include <cmath>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <type_traits>
#include <vector>

namespace b2h5
{

namespace
{

constexpr char kNativeOrderChar =
    std::endian::native == std::endian::little ? '<' : '>';

std::string trim(const std::string& s)
{
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && (std::isspace(static_cast<unsigned char>(s[b])) ||
                     s[b] == '\'' || s[b] == '"')) {
        ++b;
    }
    while (e > b && (std::isspace(static_cast<unsigned char>(s[e - 1])) ||
                     s[e - 1] == '\'' || s[e - 1] == '"')) {
        --e;
    }
    return s.substr(b, e - b);
}

// Splits on commas at nesting depth zero.
std::vector<std::string> splitTopLevel(const std::string& s)
{
    std::vector<std::string> parts;
    int depth = 0;
    std::string cur;
    for (char c : s) {
        if (c == '(' || c == '[') {
            ++depth;
        } else if (c == ')' || c == ']') {
            --depth;
        }
        if (c == ',' && depth == 0) {
            parts.push_back(cur);
            cur.clear();
        } else {
            cur += c;
        }
    }
    if (!trim(cur).empty()) {
        parts.push_back(cur);
    }
    return parts;
}

ElementType parseSimple(const std::string& s)
{
    if (s.empty()) {
        return {};
    }

    std::size_t pos = 0;
    bool native = true;
    if (s[0] == '<' || s[0] == '>' || s[0] == '|' || s[0] == '=') {
        native = (s[0] != '<' && s[0] != '>') || s[0] == kNativeOrderChar;
        pos = 1;
    }
    if (pos >= s.size()) {
        return {};
    }

    char kind = s[pos];
    std::size_t size = 0;
    try {
        size = static_cast<std::size_t>(std::stoul(s.substr(pos + 1)));
    } catch (const std::exception&) {
        return {};
    }

    ElementType t;
    t.size = size;
    t.nativeOrder = native || size == 1;
    switch (kind) {
        case 'i':
            switch (size) {
                case 1: t.dtype = Dtype::Int8; break;
                case 2: t.dtype = Dtype::Int16; break;
                case 4: t.dtype = Dtype::Int32; break;
                case 8: t.dtype = Dtype::Int64; break;
                default: return {};
            }
            break;
        case 'u':
            switch (size) {
                case 1: t.dtype = Dtype::UInt8; break;
                case 2: t.dtype = Dtype::UInt16; break;
                case 4: t.dtype = Dtype::UInt32; break;
                case 8: t.dtype = Dtype::UInt64; break;
                default: return {};
            }
            break;
        case 'f':
            switch (size) {
                case 4: t.dtype = Dtype::Float32; break;
                case 8: t.dtype = Dtype::Float64; break;
                default: return {};
            }
            break;
        case 'V':
            t.dtype = Dtype::Opaque;
            t.nativeOrder = true;
            break;
        default:
            return {};
    }
    return size > 0 ? t : ElementType{};
}

ElementType parseStructured(const std::string& s)
{
    auto body = s.substr(1, s.size() - 2);
    std::size_t total = 0;
    bool native = true;
    std::string fields;
    for (const auto& field : splitTopLevel(body)) {
        auto f = trim(field);
        if (f.size() < 2 || f.front() != '(' || f.back() != ')') {
            return {};
        }
        auto items = splitTopLevel(f.substr(1, f.size() - 2));
        if (items.size() < 2) {
            return {};
        }
        auto inner = trim(items[1]);
        if (inner.empty()) {
            return {};
        }
        ElementType ft = inner.front() == '['
            ? parseStructured(inner) : parseSimple(inner);
        if (!ft.valid()) {
            return {};
        }
        std::size_t count = 1;
        std::string dims;
        if (items.size() > 2) {
            auto shape = trim(items[2]);
            if (shape.size() >= 2 && shape.front() == '(') {
                for (const auto& d : splitTopLevel(shape.substr(1, shape.size() - 2))) {
                    std::size_t n = 0;
                    try {
                        n = static_cast<std::size_t>(std::stoul(trim(d)));
                    } catch (const std::exception&) {
                        return {};
                    }
                    count *= n;
                    dims += (dims.empty() ? "" : ",") + std::to_string(n);
                }
            }
        }

        auto name = trim(items[0]);
        if (!name.empty()) {
            fields += (fields.empty() ? "" : ";") + name + ":" + std::to_string(total) +
                      ":" + fieldSignature(ft, dims);
        }
        total += ft.size * count;
        native = native && ft.nativeOrder;
    }
    if (total == 0) {
        return {};
    }
    auto t = ElementType::compound(total, std::move(fields));
    t.nativeOrder = native;
    return t;
}

// Float to integer truncates toward zero; NaN and values outside the
// target range become the target's minimum, as numpy does on x86.
// Narrowing floats round, with magnitudes past the target range going
// to infinity.
template <typename Dst, typename Src>
Dst convertValue(Src v)
{
    using Limits = std::numeric_limits<Dst>;
    if constexpr (std::is_floating_point_v<Src> && std::is_integral_v<Dst>) {
        const Src hi = std::ldexp(Src(1), Limits::digits);
        const Src lo = std::is_signed_v<Dst> ? -hi : Src(-1);
        if (!(v > lo && v < hi)) {
            return Limits::min();
        }
    } else if constexpr (
        std::is_floating_point_v<Src> && std::is_floating_point_v<Dst> &&
        (Limits::max_exponent < std::numeric_limits<Src>::max_exponent)) {
        // Smallest magnitude that rounds past Limits::max()
        const Src overflow = std::ldexp(Src(1), Limits::max_exponent) -
                             std::ldexp(Src(1), Limits::max_exponent - Limits::digits - 1);
        if (v >= overflow) {
            return Limits::infinity();
        }
        if (v <= -overflow) {
            return -Limits::infinity();
        }
    }
    return static_cast<Dst>(v);
}

template <typename Dst>
void convertFrom(const void* src, Dtype srcType, Dst* dst, std::size_t n)
{
    auto run = [&](auto tag) {
        using Src = decltype(tag);
        const auto* s = static_cast<const Src*>(src);
        for (std::size_t i = 0; i < n; ++i) {
            dst[i] = convertValue<Dst>(s[i]);
        }
    };
    switch (srcType) {
        case Dtype::Int8: run(std::int8_t{}); break;
        case Dtype::Int16: run(std::int16_t{}); break;
        case Dtype::Int32: run(std::int32_t{}); break;
        case Dtype::Int64: run(std::int64_t{}); break;
        case Dtype::UInt8: run(std::uint8_t{}); break;
        case Dtype::UInt16: run(std::uint16_t{}); break;
        case Dtype::UInt32: run(std::uint32_t{}); break;
        case Dtype::UInt64: run(std::uint64_t{}); break;
        case Dtype::Float32: run(float{}); break;
        case Dtype::Float64: run(double{}); break;
        default:
            throw std::invalid_argument("convertElements: non-numeric source");
    }
}

}  // namespace

ElementType ElementType::native(Dtype dtype)
{
    return {dtype, dtypeSize(dtype), true};
}

ElementType ElementType::compound(std::size_t size, std::string fields)
{
    return {Dtype::Compound, size, true, std::move(fields)};
}

ElementType ElementType::opaque(std::size_t size)
{
    return {Dtype::Opaque, size, true};
}

bool ElementType::isNumeric() const noexcept
{
    return dtypeSize(dtype) != 0;
}

std::size_t dtypeSize(Dtype dtype)
{
    switch (dtype) {
        case Dtype::Int8:
        case Dtype::UInt8:
            return 1;
        case Dtype::Int16:
        case Dtype::UInt16:
            return 2;
        case Dtype::Int32:
        case Dtype::UInt32:
        case Dtype::Float32:
            return 4;
        case Dtype::Int64:
        case Dtype::UInt64:
        case Dtype::Float64:
            return 8;
        default:
            return 0;
    }
}

std::string dtypeToString(const ElementType& type)
{
    std::string order(1, type.size == 1 ? '|' : kNativeOrderChar);
    if (!type.nativeOrder) {
        order = kNativeOrderChar == '<' ? ">" : "<";
    }
    auto sz = std::to_string(type.size);
    switch (type.dtype) {
        case Dtype::Int8:
        case Dtype::Int16:
        case Dtype::Int32:
        case Dtype::Int64:
            return order + "i" + sz;
        case Dtype::UInt8:
        case Dtype::UInt16:
        case Dtype::UInt32:
        case Dtype::UInt64:
            return order + "u" + sz;
        case Dtype::Float32:
        case Dtype::Float64:
            return order + "f" + sz;
        case Dtype::Compound:
        case Dtype::Opaque:
            return "|V" + sz;
        default:
            return "";
    }
}

std::string fieldSignature(const ElementType& type, const std::string& dims)
{
    auto sig = type.dtype == Dtype::Compound ? "[" + type.fields + "]" : dtypeToString(type);
    if (!dims.empty()) {
        sig += "(" + dims + ")";
    }
    return sig;
}

ElementType dtypeFromString(const std::string& s)
{
    auto t = trim(s);
    if (t.size() >= 2 && t.front() == '[' && t.back() == ']') {
        return parseStructured(t);
    }
    return parseSimple(t);
}

bool canConvert(const ElementType& from, const ElementType& to) noexcept
{
    if (from == to) {
        return true;
    }
    return from.isNumeric() && to.isNumeric() && from.nativeOrder &&
           to.nativeOrder;
}

void convertElements(
    const void* src,
    const ElementType& srcType,
    void* dst,
    const ElementType& dstType,
    std::size_t count)
{
    if (srcType == dstType) {
        std::memcpy(dst, src, count * srcType.size);
        return;
    }
    if (!canConvert(srcType, dstType)) {
        throw std::invalid_argument(
            "convertElements: cannot convert " + dtypeToString(srcType) +
            " to " + dtypeToString(dstType));
    }

    switch (dstType.dtype) {
        case Dtype::Int8:
            convertFrom(src, srcType.dtype, static_cast<std::int8_t*>(dst), count);
            break;
        case Dtype::Int16:
            convertFrom(src, srcType.dtype, static_cast<std::int16_t*>(dst), count);
            break;
        case Dtype::Int32:
            convertFrom(src, srcType.dtype, static_cast<std::int32_t*>(dst), count);
            break;
        case Dtype::Int64:
            convertFrom(src, srcType.dtype, static_cast<std::int64_t*>(dst), count);
            break;
        case Dtype::UInt8:
            convertFrom(src, srcType.dtype, static_cast<std::uint8_t*>(dst), count);
            break;
        case Dtype::UInt16:
            convertFrom(src, srcType.dtype, static_cast<std::uint16_t*>(dst), count);
            break;
        case Dtype::UInt32:
            convertFrom(src, srcType.dtype, static_cast<std::uint32_t*>(dst), count);
            break;
        case Dtype::UInt64:
            convertFrom(src, srcType.dtype, static_cast<std::uint64_t*>(dst), count);
            break;
        case Dtype::Float32:
            convertFrom(src, srcType.dtype, static_cast<float*>(dst), count);
            break;
        case Dtype::Float64:
            convertFrom(src, srcType.dtype, static_cast<double*>(dst), count);
            break;
        default:
            throw std::invalid_argument("convertElements: non-numeric target");
    }
}

}  // namespace b2h5
