#include "test.hpp"

#include <bit>
#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <vector>

#include "b2h5/core/types/ElementType.hpp"
#include "b2h5/core/types/NDArray.hpp"

using namespace b2h5;

namespace
{
constexpr bool kLittle = std::endian::native == std::endian::little;
const char* kForeignI4 = kLittle ? ">i4" : "<i4";
const char* kNativeI4 = kLittle ? "<i4" : ">i4";
}  // namespace

// --- dtype strings -----------------------------------------------------------

TEST(Dtype, ParsesNativeNumericTypes)
{
    auto t = dtypeFromString(kNativeI4);
    EXPECT_EQ(t.dtype, Dtype::Int32);
    EXPECT_EQ(t.size, 4u);
    EXPECT_TRUE(t.nativeOrder);

    EXPECT_EQ(dtypeFromString("|u1"), ElementType::native(Dtype::UInt8));
    EXPECT_EQ(dtypeFromString("=f8"), ElementType::native(Dtype::Float64));
    EXPECT_EQ(dtypeFromString("i8"), ElementType::native(Dtype::Int64));
}

TEST(Dtype, ForeignOrderIsFlagged)
{
    auto t = dtypeFromString(kForeignI4);
    EXPECT_EQ(t.dtype, Dtype::Int32);
    EXPECT_FALSE(t.nativeOrder);
    EXPECT_EQ(dtypeToString(t), std::string(kForeignI4));
}

TEST(Dtype, SingleByteTypesHaveNoOrder)
{
    EXPECT_TRUE(dtypeFromString(">u1").nativeOrder);
    EXPECT_EQ(dtypeToString(ElementType::native(Dtype::Int8)), std::string("|i1"));
}

TEST(Dtype, OpaqueBlob)
{
    auto t = dtypeFromString("|V12");
    EXPECT_TRUE(t.isOpaque());
    EXPECT_EQ(t.size, 12u);
    EXPECT_EQ(dtypeToString(t), std::string("|V12"));
}

TEST(Dtype, StructuredBecomesCompound)
{
    auto t = dtypeFromString("[('f0', '<i4'), ('f1', '<f8')]");
    EXPECT_EQ(t.dtype, Dtype::Compound);
    EXPECT_EQ(t.size, 12u);

    EXPECT_EQ(t.fields, std::string("f0:0:<i4;f1:4:<f8"));

    auto nested = dtypeFromString("[('a', '<u2', (3,)), ('b', [('x', '<f4')])]");
    EXPECT_EQ(nested.dtype, Dtype::Compound);
    EXPECT_EQ(nested.size, 10u);
    EXPECT_EQ(nested.fields, std::string("a:0:<u2(3);b:6:[x:0:<f4]"));
}

TEST(Dtype, StructuredPaddingShiftsOffsets)
{
    auto t = dtypeFromString("[('a', '<i4'), ('', '|V4'), ('b', '<f8')]");
    EXPECT_EQ(t.size, 16u);
    EXPECT_EQ(t.fields, std::string("a:0:<i4;b:8:<f8"));
}

TEST(Dtype, RecordsCompareByFields)
{
    auto a = dtypeFromString("[('f0', '<i4'), ('f1', '<f8')]");
    auto renamed = dtypeFromString("[('x', '<i4'), ('y', '<f8')]");
    auto swapped = dtypeFromString("[('f1', '<f8'), ('f0', '<i4')]");
    EXPECT_EQ(a.size, renamed.size);
    EXPECT_EQ(a, dtypeFromString("[('f0','<i4'),('f1','<f8')]"));
    EXPECT_NE(a, renamed);
    EXPECT_NE(a, swapped);
    EXPECT_NE(a, ElementType::compound(12));
    EXPECT_FALSE(canConvert(a, renamed));
}

TEST(Dtype, MalformedStringsAreUnknown)
{
    EXPECT_FALSE(dtypeFromString("").valid());
    EXPECT_FALSE(dtypeFromString("<x4").valid());
    EXPECT_FALSE(dtypeFromString("<i3").valid());
    EXPECT_FALSE(dtypeFromString("[('f0', )]").valid());
    EXPECT_FALSE(dtypeFromString("[]").valid());
}

TEST(Dtype, RoundTripsNumericTypes)
{
    for (auto d : {Dtype::Int8, Dtype::Int16, Dtype::Int32, Dtype::Int64, Dtype::UInt8,
                   Dtype::UInt16, Dtype::UInt32, Dtype::UInt64, Dtype::Float32,
                   Dtype::Float64}) {
        auto t = ElementType::native(d);
        EXPECT_EQ(dtypeFromString(dtypeToString(t)), t);
    }
}

// --- conversion --------------------------------------------------------------

TEST(Convert, WidensUnsigned)
{
    std::vector<std::uint16_t> src{1, 65535, 7};
    std::vector<std::uint32_t> dst(3);
    convertElements(
        src.data(), ElementType::native(Dtype::UInt16), dst.data(),
        ElementType::native(Dtype::UInt32), src.size());
    EXPECT_EQ(dst[0], 1u);
    EXPECT_EQ(dst[1], 65535u);
    EXPECT_EQ(dst[2], 7u);
}

TEST(Convert, IntToFloat)
{
    std::vector<std::int32_t> src{-3, 0, 5};
    std::vector<double> dst(3);
    convertElements(
        src.data(), ElementType::native(Dtype::Int32), dst.data(),
        ElementType::native(Dtype::Float64), src.size());
    EXPECT_FLOAT_EQ(dst[0], -3.0);
    EXPECT_FLOAT_EQ(dst[2], 5.0);
}

TEST(Convert, FloatToIntOutOfRangeIsMinimum)
{
    std::vector<double> src{
        std::numeric_limits<double>::quiet_NaN(), 1e30, -1e30, -7.9, 2147483647.0,
        2147483648.0, -2147483648.0};
    std::vector<std::int32_t> dst(src.size());
    convertElements(
        src.data(), ElementType::native(Dtype::Float64), dst.data(),
        ElementType::native(Dtype::Int32), src.size());
    const auto lo = std::numeric_limits<std::int32_t>::min();
    EXPECT_EQ(dst[0], lo);
    EXPECT_EQ(dst[1], lo);
    EXPECT_EQ(dst[2], lo);
    EXPECT_EQ(dst[3], -7);
    EXPECT_EQ(dst[4], 2147483647);
    EXPECT_EQ(dst[5], lo);
    EXPECT_EQ(dst[6], lo);
}

TEST(Convert, FloatToUnsigned)
{
    std::vector<float> src{-0.5f, -1.0f, 255.9f, 256.0f, std::numeric_limits<float>::infinity()};
    std::vector<std::uint8_t> dst(src.size());
    convertElements(
        src.data(), ElementType::native(Dtype::Float32), dst.data(),
        ElementType::native(Dtype::UInt8), src.size());
    EXPECT_EQ(dst[0], 0u);
    EXPECT_EQ(dst[1], 0u);
    EXPECT_EQ(dst[2], 255u);
    EXPECT_EQ(dst[3], 0u);
    EXPECT_EQ(dst[4], 0u);

    std::vector<std::uint64_t> wide(1);
    double big = 1e19;
    convertElements(
        &big, ElementType::native(Dtype::Float64), wide.data(),
        ElementType::native(Dtype::UInt64), 1);
    EXPECT_EQ(wide[0], 10000000000000000000ull);
}

TEST(Convert, NarrowingFloatOverflowIsInfinite)
{
    std::vector<double> src{1e300, -1e300, 1.5, std::numeric_limits<double>::quiet_NaN(),
                            static_cast<double>(std::numeric_limits<float>::max())};
    std::vector<float> dst(src.size());
    convertElements(
        src.data(), ElementType::native(Dtype::Float64), dst.data(),
        ElementType::native(Dtype::Float32), src.size());
    EXPECT_EQ(dst[0], std::numeric_limits<float>::infinity());
    EXPECT_EQ(dst[1], -std::numeric_limits<float>::infinity());
    EXPECT_EQ(dst[2], 1.5f);
    EXPECT_TRUE(std::isnan(dst[3]));
    EXPECT_EQ(dst[4], std::numeric_limits<float>::max());
}

TEST(Convert, CompoundOnlyToItself)
{
    auto rec = ElementType::compound(12);
    EXPECT_TRUE(canConvert(rec, rec));
    EXPECT_FALSE(canConvert(rec, ElementType::compound(16)));
    EXPECT_FALSE(canConvert(rec, ElementType::native(Dtype::Int32)));

    std::vector<std::uint8_t> src(12, 1);
    std::vector<std::uint8_t> dst(16);
    EXPECT_THROW(
        convertElements(src.data(), rec, dst.data(), ElementType::compound(16), 1),
        std::invalid_argument);
}

TEST(Convert, ForeignOrderIsNotConverted)
{
    auto foreign = dtypeFromString(kForeignI4);
    EXPECT_FALSE(canConvert(foreign, ElementType::native(Dtype::Int64)));
    EXPECT_TRUE(canConvert(foreign, foreign));
}

// --- NDArray -----------------------------------------------------------------

TEST(NDArray, ShapeAndStrides)
{
    NDArray a(ElementType::native(Dtype::Int16), {2, 3, 4});
    EXPECT_EQ(a.size(), 24u);
    EXPECT_EQ(a.nbytes(), 48u);
    EXPECT_EQ(a.strides(), (std::vector<std::size_t>{12, 4, 1}));
    EXPECT_EQ(a.linearIndex({1, 2, 3}), 23u);
    EXPECT_THROW(a.linearIndex({2, 0, 0}), std::out_of_range);
}

TEST(NDArray, RankZeroHoldsOneElement)
{
    NDArray a(ElementType::native(Dtype::Float64), {});
    EXPECT_EQ(a.size(), 1u);
    EXPECT_EQ(a.nbytes(), 8u);
}

TEST(NDArray, RejectsWrongByteCount)
{
    EXPECT_THROW(
        NDArray(ElementType::native(Dtype::Int32), {3}, std::vector<std::uint8_t>(11)),
        std::invalid_argument);
}

TEST(NDArray, ReshapeKeepsData)
{
    auto a = NDArray::fromVector(
        std::vector<std::int32_t>{0, 1, 2, 3, 4, 5}, {2, 3},
        ElementType::native(Dtype::Int32));
    a.reshape({3, 2});
    EXPECT_EQ(a.at<std::int32_t>({2, 1}), 5);
    EXPECT_THROW(a.reshape({4}), std::invalid_argument);
}

TEST(NDArray, TypedAccessChecksSize)
{
    NDArray a(ElementType::native(Dtype::Int32), {2});
    EXPECT_THROW(a.toVector<std::int64_t>(), std::invalid_argument);
    EXPECT_NO_THROW(a.toVector<float>());
}

TEST(CopyRegion, CopiesInnerBoxWithConversion)
{
    // 3x4 source, values 0..11
    std::vector<std::uint8_t> src(12);
    for (std::size_t i = 0; i < src.size(); ++i) {
        src[i] = static_cast<std::uint8_t>(i);
    }
    std::vector<std::int64_t> dst(2 * 3, -1);
    copyRegion(
        src.data(), ElementType::native(Dtype::UInt8), {3, 4}, {1, 1},
        reinterpret_cast<std::uint8_t*>(dst.data()), ElementType::native(Dtype::Int64),
        {2, 3}, {0, 1}, {2, 2});
    EXPECT_EQ(dst[0], -1);
    EXPECT_EQ(dst[1], 5);
    EXPECT_EQ(dst[2], 6);
    EXPECT_EQ(dst[3], -1);
    EXPECT_EQ(dst[4], 9);
    EXPECT_EQ(dst[5], 10);
}

TEST(Shape, ToString)
{
    EXPECT_EQ(shapeToString({}), std::string("()"));
    EXPECT_EQ(shapeToString({3}), std::string("(3,)"));
    EXPECT_EQ(shapeToString({3, 4}), std::string("(3, 4)"));
}
