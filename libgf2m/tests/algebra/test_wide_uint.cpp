#include <cstdint>
#include <gtest/gtest.h>
#include <sstream>

#include "libgf2m/algebra/wide_uint.hpp"
#include "libgf2m/algebra/word_traits.hpp"

namespace libgf2m {

typedef wide_uint<uint64_t> uint128;
typedef wide_uint<uint128> uint256;

TEST(WideUintTest, BitwiseOperators) {
    const uint128 a(0xF0F0F0F0F0F0F0F0ull, 0x00000000FFFFFFFFull);
    const uint128 b(0xFF00FF00FF00FF00ull, 0xFFFFFFFF00000000ull);

    EXPECT_EQ(a ^ b, uint128(0x0FF00FF00FF00FF0ull, 0xFFFFFFFFFFFFFFFFull));
    EXPECT_EQ(a & b, uint128(0xF000F000F000F000ull, 0));
    EXPECT_EQ(a | b, uint128(0xFFF0FFF0FFF0FFF0ull, 0xFFFFFFFFFFFFFFFFull));
    EXPECT_EQ(~a, uint128(0x0F0F0F0F0F0F0F0Full, 0xFFFFFFFF00000000ull));
    EXPECT_EQ(~uint128(), uint128(~0ull, ~0ull));

    EXPECT_TRUE(uint128().is_zero());
    EXPECT_FALSE(uint128(0, 1).is_zero());
    EXPECT_NE(uint128(1, 0), uint128(0, 1));
}

TEST(WideUintTest, ShiftLeftSpillsIntoUpperHalf) {
    const uint128 one(1);
    const uint128 top_of_lower(0x8000000000000000ull);

    EXPECT_EQ(one << 0, one);
    EXPECT_EQ(one << 1, uint128(2));
    EXPECT_EQ(top_of_lower << 1, uint128(0, 1));
    EXPECT_EQ(uint128(0xFFull) << 60, uint128(0xF000000000000000ull, 0xF));
    EXPECT_EQ(one << 64, uint128(0, 1));
    EXPECT_EQ(one << 127, uint128(0, 0x8000000000000000ull));
    EXPECT_EQ(uint128(~0ull, ~0ull) << 64, uint128(0, ~0ull));
    EXPECT_EQ(uint128(~0ull, ~0ull) << 128, uint128());
    EXPECT_EQ(uint128(~0ull, ~0ull) << 500, uint128());
}

TEST(WideUintTest, ShiftRightSpillsIntoLowerHalf) {
    const uint128 top(0, 0x8000000000000000ull);

    EXPECT_EQ(top >> 0, top);
    EXPECT_EQ(top >> 63, uint128(0, 1));
    EXPECT_EQ(top >> 64, uint128(0x8000000000000000ull));
    EXPECT_EQ(top >> 127, uint128(1));
    EXPECT_EQ(top >> 128, uint128());
    EXPECT_EQ(uint128(0, 0xABull) >> 4, uint128(0xB000000000000000ull, 0xA));
    EXPECT_EQ(uint128(~0ull, ~0ull) >> 65, uint128(0x7FFFFFFFFFFFFFFFull, 0));
}

TEST(WideUintTest, ShiftRoundTrip) {
    const uint128 value(0x0123456789ABCDEFull, 0x0FEDCBA987654321ull);
    for (std::size_t shift = 0; shift <= 128; ++shift)
    {
        /* shifting out and back keeps exactly the bits that stayed inside */
        const uint128 kept_high = (value >> shift) << shift;
        const uint128 mask_high = uint128(~0ull, ~0ull) << shift;
        EXPECT_EQ(kept_high, value & mask_high);

        const uint128 kept_low = (value << shift) >> shift;
        const uint128 mask_low = uint128(~0ull, ~0ull) >> shift;
        EXPECT_EQ(kept_low, value & mask_low);
    }
}

TEST(WideUintTest, Widen) {
    EXPECT_EQ(uint128::widen(0xF, 0), uint128(0xF));
    EXPECT_EQ(uint128::widen(0xF, 62), uint128(0xC000000000000000ull, 0x3));
    EXPECT_EQ(uint128::widen(0xF, 64), uint128(0, 0xF));
    EXPECT_EQ(uint128::widen(0xF, 126), uint128(0, 0xC000000000000000ull));
    EXPECT_EQ(uint128::widen(0xF, 128), uint128());
    EXPECT_EQ(uint128::widen(0xF, 200), uint128());
}

TEST(WideUintTest, SmallHalves) {
    typedef wide_uint<uint8_t> uint16;

    EXPECT_EQ(uint16(0x81) << 1, uint16(0x02, 0x01));
    EXPECT_EQ(uint16(0x00, 0x81) >> 1, uint16(0x80, 0x40));
    EXPECT_EQ(uint16::widen(0xFF, 4), uint16(0xF0, 0x0F));
    EXPECT_EQ(~uint16(0x0F, 0xF0), uint16(0xF0, 0x0F));
}

TEST(WideUintTest, NestedWideUint) {
    const uint256 one(uint128(1));

    EXPECT_EQ(one << 128, uint256(uint128(), uint128(1)));
    EXPECT_EQ(one << 255, uint256(uint128(), uint128(0, 0x8000000000000000ull)));
    EXPECT_EQ((one << 200) >> 200, one);
    EXPECT_EQ(one << 256, uint256());
    EXPECT_EQ(uint256::num_bits, 256u);
    EXPECT_EQ(word_traits<uint128>::num_bits, 128u);
    EXPECT_EQ(word_traits<uint256>::num_bits, 256u);
}

TEST(WideUintTest, Traits) {
    typedef word_traits<uint128> traits;

    EXPECT_EQ(traits::leading_zeros(uint128()), 128u);
    EXPECT_EQ(traits::leading_zeros(uint128(1)), 127u);
    EXPECT_EQ(traits::leading_zeros(uint128(0, 1)), 63u);
    EXPECT_TRUE(traits::test_bit(uint128(0, 4), 66));
    EXPECT_FALSE(traits::test_bit(uint128(0, 4), 65));
    EXPECT_EQ(traits::from_uint64(0x1234), uint128(0x1234));
    EXPECT_EQ(traits::to_uint64(uint128(0x1234, 0x5678)), 0x1234u);
    EXPECT_EQ(word_traits<uint64_t>::combine(3, 5), uint128(3, 5));
    EXPECT_EQ(word_traits<uint8_t>::combine(0x34, 0x12), 0x1234u);
    EXPECT_EQ(word_traits<uint32_t>::low_half(0x1122334455667788ull), 0x55667788u);
}

TEST(WideUintTest, Printing) {
    std::ostringstream out;
    out << uint128(0xF, 0x7) << " " << 42;
    EXPECT_EQ(out.str(), "0x0000000000000007000000000000000f 42");
}

} // namespace libgf2m
