#include <cstdint>
#include <gtest/gtest.h>

#include "libgf2m/algebra/fields/gf2m_element.hpp"
#include "libgf2m/algebra/fields/gf2m_fields.hpp"
#include "libgf2m/algebra/fields/gf2m_lut_element.hpp"

namespace libgf2m {

template<typename WordT, uint64_t Modulus>
void check_backends_agree_exhaustively()
{
    typedef gf2m_element<WordT, Modulus> computed;
    typedef gf2m_lut_element<WordT, Modulus> tabulated;

    for (uint64_t a = 0; a < computed::num_elements(); ++a)
    {
        const computed ca(static_cast<WordT>(a));
        const tabulated ta(static_cast<WordT>(a));

        ASSERT_EQ(ca.squared().value(), ta.squared().value());
        if (a != 0)
        {
            ASSERT_EQ(ca.inverse().value(), ta.inverse().value());
        }

        for (uint64_t b = 0; b < computed::num_elements(); ++b)
        {
            const computed cb(static_cast<WordT>(b));
            const tabulated tb(static_cast<WordT>(b));

            ASSERT_EQ((ca + cb).value(), (ta + tb).value());
            ASSERT_EQ((ca * cb).value(), (ta * tb).value());
            if (b != 0)
            {
                ASSERT_EQ((ca / cb).value(), (ta / tb).value());
            }
        }
    }
}

template<typename WordT, uint64_t Modulus>
void check_backends_agree_randomly(const std::size_t count)
{
    typedef gf2m_element<WordT, Modulus> computed;
    typedef gf2m_lut_element<WordT, Modulus> tabulated;

    for (std::size_t i = 0; i < count; ++i)
    {
        const computed ca = computed::random_element();
        const computed cb = computed::random_element();
        const tabulated ta(ca.value());
        const tabulated tb(cb.value());

        EXPECT_EQ((ca * cb).value(), (ta * tb).value());
        EXPECT_EQ(ca.squared().value(), ta.squared().value());
        if (!cb.is_zero())
        {
            EXPECT_EQ(cb.inverse().value(), tb.inverse().value());
            EXPECT_EQ((ca / cb).value(), (ta / tb).value());
        }
    }
}

TEST(BackendEquivalenceTest, SmallFields) {
    check_backends_agree_exhaustively<uint8_t, 0x3>();
    check_backends_agree_exhaustively<uint8_t, 0x7>();
    check_backends_agree_exhaustively<uint8_t, 0xB>();
    check_backends_agree_exhaustively<uint16_t, 0x13>();
    check_backends_agree_exhaustively<uint8_t, 0x25>();
    check_backends_agree_exhaustively<uint8_t, 0x43>();
    check_backends_agree_exhaustively<uint16_t, 0x83>();
}

TEST(BackendEquivalenceTest, ByteFields) {
    check_backends_agree_exhaustively<uint8_t, 0x11D>();
    check_backends_agree_exhaustively<uint8_t, 0x163>();
}

TEST(BackendEquivalenceTest, SixteenBitField) {
    check_backends_agree_randomly<uint16_t, 0x1100B>(20000);

    /* every nonzero element, against the computation backend's inverse */
    for (uint32_t a = 1; a < 65536; ++a)
    {
        const gf2_16 el(static_cast<uint16_t>(a));
        ASSERT_EQ(el.inverse().value(),
                  (gf2m_element<uint16_t, 0x1100B>(static_cast<uint16_t>(a)).inverse().value()));
    }
}

} // namespace libgf2m
