#include <cstdint>
#include <gtest/gtest.h>
#include <set>
#include <string>
#include <vector>

#include "libgf2m/algebra/fields/gf2m_fields.hpp"
#include "libgf2m/algebra/fields/gf2m_lut_element.hpp"
#include "libgf2m/algebra/fields/lut_tables.hpp"
#include "libgf2m/tests/algebra/field_test_utils.hpp"

namespace libgf2m {

/* the first table lookup happens during static initialization */
static const gf2_8_rs generator_times_x = gf2_8_rs(0x80) * gf2_8_rs(0x02);

template<typename FieldT>
void check_log_bijection()
{
    const long order = static_cast<long>(FieldT::num_elements() - 1);

    EXPECT_EQ(FieldT::zero().log_alpha(), -1);
    EXPECT_EQ(FieldT::one().log_alpha(), 0);
    EXPECT_EQ(FieldT::alpha_pow(0), FieldT::one());
    EXPECT_EQ(FieldT::alpha_pow(order), FieldT::one());

    std::set<uint64_t> seen;
    for (long i = 0; i < order; ++i)
    {
        const FieldT el = FieldT::alpha_pow(i);
        ASSERT_FALSE(el.is_zero());
        ASSERT_FALSE(el.validate());
        ASSERT_EQ(el.log_alpha(), i);
        seen.insert(static_cast<uint64_t>(el.value()));

        EXPECT_EQ(FieldT::alpha_pow(i - order), el);
        EXPECT_EQ(FieldT::alpha_pow(i + 3 * order), el);
    }
    EXPECT_EQ(seen.size(), static_cast<std::size_t>(order));
}

TEST(GF2mLutElementTest, SmallFieldsExhaustive) {
    check_small_field<gf2m_lut_element<uint16_t, 0x3> >();
    check_small_field<gf2m_lut_element<uint16_t, 0x7> >();
    check_small_field<gf2m_lut_element<uint16_t, 0xB> >();
    check_small_field<gf2m_lut_element<uint16_t, 0x13> >();
    check_small_field<gf2m_lut_element<uint8_t, 0x25> >();
    check_small_field<gf2m_lut_element<uint8_t, 0x43> >();
    check_small_field<gf2m_lut_element<uint8_t, 0x83> >();
}

TEST(GF2mLutElementTest, TablesUsedDuringStaticInitialization) {
    /* x^8 = x^4 + x^3 + x^2 + 1 modulo 0x11D */
    EXPECT_EQ(generator_times_x, gf2_8_rs(0x1D));
    EXPECT_EQ(generator_times_x, gf2_8_rs::alpha_pow(8));
}

TEST(GF2mLutElementTest, TableConstructionIsSilent) {
    /* x^8 + x^5 + x^3 + x + 1, used nowhere else */
    typedef gf2m_lut_element<uint8_t, 0x12B> FieldT;

    testing::internal::CaptureStdout();
    const FieldT product = FieldT(0x80) * FieldT(0x02);
    const std::string out = testing::internal::GetCapturedStdout();

    EXPECT_EQ(out, "");
    EXPECT_EQ(product, FieldT(0x2B));
}

TEST(GF2mLutElementTest, ByteFieldsPairwise) {
    check_pairwise_axioms<gf2_8_rs>(all_field_elements<gf2_8_rs>());
    check_pairwise_axioms<gf2m_lut_element<uint8_t, 0x163> >(all_field_elements<gf2m_lut_element<uint8_t, 0x163> >());
    check_division_by_zero<gf2_8_rs>();
}

TEST(GF2mLutElementTest, SixteenBitFieldRandom) {
    check_random_triples<gf2_16>(10000);
    check_division_by_zero<gf2_16>();
}

TEST(GF2mLutElementTest, LogBijection) {
    check_log_bijection<gf2m_lut_element<uint8_t, 0x3> >();
    check_log_bijection<gf2m_lut_element<uint16_t, 0x7> >();
    check_log_bijection<gf2m_lut_element<uint16_t, 0xB> >();
    check_log_bijection<gf2m_lut_element<uint8_t, 0x13> >();
    check_log_bijection<gf2m_lut_element<uint8_t, 0x25> >();
    check_log_bijection<gf2m_lut_element<uint8_t, 0x43> >();
    check_log_bijection<gf2m_lut_element<uint8_t, 0x83> >();
    check_log_bijection<gf2_8_rs>();
    check_log_bijection<gf2_16>();
}

TEST(GF2mLutElementTest, ReedSolomonVectors) {
    EXPECT_EQ(gf2_8_rs::alpha(), gf2_8_rs(0x02));
    EXPECT_EQ(gf2_8_rs::alpha_pow(8), gf2_8_rs(0x1D));
    EXPECT_EQ(gf2_8_rs::alpha_pow(9), gf2_8_rs(0x3A));
    EXPECT_EQ(gf2_8_rs::alpha_pow(100), gf2_8_rs(0x11));
    EXPECT_EQ(gf2_8_rs::alpha_pow(-1), gf2_8_rs(0x8E));
    EXPECT_EQ(gf2_8_rs(0x02).inverse(), gf2_8_rs(0x8E));
    EXPECT_EQ(gf2_8_rs(0x80) * gf2_8_rs(0x02), gf2_8_rs(0x1D));
    EXPECT_EQ(gf2_8_rs(0x1D) / gf2_8_rs(0x02), gf2_8_rs(0x80));
    EXPECT_EQ(gf2_8_rs(0x1D).log_alpha(), 8);
    EXPECT_EQ(gf2_8_rs(0x80).squared(), gf2_8_rs::alpha_pow(14));

    /* in GF(2) itself x reduces to 1 */
    EXPECT_EQ((gf2m_lut_element<uint8_t, 0x3>::alpha()), (gf2m_lut_element<uint8_t, 0x3>::one()));
}

TEST(GF2mLutElementTest, Tables) {
    const gf2m_lut_tables<uint8_t> &tables = gf2_8_rs::tables();
    ASSERT_EQ(tables.exp_table.size(), 256u);
    ASSERT_EQ(tables.log_table.size(), 256u);
    EXPECT_EQ(tables.log_table[0], -1);
    EXPECT_EQ(tables.exp_table[0], 1);
    for (std::size_t i = 0; i < 255; ++i)
    {
        EXPECT_EQ(tables.log_table[tables.exp_table[i]], static_cast<int32_t>(i));
    }

    /* the tables are shared by every element of the instantiation */
    EXPECT_EQ(&tables, &gf2_8_rs::tables());

    /* 2^W entries even when m < W */
    const gf2m_lut_tables<uint16_t> &small = gf2m_lut_element<uint16_t, 0xB>::tables();
    EXPECT_EQ(small.exp_table.size(), 65536u);
    EXPECT_EQ(small.log_table[7], 5);
    EXPECT_EQ(small.log_table[8], -1);
}

TEST(GF2mLutElementTest, Lfsr) {
    EXPECT_EQ(lfsr_step(0x80, 0x11D), 0x1Du);
    EXPECT_EQ(lfsr_step(0x40, 0x11D), 0x80u);
    EXPECT_EQ(lfsr_period(0x3), 1u);
    EXPECT_EQ(lfsr_period(0x11D), 255u);
    EXPECT_EQ(lfsr_period(0x1100B), 65535u);
    EXPECT_EQ(lfsr_period(0x11B), 51u);
    EXPECT_EQ(lfsr_period(0x203), 73u);
    EXPECT_EQ(lfsr_period(0x15), 6u);
}

TEST(GF2mLutElementTest, ValidateModulus) {
    EXPECT_NO_THROW(gf2_8_rs::validate_modulus());
    EXPECT_NO_THROW(gf2_16::validate_modulus());
    EXPECT_NO_THROW((gf2m_lut_element<uint8_t, 0x3>::validate_modulus()));
    EXPECT_NO_THROW((gf2m_lut_element<uint8_t, 0x7>::validate_modulus()));
    EXPECT_NO_THROW((gf2m_lut_element<uint8_t, 0xB>::validate_modulus()));
    EXPECT_NO_THROW((gf2m_lut_element<uint8_t, 0x13>::validate_modulus()));
    EXPECT_NO_THROW((gf2m_lut_element<uint8_t, 0x25>::validate_modulus()));
    EXPECT_NO_THROW((gf2m_lut_element<uint8_t, 0x43>::validate_modulus()));
    EXPECT_NO_THROW((gf2m_lut_element<uint8_t, 0x83>::validate_modulus()));
    EXPECT_NO_THROW((gf2m_lut_element<uint16_t, 0x163>::validate_modulus()));

    EXPECT_THROW((gf2m_lut_element<uint8_t, 0x4>::validate_modulus()), invalid_polynomial);
    EXPECT_THROW((gf2m_lut_element<uint8_t, 0x5>::validate_modulus()), invalid_polynomial);
    /* x^4 + x^2 + 1 = (x^2 + x + 1)^2 */
    EXPECT_THROW((gf2m_lut_element<uint8_t, 0x15>::validate_modulus()), invalid_polynomial);
    /* irreducible, but x is not a generator */
    EXPECT_THROW((gf2m_lut_element<uint8_t, 0x11B>::validate_modulus()), invalid_polynomial);
    EXPECT_THROW((gf2m_lut_element<uint16_t, 0x203>::validate_modulus()), invalid_polynomial);
}

TEST(GF2mLutElementTest, NonPrimitiveModulusRejectedOnUse) {
    typedef gf2m_lut_element<uint8_t, 0x11B> aes_lut;

    /* arithmetic that needs no table is unaffected */
    EXPECT_EQ(aes_lut(0x57) + aes_lut(0x83), aes_lut(0xD4));
    EXPECT_EQ(aes_lut(0x57) * aes_lut::zero(), aes_lut::zero());

    EXPECT_THROW(aes_lut(0x57) * aes_lut(0x83), invalid_polynomial);
    EXPECT_THROW(aes_lut(0x53).inverse(), invalid_polynomial);
    /* the failed build is retried, and fails again */
    EXPECT_THROW(aes_lut::tables(), invalid_polynomial);
    EXPECT_THROW(aes_lut::alpha(), invalid_polynomial);

    /* zero divisor is reported before the tables are needed */
    EXPECT_THROW(aes_lut(0x53) / aes_lut::zero(), divide_by_zero);
}

TEST(GF2mLutElementTest, ToString) {
    EXPECT_EQ(gf2_8_rs(0x0F).to_string(), "0x0F");
    EXPECT_EQ(gf2_16(0x1F).to_string(), "0x001F");
    EXPECT_EQ((gf2m_lut_element<uint16_t, 0x13>(0x9).to_string()), "0x9");
    EXPECT_TRUE((gf2m_lut_element<uint16_t, 0x13>(0x10).validate()));
    EXPECT_EQ(gf2_16::extension_degree(), 16u);
    EXPECT_EQ(gf2_16::num_elements(), 65536u);
}

} // namespace libgf2m
