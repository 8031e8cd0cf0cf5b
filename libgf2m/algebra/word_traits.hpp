/**@file
 *****************************************************************************
 Storage word capabilities used by the GF(2^m) arithmetic.

 word_traits<WordT> tells the generic carry-less multiplication, polynomial
 division and field element code how wide a storage word is, which type holds
 a product of two words, and how to move values between the two. Native
 unsigned integers up to 32 bits use the next native width as double word;
 uint64_t (the widest native word) and wide_uint words use wide_uint.
 *****************************************************************************
 * @author     This file is part of libgf2m (see AUTHORS)
 * @copyright  MIT license (see LICENSE file)
 *****************************************************************************/
#ifndef LIBGF2M_ALGEBRA_WORD_TRAITS_HPP_
#define LIBGF2M_ALGEBRA_WORD_TRAITS_HPP_

#include <cstddef>
#include <cstdint>

#include "libgf2m/algebra/wide_uint.hpp"

namespace libgf2m {

template<typename WordT>
struct word_traits;

template<typename WordT, typename DoubleWordT>
struct native_word_traits {
    typedef WordT word;
    typedef DoubleWordT double_word;

    static const constexpr std::size_t num_bits = 8 * sizeof(WordT);

    static WordT zero() { return 0; }
    static WordT one() { return 1; }

    static WordT from_uint64(const uint64_t value)
    {
        return static_cast<WordT>(value);
    }

    static uint64_t to_uint64(const WordT &value)
    {
        return static_cast<uint64_t>(value);
    }

    static bool test_bit(const WordT &value, const std::size_t i)
    {
        return ((value >> i) & 1) != 0;
    }

    static std::size_t leading_zeros(WordT value)
    {
        std::size_t count = num_bits;
        while (value != 0)
        {
            value = static_cast<WordT>(value >> 1);
            --count;
        }
        return count;
    }

    /* the double word lower | (upper << num_bits) */
    static DoubleWordT combine(const WordT &lower, const WordT &upper)
    {
        return static_cast<DoubleWordT>(static_cast<DoubleWordT>(lower) |
                                        static_cast<DoubleWordT>(static_cast<DoubleWordT>(upper) << num_bits));
    }

    static WordT low_half(const DoubleWordT &value)
    {
        return static_cast<WordT>(value);
    }
};

template<typename WordT, typename DoubleWordT>
const constexpr std::size_t native_word_traits<WordT, DoubleWordT>::num_bits;

template<>
struct word_traits<uint8_t> : public native_word_traits<uint8_t, uint16_t> {};

template<>
struct word_traits<uint16_t> : public native_word_traits<uint16_t, uint32_t> {};

template<>
struct word_traits<uint32_t> : public native_word_traits<uint32_t, uint64_t> {};

/* uint64_t is the widest native word, so its products need wide_uint */
template<>
struct word_traits<uint64_t> {
    typedef uint64_t word;
    typedef wide_uint<uint64_t> double_word;

    static const constexpr std::size_t num_bits = 64;

    static uint64_t zero() { return 0; }
    static uint64_t one() { return 1; }

    static uint64_t from_uint64(const uint64_t value) { return value; }
    static uint64_t to_uint64(const uint64_t &value) { return value; }

    static bool test_bit(const uint64_t &value, const std::size_t i)
    {
        return ((value >> i) & 1) != 0;
    }

    static std::size_t leading_zeros(uint64_t value)
    {
        std::size_t count = num_bits;
        while (value != 0)
        {
            value >>= 1;
            --count;
        }
        return count;
    }

    static double_word combine(const uint64_t &lower, const uint64_t &upper)
    {
        return double_word(lower, upper);
    }

    static uint64_t low_half(const double_word &value)
    {
        return value.lower();
    }
};

template<typename HalfT>
struct word_traits<wide_uint<HalfT> > {
    typedef wide_uint<HalfT> word;
    typedef wide_uint<wide_uint<HalfT> > double_word;
    typedef word_traits<HalfT> half_traits;

    static const constexpr std::size_t num_bits = 2 * half_traits::num_bits;
    static_assert(num_bits == wide_uint<HalfT>::num_bits, "wide_uint halves must not be padded");

    static word zero() { return word(); }
    static word one() { return word(half_traits::one()); }

    static word from_uint64(const uint64_t value)
    {
        return word(half_traits::from_uint64(value));
    }

    /* truncates to the low 64 bits */
    static uint64_t to_uint64(const word &value)
    {
        return half_traits::to_uint64(value.lower());
    }

    static bool test_bit(const word &value, const std::size_t i)
    {
        if (i >= num_bits)
        {
            return false;
        }
        return (i < half_traits::num_bits ?
                half_traits::test_bit(value.lower(), i) :
                half_traits::test_bit(value.upper(), i - half_traits::num_bits));
    }

    static std::size_t leading_zeros(const word &value)
    {
        if (value.upper() != half_traits::zero())
        {
            return half_traits::leading_zeros(value.upper());
        }
        return half_traits::num_bits + half_traits::leading_zeros(value.lower());
    }

    static double_word combine(const word &lower, const word &upper)
    {
        return double_word(lower, upper);
    }

    static word low_half(const double_word &value)
    {
        return value.lower();
    }
};

template<typename HalfT>
const constexpr std::size_t word_traits<wide_uint<HalfT> >::num_bits;

} // namespace libgf2m

#endif // LIBGF2M_ALGEBRA_WORD_TRAITS_HPP_
