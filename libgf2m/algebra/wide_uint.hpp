/**@file
 *****************************************************************************
 Declaration of a double-width unsigned integer built from two words.
 *****************************************************************************
 * @author     This file is part of libgf2m (see AUTHORS)
 * @copyright  MIT license (see LICENSE file)
 *****************************************************************************/
#ifndef LIBGF2M_ALGEBRA_WIDE_UINT_HPP_
#define LIBGF2M_ALGEBRA_WIDE_UINT_HPP_

#include <cstddef>
#include <cstdint>
#include <ostream>

namespace libgf2m {

/* wide_uint<WordT> is a 2W-bit unsigned integer stored as two W-bit halves,
   little-endian. It only supports the bit operations that carry-less
   multiplication and polynomial division need, and it nests:
   wide_uint<wide_uint<uint64_t>> is a 256-bit integer. */
template<typename WordT>
class wide_uint {
public:
    static const constexpr std::size_t half_bits = 8 * sizeof(WordT);
    static const constexpr std::size_t num_bits = 2 * half_bits;

    wide_uint();
    explicit wide_uint(const WordT &lower);
    wide_uint(const WordT &lower, const WordT &upper);

    /* value placed in the low half, then shifted left by shift bits.
       Bits shifted past the top are dropped. */
    static wide_uint widen(const WordT &value, const std::size_t shift);

    const WordT& lower() const { return this->lower_; }
    const WordT& upper() const { return this->upper_; }

    wide_uint& operator^=(const wide_uint &other);
    wide_uint& operator&=(const wide_uint &other);
    wide_uint& operator|=(const wide_uint &other);
    wide_uint& operator<<=(const std::size_t shift);
    wide_uint& operator>>=(const std::size_t shift);

    wide_uint operator^(const wide_uint &other) const;
    wide_uint operator&(const wide_uint &other) const;
    wide_uint operator|(const wide_uint &other) const;
    wide_uint operator~() const;
    wide_uint operator<<(const std::size_t shift) const;
    wide_uint operator>>(const std::size_t shift) const;

    bool operator==(const wide_uint &other) const;
    bool operator!=(const wide_uint &other) const;

    bool is_zero() const;

private:
    WordT lower_;
    WordT upper_;
};

template<typename WordT>
std::ostream& operator<<(std::ostream &out, const wide_uint<WordT> &value);

} // namespace libgf2m

#include "libgf2m/algebra/wide_uint.tcc"

#endif // LIBGF2M_ALGEBRA_WIDE_UINT_HPP_
