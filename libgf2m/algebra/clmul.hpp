/**@file
 *****************************************************************************
 Carry-less (XOR) multiplication of storage words.

 clmul(a, b) is the product of a and b as binary polynomials: the XOR of
 a << i over every bit i set in b. The product of two W-bit words has 2W bits;
 clmul_low returns bits [0, W) and clmul_high bits [W, 2W).
 *****************************************************************************
 * @author     This file is part of libgf2m (see AUTHORS)
 * @copyright  MIT license (see LICENSE file)
 *****************************************************************************/
#ifndef LIBGF2M_ALGEBRA_CLMUL_HPP_
#define LIBGF2M_ALGEBRA_CLMUL_HPP_

#include <cstdint>

#include "libgf2m/algebra/word_traits.hpp"

namespace libgf2m {

template<typename WordT>
WordT clmul_low(const WordT &a, const WordT &b);

template<typename WordT>
WordT clmul_high(const WordT &a, const WordT &b);

template<typename WordT>
typename word_traits<WordT>::double_word clmul(const WordT &a, const WordT &b);

#ifdef USE_ASM
/* PCLMULQDQ */
template<>
wide_uint<uint64_t> clmul<uint64_t>(const uint64_t &a, const uint64_t &b);
#endif

} // namespace libgf2m

#include "libgf2m/algebra/clmul.tcc"

#endif // LIBGF2M_ALGEBRA_CLMUL_HPP_
