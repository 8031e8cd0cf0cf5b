/**@file
 *****************************************************************************
 Division of binary polynomials (polynomials over GF(2)) stored as words.

 Bit i of a word is the coefficient of x^i. The same templates work on native
 words and on wide_uint double words, so a 2W-bit carry-less product can be
 reduced without truncating it first.
 *****************************************************************************
 * @author     This file is part of libgf2m (see AUTHORS)
 * @copyright  MIT license (see LICENSE file)
 *****************************************************************************/
#ifndef LIBGF2M_ALGEBRA_POLY_DIV_HPP_
#define LIBGF2M_ALGEBRA_POLY_DIV_HPP_

#include <cstddef>
#include <cstdint>

#include "libgf2m/algebra/word_traits.hpp"

namespace libgf2m {

template<typename T>
struct poly_div_result {
    T quotient;
    T remainder;
};

/* index of the highest set bit, -1 for the zero polynomial */
template<typename T>
int poly_degree(const T &poly);

constexpr int constexpr_poly_degree(const uint64_t poly)
{
    return (poly == 0 ? -1 : 1 + constexpr_poly_degree(poly >> 1));
}

/* Returns false, leaving result untouched, if divisor is zero. */
template<typename T>
bool try_poly_div(const T &dividend, const T &divisor, poly_div_result<T> &result);

/* dividend = quotient * divisor + remainder, deg(remainder) < deg(divisor).
   Throws std::domain_error if divisor is zero. */
template<typename T>
poly_div_result<T> poly_div(const T &dividend, const T &divisor);

} // namespace libgf2m

#include "libgf2m/algebra/poly_div.tcc"

#endif // LIBGF2M_ALGEBRA_POLY_DIV_HPP_
