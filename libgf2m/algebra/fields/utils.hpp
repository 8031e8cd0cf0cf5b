/**@file
 *****************************************************************************
 Helpers shared by the GF(2^m) element backends: range checks, formatting,
 random sampling and the structural checks on a defining polynomial.
 *****************************************************************************
 * @author     This file is part of libgf2m (see AUTHORS)
 * @copyright  MIT license (see LICENSE file)
 *****************************************************************************/
#ifndef LIBGF2M_ALGEBRA_FIELDS_UTILS_HPP_
#define LIBGF2M_ALGEBRA_FIELDS_UTILS_HPP_

#include <cstddef>
#include <cstdint>
#include <string>

#include "libgf2m/algebra/word_traits.hpp"

namespace libgf2m {

/* true iff value >= 2^degree */
template<typename WordT>
bool value_out_of_range(const WordT &value, const std::size_t degree);

/* "0x" followed by ceil(degree/4) upper-case hex digits, more if value
   does not fit */
template<typename WordT>
std::string format_value(const WordT &value, const std::size_t degree);

/* uniformly random value in [0, 2^degree), from libsodium */
template<typename WordT>
WordT random_value(const std::size_t degree);

/* Checks the polynomial x^degree + modulus: degree in [1, num_bits], no term
   of modulus above x^degree, and neither 0 nor 1 a root. Throws
   invalid_polynomial otherwise. */
void check_modulus_structure(const uint64_t modulus, const std::size_t degree, const std::size_t num_bits);

} // namespace libgf2m

#include "libgf2m/algebra/fields/utils.tcc"

#endif // LIBGF2M_ALGEBRA_FIELDS_UTILS_HPP_
