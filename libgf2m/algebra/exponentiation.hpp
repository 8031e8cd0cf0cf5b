/**@file
 *****************************************************************************
 Exponentiation in a field.
 *****************************************************************************
 * @author     This file is part of libgf2m (see AUTHORS)
 * @copyright  MIT license (see LICENSE file)
 *****************************************************************************/
#ifndef LIBGF2M_ALGEBRA_EXPONENTIATION_HPP_
#define LIBGF2M_ALGEBRA_EXPONENTIATION_HPP_

#include <cstddef>
#include <cstdint>

#include "libgf2m/algebra/fields/gf2m_lut_element.hpp"

namespace libgf2m {

/* base^exponent by right-to-left square-and-multiply; power(x, 0) is one,
   zero included */
template<typename FieldT>
FieldT power(const FieldT &base, const std::size_t exponent);

/* the table backend multiplies the logarithm instead */
template<typename WordT, uint64_t Modulus, std::size_t Degree>
gf2m_lut_element<WordT, Modulus, Degree> power(const gf2m_lut_element<WordT, Modulus, Degree> &base,
                                               const std::size_t exponent);

} // namespace libgf2m

#include "libgf2m/algebra/exponentiation.tcc"

#endif // LIBGF2M_ALGEBRA_EXPONENTIATION_HPP_
