/**@file
 *****************************************************************************
 Commonly used GF(2^m) instantiations.
 *****************************************************************************
 * @author     This file is part of libgf2m (see AUTHORS)
 * @copyright  MIT license (see LICENSE file)
 *****************************************************************************/
#ifndef LIBGF2M_ALGEBRA_FIELDS_GF2M_FIELDS_HPP_
#define LIBGF2M_ALGEBRA_FIELDS_GF2M_FIELDS_HPP_

#include <cstdint>

#include "libgf2m/algebra/fields/gf2m_element.hpp"
#include "libgf2m/algebra/fields/gf2m_lut_element.hpp"
#include "libgf2m/algebra/wide_uint.hpp"

namespace libgf2m {

/* AES: x^8 + x^4 + x^3 + x + 1. Irreducible but not primitive, so it has no
   table backend. */
typedef gf2m_element<uint8_t, 0x11B> gf2_8;

/* Reed-Solomon: x^8 + x^4 + x^3 + x^2 + 1 */
typedef gf2m_lut_element<uint8_t, 0x11D> gf2_8_rs;

/* x^16 + x^12 + x^3 + x + 1 */
typedef gf2m_lut_element<uint16_t, 0x1100B> gf2_16;

/* x^32 + x^22 + x^2 + x + 1 */
typedef gf2m_element<uint32_t, 0x100400007ull> gf2_32;

/* x^63 + x + 1 */
typedef gf2m_element<uint64_t, 0x8000000000000003ull> gf2_63;

/* x^64 + x^4 + x^3 + x + 1, leading term implied */
typedef gf2m_element<uint64_t, 0x1B, 64> gf2_64;

/* x^128 + x^7 + x^2 + x + 1 (GCM), leading term implied */
typedef gf2m_element<wide_uint<uint64_t>, 0x87, 128> gf2_128;

} // namespace libgf2m

#endif // LIBGF2M_ALGEBRA_FIELDS_GF2M_FIELDS_HPP_
