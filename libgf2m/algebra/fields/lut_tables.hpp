/**@file
 *****************************************************************************
 Exponent and logarithm tables for GF(2^m) with a primitive modulus.

 The tables are produced by running the Fibonacci LFSR of the modulus from 1:
 step i yields alpha^i, alpha = x (the element 2). The modulus is primitive
 exactly when this walk visits every nonzero element before returning to 1.
 *****************************************************************************
 * @author     This file is part of libgf2m (see AUTHORS)
 * @copyright  MIT license (see LICENSE file)
 *****************************************************************************/
#ifndef LIBGF2M_ALGEBRA_FIELDS_LUT_TABLES_HPP_
#define LIBGF2M_ALGEBRA_FIELDS_LUT_TABLES_HPP_

#include <cstddef>
#include <cstdint>
#include <vector>

namespace libgf2m {

/* exp_table[i] = alpha^i for i < 2^m - 1.
   log_table[v] = i with exp_table[i] = v, and -1 for v = 0.
   Both have one entry per storage value (2^W). */
template<typename WordT>
struct gf2m_lut_tables {
    std::vector<WordT> exp_table;
    std::vector<int32_t> log_table;
};

/* one LFSR step: multiply value by x modulo modulus */
uint64_t lfsr_step(const uint64_t value, const uint64_t modulus);

/* Number of steps the LFSR of modulus needs to come back to 1, starting
   from 1, or 0 if it does not within 2^deg(modulus) - 1 steps. */
uint64_t lfsr_period(const uint64_t modulus);

/* Throws invalid_polynomial unless modulus has degree in [1, num_bits],
   has neither 0 nor 1 as a root, and is primitive. */
void validate_primitive_modulus(const uint64_t modulus, const std::size_t num_bits);

template<typename WordT>
gf2m_lut_tables<WordT> build_lut_tables(const uint64_t modulus);

} // namespace libgf2m

#include "libgf2m/algebra/fields/lut_tables.tcc"

#endif // LIBGF2M_ALGEBRA_FIELDS_LUT_TABLES_HPP_
