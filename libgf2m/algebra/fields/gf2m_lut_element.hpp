/**@file
 *****************************************************************************
 Declaration of GF(2^m) elements computed with exponent/logarithm tables.
 *****************************************************************************
 * @author     This file is part of libgf2m (see AUTHORS)
 * @copyright  MIT license (see LICENSE file)
 *****************************************************************************/
#ifndef LIBGF2M_ALGEBRA_FIELDS_GF2M_LUT_ELEMENT_HPP_
#define LIBGF2M_ALGEBRA_FIELDS_GF2M_LUT_ELEMENT_HPP_

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>

#include "libgf2m/algebra/fields/errors.hpp"
#include "libgf2m/algebra/fields/lut_tables.hpp"
#include "libgf2m/algebra/poly_div.hpp"
#include "libgf2m/algebra/word_traits.hpp"

namespace libgf2m {

/* gf2m_lut_element<WordT, Modulus, Degree> implements the same field and
   interface as gf2m_element<WordT, Modulus, Degree>, but multiplies, divides
   and inverts by adding and subtracting discrete logarithms to the base
   alpha = x.

   Modulus must be primitive, and WordT at most 16 bits wide since the tables
   have 2^W entries. The tables are built, after validate_modulus(), the first
   time any element of the instantiation needs them, and are read-only from
   then on. With a non-primitive modulus every table lookup throws
   invalid_polynomial. Table construction does not log. */
template<typename WordT, uint64_t Modulus,
         std::size_t Degree = static_cast<std::size_t>(constexpr_poly_degree(Modulus))>
class gf2m_lut_element {
public:
    typedef WordT word_type;

    static const constexpr uint64_t modulus = Modulus;
    static const constexpr std::size_t num_bits = word_traits<WordT>::num_bits;

    static const constexpr std::size_t degree = Degree;

    static_assert(num_bits <= 16, "table backend needs a storage word of at most 16 bits");
    static_assert(Degree >= 1, "modulus must have degree at least 1");
    static_assert(Degree <= num_bits, "modulus degree exceeds the storage width");
    static_assert(constexpr_poly_degree(Modulus) <= static_cast<int>(Degree),
                  "modulus has terms above x^Degree");

    gf2m_lut_element();
    explicit gf2m_lut_element(const WordT &value);

    const WordT& value() const { return this->value_; }

    gf2m_lut_element& operator+=(const gf2m_lut_element &other);
    gf2m_lut_element& operator-=(const gf2m_lut_element &other);
    gf2m_lut_element& operator*=(const gf2m_lut_element &other);
    gf2m_lut_element& operator/=(const gf2m_lut_element &other);
    void square();

    gf2m_lut_element operator+(const gf2m_lut_element &other) const;
    gf2m_lut_element operator-(const gf2m_lut_element &other) const;
    gf2m_lut_element operator-() const;
    gf2m_lut_element operator*(const gf2m_lut_element &other) const;
    gf2m_lut_element operator/(const gf2m_lut_element &other) const;
    gf2m_lut_element squared() const;

    gf2m_lut_element inverse() const;
    bool try_inverse(gf2m_lut_element &result) const;
    bool try_divide(const gf2m_lut_element &divisor, gf2m_lut_element &result) const;

    /* discrete logarithm to the base alpha, -1 for zero */
    long log_alpha() const;

    void randomize();

    bool operator==(const gf2m_lut_element &other) const;
    bool operator!=(const gf2m_lut_element &other) const;

    bool is_zero() const;
    bool validate() const;

    std::string to_string() const;
    void print() const;

    static gf2m_lut_element random_element();

    static gf2m_lut_element zero();
    static gf2m_lut_element one();
    /* the generator x of the multiplicative group */
    static gf2m_lut_element alpha();
    /* alpha^power for any power, negative powers included */
    static gf2m_lut_element alpha_pow(const long power);

    static std::size_t extension_degree() { return Degree; }
    static uint64_t num_elements() { return (1ull << Degree); }

    static void validate_modulus();
    static const gf2m_lut_tables<WordT>& tables();
private:
    WordT value_;

    static long multiplicative_order() { return static_cast<long>(num_elements() - 1); }
    /* x^Degree + Modulus */
    static uint64_t modulus_polynomial() { return (Modulus | (1ull << Degree)); }
};

template<typename WordT, uint64_t Modulus, std::size_t Degree>
std::ostream& operator<<(std::ostream &out, const gf2m_lut_element<WordT, Modulus, Degree> &el);

} // namespace libgf2m

#include "libgf2m/algebra/fields/gf2m_lut_element.tcc"

#endif // LIBGF2M_ALGEBRA_FIELDS_GF2M_LUT_ELEMENT_HPP_
