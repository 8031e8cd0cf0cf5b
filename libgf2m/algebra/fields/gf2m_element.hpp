/**@file
 *****************************************************************************
 Declaration of GF(2^m) elements computed with carry-less arithmetic.
 *****************************************************************************
 * @author     This file is part of libgf2m (see AUTHORS)
 * @copyright  MIT license (see LICENSE file)
 *****************************************************************************/
#ifndef LIBGF2M_ALGEBRA_FIELDS_GF2M_ELEMENT_HPP_
#define LIBGF2M_ALGEBRA_FIELDS_GF2M_ELEMENT_HPP_

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>

#include "libgf2m/algebra/clmul.hpp"
#include "libgf2m/algebra/fields/errors.hpp"
#include "libgf2m/algebra/poly_div.hpp"
#include "libgf2m/algebra/word_traits.hpp"

namespace libgf2m {

/* gf2m_element<WordT, Modulus, Degree> implements the field
   GF(2)[x]/(x^Degree + Modulus), where bit i of Modulus is the coefficient of
   x^i. Modulus may spell out its leading term (x^8 + x^4 + x^3 + x + 1 is
   0x11B, and Degree defaults to its degree) or leave it implied, which fields
   of degree 64 and more need: gf2m_element<uint64_t, 0x1B, 64> is
   GF(2)[x]/(x^64 + x^4 + x^3 + x + 1). Elements are stored in a single WordT.
   Multiplication is a double-width carry-less product reduced by polynomial
   division, inversion is the extended Euclidean algorithm.

   The modulus must be irreducible; this is not checked; a reducible modulus
   gives a ring with zero divisors. */
template<typename WordT, uint64_t Modulus,
         std::size_t Degree = static_cast<std::size_t>(constexpr_poly_degree(Modulus))>
class gf2m_element {
public:
    typedef WordT word_type;
    typedef typename word_traits<WordT>::double_word double_word;

    static const constexpr uint64_t modulus = Modulus;
    static const constexpr std::size_t num_bits = word_traits<WordT>::num_bits;

    static const constexpr std::size_t degree = Degree;

    static_assert(Degree >= 1, "modulus must have degree at least 1");
    static_assert(Degree <= num_bits, "modulus degree exceeds the storage width");
    static_assert(constexpr_poly_degree(Modulus) <= static_cast<int>(Degree),
                  "modulus has terms above x^Degree");

    gf2m_element();
    explicit gf2m_element(const WordT &value);

    const WordT& value() const { return this->value_; }

    gf2m_element& operator+=(const gf2m_element &other);
    gf2m_element& operator-=(const gf2m_element &other);
    gf2m_element& operator*=(const gf2m_element &other);
    gf2m_element& operator/=(const gf2m_element &other);
    void square();

    gf2m_element operator+(const gf2m_element &other) const;
    gf2m_element operator-(const gf2m_element &other) const;
    gf2m_element operator-() const;
    gf2m_element operator*(const gf2m_element &other) const;
    gf2m_element operator/(const gf2m_element &other) const;
    gf2m_element squared() const;

    /* throws divide_by_zero for zero */
    gf2m_element inverse() const;
    /* Leaves result untouched and returns false if *this is zero. */
    bool try_inverse(gf2m_element &result) const;
    bool try_divide(const gf2m_element &divisor, gf2m_element &result) const;

    void randomize();

    bool operator==(const gf2m_element &other) const;
    bool operator!=(const gf2m_element &other) const;

    bool is_zero() const;
    /* true iff the stored value is NOT a field element (value >= 2^m) */
    bool validate() const;

    std::string to_string() const;
    void print() const;

    static gf2m_element random_element();

    static gf2m_element zero();
    static gf2m_element one();

    static std::size_t extension_degree() { return Degree; }
    /* only for fields with fewer than 2^64 elements */
    static uint64_t num_elements()
    {
        static_assert(Degree < 64, "2^Degree does not fit in uint64_t");
        return (1ull << Degree);
    }

    /* degree, 0 root and 1 root checks; throws invalid_polynomial */
    static void validate_modulus();
private:
    WordT value_;

    /* x^Degree + Modulus in the double word */
    static double_word modulus_polynomial();
};

template<typename WordT, uint64_t Modulus, std::size_t Degree>
std::ostream& operator<<(std::ostream &out, const gf2m_element<WordT, Modulus, Degree> &el);

} // namespace libgf2m

#include "libgf2m/algebra/fields/gf2m_element.tcc"

#endif // LIBGF2M_ALGEBRA_FIELDS_GF2M_ELEMENT_HPP_
