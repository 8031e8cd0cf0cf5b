/**@file
 *****************************************************************************
 Implementation of GF(2^m) elements computed with carry-less arithmetic.
 *****************************************************************************
 * @author     This file is part of libgf2m (see AUTHORS)
 * @copyright  MIT license (see LICENSE file)
 *****************************************************************************/

#include <cstdio>

#include "libgf2m/algebra/fields/utils.hpp"

namespace libgf2m {

template<typename WordT, uint64_t Modulus, std::size_t Degree>
const constexpr uint64_t gf2m_element<WordT, Modulus, Degree>::modulus;

template<typename WordT, uint64_t Modulus, std::size_t Degree>
const constexpr std::size_t gf2m_element<WordT, Modulus, Degree>::num_bits;

template<typename WordT, uint64_t Modulus, std::size_t Degree>
const constexpr std::size_t gf2m_element<WordT, Modulus, Degree>::degree;

template<typename WordT, uint64_t Modulus, std::size_t Degree>
gf2m_element<WordT, Modulus, Degree>::gf2m_element() : value_(word_traits<WordT>::zero())
{
}

template<typename WordT, uint64_t Modulus, std::size_t Degree>
gf2m_element<WordT, Modulus, Degree>::gf2m_element(const WordT &value) : value_(value)
{
}

template<typename WordT, uint64_t Modulus, std::size_t Degree>
gf2m_element<WordT, Modulus, Degree>& gf2m_element<WordT, Modulus, Degree>::operator+=(const gf2m_element<WordT, Modulus, Degree> &other)
{
    this->value_ = static_cast<WordT>(this->value_ ^ other.value_);
    return (*this);
}

template<typename WordT, uint64_t Modulus, std::size_t Degree>
gf2m_element<WordT, Modulus, Degree>& gf2m_element<WordT, Modulus, Degree>::operator-=(const gf2m_element<WordT, Modulus, Degree> &other)
{
    this->value_ = static_cast<WordT>(this->value_ ^ other.value_);
    return (*this);
}

template<typename WordT, uint64_t Modulus, std::size_t Degree>
gf2m_element<WordT, Modulus, Degree>& gf2m_element<WordT, Modulus, Degree>::operator*=(const gf2m_element<WordT, Modulus, Degree> &other)
{
    /* Does not require *this and other to be different, and therefore
       also works for squaring. */
    const double_word product = clmul(this->value_, other.value_);
    const double_word reduced = poly_div(product, modulus_polynomial()).remainder;

    this->value_ = word_traits<WordT>::low_half(reduced);
    return (*this);
}

template<typename WordT, uint64_t Modulus, std::size_t Degree>
gf2m_element<WordT, Modulus, Degree>& gf2m_element<WordT, Modulus, Degree>::operator/=(const gf2m_element<WordT, Modulus, Degree> &other)
{
    (*this) *= other.inverse();
    return (*this);
}

template<typename WordT, uint64_t Modulus, std::size_t Degree>
void gf2m_element<WordT, Modulus, Degree>::square()
{
    this->operator*=(*this);
}

template<typename WordT, uint64_t Modulus, std::size_t Degree>
gf2m_element<WordT, Modulus, Degree> gf2m_element<WordT, Modulus, Degree>::operator+(const gf2m_element<WordT, Modulus, Degree> &other) const
{
    gf2m_element<WordT, Modulus, Degree> result(*this);
    return (result+=(other));
}

template<typename WordT, uint64_t Modulus, std::size_t Degree>
gf2m_element<WordT, Modulus, Degree> gf2m_element<WordT, Modulus, Degree>::operator-(const gf2m_element<WordT, Modulus, Degree> &other) const
{
    gf2m_element<WordT, Modulus, Degree> result(*this);
    return (result-=(other));
}

template<typename WordT, uint64_t Modulus, std::size_t Degree>
gf2m_element<WordT, Modulus, Degree> gf2m_element<WordT, Modulus, Degree>::operator-() const
{
    /* additive inverse matches the element itself */
    return gf2m_element<WordT, Modulus, Degree>(*this);
}

template<typename WordT, uint64_t Modulus, std::size_t Degree>
gf2m_element<WordT, Modulus, Degree> gf2m_element<WordT, Modulus, Degree>::operator*(const gf2m_element<WordT, Modulus, Degree> &other) const
{
    gf2m_element<WordT, Modulus, Degree> result(*this);
    return (result*=(other));
}

template<typename WordT, uint64_t Modulus, std::size_t Degree>
gf2m_element<WordT, Modulus, Degree> gf2m_element<WordT, Modulus, Degree>::operator/(const gf2m_element<WordT, Modulus, Degree> &other) const
{
    gf2m_element<WordT, Modulus, Degree> result(*this);
    return (result/=(other));
}

template<typename WordT, uint64_t Modulus, std::size_t Degree>
gf2m_element<WordT, Modulus, Degree> gf2m_element<WordT, Modulus, Degree>::squared() const
{
    gf2m_element<WordT, Modulus, Degree> result(*this);
    result.square();
    return result;
}

template<typename WordT, uint64_t Modulus, std::size_t Degree>
gf2m_element<WordT, Modulus, Degree> gf2m_element<WordT, Modulus, Degree>::inverse() const
{
    gf2m_element<WordT, Modulus, Degree> result;
    if (!this->try_inverse(result))
    {
        throw divide_by_zero("gf2m_element: zero has no multiplicative inverse");
    }
    return result;
}

/* Extended Euclidean algorithm over GF(2)[x]. The remainders live in the
   double word since the modulus needs m+1 bits; the quotients always have
   degree < m and are reduced field elements. */
template<typename WordT, uint64_t Modulus, std::size_t Degree>
bool gf2m_element<WordT, Modulus, Degree>::try_inverse(gf2m_element<WordT, Modulus, Degree> &result) const
{
    typedef word_traits<double_word> double_traits;

    if (this->is_zero())
    {
        return false;
    }

    if (this->value_ == word_traits<WordT>::one())
    {
        result = gf2m_element<WordT, Modulus, Degree>::one();
        return true;
    }

    const double_word double_zero = double_traits::zero();

    double_word r_prev = modulus_polynomial();
    double_word r_cur = word_traits<WordT>::combine(this->value_, word_traits<WordT>::zero());
    gf2m_element<WordT, Modulus, Degree> t_prev = gf2m_element<WordT, Modulus, Degree>::zero();
    gf2m_element<WordT, Modulus, Degree> t_cur = gf2m_element<WordT, Modulus, Degree>::one();

    /* invariant: t_prev * value = r_prev and t_cur * value = r_cur (mod Modulus) */
    while (r_cur != double_zero)
    {
        const poly_div_result<double_word> qr = poly_div(r_prev, r_cur);
        const gf2m_element<WordT, Modulus, Degree> q(word_traits<WordT>::low_half(qr.quotient));

        r_prev = r_cur;
        r_cur = qr.remainder;

        const gf2m_element<WordT, Modulus, Degree> t_next = t_prev + q * t_cur;
        t_prev = t_cur;
        t_cur = t_next;
    }

    result = t_prev;
    return true;
}

template<typename WordT, uint64_t Modulus, std::size_t Degree>
bool gf2m_element<WordT, Modulus, Degree>::try_divide(const gf2m_element<WordT, Modulus, Degree> &divisor,
                                              gf2m_element<WordT, Modulus, Degree> &result) const
{
    gf2m_element<WordT, Modulus, Degree> divisor_inverse;
    if (!divisor.try_inverse(divisor_inverse))
    {
        return false;
    }
    result = (*this) * divisor_inverse;
    return true;
}

template<typename WordT, uint64_t Modulus, std::size_t Degree>
void gf2m_element<WordT, Modulus, Degree>::randomize()
{
    this->value_ = random_value<WordT>(extension_degree());
}

template<typename WordT, uint64_t Modulus, std::size_t Degree>
bool gf2m_element<WordT, Modulus, Degree>::operator==(const gf2m_element<WordT, Modulus, Degree> &other) const
{
    return (this->value_ == other.value_);
}

template<typename WordT, uint64_t Modulus, std::size_t Degree>
bool gf2m_element<WordT, Modulus, Degree>::operator!=(const gf2m_element<WordT, Modulus, Degree> &other) const
{
    return !(this->operator==(other));
}

template<typename WordT, uint64_t Modulus, std::size_t Degree>
bool gf2m_element<WordT, Modulus, Degree>::is_zero() const
{
    return (this->value_ == word_traits<WordT>::zero());
}

template<typename WordT, uint64_t Modulus, std::size_t Degree>
bool gf2m_element<WordT, Modulus, Degree>::validate() const
{
    return value_out_of_range(this->value_, extension_degree());
}

template<typename WordT, uint64_t Modulus, std::size_t Degree>
std::string gf2m_element<WordT, Modulus, Degree>::to_string() const
{
    return format_value(this->value_, extension_degree());
}

template<typename WordT, uint64_t Modulus, std::size_t Degree>
void gf2m_element<WordT, Modulus, Degree>::print() const
{
    printf("%s\n", this->to_string().c_str());
}

template<typename WordT, uint64_t Modulus, std::size_t Degree>
gf2m_element<WordT, Modulus, Degree> gf2m_element<WordT, Modulus, Degree>::random_element()
{
    gf2m_element<WordT, Modulus, Degree> result;
    result.randomize();
    return result;
}

template<typename WordT, uint64_t Modulus, std::size_t Degree>
gf2m_element<WordT, Modulus, Degree> gf2m_element<WordT, Modulus, Degree>::zero()
{
    return gf2m_element<WordT, Modulus, Degree>(word_traits<WordT>::zero());
}

template<typename WordT, uint64_t Modulus, std::size_t Degree>
gf2m_element<WordT, Modulus, Degree> gf2m_element<WordT, Modulus, Degree>::one()
{
    return gf2m_element<WordT, Modulus, Degree>(word_traits<WordT>::one());
}

template<typename WordT, uint64_t Modulus, std::size_t Degree>
void gf2m_element<WordT, Modulus, Degree>::validate_modulus()
{
    check_modulus_structure(Modulus, Degree, num_bits);
}

template<typename WordT, uint64_t Modulus, std::size_t Degree>
typename gf2m_element<WordT, Modulus, Degree>::double_word gf2m_element<WordT, Modulus, Degree>::modulus_polynomial()
{
    typedef word_traits<double_word> double_traits;

    /* a spelled-out leading term is or-ed with itself */
    return static_cast<double_word>(double_traits::from_uint64(Modulus) |
                                    static_cast<double_word>(double_traits::one() << Degree));
}

template<typename WordT, uint64_t Modulus, std::size_t Degree>
std::ostream& operator<<(std::ostream &out, const gf2m_element<WordT, Modulus, Degree> &el)
{
    out << el.to_string();
    return out;
}

} // namespace libgf2m
