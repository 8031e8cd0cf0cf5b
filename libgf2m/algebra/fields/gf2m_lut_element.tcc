#include <cstdio>

#include "libgf2m/algebra/fields/utils.hpp"

namespace libgf2m {

template<typename WordT, uint64_t Modulus, std::size_t Degree>
const constexpr uint64_t gf2m_lut_element<WordT, Modulus, Degree>::modulus;

template<typename WordT, uint64_t Modulus, std::size_t Degree>
const constexpr std::size_t gf2m_lut_element<WordT, Modulus, Degree>::num_bits;

template<typename WordT, uint64_t Modulus, std::size_t Degree>
const constexpr std::size_t gf2m_lut_element<WordT, Modulus, Degree>::degree;

template<typename WordT, uint64_t Modulus, std::size_t Degree>
gf2m_lut_element<WordT, Modulus, Degree>::gf2m_lut_element() : value_(0)
{
}

template<typename WordT, uint64_t Modulus, std::size_t Degree>
gf2m_lut_element<WordT, Modulus, Degree>::gf2m_lut_element(const WordT &value) : value_(value)
{
}

template<typename WordT, uint64_t Modulus, std::size_t Degree>
const gf2m_lut_tables<WordT>& gf2m_lut_element<WordT, Modulus, Degree>::tables()
{
    /* one-time, thread-safe initialization; a throw leaves it uninitialized */
    static const gf2m_lut_tables<WordT> tables = build_lut_tables<WordT>(modulus_polynomial());
    return tables;
}

template<typename WordT, uint64_t Modulus, std::size_t Degree>
gf2m_lut_element<WordT, Modulus, Degree> gf2m_lut_element<WordT, Modulus, Degree>::alpha_pow(const long power)
{
    const long order = multiplicative_order();
    const long index = ((power % order) + order) % order;
    return gf2m_lut_element<WordT, Modulus, Degree>(tables().exp_table[static_cast<std::size_t>(index)]);
}

template<typename WordT, uint64_t Modulus, std::size_t Degree>
long gf2m_lut_element<WordT, Modulus, Degree>::log_alpha() const
{
    return tables().log_table[static_cast<std::size_t>(this->value_)];
}

template<typename WordT, uint64_t Modulus, std::size_t Degree>
gf2m_lut_element<WordT, Modulus, Degree>& gf2m_lut_element<WordT, Modulus, Degree>::operator+=(const gf2m_lut_element<WordT, Modulus, Degree> &other)
{
    this->value_ ^= other.value_;
    return (*this);
}

template<typename WordT, uint64_t Modulus, std::size_t Degree>
gf2m_lut_element<WordT, Modulus, Degree>& gf2m_lut_element<WordT, Modulus, Degree>::operator-=(const gf2m_lut_element<WordT, Modulus, Degree> &other)
{
    this->value_ ^= other.value_;
    return (*this);
}

template<typename WordT, uint64_t Modulus, std::size_t Degree>
gf2m_lut_element<WordT, Modulus, Degree>& gf2m_lut_element<WordT, Modulus, Degree>::operator*=(const gf2m_lut_element<WordT, Modulus, Degree> &other)
{
    if (this->is_zero() || other.is_zero())
    {
        this->value_ = 0;
    }
    else
    {
        (*this) = alpha_pow(this->log_alpha() + other.log_alpha());
    }
    return (*this);
}

template<typename WordT, uint64_t Modulus, std::size_t Degree>
gf2m_lut_element<WordT, Modulus, Degree>& gf2m_lut_element<WordT, Modulus, Degree>::operator/=(const gf2m_lut_element<WordT, Modulus, Degree> &other)
{
    if (other.is_zero())
    {
        throw divide_by_zero("gf2m_lut_element: division by zero");
    }

    if (!this->is_zero())
    {
        (*this) = alpha_pow(this->log_alpha() - other.log_alpha());
    }
    return (*this);
}

template<typename WordT, uint64_t Modulus, std::size_t Degree>
void gf2m_lut_element<WordT, Modulus, Degree>::square()
{
    if (!this->is_zero())
    {
        (*this) = alpha_pow(2 * this->log_alpha());
    }
}

template<typename WordT, uint64_t Modulus, std::size_t Degree>
gf2m_lut_element<WordT, Modulus, Degree> gf2m_lut_element<WordT, Modulus, Degree>::operator+(const gf2m_lut_element<WordT, Modulus, Degree> &other) const
{
    gf2m_lut_element<WordT, Modulus, Degree> result(*this);
    return (result+=(other));
}

template<typename WordT, uint64_t Modulus, std::size_t Degree>
gf2m_lut_element<WordT, Modulus, Degree> gf2m_lut_element<WordT, Modulus, Degree>::operator-(const gf2m_lut_element<WordT, Modulus, Degree> &other) const
{
    gf2m_lut_element<WordT, Modulus, Degree> result(*this);
    return (result-=(other));
}

template<typename WordT, uint64_t Modulus, std::size_t Degree>
gf2m_lut_element<WordT, Modulus, Degree> gf2m_lut_element<WordT, Modulus, Degree>::operator-() const
{
    return gf2m_lut_element<WordT, Modulus, Degree>(*this);
}

template<typename WordT, uint64_t Modulus, std::size_t Degree>
gf2m_lut_element<WordT, Modulus, Degree> gf2m_lut_element<WordT, Modulus, Degree>::operator*(const gf2m_lut_element<WordT, Modulus, Degree> &other) const
{
    gf2m_lut_element<WordT, Modulus, Degree> result(*this);
    return (result*=(other));
}

template<typename WordT, uint64_t Modulus, std::size_t Degree>
gf2m_lut_element<WordT, Modulus, Degree> gf2m_lut_element<WordT, Modulus, Degree>::operator/(const gf2m_lut_element<WordT, Modulus, Degree> &other) const
{
    gf2m_lut_element<WordT, Modulus, Degree> result(*this);
    return (result/=(other));
}

template<typename WordT, uint64_t Modulus, std::size_t Degree>
gf2m_lut_element<WordT, Modulus, Degree> gf2m_lut_element<WordT, Modulus, Degree>::squared() const
{
    gf2m_lut_element<WordT, Modulus, Degree> result(*this);
    result.square();
    return result;
}

template<typename WordT, uint64_t Modulus, std::size_t Degree>
gf2m_lut_element<WordT, Modulus, Degree> gf2m_lut_element<WordT, Modulus, Degree>::inverse() const
{
    gf2m_lut_element<WordT, Modulus, Degree> result;
    if (!this->try_inverse(result))
    {
        throw divide_by_zero("gf2m_lut_element: zero has no multiplicative inverse");
    }
    return result;
}

template<typename WordT, uint64_t Modulus, std::size_t Degree>
bool gf2m_lut_element<WordT, Modulus, Degree>::try_inverse(gf2m_lut_element<WordT, Modulus, Degree> &result) const
{
    if (this->is_zero())
    {
        return false;
    }
    result = alpha_pow(multiplicative_order() - this->log_alpha());
    return true;
}

template<typename WordT, uint64_t Modulus, std::size_t Degree>
bool gf2m_lut_element<WordT, Modulus, Degree>::try_divide(const gf2m_lut_element<WordT, Modulus, Degree> &divisor,
                                                  gf2m_lut_element<WordT, Modulus, Degree> &result) const
{
    if (divisor.is_zero())
    {
        return false;
    }
    result = (*this) / divisor;
    return true;
}

template<typename WordT, uint64_t Modulus, std::size_t Degree>
void gf2m_lut_element<WordT, Modulus, Degree>::randomize()
{
    this->value_ = random_value<WordT>(extension_degree());
}

template<typename WordT, uint64_t Modulus, std::size_t Degree>
bool gf2m_lut_element<WordT, Modulus, Degree>::operator==(const gf2m_lut_element<WordT, Modulus, Degree> &other) const
{
    return (this->value_ == other.value_);
}

template<typename WordT, uint64_t Modulus, std::size_t Degree>
bool gf2m_lut_element<WordT, Modulus, Degree>::operator!=(const gf2m_lut_element<WordT, Modulus, Degree> &other) const
{
    return !(this->operator==(other));
}

template<typename WordT, uint64_t Modulus, std::size_t Degree>
bool gf2m_lut_element<WordT, Modulus, Degree>::is_zero() const
{
    return (this->value_ == 0);
}

template<typename WordT, uint64_t Modulus, std::size_t Degree>
bool gf2m_lut_element<WordT, Modulus, Degree>::validate() const
{
    return value_out_of_range(this->value_, extension_degree());
}

template<typename WordT, uint64_t Modulus, std::size_t Degree>
std::string gf2m_lut_element<WordT, Modulus, Degree>::to_string() const
{
    return format_value(this->value_, extension_degree());
}

template<typename WordT, uint64_t Modulus, std::size_t Degree>
void gf2m_lut_element<WordT, Modulus, Degree>::print() const
{
    printf("%s\n", this->to_string().c_str());
}

template<typename WordT, uint64_t Modulus, std::size_t Degree>
gf2m_lut_element<WordT, Modulus, Degree> gf2m_lut_element<WordT, Modulus, Degree>::random_element()
{
    gf2m_lut_element<WordT, Modulus, Degree> result;
    result.randomize();
    return result;
}

template<typename WordT, uint64_t Modulus, std::size_t Degree>
gf2m_lut_element<WordT, Modulus, Degree> gf2m_lut_element<WordT, Modulus, Degree>::zero()
{
    return gf2m_lut_element<WordT, Modulus, Degree>(0);
}

template<typename WordT, uint64_t Modulus, std::size_t Degree>
gf2m_lut_element<WordT, Modulus, Degree> gf2m_lut_element<WordT, Modulus, Degree>::one()
{
    return gf2m_lut_element<WordT, Modulus, Degree>(1);
}

template<typename WordT, uint64_t Modulus, std::size_t Degree>
gf2m_lut_element<WordT, Modulus, Degree> gf2m_lut_element<WordT, Modulus, Degree>::alpha()
{
    /* x, which is 1 in GF(2) itself */
    return alpha_pow(1);
}

template<typename WordT, uint64_t Modulus, std::size_t Degree>
void gf2m_lut_element<WordT, Modulus, Degree>::validate_modulus()
{
    validate_primitive_modulus(modulus_polynomial(), num_bits);
}

template<typename WordT, uint64_t Modulus, std::size_t Degree>
std::ostream& operator<<(std::ostream &out, const gf2m_lut_element<WordT, Modulus, Degree> &el)
{
    out << el.to_string();
    return out;
}

} // namespace libgf2m
