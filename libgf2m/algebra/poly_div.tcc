#include <stdexcept>

namespace libgf2m {

template<typename T>
int poly_degree(const T &poly)
{
    typedef word_traits<T> traits;
    return static_cast<int>(traits::num_bits) - 1 - static_cast<int>(traits::leading_zeros(poly));
}

template<typename T>
bool try_poly_div(const T &dividend, const T &divisor, poly_div_result<T> &result)
{
    typedef word_traits<T> traits;
    const T zero = traits::zero();
    const T one = traits::one();

    if (divisor == zero)
    {
        return false;
    }

    if (divisor == one)
    {
        result.quotient = dividend;
        result.remainder = zero;
        return true;
    }

    const int divisor_degree = poly_degree(divisor);
    const int dividend_degree = poly_degree(dividend);

    if (dividend_degree < divisor_degree)
    {
        result.quotient = zero;
        result.remainder = dividend;
        return true;
    }

    /* Long division as a shift register of divisor_degree bits: each step
       shifts in the next dividend bit, and when a bit leaves position
       divisor_degree-1 the divisor (leading term dropped) is subtracted. */
    const std::size_t feedback_position = static_cast<std::size_t>(divisor_degree - 1);
    const T feedback = static_cast<T>(divisor ^ static_cast<T>(one << divisor_degree));
    const T all_ones = static_cast<T>(~zero);
    const T mask = static_cast<T>(all_ones >> (traits::num_bits - static_cast<std::size_t>(divisor_degree)));

    T remainder = zero;
    T quotient = zero;

    for (int i = dividend_degree; i >= 0; --i)
    {
        const bool overflow = traits::test_bit(remainder, feedback_position);

        remainder = static_cast<T>(remainder << 1);
        if (traits::test_bit(dividend, static_cast<std::size_t>(i)))
        {
            remainder = static_cast<T>(remainder ^ one);
        }

        if (overflow)
        {
            remainder = static_cast<T>(remainder ^ feedback);
            quotient = static_cast<T>(quotient ^ static_cast<T>(one << i));
        }
    }

    result.quotient = quotient;
    result.remainder = static_cast<T>(remainder & mask);
    return true;
}

template<typename T>
poly_div_result<T> poly_div(const T &dividend, const T &divisor)
{
    poly_div_result<T> result;
    if (!try_poly_div(dividend, divisor, result))
    {
        throw std::domain_error("poly_div: division by the zero polynomial");
    }
    return result;
}

} // namespace libgf2m
