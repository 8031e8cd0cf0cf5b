#include <cassert>

#include <sodium/randombytes.h>

#include "libgf2m/algebra/poly_div.hpp"

namespace libgf2m {

template<typename WordT>
bool value_out_of_range(const WordT &value, const std::size_t degree)
{
    typedef word_traits<WordT> traits;

    if (degree >= traits::num_bits)
    {
        return false;
    }
    return (static_cast<WordT>(value >> degree) != traits::zero());
}

template<typename WordT>
std::string format_value(const WordT &value, const std::size_t degree)
{
    typedef word_traits<WordT> traits;
    static const char hex_digits[] = "0123456789ABCDEF";

    std::size_t num_digits = (degree + 3) / 4;
    const std::size_t value_digits = static_cast<std::size_t>(poly_degree(value) + 4) / 4;
    if (value_digits > num_digits)
    {
        num_digits = value_digits;
    }

    std::string result("0x");
    result.reserve(2 + num_digits);
    for (std::size_t i = num_digits; i > 0; --i)
    {
        const WordT shifted = static_cast<WordT>(value >> (4 * (i - 1)));
        result.push_back(hex_digits[traits::to_uint64(shifted) & 0xF]);
    }

    return result;
}

template<typename WordT>
WordT random_value(const std::size_t degree)
{
    typedef word_traits<WordT> traits;
    assert(degree <= traits::num_bits);

    WordT value;
    randombytes_buf(&value, sizeof(WordT));
    if (degree == traits::num_bits)
    {
        return value;
    }

    const WordT all_ones = static_cast<WordT>(~traits::zero());
    const WordT mask = static_cast<WordT>(~static_cast<WordT>(all_ones << degree));
    return static_cast<WordT>(value & mask);
}

} // namespace libgf2m
