#include <cassert>
#include <string>

#include "libgf2m/algebra/fields/errors.hpp"
#include "libgf2m/algebra/fields/lut_tables.hpp"
#include "libgf2m/algebra/fields/utils.hpp"

namespace libgf2m {

uint64_t lfsr_step(const uint64_t value, const uint64_t modulus)
{
    const int degree = poly_degree(modulus);
    const uint64_t top_bit = (1ull << (degree - 1));

    /* the bit leaving position degree-1 is cancelled by the leading term */
    if (value & top_bit)
    {
        return (value << 1) ^ modulus;
    }
    return (value << 1);
}

uint64_t lfsr_period(const uint64_t modulus)
{
    const int degree = poly_degree(modulus);
    assert(degree >= 1 && degree < 64);

    const uint64_t order = (1ull << degree) - 1;
    uint64_t value = 1;
    for (uint64_t step = 1; step <= order; ++step)
    {
        value = lfsr_step(value, modulus);
        if (value == 1)
        {
            return step;
        }
    }

    return 0;
}

void validate_primitive_modulus(const uint64_t modulus, const std::size_t num_bits)
{
    const int degree = poly_degree(modulus);
    check_modulus_structure(modulus, (degree < 0 ? 0 : static_cast<std::size_t>(degree)), num_bits);

    const uint64_t order = (1ull << degree) - 1;
    const uint64_t period = lfsr_period(modulus);

    if (period != order)
    {
        throw invalid_polynomial("modulus " + format_value(modulus, 0) + " is not primitive: x has order " +
                                 std::to_string(period) + ", expected " + std::to_string(order));
    }
}

} // namespace libgf2m
