#include "libgf2m/algebra/fields/errors.hpp"
#include "libgf2m/algebra/fields/utils.hpp"

namespace libgf2m {

void check_modulus_structure(const uint64_t modulus, const std::size_t degree, const std::size_t num_bits)
{
    const std::string name = "x^" + std::to_string(degree) + " + " + format_value(modulus, 0);

    if (degree < 1 || degree > num_bits)
    {
        throw invalid_polynomial("modulus " + name + " has degree " + std::to_string(degree) +
                                 ", expected a degree in [1, " + std::to_string(num_bits) + "]");
    }

    if (poly_degree(modulus) > static_cast<int>(degree))
    {
        throw invalid_polynomial("modulus " + name + " has terms above its leading term");
    }

    /* terms below the leading one */
    const uint64_t tail = (degree >= 64 ? modulus : (modulus & ((1ull << degree) - 1)));

    if ((tail & 1) == 0)
    {
        throw invalid_polynomial("modulus " + name + " is reducible: 0 is a root");
    }

    /* p(1) is the parity of the number of terms, the leading one included */
    std::size_t num_terms = 1;
    for (uint64_t rest = tail; rest != 0; rest >>= 1)
    {
        num_terms += (rest & 1);
    }
    if (num_terms % 2 == 0)
    {
        throw invalid_polynomial("modulus " + name + " is reducible: 1 is a root");
    }
}

} // namespace libgf2m
