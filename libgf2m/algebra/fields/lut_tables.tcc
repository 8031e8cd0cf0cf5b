#include <cassert>

#include "libgf2m/algebra/poly_div.hpp"
#include "libgf2m/algebra/word_traits.hpp"

namespace libgf2m {

template<typename WordT>
gf2m_lut_tables<WordT> build_lut_tables(const uint64_t modulus)
{
    typedef word_traits<WordT> traits;
    static_assert(traits::num_bits <= 16, "exp/log tables are only built for words of at most 16 bits");

    validate_primitive_modulus(modulus, traits::num_bits);

    const int degree = poly_degree(modulus);
    const uint64_t order = (1ull << degree) - 1;
    const std::size_t table_size = (1ull << traits::num_bits);

    gf2m_lut_tables<WordT> tables;
    tables.exp_table.assign(table_size, traits::zero());
    tables.log_table.assign(table_size, -1);

    uint64_t value = 1;
    for (uint64_t i = 0; i < order; ++i)
    {
        tables.exp_table[i] = traits::from_uint64(value);
        tables.log_table[value] = static_cast<int32_t>(i);
        value = lfsr_step(value, modulus);
    }
    assert(value == 1);

    return tables;
}

} // namespace libgf2m
