#include "libgf2m/algebra/fields/errors.hpp"

namespace libgf2m {

template<typename FieldT>
std::vector<FieldT> random_vector(const std::size_t count)
{
    std::vector<FieldT> result;
    result.reserve(count);
    for (std::size_t i = 0; i < count; i++)
    {
        result.emplace_back(FieldT::random_element());
    }

    return result;
}

template<typename FieldT>
std::vector<FieldT> batch_inverse(const std::vector<FieldT> &vec, const bool has_zeroes)
{
    /* prefix[i] is the product of the nonzero entries before i */
    std::vector<FieldT> prefix;
    prefix.reserve(vec.size());

    FieldT running = FieldT::one();
    for (const FieldT &el : vec)
    {
        prefix.emplace_back(running);
        if (el.is_zero())
        {
            if (!has_zeroes)
            {
                throw divide_by_zero("batch_inverse: zero entry");
            }
            continue;
        }
        running *= el;
    }

    /* running_inverse is the inverse of the product of the nonzero entries
       before i+1, walking i down */
    FieldT running_inverse = running.inverse();
    std::vector<FieldT> result(vec.size(), FieldT::zero());
    for (std::size_t i = vec.size(); i-- > 0; )
    {
        if (vec[i].is_zero())
        {
            continue;
        }
        result[i] = prefix[i] * running_inverse;
        running_inverse *= vec[i];
    }

    return result;
}

} // namespace libgf2m
