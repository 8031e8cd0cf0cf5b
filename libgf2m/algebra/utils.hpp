/**@file
 *****************************************************************************
 Operations over vectors of field elements.
 *****************************************************************************
 * @author     This file is part of libgf2m (see AUTHORS)
 * @copyright  MIT license (see LICENSE file)
 *****************************************************************************/
#ifndef LIBGF2M_ALGEBRA_UTILS_HPP_
#define LIBGF2M_ALGEBRA_UTILS_HPP_

#include <cstddef>
#include <vector>

namespace libgf2m {

template<typename FieldT>
std::vector<FieldT> random_vector(const std::size_t count);

/* Elementwise inverses with a single field inversion. With has_zeroes set,
   zero entries are allowed and map to zero; otherwise a zero entry makes
   the inversion throw divide_by_zero. */
template<typename FieldT>
std::vector<FieldT> batch_inverse(const std::vector<FieldT> &vec, const bool has_zeroes=false);

} // namespace libgf2m

#include "libgf2m/algebra/utils.tcc"

#endif // LIBGF2M_ALGEBRA_UTILS_HPP_
