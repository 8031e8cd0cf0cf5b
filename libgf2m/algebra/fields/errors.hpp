/**@file
 *****************************************************************************
 Exceptions thrown by the GF(2^m) field elements.
 *****************************************************************************
 * @author     This file is part of libgf2m (see AUTHORS)
 * @copyright  MIT license (see LICENSE file)
 *****************************************************************************/
#ifndef LIBGF2M_ALGEBRA_FIELDS_ERRORS_HPP_
#define LIBGF2M_ALGEBRA_FIELDS_ERRORS_HPP_

#include <stdexcept>
#include <string>

namespace libgf2m {

/* division by, or inversion of, the additive identity */
class divide_by_zero : public std::domain_error {
public:
    explicit divide_by_zero(const std::string &what) : std::domain_error(what) {}
};

/* a defining polynomial that cannot be used for the requested field backend */
class invalid_polynomial : public std::invalid_argument {
public:
    explicit invalid_polynomial(const std::string &what) : std::invalid_argument(what) {}
};

} // namespace libgf2m

#endif // LIBGF2M_ALGEBRA_FIELDS_ERRORS_HPP_
