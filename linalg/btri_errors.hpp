#ifndef BTRI_LINALG_BTRI_ERRORS_HPP
#define BTRI_LINALG_BTRI_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace btri {

/* A block which the caller (or the recursion) expects to be invertible
 * is not. Raised by the dense kernel.
 */
struct singular_block : public std::runtime_error {
    explicit singular_block(std::string const & what)
        : std::runtime_error(what)
    {}
};

/* Input rejected upfront: shapes do not match, or the matrix is not
 * block triangular with respect to the labeling.
 */
struct invalid_input : public std::runtime_error {
    explicit invalid_input(std::string const & what)
        : std::runtime_error(what)
    {}
};

struct internal_inconsistency : public std::runtime_error {
    explicit internal_inconsistency(std::string const & what)
        : std::runtime_error(what)
    {}
};

/* max_label / min_label of an empty label set */
struct empty_domain : public std::runtime_error {
    explicit empty_domain(std::string const & what)
        : std::runtime_error(what)
    {}
};

} /* namespace btri */

#endif	/* BTRI_LINALG_BTRI_ERRORS_HPP */
