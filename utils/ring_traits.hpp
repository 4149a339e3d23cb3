#ifndef BTRI_UTILS_RING_TRAITS_HPP
#define BTRI_UTILS_RING_TRAITS_HPP

#include <cstdint>

#include <gmp.h>

#include "cxx_mpz.hpp"
#include "macros.h"
#include "residue_mod.hpp"

namespace btri {

/* What the dense kernel and the block engines need to know about the
 * scalars, beyond the +, -, * and == operators: the two constants, unit
 * detection and inversion of units, and exact division (the quotient is
 * known to exist, as in fraction-free elimination).
 *
 * is_field tells whether every nonzero element is a unit, in which case
 * the dense kernel may use plain Gauss-Jordan elimination.
 *
 * The scalars are assumed to form an integral domain, which is what
 * makes Bareiss elimination exact.
 */
template<typename T>
struct ring_traits;

template<>
struct ring_traits<cxx_mpz> {
    static constexpr bool is_field = false;
    static constexpr const char * name = "Z";
    static cxx_mpz zero() { return 0; }
    static cxx_mpz one() { return 1; }
    static bool is_zero(cxx_mpz const & a) { return mpz_sgn(a) == 0; }
    static bool is_unit(cxx_mpz const & a) { return mpz_cmpabs_ui(a, 1) == 0; }
    static cxx_mpz inverse_unit(cxx_mpz const & a) {
        ASSERT_ALWAYS(is_unit(a));
        return a;
    }
    static cxx_mpz divexact(cxx_mpz const & a, cxx_mpz const & b) {
        ASSERT_EXPENSIVE(mpz_divisible_p(a, b));
        cxx_mpz q;
        mpz_divexact(q, a, b);
        return q;
    }
};

template<>
struct ring_traits<cxx_mpq> {
    static constexpr bool is_field = true;
    static constexpr const char * name = "Q";
    static cxx_mpq zero() { return 0; }
    static cxx_mpq one() { return 1; }
    static bool is_zero(cxx_mpq const & a) { return mpq_sgn(a) == 0; }
    static bool is_unit(cxx_mpq const & a) { return !is_zero(a); }
    static cxx_mpq inverse_unit(cxx_mpq const & a) {
        ASSERT_ALWAYS(is_unit(a));
        cxx_mpq r;
        mpq_inv(r, a);
        return r;
    }
    static cxx_mpq divexact(cxx_mpq const & a, cxx_mpq const & b) {
        return a / b;
    }
};

template<uint32_t p>
struct ring_traits<residue_mod<p>> {
    typedef residue_mod<p> T;
    static constexpr bool is_field = true;
    static constexpr const char * name = "GF(p)";
    static T zero() { return 0; }
    static T one() { return 1; }
    static bool is_zero(T const & a) { return !a; }
    static bool is_unit(T const & a) {
        T r;
        return a.inverse(r);
    }
    static T inverse_unit(T const & a) {
        T r;
        ASSERT_ALWAYS(a.inverse(r));
        return r;
    }
    static T divexact(T const & a, T const & b) { return a / b; }
};

} /* namespace btri */

#endif	/* BTRI_UTILS_RING_TRAITS_HPP */
