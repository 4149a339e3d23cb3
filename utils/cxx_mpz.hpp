#ifndef BTRI_CXX_MPZ_HPP
#define BTRI_CXX_MPZ_HPP

#include <cstdint>
#include <cstdlib>

#include <compare>
#include <istream>
#include <ostream>
#include <string>
#include <type_traits>

#include <gmp.h>
#include <fmt/format.h>
#include <fmt/ostream.h>

#include "macros.h"

/* RAII wrappers around mpz_t and mpq_t. These are the exact scalars of
 * the block-triangular code: integers and rationals. Only the operations
 * a commutative ring (resp. field) needs are overloaded.
 */

struct cxx_mpz {
public:
    mpz_t x;
    // NOLINTBEGIN(cppcoreguidelines-pro-type-member-init,hicpp-member-init)

    /* we set to zero because both default-initialization and
     * value-initialization reach here. It makes better sense to take 0
     * for the value-initialized case.
     */
    cxx_mpz() { mpz_init_set_ui(x, 0); }

    template <typename T>
        // NOLINTNEXTLINE(hicpp-explicit-conversions)
        cxx_mpz (const T rhs)
        requires (std::is_integral_v<T> && std::is_signed_v<T>)
        {
            mpz_init_set_si(x, long(rhs));
        }
    template <typename T>
        // NOLINTNEXTLINE(hicpp-explicit-conversions)
        cxx_mpz (const T rhs)
        requires (std::is_integral_v<T> && std::is_unsigned_v<T>)
        {
            mpz_init_set_ui(x, (unsigned long) rhs);
        }
    template <typename T>
        cxx_mpz & operator=(const T a)
        requires (std::is_integral_v<T> && std::is_signed_v<T>)
        {
            mpz_set_si(x, long(a));
            return *this;
        }
    template <typename T>
        cxx_mpz & operator=(const T a)
        requires (std::is_integral_v<T> && std::is_unsigned_v<T>)
        {
            mpz_set_ui(x, (unsigned long) a);
            return *this;
        }

    ~cxx_mpz() { mpz_clear(x); }
    cxx_mpz(cxx_mpz const & o) {
        mpz_init_set(x, o.x);
    }
    // NOLINTNEXTLINE(hicpp-explicit-conversions)
    cxx_mpz(mpz_srcptr a) {
        mpz_init_set(x, a);
    }
    cxx_mpz & operator=(cxx_mpz const & o) {
        if (&o != this)
            mpz_set(x, o.x);
        return *this;
    }
    // NOLINTEND(cppcoreguidelines-pro-type-member-init,hicpp-member-init)

    cxx_mpz(cxx_mpz && o) noexcept
        : cxx_mpz()
    {
        mpz_swap(x, o.x);
    }
    cxx_mpz& operator=(cxx_mpz && o) noexcept {
        if (&o != this)
            mpz_swap(x, o.x);
        return *this;
    }
    // NOLINTBEGIN(hicpp-explicit-conversions)
    operator mpz_ptr() { return x; }
    operator mpz_srcptr() const { return x; }
    /* it is very impotant to have the conversion to bool, otherwise the
     * implicit conversion to mpz_ptr wins!
     */
    explicit operator bool() const { return mpz_sgn(x) != 0; }
    // NOLINTEND(hicpp-explicit-conversions)
    mpz_ptr operator->() { return x; }
    mpz_srcptr operator->() const { return x; }

    size_t bits() const { return mpz_sizeinbase(x, 2); }

    /* returns false (and leaves *this unspecified) if s is not a valid
     * integer in the given base */
    bool set_str(std::string const & s, int base = 10) {
        return mpz_set_str(x, s.c_str(), base) == 0;
    }
};

#if GNUC_VERSION_ATLEAST(4,3,0)
extern void mpz_init(cxx_mpz & pl) __attribute__((error("mpz_init must not be called on a mpz reference -- it is the caller's business (via a ctor)")));
extern void mpz_clear(cxx_mpz & pl) __attribute__((error("mpz_clear must not be called on a mpz reference -- it is the caller's business (via a dtor)")));
#endif

struct cxx_mpq{
    mpq_t x;
    cxx_mpq() {mpq_init(x);}
    ~cxx_mpq() {mpq_clear(x);}

    cxx_mpq(cxx_mpq const & o) {
        mpq_init(x);
        mpq_set(x, o.x);
    }
    cxx_mpq & operator=(cxx_mpq const & o) {
        if (&o != this)
            mpq_set(x, o.x);
        return *this;
    }
    cxx_mpq(cxx_mpq && o) noexcept {
        mpq_init(x);
        mpq_swap(x, o.x);
    }
    cxx_mpq& operator=(cxx_mpq && o) noexcept {
        if (&o != this)
            mpq_swap(x, o.x);
        return *this;
    }

    template<typename T>
    // NOLINTNEXTLINE(hicpp-explicit-conversions)
    cxx_mpq(T a, unsigned long b = 1)
        requires (std::is_integral_v<T> && std::is_signed_v<T>)
    {
        ASSERT_ALWAYS(b != 0);
        mpq_init(x);
        mpq_set_si(x, long(a), b);
        mpq_canonicalize(x);
    }
    template<typename T>
    // NOLINTNEXTLINE(hicpp-explicit-conversions)
    cxx_mpq(T a, unsigned long b = 1)
        requires (std::is_integral_v<T> && std::is_unsigned_v<T>)
    {
        ASSERT_ALWAYS(b != 0);
        mpq_init(x);
        mpq_set_ui(x, (unsigned long) a, b);
        mpq_canonicalize(x);
    }
    template <typename T>
        cxx_mpq & operator=(const T a)
        requires std::is_integral_v<T>
        {
            return *this = cxx_mpq(a);
        }

    // NOLINTNEXTLINE(hicpp-explicit-conversions)
    cxx_mpq(cxx_mpz const & a) {
        mpq_init(x);
        mpq_set_z(x, a);
    }
    // NOLINTNEXTLINE(hicpp-explicit-conversions)
    cxx_mpq(mpq_srcptr a) {
        mpq_init(x);
        mpq_set(x, a);
    }
    // NOLINTBEGIN(hicpp-explicit-conversions)
    operator mpq_ptr() { return x; }
    operator mpq_srcptr() const { return x; }
    // NOLINTEND(hicpp-explicit-conversions)
    mpq_ptr operator->() { return x; }
    mpq_srcptr operator->() const { return x; }

    explicit operator bool() const { return mpq_sgn(x) != 0; }

    /* accepts "p" or "p/q" ; the result is canonicalized */
    bool set_str(std::string const & s, int base = 10) {
        if (mpq_set_str(x, s.c_str(), base) != 0)
            return false;
        if (mpz_sgn(mpq_denref(x)) == 0)
            return false;
        mpq_canonicalize(x);
        return true;
    }
};
#if GNUC_VERSION_ATLEAST(4,3,0)
extern void mpq_init(cxx_mpq & pl) __attribute__((error("mpq_init must not be called on a mpq reference -- it is the caller's business (via a ctor)")));
extern void mpq_clear(cxx_mpq & pl) __attribute__((error("mpq_clear must not be called on a mpq reference -- it is the caller's business (via a dtor)")));
#endif

/* {{{ cxx_mpz comparisons and arithmetic */
static inline std::strong_ordering operator<=>(cxx_mpz const & a, cxx_mpz const & b)
{
    return mpz_cmp(a, b) <=> 0;
}
static inline bool operator==(cxx_mpz const & a, cxx_mpz const & b) {
    return mpz_cmp(a, b) == 0;
}
template <typename T>
static inline std::strong_ordering operator<=>(cxx_mpz const & a, T const & b)
    requires std::is_integral_v<T>
{
    return mpz_cmp(a, cxx_mpz(b)) <=> 0;
}
template <typename T>
static inline bool operator==(cxx_mpz const & a, T const & b)
    requires std::is_integral_v<T>
{
    return mpz_cmp(a, cxx_mpz(b)) == 0;
}

static inline cxx_mpz operator+(cxx_mpz const & a, cxx_mpz const & b) { cxx_mpz r; mpz_add(r, a, b); return r; }
static inline cxx_mpz & operator+=(cxx_mpz & a, cxx_mpz const & b) { mpz_add(a, a, b); return a; }
static inline cxx_mpz operator-(cxx_mpz const & a) { cxx_mpz r; mpz_neg(r, a); return r; }
static inline cxx_mpz operator-(cxx_mpz const & a, cxx_mpz const & b) { cxx_mpz r; mpz_sub(r, a, b); return r; }
static inline cxx_mpz & operator-=(cxx_mpz & a, cxx_mpz const & b) { mpz_sub(a, a, b); return a; }
static inline cxx_mpz operator*(cxx_mpz const & a, cxx_mpz const & b) { cxx_mpz r; mpz_mul(r, a, b); return r; }
static inline cxx_mpz & operator*=(cxx_mpz & a, cxx_mpz const & b) { mpz_mul(a, a, b); return a; }
/* truncating division, as in C. Exact division lives in ring_traits */
static inline cxx_mpz operator/(cxx_mpz const & a, cxx_mpz const & b) { cxx_mpz r; mpz_tdiv_q(r, a, b); return r; }
static inline cxx_mpz & operator/=(cxx_mpz & a, cxx_mpz const & b) { mpz_tdiv_q(a, a, b); return a; }
/* }}} */

/* {{{ cxx_mpq comparisons and arithmetic */
static inline std::strong_ordering operator<=>(cxx_mpq const & a, cxx_mpq const & b)
{
    return mpq_cmp(a, b) <=> 0;
}
static inline bool operator==(cxx_mpq const & a, cxx_mpq const & b)
{
    return mpq_equal(a, b) != 0;
}
template <typename T>
static inline bool operator==(cxx_mpq const & a, T const & b)
    requires std::is_integral_v<T>
{
    return mpq_equal(a, cxx_mpq(b)) != 0;
}

static inline cxx_mpq operator+(cxx_mpq const & a, cxx_mpq const & b) { cxx_mpq r; mpq_add(r, a, b); return r; }
static inline cxx_mpq & operator+=(cxx_mpq & a, cxx_mpq const & b) { mpq_add(a, a, b); return a; }
static inline cxx_mpq operator-(cxx_mpq const & a) { cxx_mpq r; mpq_neg(r, a); return r; }
static inline cxx_mpq operator-(cxx_mpq const & a, cxx_mpq const & b) { cxx_mpq r; mpq_sub(r, a, b); return r; }
static inline cxx_mpq & operator-=(cxx_mpq & a, cxx_mpq const & b) { mpq_sub(a, a, b); return a; }
static inline cxx_mpq operator*(cxx_mpq const & a, cxx_mpq const & b) { cxx_mpq r; mpq_mul(r, a, b); return r; }
static inline cxx_mpq & operator*=(cxx_mpq & a, cxx_mpq const & b) { mpq_mul(a, a, b); return a; }
static inline cxx_mpq operator/(cxx_mpq const & a, cxx_mpq const & b) {
    ASSERT_ALWAYS(mpq_sgn(b) != 0);
    cxx_mpq r;
    mpq_div(r, a, b);
    return r;
}
static inline cxx_mpq & operator/=(cxx_mpq & a, cxx_mpq const & b) {
    ASSERT_ALWAYS(mpq_sgn(b) != 0);
    mpq_div(a, a, b);
    return a;
}
/* }}} */

inline std::ostream& operator<<(std::ostream& os, cxx_mpz const& x) { return os << (mpz_srcptr) x; }
inline std::ostream& operator<<(std::ostream& os, cxx_mpq const& x) { return os << (mpq_srcptr) x; }
inline std::istream& operator>>(std::istream& is, cxx_mpz & x) { return is >> (mpz_ptr) x; }
inline std::istream& operator>>(std::istream& is, cxx_mpq & x) {
    is >> (mpq_ptr) x;
    if (is)
        mpq_canonicalize(x);
    return is;
}

namespace fmt {
    template <> struct formatter<cxx_mpz>: ostream_formatter {};
    template <> struct formatter<cxx_mpq>: ostream_formatter {};
}

/* a shorthand so that we can use user-defined literals */
static inline cxx_mpz operator""_mpz(char const * str, size_t)
{
    cxx_mpz res;
    mpz_set_str(res, str, 0);
    return res;
}

#endif	/* BTRI_CXX_MPZ_HPP */
