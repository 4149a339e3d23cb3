#ifndef BTRI_UTILS_RESIDUE_MOD_HPP
#define BTRI_UTILS_RESIDUE_MOD_HPP

#include <cstdint>

#include <compare>
#include <ostream>
#include <type_traits>

#include <fmt/format.h>
#include <fmt/ostream.h>

#include "macros.h"

namespace btri {

/* trial division, only meant for compile-time checks */
constexpr bool is_prime_u32(uint32_t n)
{
    if (n < 2)
        return false;
    for(uint64_t d = 2 ; d * d <= n ; d++)
        if (n % d == 0)
            return false;
    return true;
}

/* Residues modulo a prime p < 2^32, fixed at compile time. The value is
 * always kept reduced in [0, p). Products fit in 64 bits, so no Montgomery
 * representation is needed. Composite moduli are rejected, since
 * ring_traits advertises these residues as a field.
 */
template<uint32_t p>
class residue_mod {
    static_assert(is_prime_u32(p), "modulus must be prime");
    uint64_t v = 0;

    static uint64_t reduce_signed(int64_t a) {
        int64_t r = a % (int64_t) p;
        return r < 0 ? (uint64_t) (r + (int64_t) p) : (uint64_t) r;
    }

public:
    static constexpr uint32_t modulus = p;

    residue_mod() = default;
    template<typename T>
        // NOLINTNEXTLINE(hicpp-explicit-conversions)
        residue_mod(const T a)
        requires (std::is_integral_v<T> && std::is_signed_v<T>)
        : v(reduce_signed(int64_t(a)))
    {}
    template<typename T>
        // NOLINTNEXTLINE(hicpp-explicit-conversions)
        residue_mod(const T a)
        requires (std::is_integral_v<T> && std::is_unsigned_v<T>)
        : v(uint64_t(a) % p)
    {}

    uint64_t get() const { return v; }
    explicit operator bool() const { return v != 0; }

    bool operator==(residue_mod const & a) const { return v == a.v; }
    /* This is not an order on the ring, only a convenience for sorting */
    std::strong_ordering operator<=>(residue_mod const & a) const { return v <=> a.v; }

    residue_mod operator+(residue_mod const & a) const {
        residue_mod r;
        r.v = v + a.v;
        if (r.v >= p) r.v -= p;
        return r;
    }
    residue_mod& operator+=(residue_mod const & a) { return *this = *this + a; }
    residue_mod operator-() const {
        residue_mod r;
        r.v = v ? p - v : 0;
        return r;
    }
    residue_mod operator-(residue_mod const & a) const { return *this + (-a); }
    residue_mod& operator-=(residue_mod const & a) { return *this = *this - a; }
    residue_mod operator*(residue_mod const & a) const {
        residue_mod r;
        r.v = (v * a.v) % p;
        return r;
    }
    residue_mod& operator*=(residue_mod const & a) { return *this = *this * a; }

    /* Extended Euclid. Returns false only for zero */
    bool inverse(residue_mod & r) const {
        int64_t t = 0, newt = 1;
        int64_t rr = p, newr = (int64_t) v;
        for( ; newr != 0 ; ) {
            int64_t const q = rr / newr;
            int64_t tmp = t - q * newt; t = newt; newt = tmp;
            tmp = rr - q * newr; rr = newr; newr = tmp;
        }
        if (rr != 1)
            return false;
        r.v = reduce_signed(t);
        return true;
    }

    residue_mod operator/(residue_mod const & a) const {
        residue_mod ia;
        ASSERT_ALWAYS(a.inverse(ia));
        return *this * ia;
    }
    residue_mod& operator/=(residue_mod const & a) { return *this = *this / a; }
};

template<uint32_t p>
inline std::ostream& operator<<(std::ostream& os, residue_mod<p> const & x)
{
    return os << x.get();
}

} /* namespace btri */

namespace fmt {
    template<uint32_t p>
    struct formatter<btri::residue_mod<p>>: ostream_formatter {};
}

#endif	/* BTRI_UTILS_RESIDUE_MOD_HPP */
