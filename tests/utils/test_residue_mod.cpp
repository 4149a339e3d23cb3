#include <cstdint>
#include <cstdlib>

#include <gmp.h>
#include <fmt/format.h>

#include "macros.h"
#include "residue_mod.hpp"
#include "ring_traits.hpp"
#include "tests_common.h"

typedef btri::residue_mod<1009> gf;

static void test_reduction()
{
    ASSERT_ALWAYS(gf(1009).get() == 0);
    ASSERT_ALWAYS(gf(-1).get() == 1008);
    ASSERT_ALWAYS(gf(-2018).get() == 0);
    ASSERT_ALWAYS(gf(2020UL).get() == 2);
    ASSERT_ALWAYS(gf(500) + gf(600) == gf(91));
    ASSERT_ALWAYS(gf(3) - gf(5) == gf(-2));
    ASSERT_ALWAYS(-gf(0) == gf(0));
    ASSERT_ALWAYS(gf(1000) * gf(1000) == gf(1000000 % 1009));
    ASSERT_ALWAYS(fmt::format("{}", gf(-1)) == "1008");
}

static void test_inverse(unsigned long iter)
{
    gf r;
    ASSERT_ALWAYS(!gf(0).inverse(r));
    for(unsigned long t = 0 ; t < iter ; t++) {
        gf const a(gmp_urandomm_ui(state, 1008) + 1);
        ASSERT_ALWAYS(a.inverse(r));
        ASSERT_ALWAYS(a * r == gf(1));
        ASSERT_ALWAYS((gf(7) / a) * a == gf(7));
    }

    typedef btri::residue_mod<2> gf2;
    gf2 s;
    ASSERT_ALWAYS(gf2(1).inverse(s) && s == gf2(1));
    ASSERT_ALWAYS(!gf2(2).inverse(s));
}

static void test_modulus_check()
{
    static_assert(btri::is_prime_u32(2));
    static_assert(btri::is_prime_u32(1009));
    static_assert(btri::is_prime_u32(65521));
    static_assert(btri::is_prime_u32(4294967291u));
    static_assert(!btri::is_prime_u32(0));
    static_assert(!btri::is_prime_u32(1));
    static_assert(!btri::is_prime_u32(12));
    static_assert(!btri::is_prime_u32(65535));
    /* 65521^2 */
    static_assert(!btri::is_prime_u32(4293001441u));
}

static void test_traits()
{
    typedef btri::ring_traits<gf> R;
    static_assert(R::is_field);
    ASSERT_ALWAYS(R::is_zero(R::zero()));
    ASSERT_ALWAYS(R::is_unit(R::one()));
    ASSERT_ALWAYS(!R::is_unit(gf(0)));
    ASSERT_ALWAYS(R::inverse_unit(gf(2)) == gf(505));
    ASSERT_ALWAYS(R::divexact(gf(10), gf(5)) == gf(2));

    typedef btri::ring_traits<cxx_mpz> Z;
    static_assert(!Z::is_field);
    ASSERT_ALWAYS(Z::is_unit(cxx_mpz(-1)));
    ASSERT_ALWAYS(!Z::is_unit(cxx_mpz(2)));
    ASSERT_ALWAYS(Z::divexact(cxx_mpz(-42), cxx_mpz(7)) == -6);

    typedef btri::ring_traits<cxx_mpq> Q;
    ASSERT_ALWAYS(Q::inverse_unit(cxx_mpq(-2, 3)) == cxx_mpq(-3, 2));
    ASSERT_ALWAYS(!Q::is_unit(cxx_mpq(0)));
}

int main(int argc, char const * argv[])
{
    unsigned long iter = 100;
    tests_common_cmdline(&argc, &argv, PARSE_SEED | PARSE_ITER);
    tests_common_get_iter(&iter);

    test_reduction();
    test_inverse(iter);
    test_traits();
    test_modulus_check();

    tests_common_clear();
    return EXIT_SUCCESS;
}
