#include <cstdlib>

#include <functional>
#include <vector>

#include <gmp.h>
#include <fmt/format.h>

#include "cxx_mpz.hpp"
#include "macros.h"
#include "matrix.hpp"
#include "residue_mod.hpp"
#include "linalg/btri_errors.hpp"
#include "linalg/block_triangular.hpp"
#include "linalg/dense_kernel.hpp"
#include "linalg/label_partition.hpp"
#include "random_block_triangular.hpp"
#include "tests_common.h"

using btri::matrix;
using btri::labeling;
using btri::input_check;

/* identity labels on {1,2,3}, strictly upper triangular part plus
 * diagonal (2,3,5) */
static void test_upper_triangular_scenario()
{
    matrix<cxx_mpz> const M(3, 3, {
            2, 7, -4,
            0, 3, 11,
            0, 0, 5 });
    labeling<int> const b { 1, 2, 3 };
    ASSERT_ALWAYS(btri::is_block_triangular(M, b));
    ASSERT_ALWAYS(btri::block_triangular_det(M, b) == 30);
    ASSERT_ALWAYS(btri::block_triangular_det(M, b, input_check::validate) == 30);
    ASSERT_ALWAYS(btri::block_triangular_det_product(M, b) == 30);
    ASSERT_ALWAYS(btri::det_of_upper_triangular(M) == 30);
    ASSERT_ALWAYS(btri::det_of_lower_triangular(M.transpose()) == 30);
    ASSERT_ALWAYS(btri::dense_det(M) == 30);
}

static void test_boundary()
{
    ASSERT_ALWAYS(btri::block_triangular_det(matrix<cxx_mpz>(0, 0), labeling<int>()) == 1);
    ASSERT_ALWAYS(btri::block_triangular_det(matrix<cxx_mpq>(0, 0), labeling<int>()) == 1);
    ASSERT_ALWAYS(btri::block_triangular_det_product(matrix<cxx_mpz>(0, 0), labeling<int>()) == 1);

    /* a single label: any matrix, and the kernel's answer */
    matrix<cxx_mpz> const M(3, 3, { 1, 2, 3, 4, 5, 6, 7, 8, 10 });
    labeling<int> const b(3, 42);
    ASSERT_ALWAYS(btri::block_triangular_det(M, b, input_check::validate) == btri::dense_det(M));
    ASSERT_ALWAYS(btri::block_triangular_det(M, b) == -3);

    /* a singular diagonal block kills the product */
    matrix<cxx_mpz> const S(3, 3, { 1, 9, 9, 0, 2, 4, 0, 1, 2 });
    ASSERT_ALWAYS(btri::block_triangular_det(S, labeling<int> { 0, 1, 1 }) == 0);
}

static void test_invalid_input()
{
    matrix<cxx_mpz> const M(3, 3, {
            1, 2, 3,
            0, 1, 2,
            0, 4, 1 });
    labeling<int> const b { 0, 1, 2 };
    ASSERT_ALWAYS(!btri::is_block_triangular(M, b));
    ASSERT_ALWAYS(btri::is_block_triangular(M, labeling<int> { 0, 1, 1 }));

    bool caught = false;
    try {
        btri::block_triangular_det(M, b, input_check::validate);
    } catch (btri::invalid_input const & e) {
        caught = true;
        fmt::print("expected failure: {}\n", e.what());
    }
    ASSERT_ALWAYS(caught);

    caught = false;
    try {
        btri::det_of_upper_triangular(M);
    } catch (btri::invalid_input const &) {
        caught = true;
    }
    ASSERT_ALWAYS(caught);

    /* shapes are checked even when the caller is trusted */
    caught = false;
    try {
        btri::block_triangular_det(M, labeling<int> { 0, 1 });
    } catch (btri::invalid_input const &) {
        caught = true;
    }
    ASSERT_ALWAYS(caught);

    caught = false;
    try {
        btri::block_triangular_det(matrix<cxx_mpz>(2, 3), labeling<int> { 0, 1 });
    } catch (btri::invalid_input const &) {
        caught = true;
    }
    ASSERT_ALWAYS(caught);
}

template<typename T>
static void test_vs_dense(unsigned long iter, unsigned long bound)
{
    for(unsigned long t = 0 ; t < iter ; t++) {
        unsigned int const n = gmp_urandomm_ui(state, 9);
        unsigned int const nl = gmp_urandomm_ui(state, 4) + 1;
        labeling<int> const b = random_labeling(state, n, nl);
        matrix<T> const M = random_block_triangular<T>(state, b, bound);
        ASSERT_ALWAYS(btri::is_block_triangular(M, b));

        T const d = btri::block_triangular_det(M, b, input_check::validate);
        ASSERT_ALWAYS(d == btri::dense_det(M));
        ASSERT_ALWAYS(d == btri::block_triangular_det_product(M, b));

        if (tests_common_get_verbose())
            fmt::print("n={} labels={} det={}\n", n, btri::label_set(b).size(), d);
    }
}

/* relabeling by an increasing map, or permuting the indices together
 * with the labels, does not change the determinant */
static void test_order_invariance(unsigned long iter)
{
    for(unsigned long t = 0 ; t < iter ; t++) {
        unsigned int const n = gmp_urandomm_ui(state, 9);
        labeling<int> const b = random_labeling(state, n, 4);
        matrix<cxx_mpz> const M = random_block_triangular<cxx_mpz>(state, b, 10);
        cxx_mpz const d = btri::block_triangular_det(M, b);

        labeling<int> b2 = b;
        for(auto & x : b2)
            x = 3 * x * x - 17;
        ASSERT_ALWAYS(btri::block_triangular_det(M, b2, input_check::validate) == d);

        std::vector<unsigned int> const e = random_permutation(state, n);
        auto const [Me, be] = btri::block_triangular_reindex(M, b, e);
        ASSERT_ALWAYS(btri::block_triangular_det(Me, be, input_check::validate) == d);

        /* the transpose, for the dual order */
        ASSERT_ALWAYS(btri::block_triangular_det(M.transpose(), b, input_check::validate, std::greater<int>()) == d);
    }
}

int main(int argc, char const * argv[])
{
    unsigned long iter = 100;
    tests_common_cmdline(&argc, &argv, PARSE_SEED | PARSE_ITER | PARSE_VERBOSE);
    tests_common_get_iter(&iter);

    test_upper_triangular_scenario();
    test_boundary();
    test_invalid_input();
    test_vs_dense<cxx_mpz>(iter, 20);
    test_vs_dense<cxx_mpq>(iter, 20);
    test_vs_dense<btri::residue_mod<65521>>(iter, 1000);
    test_order_invariance(iter);

    tests_common_clear();
    return EXIT_SUCCESS;
}
