#include <cstdlib>

#include <functional>
#include <string>
#include <utility>
#include <vector>

#include <gmp.h>

#include "macros.h"
#include "linalg/btri_errors.hpp"
#include "linalg/index_subset.hpp"
#include "linalg/label_partition.hpp"
#include "random_block_triangular.hpp"
#include "tests_common.h"

using btri::index_subset;
using btri::labeling;

static std::vector<unsigned int> as_vector(index_subset const & S)
{
    return std::vector<unsigned int>(S.begin(), S.end());
}

static void test_index_subset()
{
    index_subset const S(6, { 1, 3, 4 });
    ASSERT_ALWAYS(S.size() == 3 && S.ambient_size() == 6);
    ASSERT_ALWAYS(S[0] == 1 && S[2] == 4);
    ASSERT_ALWAYS(S.position(3) == 1);
    ASSERT_ALWAYS(S.position(2) == index_subset::npos);
    ASSERT_ALWAYS(S.contains(4) && !S.contains(5));

    index_subset const C = S.complement();
    ASSERT_ALWAYS(as_vector(C) == std::vector<unsigned int>({ 0, 2, 5 }));
    ASSERT_ALWAYS(C.complement() == S);

    ASSERT_ALWAYS(index_subset(4).complement().empty());
    ASSERT_ALWAYS(index_subset(0).empty());

    auto const even = index_subset::from_predicate(7, [](unsigned int i) { return i % 2 == 0; });
    ASSERT_ALWAYS(as_vector(even) == std::vector<unsigned int>({ 0, 2, 4, 6 }));
}

static void test_queries()
{
    labeling<int> const b { 2, 0, 5, 2, 0, 7 };

    ASSERT_ALWAYS(btri::label_set(b) == std::vector<int>({ 0, 2, 5, 7 }));
    ASSERT_ALWAYS(btri::max_label(btri::label_set(b)) == 7);
    ASSERT_ALWAYS(btri::min_label(btri::label_set(b)) == 0);

    ASSERT_ALWAYS(as_vector(btri::prefix_indices(b, 5)) == std::vector<unsigned int>({ 0, 1, 3, 4 }));
    ASSERT_ALWAYS(as_vector(btri::indices_at(b, 2)) == std::vector<unsigned int>({ 0, 3 }));
    ASSERT_ALWAYS(as_vector(btri::indices_upto(b, 5)) == std::vector<unsigned int>({ 0, 1, 2, 3, 4 }));
    /* labels which do not occur are fine */
    ASSERT_ALWAYS(btri::indices_at(b, 3).empty());
    ASSERT_ALWAYS(btri::prefix_indices(b, 0).empty());
    ASSERT_ALWAYS(btri::indices_upto(b, 100).size() == b.size());

    ASSERT_ALWAYS(btri::restrict_labeling(b, btri::indices_upto(b, 2)) == labeling<int>({ 2, 0, 2, 0 }));

    auto const sizes = btri::block_sizes(b);
    ASSERT_ALWAYS(sizes.size() == 4);
    ASSERT_ALWAYS(sizes[0] == std::make_pair(0, 2u));
    ASSERT_ALWAYS(sizes[3] == std::make_pair(7, 1u));

    /* with the dual order, the max is the smallest integer */
    std::greater<int> const dual;
    ASSERT_ALWAYS(btri::label_set(b, dual) == std::vector<int>({ 7, 5, 2, 0 }));
    ASSERT_ALWAYS(btri::max_label(btri::label_set(b, dual), dual) == 0);
    ASSERT_ALWAYS(as_vector(btri::prefix_indices(b, 2, dual)) == std::vector<unsigned int>({ 2, 5 }));

    ASSERT_ALWAYS(btri::consecutive_labeling({ 2, 0, 1 }) == labeling<int>({ 0, 0, 2 }));
    ASSERT_ALWAYS(btri::identity_labeling(3) == labeling<int>({ 0, 1, 2 }));
    ASSERT_ALWAYS(btri::reindex_labeling(b, { 5, 4, 3, 2, 1, 0 }) == labeling<int>({ 7, 0, 2, 5, 0, 2 }));
}

static void test_string_labels()
{
    labeling<std::string> const b { "beta", "alpha", "beta", "gamma" };
    ASSERT_ALWAYS(btri::max_label(btri::label_set(b)) == "gamma");
    ASSERT_ALWAYS(btri::indices_at(b, std::string("beta")).size() == 2);
    ASSERT_ALWAYS(btri::prefix_indices(b, std::string("beta")).size() == 1);
}

static void test_empty()
{
    labeling<int> const b;
    ASSERT_ALWAYS(btri::label_set(b).empty());
    bool caught = false;
    try {
        btri::max_label(btri::label_set(b));
    } catch (btri::empty_domain const &) {
        caught = true;
    }
    ASSERT_ALWAYS(caught);
    caught = false;
    try {
        btri::min_label(btri::label_set(b));
    } catch (btri::empty_domain const &) {
        caught = true;
    }
    ASSERT_ALWAYS(caught);
    ASSERT_ALWAYS(btri::prefix_indices(b, 0).empty());
}

/* the three predicates are consistent with each other */
static void test_random(unsigned long iter)
{
    for(unsigned long t = 0 ; t < iter ; t++) {
        unsigned int const n = gmp_urandomm_ui(state, 20);
        labeling<int> const b = random_labeling(state, n, 5);
        unsigned int total = 0;
        for(auto const k : btri::label_set(b)) {
            index_subset const lt = btri::prefix_indices(b, k);
            index_subset const eq = btri::indices_at(b, k);
            index_subset const le = btri::indices_upto(b, k);
            ASSERT_ALWAYS(!eq.empty());
            ASSERT_ALWAYS(lt.size() + eq.size() == le.size());
            for(auto const i : le)
                ASSERT_ALWAYS(lt.contains(i) != eq.contains(i));
            total += eq.size();
        }
        ASSERT_ALWAYS(total == n);
    }
}

int main(int argc, char const * argv[])
{
    unsigned long iter = 100;
    tests_common_cmdline(&argc, &argv, PARSE_SEED | PARSE_ITER);
    tests_common_get_iter(&iter);

    test_index_subset();
    test_queries();
    test_string_labels();
    test_empty();
    test_random(iter);

    tests_common_clear();
    return EXIT_SUCCESS;
}
