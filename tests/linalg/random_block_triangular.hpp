#ifndef BTRI_TESTS_RANDOM_BLOCK_TRIANGULAR_HPP
#define BTRI_TESTS_RANDOM_BLOCK_TRIANGULAR_HPP

/* Random block-triangular matrices for the tests. Entries are small
 * integers, seen in the ring T. */

#include <algorithm>
#include <vector>

#include <gmp.h>

#include "gmp_aux.h"
#include "utils/matrix.hpp"
#include "utils/ring_traits.hpp"
#include "linalg/index_subset.hpp"
#include "linalg/block_view.hpp"
#include "linalg/label_partition.hpp"

template<typename T>
static T random_scalar(gmp_randstate_t rstate, unsigned long bound)
{
    return T(gmp_urandom_symmetric_si(rstate, bound));
}

/* n labels in [0, nlabels), in no particular order */
static inline btri::labeling<int> random_labeling(gmp_randstate_t rstate, unsigned int n, unsigned int nlabels)
{
    btri::labeling<int> b(n);
    for(auto & x : b)
        x = gmp_urandomm_ui(rstate, nlabels);
    return b;
}

/* a random permutation of [0, n) */
static inline std::vector<unsigned int> random_permutation(gmp_randstate_t rstate, unsigned int n)
{
    std::vector<unsigned int> e(n);
    for(unsigned int i = 0 ; i < n ; i++)
        e[i] = i;
    for(unsigned int i = n ; i > 1 ; i--)
        std::swap(e[i-1], e[gmp_urandomm_ui(rstate, i)]);
    return e;
}

/* all allowed entries random, all forbidden entries zero */
template<typename T>
btri::matrix<T> random_block_triangular(gmp_randstate_t rstate, btri::labeling<int> const & b, unsigned long bound)
{
    unsigned int const n = b.size();
    btri::matrix<T> M(n, n);
    for(unsigned int i = 0 ; i < n ; i++)
        for(unsigned int j = 0 ; j < n ; j++)
            if (!(b[j] < b[i]))
                M(i, j) = random_scalar<T>(rstate, bound);
    return M;
}

/* L * U with L unit lower triangular and U upper triangular with
 * diagonal entries +-1 (if units_only) or nonzero. The determinant is
 * the product of the diagonal of U, so this is invertible over any
 * field, and over Z when units_only is set. */
template<typename T>
btri::matrix<T> random_invertible(gmp_randstate_t rstate, unsigned int n, unsigned long bound, bool units_only)
{
    btri::matrix<T> Lo = btri::matrix<T>::identity(n);
    btri::matrix<T> Up(n, n);
    for(unsigned int i = 0 ; i < n ; i++) {
        for(unsigned int j = 0 ; j < i ; j++)
            Lo(i, j) = random_scalar<T>(rstate, bound);
        for(unsigned int j = i + 1 ; j < n ; j++)
            Up(i, j) = random_scalar<T>(rstate, bound);
        long d;
        if (units_only) {
            d = gmp_urandomb_ui(rstate, 1) ? 1 : -1;
        } else {
            for(d = 0 ; d == 0 ; d = gmp_urandom_symmetric_si(rstate, bound)) ;
        }
        Up(i, i) = T(d);
    }
    return Lo * Up;
}

/* block triangular for b, with invertible diagonal blocks */
template<typename T>
btri::matrix<T> random_invertible_block_triangular(gmp_randstate_t rstate, btri::labeling<int> const & b, unsigned long bound, bool units_only)
{
    btri::matrix<T> M = random_block_triangular<T>(rstate, b, bound);
    for(auto const k : btri::label_set(b)) {
        btri::index_subset const p = btri::indices_at(b, k);
        btri::matrix<T> const D = random_invertible<T>(rstate, p.size(), bound, units_only);
        for(unsigned int a = 0 ; a < p.size() ; a++)
            for(unsigned int c = 0 ; c < p.size() ; c++)
                M(p[a], p[c]) = D(a, c);
    }
    return M;
}

#endif	/* BTRI_TESTS_RANDOM_BLOCK_TRIANGULAR_HPP */
