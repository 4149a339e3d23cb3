#ifndef BTRI_LINALG_BLOCK_TRIANGULAR_HPP
#define BTRI_LINALG_BLOCK_TRIANGULAR_HPP

/* Determinant and inverse of block-triangular matrices.
 *
 * M is block triangular with respect to a labeling b when
 *
 *      b(j) < b(i)  implies  M(i, j) == 0,
 *
 * i.e. an entry may be nonzero only if the label of its column is at
 * least the label of its row. With the identity labeling, this is the
 * usual notion of an upper triangular matrix. If the indices are sorted
 * by label, M is block upper triangular, with the diagonal blocks
 * indexed by the labels which occur in b.
 *
 * Both engines recurse on the set of labels which occur, removing the
 * largest label k at each step. With p = {b = k} and q = {b < k} its
 * complement, the rows in p vanish on the columns in q, so that up to a
 * simultaneous permutation of rows and columns
 *
 *      M = [ A  B ]      A on q x q, B on q x p, D on p x p
 *          [ 0  D ]
 *
 * and the restriction of b to q is a labeling of A without k.
 *
 * The engines trust the caller for the block-triangular property unless
 * input_check::validate is passed. Shapes are always checked.
 */

#include <functional>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "macros.h"
#include "utils/cxx_mpz.hpp"
#include "utils/matrix.hpp"
#include "utils/ring_traits.hpp"
#include "utils/verbose.h"
#include "btri_errors.hpp"
#include "index_subset.hpp"
#include "block_view.hpp"
#include "label_partition.hpp"
#include "dense_kernel.hpp"

namespace btri {

enum class input_check { trust, validate };

/* {{{ the predicate */
template<typename T, typename L, typename Compare = std::less<L>>
bool is_block_triangular(matrix<T> const & M, labeling<L> const & b, Compare const & cmp = Compare())
{
    if (!M.is_square() || b.size() != M.nrows())
        return false;
    for(unsigned int i = 0 ; i < M.nrows() ; i++)
        for(unsigned int j = 0 ; j < M.ncols() ; j++)
            if (cmp(b[j], b[i]) && !ring_traits<T>::is_zero(M(i, j)))
                return false;
    return true;
}

template<typename T, typename L>
void check_shapes(matrix<T> const & M, labeling<L> const & b)
{
    if (!M.is_square())
        throw invalid_input(fmt::format("matrix is {}x{}, not square",
                    M.nrows(), M.ncols()));
    if (b.size() != M.nrows())
        throw invalid_input(fmt::format("labeling has {} entries for a matrix of size {}",
                    b.size(), M.nrows()));
}

/* throws invalid_input, naming the first entry which breaks the property */
template<typename T, typename L, typename Compare = std::less<L>>
void check_block_triangular(matrix<T> const & M, labeling<L> const & b, Compare const & cmp = Compare())
{
    check_shapes(M, b);
    for(unsigned int i = 0 ; i < M.nrows() ; i++)
        for(unsigned int j = 0 ; j < M.ncols() ; j++)
            if (cmp(b[j], b[i]) && !ring_traits<T>::is_zero(M(i, j)))
                throw invalid_input(fmt::format(
                            "entry ({}, {}) is nonzero while the label of "
                            "column {} is below the label of row {}",
                            i, j, j, i));
}
/* }}} */

namespace details {

template<typename T, typename L, typename Compare>
T block_triangular_det_rec(matrix<T> const & M, labeling<L> const & b, Compare const & cmp, unsigned int depth)
{
    if (M.nrows() == 0)
        return ring_traits<T>::one();

    L const k = max_label(label_set(b, cmp), cmp);
    index_subset const p = indices_at(b, k, cmp);
    index_subset const q = p.complement();

    if (verbose_enabled(BTRI_VERBOSE_PRINT_RECURSION))
        verbose_fmt_print(0, 1, "# det: depth {}, diagonal block of size {}, {} indices left\n",
                depth, p.size(), q.size());

    T const dp = dense_det(principal_block(M, p));
    if (ring_traits<T>::is_zero(dp))
        return dp;

    return dp * block_triangular_det_rec(principal_block(M, q), restrict_labeling(b, q), cmp, depth + 1);
}

template<typename T, typename L, typename Compare>
matrix<T> invert_block_triangular_rec(matrix<T> const & M, labeling<L> const & b, Compare const & cmp, unsigned int depth)
{
    unsigned int const n = M.nrows();
    if (n == 0)
        return matrix<T>(0, 0);

    L const k = max_label(label_set(b, cmp), cmp);
    index_subset const p = indices_at(b, k, cmp);
    index_subset const q = p.complement();

    if (verbose_enabled(BTRI_VERBOSE_PRINT_RECURSION))
        verbose_fmt_print(0, 1, "# inverse: depth {}, diagonal block of size {}, prefix of size {}\n",
                depth, p.size(), q.size());

    /* dense_inverse throws singular_block, which goes to the caller */
    matrix<T> const Dinv = dense_inverse(principal_block(M, p));
    if (Dinv.nrows() != p.size() || Dinv.ncols() != p.size())
        throw internal_inconsistency(fmt::format(
                    "inverse of the {}x{} diagonal block at depth {} has shape {}x{}",
                    p.size(), p.size(), depth, Dinv.nrows(), Dinv.ncols()));

    matrix<T> const Ainv = invert_block_triangular_rec(principal_block(M, q), restrict_labeling(b, q), cmp, depth + 1);
    matrix<T> const B = extract(M, q, p);

    matrix<T> const tr = -(Ainv * B * Dinv);
    matrix<T> const bl(p.size(), q.size());

    matrix<T> Minv = combine(q, Ainv, tr, bl, Dinv);
    ASSERT_EXPENSIVE(is_block_triangular(Minv, b, cmp));
    return Minv;
}

} /* namespace details */

/* {{{ determinant */
template<typename T, typename L, typename Compare = std::less<L>>
T block_triangular_det(matrix<T> const & M, labeling<L> const & b,
        input_check check = input_check::trust,
        Compare const & cmp = Compare())
{
    check_shapes(M, b);
    if (check == input_check::validate)
        check_block_triangular(M, b, cmp);
    return details::block_triangular_det_rec(M, b, cmp, 0);
}

/* Same product, accumulated over the labels by increasing order. */
template<typename T, typename L, typename Compare = std::less<L>>
T block_triangular_det_product(matrix<T> const & M, labeling<L> const & b,
        input_check check = input_check::trust,
        Compare const & cmp = Compare())
{
    check_shapes(M, b);
    if (check == input_check::validate)
        check_block_triangular(M, b, cmp);
    T d = ring_traits<T>::one();
    for(auto const & k : label_set(b, cmp))
        d *= dense_det(principal_block(M, indices_at(b, k, cmp)));
    return d;
}

/* these throw invalid_input if M does not have the advertised shape */
template<typename T>
T det_of_upper_triangular(matrix<T> const & M)
{
    return block_triangular_det(M, identity_labeling(M.nrows()), input_check::validate);
}

template<typename T>
T det_of_lower_triangular(matrix<T> const & M)
{
    return block_triangular_det(M, identity_labeling(M.nrows()), input_check::validate, std::greater<int>());
}
/* }}} */

/* {{{ inverse
 *
 * The result is block triangular for the same labeling. A singular
 * input raises singular_block when the first non-invertible diagonal
 * block is met. With input_check::validate, the result is also checked
 * against the block-triangular property, and internal_inconsistency is
 * raised if it fails.
 */
template<typename T, typename L, typename Compare = std::less<L>>
matrix<T> invert_block_triangular(matrix<T> const & M, labeling<L> const & b,
        input_check check = input_check::trust,
        Compare const & cmp = Compare())
{
    check_shapes(M, b);
    if (check == input_check::validate)
        check_block_triangular(M, b, cmp);
    matrix<T> Minv = details::invert_block_triangular_rec(M, b, cmp, 0);
    if (check == input_check::validate) {
        if (!is_block_triangular(Minv, b, cmp))
            throw internal_inconsistency("inverse is not block triangular");
        if (!(M * Minv == matrix<T>::identity(M.nrows())))
            throw internal_inconsistency("M times its computed inverse is not the identity");
    }
    return Minv;
}

/* Inverse of the principal block of M on {b < k}, computed on its own.
 * This coincides with block_triangular_inverse_restriction(M^-1, b, k).
 */
template<typename T, typename L, typename Compare = std::less<L>>
matrix<T> prefix_inverse(matrix<T> const & M, labeling<L> const & b, L const & k,
        Compare const & cmp = Compare())
{
    check_shapes(M, b);
    index_subset const S = prefix_indices(b, k, cmp);
    return details::invert_block_triangular_rec(principal_block(M, S), restrict_labeling(b, S), cmp, 0);
}

template<typename T, typename L, typename Compare = std::less<L>>
matrix<T> block_triangular_inverse_restriction(matrix<T> const & Minv, labeling<L> const & b, L const & k,
        Compare const & cmp = Compare())
{
    check_shapes(Minv, b);
    return principal_block(Minv, prefix_indices(b, k, cmp));
}
/* }}} */

/* {{{ closure under the usual operations. The operands must be block
 * triangular for b; so is the result, which is checked in debug builds.
 */
template<typename T, typename L, typename Compare = std::less<L>>
matrix<T> block_triangular_add(matrix<T> const & A, matrix<T> const & B, labeling<L> const & b, Compare const & cmp = Compare())
{
    matrix<T> C = A + B;
    ASSERT(is_block_triangular(C, b, cmp));
    return C;
}

template<typename T, typename L, typename Compare = std::less<L>>
matrix<T> block_triangular_sub(matrix<T> const & A, matrix<T> const & B, labeling<L> const & b, Compare const & cmp = Compare())
{
    matrix<T> C = A - B;
    ASSERT(is_block_triangular(C, b, cmp));
    return C;
}

template<typename T, typename L, typename Compare = std::less<L>>
matrix<T> block_triangular_neg(matrix<T> const & A, labeling<L> const & b, Compare const & cmp = Compare())
{
    matrix<T> C = -A;
    ASSERT(is_block_triangular(C, b, cmp));
    return C;
}

template<typename T, typename L, typename Compare = std::less<L>>
matrix<T> block_triangular_mul(matrix<T> const & A, matrix<T> const & B, labeling<L> const & b, Compare const & cmp = Compare())
{
    matrix<T> C = A * B;
    ASSERT(is_block_triangular(C, b, cmp));
    return C;
}

/* block triangular for dual_order<Compare> */
template<typename T, typename L, typename Compare = std::less<L>>
matrix<T> block_triangular_transpose(matrix<T> const & A, labeling<L> const & b, Compare const & cmp = Compare())
{
    matrix<T> C = A.transpose();
    ASSERT(is_block_triangular(C, b, dual_order<Compare> { cmp }));
    return C;
}

/* the principal block on S, block triangular for b|_S */
template<typename T, typename L, typename Compare = std::less<L>>
std::pair<matrix<T>, labeling<L>> block_triangular_restrict(matrix<T> const & A, labeling<L> const & b, index_subset const & S, Compare const & cmp = Compare())
{
    std::pair<matrix<T>, labeling<L>> res { principal_block(A, S), restrict_labeling(b, S) };
    ASSERT(is_block_triangular(res.first, res.second, cmp));
    return res;
}

/* A(e(i), e(j)), block triangular for b o e */
template<typename T, typename L, typename Compare = std::less<L>>
std::pair<matrix<T>, labeling<L>> block_triangular_reindex(matrix<T> const & A, labeling<L> const & b, std::vector<unsigned int> const & e, Compare const & cmp = Compare())
{
    std::pair<matrix<T>, labeling<L>> res { reindex(A, e), reindex_labeling(b, e) };
    ASSERT(is_block_triangular(res.first, res.second, cmp));
    return res;
}
/* }}} */

extern template cxx_mpz block_triangular_det<cxx_mpz, int, std::less<int>>(matrix<cxx_mpz> const &, labeling<int> const &, input_check, std::less<int> const &);
extern template cxx_mpq block_triangular_det<cxx_mpq, int, std::less<int>>(matrix<cxx_mpq> const &, labeling<int> const &, input_check, std::less<int> const &);
extern template matrix<cxx_mpz> invert_block_triangular<cxx_mpz, int, std::less<int>>(matrix<cxx_mpz> const &, labeling<int> const &, input_check, std::less<int> const &);
extern template matrix<cxx_mpq> invert_block_triangular<cxx_mpq, int, std::less<int>>(matrix<cxx_mpq> const &, labeling<int> const &, input_check, std::less<int> const &);

} /* namespace btri */

#endif	/* BTRI_LINALG_BLOCK_TRIANGULAR_HPP */
