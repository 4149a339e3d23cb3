#ifndef BTRI_LINALG_DENSE_KERNEL_HPP
#define BTRI_LINALG_DENSE_KERNEL_HPP

/* Determinant and inverse of a single dense square block, with no
 * structure assumed. This works over any ring described by
 * btri::ring_traits, which must be an integral domain.
 */

#include <optional>
#include <utility>

#include <fmt/format.h>

#include "macros.h"
#include "utils/matrix.hpp"
#include "utils/ring_traits.hpp"
#include "utils/verbose.h"
#include "btri_errors.hpp"

namespace btri {

/* {{{ dense_det: fraction-free (Bareiss) elimination
 *
 * After step k, A(i, j) for i, j > k is the (k+2)x(k+2) leading minor
 * built on rows 0..k,i and columns 0..k,j, so that all divisions are
 * exact. The last pivot is the determinant, up to the sign of the row
 * swaps.
 */
template<typename T>
T dense_det(matrix<T> const & M)
{
    typedef ring_traits<T> R;
    ASSERT_ALWAYS(M.is_square());
    unsigned int const n = M.nrows();
    if (n == 0)
        return R::one();

    matrix<T> A = M;
    bool negate = false;
    T prev = R::one();
    for(unsigned int k = 0 ; k < n ; k++) {
        unsigned int i1;
        for(i1 = k ; i1 < n && R::is_zero(A(i1, k)) ; i1++) ;
        if (i1 == n) /* this column is zero */
            return R::zero();
        if (i1 > k) {
            A.swap_rows(k, i1);
            negate = !negate;
        }
        for(unsigned int i = k + 1 ; i < n ; i++) {
            for(unsigned int j = k + 1 ; j < n ; j++) {
                A(i, j) = R::divexact(A(i, j) * A(k, k) - A(i, k) * A(k, j), prev);
            }
            A(i, k) = R::zero();
        }
        prev = A(k, k);
    }
    T d = A(n - 1, n - 1);
    return negate ? -d : d;
}
/* }}} */

namespace details {

/* {{{ Gauss-Jordan over a field. M is reduced in place, and the
 * transformation matrix is accumulated in Tr, so that on success Tr is
 * the inverse of the input M.
 */
template<typename T>
bool dense_gauss_jordan(matrix<T> & M, matrix<T> & Tr)
{
    typedef ring_traits<T> R;
    unsigned int const n = M.nrows();
    Tr = matrix<T>::identity(n);
    for(unsigned int j = 0 ; j < n ; j++) {
        unsigned int i1;
        for(i1 = j ; i1 < n && R::is_zero(M(i1, j)) ; i1++) ;
        if (i1 == n) /* rank defect */
            return false;
        if (i1 > j) {
            M.swap_rows(j, i1);
            Tr.swap_rows(j, i1);
        }
        /* canonicalize this row */
        T const c = R::inverse_unit(M(j, j));
        for(unsigned int k = 0 ; k < n ; k++) {
            M(j, k) *= c;
            Tr(j, k) *= c;
        }
        for(unsigned int i0 = 0 ; i0 < n ; i0++) {
            if (i0 == j)
                continue;
            /* row j is normalized, so all it takes is to multiply by
             * M(i0, j) */
            T const t = M(i0, j);
            if (R::is_zero(t))
                continue;
            for(unsigned int k = 0 ; k < n ; k++) {
                M(i0, k) -= t * M(j, k);
                Tr(i0, k) -= t * Tr(j, k);
            }
        }
    }
    return true;
}
/* }}} */

/* the minor of M with row i and column j removed */
template<typename T>
matrix<T> dense_minor(matrix<T> const & M, unsigned int i, unsigned int j)
{
    unsigned int const n = M.nrows();
    matrix<T> R(n - 1, n - 1);
    for(unsigned int a = 0, a1 = 0 ; a < n ; a++) {
        if (a == i) continue;
        for(unsigned int c = 0, c1 = 0 ; c < n ; c++) {
            if (c == j) continue;
            R(a1, c1++) = M(a, c);
        }
        a1++;
    }
    return R;
}

/* {{{ Adjugate divided by the determinant, which must be a unit. This is
 * for rings which are not fields, where elimination would leave the
 * ring. The blocks we see are small, so the cofactors are computed
 * one by one.
 */
template<typename T>
std::optional<matrix<T>> dense_try_inverse_unit_det(matrix<T> const & M)
{
    typedef ring_traits<T> R;
    unsigned int const n = M.nrows();
    T const d = dense_det(M);
    if (!R::is_unit(d))
        return std::nullopt;
    T const dinv = R::inverse_unit(d);
    matrix<T> inv(n, n);
    for(unsigned int i = 0 ; i < n ; i++) {
        for(unsigned int j = 0 ; j < n ; j++) {
            T c = dense_det(dense_minor(M, i, j)) * dinv;
            inv(j, i) = ((i + j) & 1) ? T(-c) : c;
        }
    }
    return inv;
}
/* }}} */

} /* namespace details */

/* Returns std::nullopt when M is not invertible over the ring. */
template<typename T>
std::optional<matrix<T>> dense_try_inverse(matrix<T> const & M)
{
    typedef ring_traits<T> R;
    ASSERT_ALWAYS(M.is_square());
    unsigned int const n = M.nrows();
    if (n == 0)
        return matrix<T>(0, 0);

    if (verbose_enabled(BTRI_VERBOSE_PRINT_KERNEL))
        verbose_fmt_print(0, 1, "# dense inverse of a {}x{} block over {}\n",
                n, n, R::name);

    if constexpr (R::is_field) {
        matrix<T> A = M;
        matrix<T> Tr;
        if (!details::dense_gauss_jordan(A, Tr))
            return std::nullopt;
        return Tr;
    } else {
        return details::dense_try_inverse_unit_det(M);
    }
}

template<typename T>
matrix<T> dense_inverse(matrix<T> const & M)
{
    std::optional<matrix<T>> inv = dense_try_inverse(M);
    if (!inv)
        throw singular_block(fmt::format("{}x{} block is not invertible over {}",
                    M.nrows(), M.ncols(), ring_traits<T>::name));
    return std::move(*inv);
}

} /* namespace btri */

#endif	/* BTRI_LINALG_DENSE_KERNEL_HPP */
