#ifndef BTRI_LINALG_BLOCK_VIEW_HPP
#define BTRI_LINALG_BLOCK_VIEW_HPP

/* Slicing of square matrices along index subsets, and the reverse
 * operation which assembles a matrix from the four blocks cut by a
 * subset and its complement.
 */

#include <vector>

#include "macros.h"
#include "utils/matrix.hpp"
#include "index_subset.hpp"

namespace btri {

/* The submatrix with rows in I and columns in J, in increasing index
 * order.
 */
template<typename T>
matrix<T> extract(matrix<T> const & M, index_subset const & I, index_subset const & J)
{
    ASSERT_ALWAYS(I.ambient_size() == M.nrows());
    ASSERT_ALWAYS(J.ambient_size() == M.ncols());
    matrix<T> R(I.size(), J.size());
    for(unsigned int a = 0 ; a < I.size() ; a++)
        for(unsigned int c = 0 ; c < J.size() ; c++)
            R(a, c) = M(I[a], J[c]);
    return R;
}

template<typename T>
matrix<T> principal_block(matrix<T> const & M, index_subset const & S)
{
    return extract(M, S, S);
}

/* Inverse of the slicing by S and its complement S': the result R has
 *      R restricted to S  x S  == tl,  R restricted to S  x S' == tr,
 *      R restricted to S' x S  == bl,  R restricted to S' x S' == br.
 * All entries land at their original index.
 */
template<typename T>
matrix<T> combine(index_subset const & S,
        matrix<T> const & tl, matrix<T> const & tr,
        matrix<T> const & bl, matrix<T> const & br)
{
    index_subset const Sc = S.complement();
    unsigned int const n = S.ambient_size();
    unsigned int const s = S.size();
    unsigned int const t = Sc.size();
    ASSERT_ALWAYS(tl.nrows() == s && tl.ncols() == s);
    ASSERT_ALWAYS(tr.nrows() == s && tr.ncols() == t);
    ASSERT_ALWAYS(bl.nrows() == t && bl.ncols() == s);
    ASSERT_ALWAYS(br.nrows() == t && br.ncols() == t);

    matrix<T> R(n, n);
    for(unsigned int a = 0 ; a < s ; a++) {
        for(unsigned int c = 0 ; c < s ; c++)
            R(S[a], S[c]) = tl(a, c);
        for(unsigned int c = 0 ; c < t ; c++)
            R(S[a], Sc[c]) = tr(a, c);
    }
    for(unsigned int a = 0 ; a < t ; a++) {
        for(unsigned int c = 0 ; c < s ; c++)
            R(Sc[a], S[c]) = bl(a, c);
        for(unsigned int c = 0 ; c < t ; c++)
            R(Sc[a], Sc[c]) = br(a, c);
    }
    return R;
}

/* e is a bijection of [0, n), given by its images. Returns true if it
 * really is one.
 */
inline bool is_permutation_of_range(std::vector<unsigned int> const & e)
{
    std::vector<bool> seen(e.size(), false);
    for(auto const i : e) {
        if (i >= e.size() || seen[i])
            return false;
        seen[i] = true;
    }
    return true;
}

/* R(i, j) = M(e[i], e[j]) */
template<typename T>
matrix<T> reindex(matrix<T> const & M, std::vector<unsigned int> const & e)
{
    ASSERT_ALWAYS(M.is_square());
    ASSERT_ALWAYS(e.size() == M.nrows());
    ASSERT_ALWAYS(is_permutation_of_range(e));
    unsigned int const n = M.nrows();
    matrix<T> R(n, n);
    for(unsigned int i = 0 ; i < n ; i++)
        for(unsigned int j = 0 ; j < n ; j++)
            R(i, j) = M(e[i], e[j]);
    return R;
}

/* Block-diagonal matrix with the given square blocks, in this order */
template<typename T>
matrix<T> block_diagonal(std::vector<matrix<T>> const & blocks)
{
    unsigned int n = 0;
    for(auto const & B : blocks) {
        ASSERT_ALWAYS(B.is_square());
        n += B.nrows();
    }
    matrix<T> R(n, n);
    unsigned int i0 = 0;
    for(auto const & B : blocks) {
        for(unsigned int i = 0 ; i < B.nrows() ; i++)
            for(unsigned int j = 0 ; j < B.ncols() ; j++)
                R(i0 + i, i0 + j) = B(i, j);
        i0 += B.nrows();
    }
    return R;
}

} /* namespace btri */

#endif	/* BTRI_LINALG_BLOCK_VIEW_HPP */
