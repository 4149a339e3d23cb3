#ifndef BTRI_LINALG_LABEL_PARTITION_HPP
#define BTRI_LINALG_LABEL_PARTITION_HPP

/* A labeling b assigns to each index i in [0, n) a label b[i] in a
 * linearly ordered set. The order is given by a comparator, std::less<L>
 * by default; two labels are equal when neither compares below the
 * other. The queries here partition [0, n) according to the labels.
 */

#include <algorithm>
#include <functional>
#include <utility>
#include <vector>

#include "macros.h"
#include "index_subset.hpp"
#include "btri_errors.hpp"

namespace btri {

template<typename L>
using labeling = std::vector<L>;

/* Reverses the order. Block-triangular matrices become
 * block-triangular for the dual order under transposition. */
template<typename Compare>
struct dual_order {
    Compare cmp;
    template<typename L>
    bool operator()(L const & a, L const & b) const { return cmp(b, a); }
};

template<typename L, typename Compare = std::less<L>>
bool labels_equal(L const & a, L const & b, Compare const & cmp = Compare())
{
    return !cmp(a, b) && !cmp(b, a);
}

/* image(b), sorted increasingly, without repetitions */
template<typename L, typename Compare = std::less<L>>
std::vector<L> label_set(labeling<L> const & b, Compare const & cmp = Compare())
{
    std::vector<L> v(b.begin(), b.end());
    std::sort(v.begin(), v.end(), cmp);
    auto eq = [&cmp](L const & x, L const & y) { return labels_equal(x, y, cmp); };
    v.erase(std::unique(v.begin(), v.end(), eq), v.end());
    return v;
}

template<typename L, typename Compare = std::less<L>>
L max_label(std::vector<L> const & labels, Compare const & cmp = Compare())
{
    if (labels.empty())
        throw empty_domain("maximum of an empty label set");
    return *std::max_element(labels.begin(), labels.end(), cmp);
}

template<typename L, typename Compare = std::less<L>>
L min_label(std::vector<L> const & labels, Compare const & cmp = Compare())
{
    if (labels.empty())
        throw empty_domain("minimum of an empty label set");
    return *std::min_element(labels.begin(), labels.end(), cmp);
}

/* {i | b(i) < k} */
template<typename L, typename Compare = std::less<L>>
index_subset prefix_indices(labeling<L> const & b, L const & k, Compare const & cmp = Compare())
{
    return index_subset::from_predicate(b.size(),
            [&](unsigned int i) { return cmp(b[i], k); });
}

/* {i | b(i) = k} */
template<typename L, typename Compare = std::less<L>>
index_subset indices_at(labeling<L> const & b, L const & k, Compare const & cmp = Compare())
{
    return index_subset::from_predicate(b.size(),
            [&](unsigned int i) { return labels_equal(b[i], k, cmp); });
}

/* {i | b(i) <= k} */
template<typename L, typename Compare = std::less<L>>
index_subset indices_upto(labeling<L> const & b, L const & k, Compare const & cmp = Compare())
{
    return index_subset::from_predicate(b.size(),
            [&](unsigned int i) { return !cmp(k, b[i]); });
}

/* b|_S, indexed by the positions of S */
template<typename L>
labeling<L> restrict_labeling(labeling<L> const & b, index_subset const & S)
{
    ASSERT_ALWAYS(S.ambient_size() == b.size());
    labeling<L> r;
    r.reserve(S.size());
    for(auto const i : S)
        r.push_back(b[i]);
    return r;
}

/* b o e, for e a bijection of [0, n) */
template<typename L>
labeling<L> reindex_labeling(labeling<L> const & b, std::vector<unsigned int> const & e)
{
    ASSERT_ALWAYS(e.size() == b.size());
    labeling<L> r;
    r.reserve(e.size());
    for(auto const i : e) {
        ASSERT_ALWAYS(i < b.size());
        r.push_back(b[i]);
    }
    return r;
}

/* (label, number of indices carrying it), by increasing label */
template<typename L, typename Compare = std::less<L>>
std::vector<std::pair<L, unsigned int>> block_sizes(labeling<L> const & b, Compare const & cmp = Compare())
{
    std::vector<std::pair<L, unsigned int>> res;
    for(auto const & k : label_set(b, cmp))
        res.emplace_back(k, indices_at(b, k, cmp).size());
    return res;
}

inline labeling<int> identity_labeling(unsigned int n)
{
    labeling<int> b(n);
    for(unsigned int i = 0 ; i < n ; i++)
        b[i] = i;
    return b;
}

/* labels 0,...,0, 1,...,1, ... with the given multiplicities */
inline labeling<int> consecutive_labeling(std::vector<unsigned int> const & sizes)
{
    labeling<int> b;
    for(unsigned int k = 0 ; k < sizes.size() ; k++)
        b.insert(b.end(), sizes[k], int(k));
    return b;
}

} /* namespace btri */

#endif	/* BTRI_LINALG_LABEL_PARTITION_HPP */
