#ifndef BTRI_LINALG_INDEX_SUBSET_HPP
#define BTRI_LINALG_INDEX_SUBSET_HPP

/* This is only an abstract description of a subset of the index range
 * [0, n) of a square matrix. It can be used on any matrix type that has
 * methods .nrows() and .ncols(). The positions 0..size()-1 of the subset
 * are in bijection with the selected indices, which are kept in
 * increasing order.
 */

#include <algorithm>
#include <utility>
#include <vector>

#include "macros.h"

namespace btri {

struct index_subset {
    private:
    std::vector<unsigned int> idx;
    unsigned int n = 0;

    public:
    static constexpr unsigned int npos = -1;

    index_subset() = default;
    /* the full range [0, n) */
    explicit index_subset(unsigned int n) : idx(n), n(n) {
        for(unsigned int i = 0 ; i < n ; i++)
            idx[i] = i;
    }
    index_subset(unsigned int n, std::vector<unsigned int> indices)
        : idx(std::move(indices)), n(n)
    {
        ASSERT_ALWAYS(std::is_sorted(idx.begin(), idx.end()));
        ASSERT_ALWAYS(std::adjacent_find(idx.begin(), idx.end()) == idx.end());
        ASSERT_ALWAYS(idx.empty() || idx.back() < n);
    }

    template<typename Pred>
    static index_subset from_predicate(unsigned int n, Pred const & pred)
    {
        std::vector<unsigned int> v;
        for(unsigned int i = 0 ; i < n ; i++)
            if (pred(i))
                v.push_back(i);
        return index_subset(n, std::move(v));
    }

    unsigned int size() const { return idx.size(); }
    bool empty() const { return idx.empty(); }
    /* size of the ambient range */
    unsigned int ambient_size() const { return n; }

    /* position -> original index */
    unsigned int operator[](unsigned int k) const {
        ASSERT(k < idx.size());
        return idx[k];
    }

    /* original index -> position, or npos */
    unsigned int position(unsigned int i) const {
        auto it = std::lower_bound(idx.begin(), idx.end(), i);
        if (it == idx.end() || *it != i)
            return npos;
        return it - idx.begin();
    }
    bool contains(unsigned int i) const { return position(i) != npos; }

    index_subset complement() const {
        std::vector<unsigned int> v;
        v.reserve(n - idx.size());
        auto it = idx.begin();
        for(unsigned int i = 0 ; i < n ; i++) {
            if (it != idx.end() && *it == i) {
                ++it;
                continue;
            }
            v.push_back(i);
        }
        return index_subset(n, std::move(v));
    }

    template<typename T>
    inline bool valid(T const & a) const {
        return a.nrows() == n && a.ncols() == n;
    }

    std::vector<unsigned int>::const_iterator begin() const { return idx.begin(); }
    std::vector<unsigned int>::const_iterator end() const { return idx.end(); }

    bool operator==(index_subset const & a) const {
        return n == a.n && idx == a.idx;
    }
};

} /* namespace btri */

#endif	/* BTRI_LINALG_INDEX_SUBSET_HPP */
