#ifndef BTRI_UTILS_MATRIX_HPP
#define BTRI_UTILS_MATRIX_HPP

/* This defines dense matrices over arbitrary types, provided that these
 * have standard operator overloads defined (+, -, *, ==), and that a
 * value-initialized T is the zero of the ring. This is the matrix type
 * that the block-triangular code reads and produces.
 */

#include <ostream>
#include <type_traits>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <fmt/ostream.h>

#include "macros.h"

namespace btri {

template<typename T>
struct matrix {
    private:
    std::vector<T> coeffs;
    unsigned int m = 0;
    unsigned int n = 0;

    public:
    typedef T value_type;

    unsigned int nrows() const { return m; }
    unsigned int ncols() const { return n; }
    bool is_square() const { return m == n; }

    matrix() = default;
    matrix(unsigned int m, unsigned int n)
        : coeffs(size_t(m) * n)
        , m(m)
        , n(n)
    { }
    /* z on the diagonal, zero elsewhere */
    matrix(unsigned int m, unsigned int n, T const & z)
        : matrix(m, n)
    {
        for(unsigned int i = 0 ; i < m && i < n ; i++)
            (*this)(i, i) = z;
    }
    /* row-major initializer, mostly for tests */
    matrix(unsigned int m, unsigned int n, std::vector<T> const & rowmajor)
        : coeffs(rowmajor)
        , m(m)
        , n(n)
    {
        ASSERT_ALWAYS(coeffs.size() == size_t(m) * n);
    }

    static matrix identity(unsigned int n) { return matrix(n, n, T(1)); }

    ~matrix() = default;
    matrix(matrix const&) = default;
    matrix(matrix &&) noexcept = default;
    matrix& operator=(matrix const&) = default;
    matrix& operator=(matrix &&) noexcept = default;

    /* all instantations love each other */
    template<typename U> friend struct matrix;
    template<typename U>
        explicit matrix(matrix<U> const & a)
        requires (!std::is_same_v<U, T>)
        : matrix(a.m, a.n)
    {
        for(size_t k = 0 ; k < coeffs.size() ; k++)
            coeffs[k] = T(a.coeffs[k]);
    }

    void set_zero() { for(auto & x : coeffs) x = T(); }

    T const & operator()(unsigned int i, unsigned int j) const
    {
        ASSERT(i < m);
        ASSERT(j < n);
        return coeffs[size_t(i) * n + j];
    }
    T & operator()(unsigned int i, unsigned int j)
    {
        ASSERT(i < m);
        ASSERT(j < n);
        return coeffs[size_t(i) * n + j];
    }

    void swap_rows(unsigned int i0, unsigned int i1)
    {
        ASSERT_ALWAYS(i0 < m && i1 < m);
        if (i0 == i1) return;
        for(unsigned int j = 0 ; j < n ; j++)
            std::swap((*this)(i0, j), (*this)(i1, j));
    }

    bool is_zero() const
    {
        T const z = T();
        for(auto const & x : coeffs)
            if (!(x == z))
                return false;
        return true;
    }

    matrix& operator*=(T const & a) { for(auto & x : coeffs) x *= a; return *this; }
    matrix operator*(T const & a) const { matrix h = *this; return h *= a; }

    matrix operator*(matrix const & b) const
    {
        matrix const & a = *this;
        ASSERT_ALWAYS(a.n == b.m);
        matrix c(a.m, b.n);
        for(unsigned int i = 0 ; i < a.m ; i++) {
            for(unsigned int j = 0 ; j < b.n ; j++) {
                T s = T();
                for(unsigned int k = 0 ; k < a.n ; k++)
                    s += a(i,k) * b(k,j);
                c(i,j) = std::move(s);
            }
        }
        return c;
    }
    matrix& operator*=(matrix const & b)
    {
        return (*this) = (*this) * b;
    }
    matrix& operator+=(matrix const & b)
    {
        ASSERT_ALWAYS(m == b.m);
        ASSERT_ALWAYS(n == b.n);
        for(size_t i = 0 ; i < coeffs.size() ; i++)
            coeffs[i] += b.coeffs[i];
        return *this;
    }
    matrix operator+(matrix const & a) const {
        matrix h = *this;
        return h += a;
    }
    matrix& operator-=(matrix const & b)
    {
        ASSERT_ALWAYS(m == b.m);
        ASSERT_ALWAYS(n == b.n);
        for(size_t i = 0 ; i < coeffs.size() ; i++)
            coeffs[i] -= b.coeffs[i];
        return *this;
    }
    matrix operator-(matrix const & a) const {
        matrix h = *this;
        return h -= a;
    }
    matrix operator-() const {
        matrix h(m, n);
        for(size_t i = 0 ; i < coeffs.size() ; i++)
            h.coeffs[i] = -coeffs[i];
        return h;
    }

    matrix transpose() const {
        matrix t(n, m);
        matrix const & a = *this;
        for(unsigned int i = 0 ; i < m ; i++) {
            for(unsigned int j = 0 ; j < n ; j++) {
                t(j,i) = a(i,j);
            }
        }
        return t;
    }

    bool operator==(matrix const & a) const
    {
        return m == a.m && n == a.n && coeffs == a.coeffs;
    }
};

template<typename T>
inline std::ostream& operator<<(std::ostream& o, matrix<T> const & M)
{
    o << "[";
    for(unsigned int i = 0 ; i < M.nrows() ; i++) {
        o << (i ? ", [" : "[");
        for(unsigned int j = 0 ; j < M.ncols() ; j++) {
            if (j) o << ", ";
            o << M(i, j);
        }
        o << "]";
    }
    return o << "]";
}

} /* namespace btri */

namespace fmt {
    template<typename T>
    struct formatter<btri::matrix<T>>: ostream_formatter {};
}

#endif	/* BTRI_UTILS_MATRIX_HPP */
