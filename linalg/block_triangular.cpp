#include <functional>

#include "utils/cxx_mpz.hpp"
#include "utils/matrix.hpp"
#include "block_triangular.hpp"

namespace btri {

template cxx_mpz block_triangular_det<cxx_mpz, int, std::less<int>>(matrix<cxx_mpz> const &, labeling<int> const &, input_check, std::less<int> const &);
template cxx_mpq block_triangular_det<cxx_mpq, int, std::less<int>>(matrix<cxx_mpq> const &, labeling<int> const &, input_check, std::less<int> const &);
template matrix<cxx_mpz> invert_block_triangular<cxx_mpz, int, std::less<int>>(matrix<cxx_mpz> const &, labeling<int> const &, input_check, std::less<int> const &);
template matrix<cxx_mpq> invert_block_triangular<cxx_mpq, int, std::less<int>>(matrix<cxx_mpq> const &, labeling<int> const &, input_check, std::less<int> const &);

} /* namespace btri */
