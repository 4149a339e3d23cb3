#include <climits>
#include <cstdio>
#include <cstdlib>

#include <fstream>
#include <new>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <gmp.h>
#include <fmt/format.h>

#include "cxx_mpz.hpp"
#include "macros.h"
#include "matrix.hpp"
#include "params.h"
#include "ring_traits.hpp"
#include "verbose.h"
#include "linalg/block_triangular.hpp"
#include "linalg/btri_errors.hpp"
#include "linalg/dense_kernel.hpp"
#include "linalg/label_partition.hpp"

/* Reads a square matrix and a labeling from a text file, and prints the
 * determinant (and optionally the inverse) computed block by block.
 *
 * File format: lines starting with # are ignored, as are empty lines.
 * The first line holds the dimension n, the next n lines the rows of the
 * matrix (integers, or rationals p/q over Q), and an optional last line
 * holds n integer labels. Without labels, each index is its own block
 * (the matrix must then be upper triangular).
 */

static void usage(cxx_param_list & pl, char const * argv0)
{
    param_list_print_usage(pl, argv0, stderr);
    exit(EXIT_FAILURE);
}

struct command_line
{
    std::string in;
    std::string ring = "Q";
    int invert = 0;
    int check = 0;
    int verbosity_level = 0; /* each -v on command line increases it by 1 */
    std::vector<int> labels;

    static void declare_usage(cxx_param_list & pl) {
        param_list_usage_header(pl, "Compute the determinant of a block "
                                    "triangular matrix, and optionally its "
                                    "inverse.\n");
        param_list_decl_usage(pl, "in", "input file");
        param_list_decl_usage(pl, "config", "read further parameters from this file (key=value lines)");
        param_list_decl_usage(pl, "ring", "ring of the coefficients, Z or Q (default Q)");
        param_list_decl_usage(pl, "invert", "also compute the inverse");
        param_list_decl_usage(pl, "check", "validate the block structure, and compare with plain dense computations");
        param_list_decl_usage(pl, "labels", "comma-separated labels, overriding those of the input file");
        param_list_decl_usage(pl, "v", "enable verbose output");
        verbose_decl_usage(pl);
    }

    void configure_switches(cxx_param_list & pl)
    {
        param_list_configure_switch(pl, "-invert", &invert);
        param_list_configure_switch(pl, "-check", &check);
        param_list_configure_switch(pl, "-v", &verbosity_level);
        param_list_configure_alias(pl, "-in", "-i");
    }

    void lookup_parameters(cxx_param_list & pl)
    {
        in = param_list_parse_mandatory<std::string>(pl, "in");
        param_list_parse(pl, "ring", ring);
        param_list_parse(pl, "labels", labels);
    }

    void check_inconsistencies(const char * argv0, cxx_param_list & pl) const
    {
        if (ring != "Z" && ring != "Q") {
            fmt::print(stderr, "Error, -ring must be Z or Q\n");
            usage(pl, argv0);
        }
    }
};

template<typename T>
struct matrix_file {
    btri::matrix<T> M;
    btri::labeling<int> b;
};

static bool next_data_line(std::istream & is, std::string & line, unsigned int & lineno)
{
    for( ; std::getline(is, line) ; ) {
        lineno++;
        auto const first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos || line[first] == '#')
            continue;
        return true;
    }
    return false;
}

static std::vector<std::string> split_tokens(std::string const & line)
{
    std::istringstream ss(line);
    std::vector<std::string> tokens;
    for(std::string t ; ss >> t ; )
        tokens.push_back(t);
    return tokens;
}

template<typename T>
static matrix_file<T> read_matrix_file(std::string const & filename)
{
    std::ifstream is(filename);
    if (!is)
        throw btri::invalid_input(fmt::format("cannot open {}", filename));

    std::string line;
    unsigned int lineno = 0;

    if (!next_data_line(is, line, lineno))
        throw btri::invalid_input(fmt::format("{}: no dimension line", filename));
    long dim;
    {
        std::istringstream ss(line);
        std::string extra;
        if (!(ss >> dim) || (ss >> extra) || dim < 0 || dim > (long) UINT_MAX)
            throw btri::invalid_input(fmt::format("{}:{}: bad dimension line \"{}\"",
                        filename, lineno, line));
    }
    auto const n = static_cast<unsigned int>(dim);

    /* the rows are all read before the matrix is allocated, so that a
     * bogus dimension fails on the missing rows */
    std::vector<std::vector<std::string>> rows;
    std::vector<unsigned int> row_lineno;
    for(unsigned int i = 0 ; i < n ; i++) {
        if (!next_data_line(is, line, lineno))
            throw btri::invalid_input(fmt::format("{}: expected {} rows, found {}", filename, n, i));
        auto tokens = split_tokens(line);
        if (tokens.size() != n)
            throw btri::invalid_input(fmt::format("{}:{}: expected {} entries, found {}",
                        filename, lineno, n, tokens.size()));
        rows.push_back(std::move(tokens));
        row_lineno.push_back(lineno);
    }

    matrix_file<T> res { btri::matrix<T>(n, n), btri::identity_labeling(n) };

    for(unsigned int i = 0 ; i < n ; i++) {
        for(unsigned int j = 0 ; j < n ; j++) {
            if (!res.M(i, j).set_str(rows[i][j], 10))
                throw btri::invalid_input(fmt::format("{}:{}: cannot parse \"{}\" over {}",
                            filename, row_lineno[i], rows[i][j], btri::ring_traits<T>::name));
        }
    }

    if (next_data_line(is, line, lineno)) {
        auto const tokens = split_tokens(line);
        if (tokens.size() != n)
            throw btri::invalid_input(fmt::format("{}:{}: expected {} labels, found {}",
                        filename, lineno, n, tokens.size()));
        for(unsigned int i = 0 ; i < n ; i++) {
            std::size_t pos = 0;
            try {
                res.b[i] = std::stoi(tokens[i], &pos);
            } catch (std::logic_error const &) {
                pos = 0;
            }
            if (pos == 0 || pos != tokens[i].size())
                throw btri::invalid_input(fmt::format("{}:{}: bad label \"{}\"",
                            filename, lineno, tokens[i]));
        }
        if (next_data_line(is, line, lineno))
            throw btri::invalid_input(fmt::format("{}:{}: trailing data", filename, lineno));
    }

    return res;
}

template<typename T>
static void print_matrix(btri::matrix<T> const & M)
{
    for(unsigned int i = 0 ; i < M.nrows() ; i++) {
        for(unsigned int j = 0 ; j < M.ncols() ; j++)
            fmt::print("{}{}", j ? " " : "", M(i, j));
        fmt::print("\n");
    }
}

template<typename T>
static void run(command_line const & cmdline)
{
    matrix_file<T> F = read_matrix_file<T>(cmdline.in);
    if (!cmdline.labels.empty())
        F.b = cmdline.labels;

    auto const check = cmdline.check ? btri::input_check::validate : btri::input_check::trust;

    verbose_fmt_print(0, 1, "# {}x{} matrix over {}, {} distinct labels\n",
            F.M.nrows(), F.M.ncols(), btri::ring_traits<T>::name,
            btri::label_set(F.b).size());
    for(auto const & [k, s] : btri::block_sizes(F.b))
        verbose_fmt_print(0, 2, "#   label {}: block of size {}\n", k, s);

    T const d = btri::block_triangular_det(F.M, F.b, check);
    if (cmdline.check) {
        T const d0 = btri::dense_det(F.M);
        if (!(d == d0))
            throw btri::internal_inconsistency(fmt::format(
                        "determinant is {} block by block, but {} with dense elimination", d, d0));
        verbose_fmt_print(0, 1, "# determinant checked against dense elimination\n");
    }
    fmt::print("det = {}\n", d);

    if (cmdline.invert) {
        btri::matrix<T> const Minv = btri::invert_block_triangular(F.M, F.b, check);
        fmt::print("inverse =\n");
        print_matrix(Minv);
    }
}

int main(int argc, char const * argv[])
{
    const char *argv0 = argv[0];

    cxx_param_list pl;
    command_line cmdline;

    command_line::declare_usage(pl);
    cmdline.configure_switches(pl);

    argv++, argc--;
    if (argc == 0)
      usage(pl, argv0);

    for( ; argc ; ) {
        if (param_list_update_cmdline(pl, &argc, &argv))
            continue;
        fmt::print(stderr, "Unhandled parameter {}\n", argv[0]);
        usage(pl, argv0);
    }
    try {
        std::string config;
        if (param_list_parse(pl, "config", config)) {
            if (!param_list_read_file(pl, config.c_str())) {
                fmt::print(stderr, "Error, cannot parse {}\n", config);
                usage(pl, argv0);
            }
        }

        if (!verbose_interpret_parameters(pl))
            usage(pl, argv0);

        /* print command-line arguments */
        param_list_print_command_line (stdout, pl);
        fflush(stdout);

        cmdline.lookup_parameters(pl);
    } catch (parameter_error const & e) {
        fmt::print(stderr, "Error: {}\n", e.what());
        usage(pl, argv0);
    }
    if (param_list_warn_unused(pl)) {
        usage(pl, argv0);
    }
    cmdline.check_inconsistencies(argv0, pl);

    verbose_output_init(1);
    verbose_output_add(0, stdout, cmdline.verbosity_level);

    int rc = EXIT_SUCCESS;
    try {
        if (cmdline.ring == "Z")
            run<cxx_mpz>(cmdline);
        else
            run<cxx_mpq>(cmdline);
    } catch (btri::invalid_input const & e) {
        fmt::print(stderr, "Error, invalid input: {}\n", e.what());
        rc = EXIT_FAILURE;
    } catch (btri::singular_block const & e) {
        fmt::print(stderr, "Error, singular matrix: {}\n", e.what());
        rc = EXIT_FAILURE;
    } catch (btri::internal_inconsistency const & e) {
        fmt::print(stderr, "Error, internal inconsistency: {}\n", e.what());
        rc = EXIT_FAILURE;
    } catch (std::bad_alloc const &) {
        fmt::print(stderr, "Error, out of memory\n");
        rc = EXIT_FAILURE;
    }

    verbose_output_clear();

    return rc;
}
