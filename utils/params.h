#ifndef BTRI_PARAMS_H
#define BTRI_PARAMS_H

#include <stdio.h>

#include <string>
#include <vector>
#include <stdexcept>

#include "macros.h"

/* This is by increasing order of priority */
enum parameter_origin { PARAMETER_FROM_FILE, PARAMETER_FROM_CMDLINE };

struct param_list_s {
    /* not exposed to the callers, which go through the functions below
     * or through cxx_param_list */
    void * pimpl;
};
typedef struct param_list_s param_list[1];
typedef struct param_list_s * param_list_ptr;
typedef struct param_list_s const * param_list_srcptr;

extern void param_list_init(param_list_ptr pl);
extern void param_list_clear(param_list_ptr pl);

// document the usage of a parameter.
extern void param_list_decl_usage(param_list_ptr pl, const char * key,
        const char * doc);
extern void param_list_print_usage(param_list_srcptr pl, const char * argv0, FILE *f);
extern void param_list_usage_header(param_list_ptr pl, const char * hdr);

// reads a file of key=value lines (# starts a comment), and stores the
// dictionary of parameters to pl. Values given on the command line take
// precedence. Returns 0 if some lines could not be parsed, and throws
// parameter_error if the file cannot be opened.
extern int param_list_read_file(param_list_ptr pl, const char * name);

// sees whether the arguments pointed to by argv[0] and (possibly)
// argv[1] correspond to either -<key> <value>, --<key> <value> or
// <key>=<value> ; configured switches and aliases for the param list are
// also checked.
extern int param_list_update_cmdline(param_list_ptr pl,
        int * p_argc, char const *** p_argv) ATTRIBUTE_NONNULL((2,3));

[[noreturn]] extern void param_list_generic_failure(param_list_srcptr pl, const char *missing);

template<typename T>
int param_list_parse(param_list_ptr pl, std::string const & key, T & r);

template<typename T>
T
param_list_parse_mandatory(param_list_ptr pl, std::string const & key)
{
    T r;
    if (!param_list_parse<T>(pl, key, r))
        param_list_generic_failure(pl, key.c_str());

    return r;
}

/* We have all of these defined in params.cpp */
extern template int param_list_parse<unsigned long>(param_list_ptr pl, std::string const & key, unsigned long & r);
extern template int param_list_parse<std::string>(param_list_ptr pl, std::string const & key, std::string & r);
extern template int param_list_parse<std::vector<int>>(param_list_ptr pl, std::string const & key, std::vector<int> & r);
extern template int param_list_parse<std::vector<std::string>>(param_list_ptr pl, std::string const & key, std::vector<std::string> & r);

// This one allows shorthands. Notice that the alias string has to
// contain the exact form of the wanted alias, which may be either "-x",
// "--x", or "x=".
extern int param_list_configure_alias(param_list_ptr, const char * key, const char * alias);

// A switch is a command-line argument which sets a value by its mere
// presence. Could be for instance -v, or -invert
extern int param_list_configure_switch(param_list_ptr, const char * key, int * ptr);

// warns against unused command-line parameters. This normally indicates
// a user error. parameters ignored from config files are considered
// normal.
extern int param_list_warn_unused(param_list_srcptr pl);

// This function is a shorthand which does employ some hackery put into
// param lists, which remember their oldest argv, argc pair.
extern void param_list_print_command_line(FILE * stream, param_list_srcptr);

/* Same idea as for cxx_mpz and friends. A parameter list belongs to
 * one program run, and is never copied. */
struct cxx_param_list {
    param_list x;

    cxx_param_list() { param_list_init(x); }
    ~cxx_param_list() { param_list_clear(x); }
    cxx_param_list(cxx_param_list const &) = delete;
    cxx_param_list & operator=(cxx_param_list const &) = delete;
    // NOLINTBEGIN(hicpp-explicit-conversions)
    operator param_list_ptr() { return x; }
    operator param_list_srcptr() const { return x; }
    // NOLINTEND(hicpp-explicit-conversions)
    param_list_ptr operator->() { return x; }
    param_list_srcptr operator->() const { return x; }
};

#if GNUC_VERSION_ATLEAST(4,3,0)
extern void param_list_init(cxx_param_list & pl) __attribute__((error("param_list_init must not be called on a param_list reference -- it is the caller's business (via a ctor)")));
extern void param_list_clear(cxx_param_list & pl) __attribute__((error("param_list_clear must not be called on a param_list reference -- it is the caller's business (via a dtor)")));
#endif

struct parameter_error : public std::runtime_error {
    explicit parameter_error(std::string const & arg)
        : std::runtime_error(arg)
    {}
};

#endif	/* BTRI_PARAMS_H */
