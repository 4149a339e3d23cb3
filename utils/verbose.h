#ifndef BTRI_VERBOSE_H
#define BTRI_VERBOSE_H

#include <stdio.h>

#include <string>
#include <utility>

#include <fmt/format.h>

#include "macros.h"
#include "params.h"

/* Verbosity is controlled in two independent ways.
 *
 * - named flags, which are set with -verbose_flags and tested with
 *   verbose_enabled(). These gate the diagnostics of specific parts of
 *   the code (the recursion of the block engines, the dense kernel).
 *
 * - output channels with a level, set up by the program with
 *   verbose_output_init() and verbose_output_add(). A message printed at
 *   level l on channel c reaches every stream registered for c with a
 *   level >= l.
 */

typedef enum {
    BTRI_VERBOSE_PRINT_CMDLINE,
    BTRI_VERBOSE_PRINT_COMPILATION_INFO,
    BTRI_VERBOSE_PRINT_RECURSION,
    BTRI_VERBOSE_PRINT_KERNEL,
} verbose_flag_t;

extern void verbose_decl_usage(cxx_param_list & pl);

/* Interpret the -verbose_flags argument, a comma-separated list of flag
 * names, each optionally prefixed with "no-". Returns 0 if an unknown
 * flag was found. */
extern int verbose_interpret_parameters(cxx_param_list & pl);

extern int verbose_enabled(verbose_flag_t flag);

extern void verbose_output_init(size_t nr_channels);
extern void verbose_output_clear();
extern int verbose_output_add(size_t channel, FILE * out, int verbose);

/* Prints to all streams of the channel which accept this verbosity
 * level. Does nothing if the channels were not set up. */
extern int verbose_output_puts(size_t channel, int verbose, std::string const & s);

template<typename... Args>
int verbose_fmt_print(size_t channel, int verbose,
        fmt::format_string<Args...> format, Args&&... args)
{
    return verbose_output_puts(channel, verbose,
            fmt::format(format, std::forward<Args>(args)...));
}

#endif	/* BTRI_VERBOSE_H */
