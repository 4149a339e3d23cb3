#include <stdio.h>

#include <mutex>
#include <string>
#include <vector>

#include <fmt/format.h>

#include "verbose.h"
#include "params.h"
#include "macros.h"

struct verbose_flag_name {
    verbose_flag_t flag;
    const char * name;
    int default_value;
};

static const verbose_flag_name verbose_flag_names[] = {
    { BTRI_VERBOSE_PRINT_CMDLINE, "cmdline", 1 },
    { BTRI_VERBOSE_PRINT_COMPILATION_INFO, "compilation-info", 0 },
    { BTRI_VERBOSE_PRINT_RECURSION, "recursion", 0 },
    { BTRI_VERBOSE_PRINT_KERNEL, "kernel", 0 },
};

static unsigned long verbose_flag_word = 0;
static bool verbose_flag_word_initialized = false;

static void verbose_flags_set_defaults()
{
    verbose_flag_word = 0;
    for(auto const & f : verbose_flag_names)
        if (f.default_value)
            verbose_flag_word |= 1UL << f.flag;
    verbose_flag_word_initialized = true;
}

void verbose_decl_usage(cxx_param_list & pl)
{
    std::string doc = "fine-grained control of diagnostics. A comma-separated"
        " list among";
    for(auto const & f : verbose_flag_names)
        doc += fmt::format(" {}", f.name);
    doc += " (each may be prefixed by no-)";
    /* param_list_decl_usage copies the string */
    param_list_decl_usage(pl, "verbose_flags", doc.c_str());
}

static void verbose_set_flag(verbose_flag_t flag, int value)
{
    if (!verbose_flag_word_initialized)
        verbose_flags_set_defaults();
    if (value)
        verbose_flag_word |= 1UL << flag;
    else
        verbose_flag_word &= ~(1UL << flag);
}

static int verbose_set_one_flag(std::string name)
{
    int value = 1;
    if (name.substr(0, 3) == "no-" || name.substr(0, 3) == "no_") {
        value = 0;
        name = name.substr(3);
    }
    for(auto & c : name)
        if (c == '_') c = '-';
    if (name == "all") {
        for(auto const & f : verbose_flag_names)
            verbose_set_flag(f.flag, value);
        return 1;
    }
    for(auto const & f : verbose_flag_names) {
        if (name == f.name) {
            verbose_set_flag(f.flag, value);
            return 1;
        }
    }
    fmt::print(stderr, "# Warning: unknown verbose flag {}\n", name);
    return 0;
}

int verbose_interpret_parameters(cxx_param_list & pl)
{
    verbose_flags_set_defaults();
    std::vector<std::string> flags;
    if (!param_list_parse(pl, "verbose_flags", flags))
        return 1;
    int ok = 1;
    for(auto const & f : flags)
        ok = verbose_set_one_flag(f) && ok;
    return ok;
}

int verbose_enabled(verbose_flag_t flag)
{
    if (!verbose_flag_word_initialized)
        verbose_flags_set_defaults();
    return (verbose_flag_word >> flag) & 1UL;
}

/* Output channels */

struct verbose_output_stream {
    FILE * out;
    int verbose;
};

static std::mutex verbose_output_mutex;
static std::vector<std::vector<verbose_output_stream>> verbose_channels;

void verbose_output_init(size_t nr_channels)
{
    std::lock_guard<std::mutex> const dummy(verbose_output_mutex);
    verbose_channels.assign(nr_channels, {});
}

void verbose_output_clear()
{
    std::lock_guard<std::mutex> const dummy(verbose_output_mutex);
    for(auto const & c : verbose_channels)
        for(auto const & s : c)
            fflush(s.out);
    verbose_channels.clear();
}

int verbose_output_add(size_t channel, FILE * out, int verbose)
{
    std::lock_guard<std::mutex> const dummy(verbose_output_mutex);
    if (channel >= verbose_channels.size())
        return 0;
    verbose_channels[channel].push_back({ out, verbose });
    return 1;
}

int verbose_output_puts(size_t channel, int verbose, std::string const & s)
{
    std::lock_guard<std::mutex> const dummy(verbose_output_mutex);
    if (channel >= verbose_channels.size())
        return 1;
    for(auto const & o : verbose_channels[channel]) {
        if (o.verbose < verbose)
            continue;
        if (fputs(s.c_str(), o.out) == EOF)
            return 0;
    }
    return 1;
}
