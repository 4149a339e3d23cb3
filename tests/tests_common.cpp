#include <cstdio>
#include <cstdlib>
#include <ctime>

#include <string>

#include <gmp.h>
#include <fmt/format.h>

#include "macros.h"
#include "params.h"
#include "verbose.h"
#include "tests_common.h"

gmp_randstate_t state;
static int rng_state_inited = 0;

static unsigned long iter = 0;
static int parsed_iter = 0;
static int verbose = 0;

void tests_common_get_iter(unsigned long *output)
{
    if (parsed_iter)
        *output = iter;
}

int tests_common_get_verbose()
{
    return verbose;
}

static void tests_common_usage(cxx_param_list & pl, const char * argv0)
{
    param_list_print_usage(pl, argv0, stderr);
    exit(EXIT_FAILURE);
}

void tests_common_cmdline(int *argc, const char ***argv, uint64_t flags)
{
    const char * argv0 = (*argv)[0];
    cxx_param_list pl;
    if (flags & PARSE_SEED)
        param_list_decl_usage(pl, "seed", "seed for the random generator");
    if (flags & PARSE_ITER)
        param_list_decl_usage(pl, "iter", "number of iterations");
    if (flags & PARSE_VERBOSE) {
        param_list_decl_usage(pl, "v", "verbose output");
        param_list_configure_switch(pl, "-v", &verbose);
    }

    (*argv)++, (*argc)--;

    unsigned long seed = 0;
    int parsed_seed = 0;

    /* ctest passes the seed as a bare first argument */
    if (*argc && (flags & PARSE_SEED)) {
        char * end;
        unsigned long const s = strtoul((*argv)[0], &end, 10);
        if (*end == '\0' && end != (*argv)[0]) {
            seed = s;
            parsed_seed = 1;
            (*argv)++, (*argc)--;
        }
    }

    for( ; *argc ; ) {
        if (param_list_update_cmdline(pl, argc, argv))
            continue;
        fmt::print(stderr, "Unhandled parameter {}\n", (*argv)[0]);
        tests_common_usage(pl, argv0);
    }

    if (flags & PARSE_SEED)
        parsed_seed = param_list_parse(pl, "seed", seed) || parsed_seed;
    if (flags & PARSE_ITER)
        parsed_iter = param_list_parse(pl, "iter", iter);

    if (param_list_warn_unused(pl))
        tests_common_usage(pl, argv0);

    if (!parsed_seed)
        seed = time(nullptr);

    gmp_randinit_default(state);
    gmp_randseed_ui(state, seed);
    rng_state_inited = 1;

    verbose_output_init(1);
    verbose_output_add(0, stdout, verbose ? 2 : 0);

    printf("Using random seed=%lu\n", seed);
    fflush(stdout);
}

void tests_common_clear()
{
    if (rng_state_inited)
        gmp_randclear(state);
    rng_state_inited = 0;
    verbose_output_clear();
}
