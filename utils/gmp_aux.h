#ifndef BTRI_UTILS_GMP_AUX_H
#define BTRI_UTILS_GMP_AUX_H

#include <gmp.h>
#include "macros.h"

/* Uniform random integer in [-bound, bound] */
static inline long
gmp_urandom_symmetric_si (gmp_randstate_t state, unsigned long bound) {
    return (long) gmp_urandomm_ui(state, 2 * bound + 1) - (long) bound;
}

#endif	/* BTRI_UTILS_GMP_AUX_H */
