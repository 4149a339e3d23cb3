/* Common header file for the btri project

This file is part of btri.

This library is free software; you can redistribute it and/or
modify it under the terms of the GNU Lesser General Public
License as published by the Free Software Foundation; either
version 2.1 of the License, or (at your option) any later version.

This library is distributed in the hope that it will be useful,
but WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
Lesser General Public License for more details.

You should have received a copy of the GNU Lesser General Public
License along with this library; if not, write to the Free Software
Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301  USA

*/

#ifndef BTRI_MACROS_H
#define BTRI_MACROS_H

/**********************************************************************/
/* Common asserting/debugging defines */

#include <assert.h>
#include <stdio.h>
#include <stdlib.h>
#ifdef __cplusplus
#include <stdexcept>
#endif

#define ASSERT(x)	assert(x)

/* Some checks (e.g. that every intermediate result of the block
 * recursion is still block triangular) cost a full pass over a matrix.
 * Define WANT_ASSERT_EXPENSIVE to have them anyway. */
#if defined(WANT_ASSERT_EXPENSIVE) || defined(STATIC_ANALYSIS)
#define ASSERT_EXPENSIVE(x) ASSERT(x)
#else
#define ASSERT_EXPENSIVE(x)
#endif

#ifndef CPP_STRINGIFY
#define CPP_STRINGIFY0(x) #x
#define CPP_STRINGIFY(x) CPP_STRINGIFY0(x)
#endif

#define croak__(x,y)     						\
        fprintf(stderr,"%s in %s at %s:%d -- %s\n",			\
                (x),__func__,__FILE__,__LINE__,(y))
#define croak_throw__(e, x)     					\
        throw e("code BUG() : condition " x            \
                " failed at " __FILE__ ":" CPP_STRINGIFY(__LINE__))

/* In C++ dtors which are not allowed to throw, use this variant instead.
 */
#define ASSERT_ALWAYS_NOTHROW(x)					\
    do {								\
        if (!(x)) {							\
            croak__("code BUG() : condition " #x " failed",		\
                    "Abort");						\
            abort();							\
        }								\
    } while (0)
// NOLINTBEGIN(readability-simplify-boolean-expr)
#ifdef __cplusplus
#define ASSERT_ALWAYS_OR_THROW(x, e)                                   \
    do {								\
        if (!(x)) 							\
            croak_throw__(e, #x);                                       \
    } while (0)
#define ASSERT_ALWAYS(x) ASSERT_ALWAYS_OR_THROW(x, std::runtime_error)
#else
#define ASSERT_ALWAYS(x) ASSERT_ALWAYS_NOTHROW(x)
#endif
// NOLINTEND(readability-simplify-boolean-expr)

/*********************************************************************/
/* Helper macros */

#define LEXGE2(X,Y,A,B) ((X)>(A) || ((X) == (A) && (Y) >= (B)))
#define LEXGE3(X,Y,Z,A,B,C) ((X)>(A) || ((X) == (A) && LEXGE2((Y),(Z),(B),(C))))

#ifndef GNUC_VERSION_ATLEAST
#ifndef __GNUC__
#define GNUC_VERSION_ATLEAST(X,Y,Z) 0
#else
#define GNUC_VERSION_ATLEAST(X,Y,Z)     \
LEXGE3(__GNUC__,__GNUC_MINOR__,__GNUC_PATCHLEVEL__,(X),(Y),(Z))
#endif
#endif

#ifndef ATTRIBUTE_NONNULL
#if GNUC_VERSION_ATLEAST(3,3,0)
#define ATTRIBUTE_NONNULL(a) __attribute__ ((__nonnull__ a))
#else
#define ATTRIBUTE_NONNULL(a)
#endif
#endif

#endif	/* BTRI_MACROS_H */
