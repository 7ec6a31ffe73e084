/* Compiler settings for libpqnest clients.
 *
 * Copyright (c) 2000-2024, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#ifndef PQNEST_H_COMPILER_PUBLIC
#define PQNEST_H_COMPILER_PUBLIC

#if __cplusplus < 201703L
#  error "libpqnest needs C++17 or better."
#endif

#if defined(_WIN32)
#  if !defined(PQNEST_LIBEXPORT) && defined(PQNEST_SHARED)
#    define PQNEST_LIBEXPORT __declspec(dllimport)
#  endif
#endif

#if !defined(PQNEST_LIBEXPORT)
#  define PQNEST_LIBEXPORT /* libexport */
#endif

#if !defined(PQNEST_PRIVATE)
#  define PQNEST_PRIVATE /* private */
#endif

#if defined(__GNUC__)
/// Hint to the compiler that a function is rarely called.
#  define PQNEST_COLD __attribute__((cold))
/// Function's only effect is its return value, which depends on arguments.
#  define PQNEST_PURE __attribute__((pure))
#else
#  define PQNEST_COLD /* cold */
#  define PQNEST_PURE /* pure */
#endif

#endif
