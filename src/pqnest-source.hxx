/* Compiler settings for compiling libpqnest itself.
 *
 * Include this header in every source file that goes into the libpqnest
 * library binary, and nowhere else.
 *
 * To ensure this, include this file once, as the very first header, in each
 * compilation unit for the library.
 *
 * DO NOT INCLUDE THIS FILE when building client programs.
 *
 * Copyright (c) 2000-2024, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#ifndef PQNEST_H_COMPILER_INTERNAL
#define PQNEST_H_COMPILER_INTERNAL

#if defined(_WIN32)

#  if defined(PQNEST_SHARED)
// We're building libpqnest as a shared library.
#    undef PQNEST_LIBEXPORT
#    define PQNEST_LIBEXPORT __declspec(dllexport)
#    define PQNEST_PRIVATE __declspec()
#  endif // PQNEST_SHARED

#elif defined(__GNUC__) // !_WIN32

#  define PQNEST_LIBEXPORT __attribute__((visibility("default")))
#  define PQNEST_PRIVATE __attribute__((visibility("hidden")))

#endif // __GNUC__

#include "pqnest/compiler-public.hxx"
#endif
