/* Version info for libpqnest.
 *
 * Copyright (c) 2000-2024, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#ifndef PQNEST_H_VERSION
#define PQNEST_H_VERSION

#include "pqnest/compiler-public.hxx"

/// Full libpqnest version string.
#define PQNEST_VERSION "1.2.0"
/// Library ABI version.
#define PQNEST_ABI "1.2"

/// Major version number.
#define PQNEST_VERSION_MAJOR 1
/// Minor version number.
#define PQNEST_VERSION_MINOR 2

#define PQNEST_VERSION_CHECK_NAME(major, minor)                               \
  check_pqnest_version_##major##_##minor
#define PQNEST_VERSION_CHECK_EXPAND(major, minor)                             \
  PQNEST_VERSION_CHECK_NAME(major, minor)
#define PQNEST_VERSION_CHECK                                                  \
  PQNEST_VERSION_CHECK_EXPAND(PQNEST_VERSION_MAJOR, PQNEST_VERSION_MINOR)

namespace pqnest::internal
{
/// Library version check stub.
/** Helps detect version mismatches between libpqnest headers and the
 * libpqnest library binary.
 *
 * This function's definition is in the library binary, so its name carries
 * the version the binary was built for.  The headers contain a call to the
 * function under the name for the version in the headers.  If the two
 * differ, linking fails instead of producing a subtly broken program.
 */
PQNEST_LIBEXPORT int PQNEST_VERSION_CHECK() noexcept;


/// Call the version check, so that linking to a mismatched binary fails.
inline void check_version() noexcept
{
  // There is no particular reason to do this here in a header, except to
  // make sure that any program using the library references the function.
  [[maybe_unused]] static int const version_ok{PQNEST_VERSION_CHECK()};
}
} // namespace pqnest::internal
#endif
