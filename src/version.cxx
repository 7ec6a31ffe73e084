/** Version check.
 *
 * Copyright (c) 2000-2024, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#include "pqnest-source.hxx"

#include "pqnest/version.hxx"

namespace pqnest::internal
{
// One, single definition of this function.  If a call fails to link, and
// (some) other calls do link, then the libpqnest binary was built against a
// different libpqnest version than the code which is being linked against it.
PQNEST_LIBEXPORT int PQNEST_VERSION_CHECK() noexcept
{
  return 0;
}
} // namespace pqnest::internal
