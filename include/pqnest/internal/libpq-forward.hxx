/* Minimal forward declarations of libpq types needed in libpqnest headers.
 *
 * DO NOT INCLUDE THIS FILE when building client programs.
 *
 * Copyright (c) 2005-2024, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#ifndef PQNEST_H_LIBPQ_FORWARD
#define PQNEST_H_LIBPQ_FORWARD

extern "C"
{
struct pg_conn;
struct pg_result;
}

/// Forward declarations of libpq types as needed in libpqnest headers.
namespace pqnest::internal::pq
{
using PGconn = pg_conn;
using PGresult = pg_result;
} // namespace pqnest::internal::pq
#endif
