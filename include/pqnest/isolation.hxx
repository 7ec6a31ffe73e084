/* Definitions for transaction isolation levels, and such.
 *
 * Copyright (c) 2000-2024, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#ifndef PQNEST_H_ISOLATION
#define PQNEST_H_ISOLATION

#include "pqnest/compiler-public.hxx"

#include "pqnest/zview.hxx"


namespace pqnest
{
/// Should a transaction be read-only, or read-write?
/** No, this is not an isolation level.  So it really doesn't belong here.
 * But it's not really worth a separate header.
 */
enum class write_policy
{
  read_only,
  read_write
};


/// Transaction isolation levels.
/** These are as defined in the SQL standard.  PostgreSQL does not support
 * "read uncommitted"; the lowest level you can get is "read committed," which
 * is better.
 *
 * A lower isolation level will allow more surprising interactions between
 * ongoing transactions, but improve performance.  A higher level gives you
 * more protection from subtle concurrency bugs, but sometimes the database
 * will abort a transaction with a @ref serialization_failure, and the
 * application will have to re-do the whole thing.
 */
enum isolation_level
{
  // read_uncommitted,
  read_committed,
  repeatable_read,
  serializable,
};


namespace internal
{
/// The SQL command for starting a given type of transaction.
[[nodiscard]] constexpr zview
begin_cmd(isolation_level isolation, write_policy rw) noexcept
{
  bool const ro{rw == write_policy::read_only};
  switch (isolation)
  {
  case repeatable_read:
    return ro ? "BEGIN ISOLATION LEVEL REPEATABLE READ READ ONLY"_zv :
                "BEGIN ISOLATION LEVEL REPEATABLE READ"_zv;
  case serializable:
    return ro ? "BEGIN ISOLATION LEVEL SERIALIZABLE READ ONLY"_zv :
                "BEGIN ISOLATION LEVEL SERIALIZABLE"_zv;
  case read_committed:
  default: return ro ? "BEGIN READ ONLY"_zv : "BEGIN"_zv;
  }
}
} // namespace internal
} // namespace pqnest
#endif
