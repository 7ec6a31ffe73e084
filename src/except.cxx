/** Implementation of libpqnest exception classes.
 *
 * Copyright (c) 2000-2024, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#include "pqnest-source.hxx"

#include <cstring>
#include <utility>

#include "pqnest/except.hxx"


pqnest::failure::failure(std::string const &whatarg) :
        std::runtime_error{whatarg}
{}


pqnest::broken_connection::broken_connection() :
        failure{"Connection to database failed."}
{}


pqnest::broken_connection::broken_connection(std::string const &whatarg) :
        failure{whatarg}
{}


pqnest::sql_error::sql_error(
  std::string const &whatarg, std::string Q, char const *sqlstate) :
        failure{whatarg},
        m_query{std::move(Q)},
        m_sqlstate{sqlstate ? sqlstate : ""}
{}


pqnest::sql_error::~sql_error() noexcept = default;


PQNEST_PURE std::string const &pqnest::sql_error::query() const noexcept
{
  return m_query;
}


PQNEST_PURE std::string const &pqnest::sql_error::sqlstate() const noexcept
{
  return m_sqlstate;
}


pqnest::in_doubt_error::in_doubt_error(std::string const &whatarg) :
        failure{whatarg}
{}


pqnest::transaction_rollback::transaction_rollback(
  std::string const &whatarg, std::string const &q, char const sqlstate[]) :
        sql_error{whatarg, q, sqlstate}
{}


pqnest::serialization_failure::serialization_failure(
  std::string const &whatarg, std::string const &q, char const sqlstate[]) :
        transaction_rollback{whatarg, q, sqlstate}
{}


pqnest::statement_completion_unknown::statement_completion_unknown(
  std::string const &whatarg, std::string const &q, char const sqlstate[]) :
        transaction_rollback{whatarg, q, sqlstate}
{}


pqnest::deadlock_detected::deadlock_detected(
  std::string const &whatarg, std::string const &q, char const sqlstate[]) :
        transaction_rollback{whatarg, q, sqlstate}
{}


pqnest::feature_not_supported::feature_not_supported(
  std::string const &err, std::string const &Q, char const sqlstate[]) :
        sql_error{err, Q, sqlstate}
{}


pqnest::integrity_constraint_violation::integrity_constraint_violation(
  std::string const &err, std::string const &Q, char const sqlstate[]) :
        sql_error{err, Q, sqlstate}
{}


pqnest::unique_violation::unique_violation(
  std::string const &err, std::string const &Q, char const sqlstate[]) :
        integrity_constraint_violation{err, Q, sqlstate}
{}


pqnest::invalid_transaction_state::invalid_transaction_state(
  std::string const &err, std::string const &Q, char const sqlstate[]) :
        sql_error{err, Q, sqlstate}
{}


pqnest::invalid_savepoint::invalid_savepoint(
  std::string const &err, std::string const &Q, char const sqlstate[]) :
        sql_error{err, Q, sqlstate}
{}


pqnest::syntax_error::syntax_error(
  std::string const &err, std::string const &Q, char const sqlstate[]) :
        sql_error{err, Q, sqlstate}
{}


pqnest::undefined_table::undefined_table(
  std::string const &err, std::string const &Q, char const sqlstate[]) :
        sql_error{err, Q, sqlstate}
{}


pqnest::insufficient_privilege::insufficient_privilege(
  std::string const &err, std::string const &Q, char const sqlstate[]) :
        sql_error{err, Q, sqlstate}
{}


pqnest::internal_error::internal_error(std::string const &whatarg) :
        logic_error{"libpqnest internal error: " + whatarg}
{}


pqnest::usage_error::usage_error(std::string const &whatarg) :
        logic_error{whatarg}
{}


pqnest::no_transaction_error::no_transaction_error() :
        usage_error{"No started transaction."}
{}


pqnest::no_transaction_error::no_transaction_error(
  std::string const &whatarg) :
        usage_error{whatarg}
{}


pqnest::transaction_active_error::transaction_active_error() :
        usage_error{"Transaction already started."}
{}


pqnest::transaction_active_error::transaction_active_error(
  std::string const &whatarg) :
        usage_error{whatarg}
{}


pqnest::argument_error::argument_error(std::string const &whatarg) :
        invalid_argument{whatarg}
{}


pqnest::range_error::range_error(std::string const &whatarg) :
        out_of_range{whatarg}
{}


namespace
{
/// Compare two C strings.
inline bool equal(char const lhs[], char const rhs[])
{
  return std::strcmp(lhs, rhs) == 0;
}
} // namespace


void PQNEST_COLD pqnest::internal::throw_sql_error(
  std::string const &Err, std::string const &Query, char const code[])
{
  if (code == nullptr)
  {
    // No SQLSTATE at all.  Can this even happen?
    // Let's assume the connection is no longer usable.
    throw broken_connection{Err};
  }

  switch (code[0])
  {
  case '\0':
    // SQLSTATE is empty.  We may have seen this happen in one
    // circumstance: a client-side socket timeout (while using the
    // tcp_user_timeout connection option).  Trying to continue to use the
    // connection breaks, so treat it as broken.
    throw broken_connection{Err};

  case '0':
    switch (code[1])
    {
    case 'A': throw feature_not_supported{Err, Query, code};
    case '8': throw broken_connection{Err};
    case 'L':
    case 'P': throw insufficient_privilege{Err, Query, code};
    }
    break;
  case '2':
    switch (code[1])
    {
    case '3':
      if (equal(code, "23505"))
        throw unique_violation{Err, Query, code};
      throw integrity_constraint_violation{Err, Query, code};
    case '5': throw invalid_transaction_state{Err, Query, code};
    }
    break;
  case '3':
    switch (code[1])
    {
    case 'B': throw invalid_savepoint{Err, Query, code};
    }
    break;
  case '4':
    switch (code[1])
    {
    case '0':
      if (equal(code, "40000"))
        throw transaction_rollback{Err, Query, code};
      if (equal(code, "40001"))
        throw serialization_failure{Err, Query, code};
      if (equal(code, "40003"))
        throw statement_completion_unknown{Err, Query, code};
      if (equal(code, "40P01"))
        throw deadlock_detected{Err, Query, code};
      break;
    case '2':
      if (equal(code, "42501"))
        throw insufficient_privilege{Err, Query, code};
      if (equal(code, "42601"))
        throw syntax_error{Err, Query, code};
      if (equal(code, "42P01"))
        throw undefined_table{Err, Query, code};
    }
    break;
  case '5':
    switch (code[1])
    {
    case '7':
      if (equal(code, "57P01"))
        throw broken_connection{Err};
    }
    break;
  }

  // Unknown error code.
  throw sql_error{Err, Query, code};
}
