/* Definition of libpqnest exception classes.
 *
 * pqnest::sql_error, pqnest::broken_connection, pqnest::usage_error, ...
 *
 * Copyright (c) 2000-2024, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#ifndef PQNEST_H_EXCEPT
#define PQNEST_H_EXCEPT

#include "pqnest/compiler-public.hxx"

#include <stdexcept>
#include <string>


namespace pqnest
{
/**
 * @addtogroup exception Exception classes
 *
 * There are two kinds of exception here.  Run-time failures (derived from
 * @ref failure) come out of the database: a lost connection, a failed
 * statement, a commit whose outcome is unknown.  Logic errors (derived from
 * @ref usage_error and friends) mean the calling code broke the rules, e.g.
 * by committing a transaction that was never started.
 *
 * Failures roughly follow the two-level hierarchy defined by the PostgreSQL
 * SQLSTATE error codes, though not exhaustively.
 *
 * @{
 */

/// Run-time failure encountered by libpqnest, similar to std::runtime_error.
struct PQNEST_LIBEXPORT failure : std::runtime_error
{
  explicit failure(std::string const &);
};


/// Exception class for lost or failed backend connection.
struct PQNEST_LIBEXPORT broken_connection : failure
{
  broken_connection();
  explicit broken_connection(std::string const &);
};


/// Exception class for failed queries.
/** Carries, in addition to a regular error message, a copy of the failed query
 * and (if available) the SQLSTATE value accompanying the error.
 */
class PQNEST_LIBEXPORT sql_error : public failure
{
  /// Query string.  Empty if unknown.
  std::string const m_query;
  /// SQLSTATE string describing the error type, if known; or empty string.
  std::string const m_sqlstate;

public:
  explicit sql_error(
    std::string const &whatarg = "", std::string Q = "",
    char const *sqlstate = nullptr);
  virtual ~sql_error() noexcept override;

  /// The query whose execution triggered the exception
  [[nodiscard]] PQNEST_PURE std::string const &query() const noexcept;

  /// SQLSTATE error code if known, or empty string otherwise.
  [[nodiscard]] PQNEST_PURE std::string const &sqlstate() const noexcept;
};


/// "Help, I don't know whether transaction was committed successfully!"
/** Exception that might be thrown in rare cases where the connection to the
 * database is lost while finishing a database transaction, and there's no way
 * of telling whether it was actually executed by the backend.  In this case
 * the database is left in an indeterminate (but consistent) state, and only
 * manual inspection will tell which is the case.
 */
struct PQNEST_LIBEXPORT in_doubt_error : failure
{
  explicit in_doubt_error(std::string const &);
};


/// The backend saw itself forced to roll back the ongoing transaction.
struct PQNEST_LIBEXPORT transaction_rollback : sql_error
{
  explicit transaction_rollback(
    std::string const &whatarg, std::string const &q = "",
    char const sqlstate[] = nullptr);
};


/// Transaction failed to serialize.  Please retry it.
/** Can only happen at transaction isolation levels REPEATABLE READ and
 * SERIALIZABLE.
 */
struct PQNEST_LIBEXPORT serialization_failure : transaction_rollback
{
  explicit serialization_failure(
    std::string const &whatarg, std::string const &q,
    char const sqlstate[] = nullptr);
};


/// We can't tell whether our last statement succeeded.
struct PQNEST_LIBEXPORT statement_completion_unknown : transaction_rollback
{
  explicit statement_completion_unknown(
    std::string const &whatarg, std::string const &q,
    char const sqlstate[] = nullptr);
};


/// The ongoing transaction has deadlocked.  Retrying it may help.
struct PQNEST_LIBEXPORT deadlock_detected : transaction_rollback
{
  explicit deadlock_detected(
    std::string const &whatarg, std::string const &q,
    char const sqlstate[] = nullptr);
};


/// Database feature not supported in current setup.
struct PQNEST_LIBEXPORT feature_not_supported : sql_error
{
  explicit feature_not_supported(
    std::string const &err, std::string const &Q = "",
    char const sqlstate[] = nullptr);
};


/// A statement would have violated an integrity constraint.
struct PQNEST_LIBEXPORT integrity_constraint_violation : sql_error
{
  explicit integrity_constraint_violation(
    std::string const &err, std::string const &Q = "",
    char const sqlstate[] = nullptr);
};


struct PQNEST_LIBEXPORT unique_violation : integrity_constraint_violation
{
  explicit unique_violation(
    std::string const &err, std::string const &Q = "",
    char const sqlstate[] = nullptr);
};


/// The transaction is in a state where it can't accept statements.
/** This is what PostgreSQL reports when you keep issuing statements after an
 * error, without rolling back to a savepoint first.
 */
struct PQNEST_LIBEXPORT invalid_transaction_state : sql_error
{
  explicit invalid_transaction_state(
    std::string const &err, std::string const &Q = "",
    char const sqlstate[] = nullptr);
};


/// Error in usage of a savepoint, e.g. releasing one that doesn't exist.
struct PQNEST_LIBEXPORT invalid_savepoint : sql_error
{
  explicit invalid_savepoint(
    std::string const &err, std::string const &Q = "",
    char const sqlstate[] = nullptr);
};


struct PQNEST_LIBEXPORT syntax_error : sql_error
{
  explicit syntax_error(
    std::string const &err, std::string const &Q = "",
    char const sqlstate[] = nullptr);
};


struct PQNEST_LIBEXPORT undefined_table : sql_error
{
  explicit undefined_table(
    std::string const &err, std::string const &Q = "",
    char const sqlstate[] = nullptr);
};


struct PQNEST_LIBEXPORT insufficient_privilege : sql_error
{
  explicit insufficient_privilege(
    std::string const &err, std::string const &Q = "",
    char const sqlstate[] = nullptr);
};


/// Internal error in libpqnest library
struct PQNEST_LIBEXPORT internal_error : std::logic_error
{
  explicit internal_error(std::string const &);
};


/// Error in usage of libpqnest library, similar to std::logic_error
struct PQNEST_LIBEXPORT usage_error : std::logic_error
{
  explicit usage_error(std::string const &);
};


/// Commit, rollback or lookup without a transaction in progress.
/** Also what you get when you keep using a context whose transaction has
 * already been committed or rolled back.
 */
struct PQNEST_LIBEXPORT no_transaction_error : usage_error
{
  no_transaction_error();
  explicit no_transaction_error(std::string const &);
};


/// Attempt to adopt a transaction where one is already in progress.
struct PQNEST_LIBEXPORT transaction_active_error : usage_error
{
  transaction_active_error();
  explicit transaction_active_error(std::string const &);
};


/// Invalid argument passed to libpqnest, similar to std::invalid_argument
struct PQNEST_LIBEXPORT argument_error : std::invalid_argument
{
  explicit argument_error(std::string const &);
};


/// Something is out of range, similar to std::out_of_range
struct PQNEST_LIBEXPORT range_error : std::out_of_range
{
  explicit range_error(std::string const &);
};

/**
 * @}
 */
} // namespace pqnest


namespace pqnest::internal
{
/// Throw the exception that best matches a server error's SQLSTATE code.
/** A missing or empty code means the connection is no longer usable, so
 * that becomes @ref broken_connection.  Codes without a more specific
 * exception class become a plain @ref sql_error.
 */
[[noreturn]] PQNEST_LIBEXPORT void throw_sql_error(
  std::string const &err, std::string const &query, char const sqlstate[]);
} // namespace pqnest::internal
#endif
