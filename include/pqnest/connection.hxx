/* Definition of the pqnest::connection class.
 *
 * pqnest::connection encapsulates a connection to a database.
 *
 * Copyright (c) 2000-2024, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#ifndef PQNEST_H_CONNECTION
#define PQNEST_H_CONNECTION

#include "pqnest/compiler-public.hxx"

#include <functional>
#include <memory>
#include <string>

#include "pqnest/backend.hxx"
#include "pqnest/isolation.hxx"
#include "pqnest/internal/libpq-forward.hxx"
#include "pqnest/version.hxx"
#include "pqnest/zview.hxx"


namespace pqnest::internal
{
/// Holds the connection's notice handler.
/** This lives in a separate, reference-counted object because libpq may call
 * the notice processor at a time when only its registration remains.
 */
struct notice_waiters
{
  std::function<void(zview)> notice_handler;
};
} // namespace pqnest::internal


namespace pqnest::internal::gate
{
class connection_transaction;
} // namespace pqnest::internal::gate


namespace pqnest
{
class transaction;

/**
 * @addtogroup connection
 *
 * Use of the libpqnest library starts here.
 *
 * Everything that can be done with a database through libpqnest must go
 * through a @ref connection.  It connects to a database when you create it,
 * and it terminates that communication during destruction.
 *
 * Many things come together in this class.  Handling of error and warning
 * messages, for example, is defined by notice handlers in the context of a
 * connection.
 *
 * When you connect to a database, you pass a connection string containing
 * any parameters and options, such as the server address and the database
 * name.  These are identical to the ones in libpq, the C language binding
 * upon which libpqnest itself is built:
 *
 * https://www.postgresql.org/docs/current/libpq-connect.html#LIBPQ-CONNSTRING
 *
 * Any parameters you leave out come from the usual environment variables
 * (`PGHOST`, `PGDATABASE`, `PGUSER`, and so on), or libpq's defaults.
 */
//@{

/// Connection to a database, and source of real transactions.
/** A connection supports one open @ref transaction at a time.  Combine it
 * with a @ref coordinator to let nested code share that transaction through
 * savepoints.
 *
 * @warning A connection is not thread-safe.  Do not use it, or any
 * transaction on it, from more than one thread at a time.
 */
class PQNEST_LIBEXPORT connection final : public backend
{
public:
  /// Connect to a database, using the given connection string.
  /** Throws @ref broken_connection if the connection fails.
   */
  explicit connection(zview options = "");

  virtual ~connection() override;

  connection(connection const &) = delete;
  connection &operator=(connection const &) = delete;

  /// Begin a real transaction with the configured options.
  /** @throw usage_error if this connection already has an open transaction.
   */
  [[nodiscard]] std::unique_ptr<backend_transaction> begin() override;

  /// Set the isolation level and write policy for @ref begin.
  void set_transaction_options(
    isolation_level isolation, write_policy rw = write_policy::read_write);

  [[nodiscard]] isolation_level default_isolation() const noexcept
  {
    return m_isolation;
  }

  [[nodiscard]] write_policy default_write_policy() const noexcept
  {
    return m_write_policy;
  }

  /// Is this connection open at the moment?
  [[nodiscard]] bool is_open() const noexcept;

  /// Explicitly close the connection.
  void close();

  /// Name of the database to which we're connected, if any.
  [[nodiscard]] char const *dbname() const;

  /// What version of the PostgreSQL server are we connected to?
  /** The result looks like 130005 for version 13.5, or 0 if not connected.
   */
  [[nodiscard]] int server_version() const noexcept;

  /// Set a notice handler to the connection.
  /** When the server sends a notice or warning, or libpqnest has something
   * to say about this connection, the connection passes it to the notice
   * handler.  The default handler writes to standard error.
   *
   * @warning The handler must not throw.
   */
  void set_notice_handler(std::function<void(zview)> handler);

  /// Invoke notice processor function.  The message should end in newline.
  void process_notice(zview) noexcept;

private:
  friend class pqnest::internal::gate::connection_transaction;

  void set_up_notice_handlers();
  void check_open() const;

  /// Execute a statement on behalf of a transaction.
  result exec(zview query);

  void register_transaction(transaction *);
  void unregister_transaction(transaction *) noexcept;

  /// Connection handle.
  internal::pq::PGconn *m_conn = nullptr;

  /// Notice handler, shared with libpq's notice processor.
  std::shared_ptr<internal::notice_waiters> m_notice_waiters;

  /// The transaction currently open on this connection, if any.
  transaction const *m_trans = nullptr;

  isolation_level m_isolation = read_committed;
  write_policy m_write_policy = write_policy::read_write;
};

//@}
} // namespace pqnest
#endif
