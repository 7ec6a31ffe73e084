/* Definition of the pqnest::transaction class.
 *
 * pqnest::transaction represents a real database transaction over libpq.
 *
 * Copyright (c) 2000-2024, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#ifndef PQNEST_H_TRANSACTION
#define PQNEST_H_TRANSACTION

#include "pqnest/compiler-public.hxx"

#include "pqnest/isolation.hxx"
#include "pqnest/transaction_base.hxx"


namespace pqnest
{
class connection;

/**
 * @ingroup backend
 */
//@{

/// Standard back-end transaction on a libpq @ref connection.
/** Opening one issues `BEGIN` (with the isolation level and write policy you
 * ask for).  A connection can have only one of these open at a time.
 *
 * You'll normally get these from @ref connection::begin through a
 * @ref coordinator.  But you can also create one yourself and hand it to
 * @ref coordinator::adopt.
 *
 * If the transaction is destroyed while still open, it rolls back.
 */
class PQNEST_LIBEXPORT transaction final : public transaction_base
{
public:
  /// Begin a transaction with the connection's configured options.
  explicit transaction(connection &cx);

  /// Begin a transaction with the given isolation level and write policy.
  transaction(
    connection &cx, isolation_level isolation,
    write_policy rw = write_policy::read_write);

  virtual ~transaction() noexcept override { close(); }

  [[nodiscard]] connection &conn() const noexcept { return m_conn; }

private:
  result do_exec(zview query) override;
  bool connection_open() const noexcept override;
  void process_notice(zview msg) noexcept override;
  void do_close() noexcept override;

  connection &m_conn;
  bool m_registered = false;
};

//@}
} // namespace pqnest
#endif
