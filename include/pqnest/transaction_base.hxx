/* Common code and definitions for the transaction classes.
 *
 * pqnest::transaction_base tracks a real transaction's status, and decides
 * what commit and rollback mean in each state.
 *
 * Copyright (c) 2000-2024, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#ifndef PQNEST_H_TRANSACTION_BASE
#define PQNEST_H_TRANSACTION_BASE

#include "pqnest/compiler-public.hxx"

#include "pqnest/backend.hxx"
#include "pqnest/result.hxx"
#include "pqnest/zview.hxx"


namespace pqnest
{
/**
 * @ingroup backend
 */
//@{

/// Status machine shared by real transaction classes.
/** A transaction starts out active.  Committing or rolling back closes it.
 * If a commit fails because the connection broke, or the server can't tell
 * whether it completed, the transaction is "in doubt": there is no way to
 * know whether it went through, except by checking the database.
 *
 * Derived classes supply the statement execution.  The most-derived class
 * must call @ref close from its destructor.
 */
class PQNEST_LIBEXPORT transaction_base : public backend_transaction
{
public:
  transaction_base(transaction_base const &) = delete;
  transaction_base &operator=(transaction_base const &) = delete;

  /// Execute a statement.  Throws @ref usage_error once closed.
  result exec(zview query) override;

  /// Commit the transaction.
  /** Committing more than once produces a notice, but no error.
   *
   * @throw in_doubt_error if the connection broke during the commit, or the
   *     server reported that it could not tell whether the commit completed.
   * @throw transaction_rollback if the server rolled back instead, e.g.
   *     because a statement in the transaction had already failed.
   * @throw usage_error if the transaction was already rolled back.
   */
  void commit() override;

  /// Roll back.  Rolling back a transaction that already failed is a no-op.
  void rollback() override;

  /// Is this transaction still open, i.e. neither committed nor aborted?
  [[nodiscard]] bool is_open() const noexcept
  {
    return m_status == status::active;
  }

  /// Has a commit left this transaction in an indeterminate state?
  [[nodiscard]] bool in_doubt() const noexcept
  {
    return m_status == status::in_doubt;
  }

protected:
  transaction_base() noexcept;
  virtual ~transaction_base() noexcept override;

  /// Roll back if still open, then let go of the connection.
  void close() noexcept;

  /// Mark the transaction as failed, and close it without executing anything.
  /** For use when even opening the transaction failed.
   */
  void mark_aborted() noexcept;

  /// Execute a statement on the connection.
  virtual result do_exec(zview query) = 0;

  /// Is the connection still usable, as far as we know?
  [[nodiscard]] virtual bool connection_open() const noexcept = 0;

  /// Pass a message to the connection's notice handler.
  virtual void process_notice(zview) noexcept = 0;

  /// Hook: the transaction has closed, for whatever reason.  Called once.
  virtual void do_close() noexcept {}

private:
  enum class status
  {
    active,
    aborted,
    committed,
    in_doubt
  };

  void end(status) noexcept;

  status m_status = status::active;
  bool m_closed = false;
};

//@}
} // namespace pqnest
#endif
