/* Definition of the pqnest::coordinator class.
 *
 * pqnest::coordinator maps nested transaction scopes onto one real
 * transaction plus savepoints.
 *
 * Copyright (c) 2000-2024, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#ifndef PQNEST_H_COORDINATOR
#define PQNEST_H_COORDINATOR

#include "pqnest/compiler-public.hxx"

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <type_traits>
#include <utility>

#include "pqnest/backend.hxx"
#include "pqnest/context.hxx"
#include "pqnest/except.hxx"
#include "pqnest/zview.hxx"


namespace pqnest
{
/**
 * @defgroup coordinator Nested transactions
 *
 * Application code often gets built up from functions that each want their
 * work to happen "in a transaction."  Sometimes one of those functions gets
 * called on its own, sometimes from inside another one that already has a
 * transaction going.  The database only supports one real transaction per
 * session, so the inner function can't just start its own.
 *
 * A @ref coordinator solves this.  The first @ref coordinator::start in a
 * call chain begins a real transaction.  Any @c start nested inside it
 * creates a savepoint instead.  Committing an inner scope releases its
 * savepoint; rolling it back rolls back to the savepoint, undoing only the
 * inner scope's work.  Only the outermost scope's commit or rollback ends the
 * real transaction.
 *
 * The "call chain" is whatever you pass a @ref context through:
 *
 * @code
 * void add_order(pqnest::coordinator &co, pqnest::context const &ctx)
 * {
 *   co.run_in(ctx, [&co](pqnest::context const &tx) {
 *     co.active(tx)->exec("INSERT INTO orders DEFAULT VALUES");
 *     add_audit_entry(co, tx);   // May use run_in as well.
 *   });
 * }
 * @endcode
 */
//@{

/// Callback receiving warnings and other diagnostics.
/** Messages normally end in a newline.  The handler must not throw.
 */
using notice_handler = std::function<void(zview)>;


/// Callback receiving each transaction-control statement, after it ran.
/** Receives the statement (`BEGIN`, `SAVEPOINT SP1`, `COMMIT`, ...) and how
 * long it took, whether it succeeded or not.  The tracer must not throw.
 *
 * The coordinator calls the tracer only once it has released its own locks,
 * so the tracer may call back into the coordinator, e.g. to ask for the
 * @ref coordinator::depth of a context.
 */
using statement_tracer =
  std::function<void(zview statement, std::chrono::microseconds elapsed)>;


/// Coordinates nested transaction scopes on one @ref backend.
/** Each coordinator keeps its bindings in a @ref context under a key of its
 * own, so multiple coordinators (e.g. for different databases) can share
 * contexts without interfering.
 *
 * A coordinator is thread-safe.  So is the sharing of one context (and
 * therefore one transaction) between threads, as far as the coordinator's
 * own bookkeeping goes: concurrent nested @c start calls will never create
 * the same savepoint twice.  However the coordinator does not serialise
 * any other statements you execute on the shared transaction.  Most database
 * drivers, including this library's own @ref connection, don't support that.
 *
 * Driver calls (e.g. @ref backend_transaction::exec for a savepoint) do run
 * while the coordinator holds the transaction's lock.  A connection's notice
 * handler, which the driver may invoke during such a call, must therefore not
 * call back into the coordinator.
 *
 * The coordinator must outlive every context in which it has bound a
 * transaction, and the backend must outlive the coordinator.
 */
class PQNEST_LIBEXPORT coordinator
{
public:
  /// Coordinate transactions on @c db.
  /**
   * @param db Source of real transactions.
   * @param notices Receives warnings, e.g. about rollbacks that failed while
   *     cleaning up after an error.  Defaults to writing to standard error.
   * @param tracer Optional: receives every transaction-control statement.
   */
  explicit coordinator(
    backend &db, notice_handler notices = {}, statement_tracer tracer = {});
  ~coordinator() noexcept;

  coordinator(coordinator const &) = delete;
  coordinator &operator=(coordinator const &) = delete;

  /// Open a transaction scope.
  /** If @c ctx has no active transaction from this coordinator, begins a real
   * transaction and returns a new context in which it is bound.
   *
   * Otherwise, creates a savepoint in the active transaction and returns
   * @c ctx itself.
   *
   * If this fails, no scope was opened.  Do not commit or roll back.
   */
  [[nodiscard]] context start(context const &ctx);

  /// Close the innermost transaction scope, keeping its work.
  /** Releases the innermost savepoint, or if there is none, commits the real
   * transaction.  In the latter case the returned context no longer has a
   * transaction bound; @c ctx and its copies will behave as if they never
   * had one either.
   *
   * @throw no_transaction_error if @c ctx has no active transaction.
   */
  context commit(context const &ctx);

  /// Close the innermost transaction scope, undoing its work.
  /** Rolls back to the innermost savepoint, or if there is none, rolls back
   * the real transaction.
   *
   * @throw no_transaction_error if @c ctx has no active transaction.
   */
  context rollback(context const &ctx);

  /// Run @c callback in a transaction scope of its own.
  /** Opens a scope with @ref start, and passes the resulting context to
   * @c callback.  If the callback returns normally, commits the scope and
   * returns whatever the callback returned.
   *
   * If the callback throws, rolls the scope back and rethrows.  If the
   * commit fails, rolls back and rethrows the commit's exception.  A failure
   * of such a rollback never hides the original exception; it goes to the
   * notice handler instead.
   */
  template<typename CALLBACK>
  auto run_in(context const &ctx, CALLBACK &&callback)
    -> std::invoke_result_t<CALLBACK, context const &>;

  /// Make an already open transaction the active transaction in @c ctx.
  /** From here on, @c start calls on the returned context create savepoints
   * in @c tx.  The coordinator takes ownership of @c tx; committing or
   * rolling back the outermost scope ends it.
   *
   * @throw argument_error if @c tx is null.
   * @throw transaction_active_error if @c ctx already has an active
   *     transaction from this coordinator.
   */
  [[nodiscard]] context
  adopt(context const &ctx, std::unique_ptr<backend_transaction> tx);

  /// The real transaction active in @c ctx, or null if there is none.
  /** Use this to execute statements in the transaction, at any nesting
   * depth.
   *
   * @warning The pointer is valid until the outermost scope commits or rolls
   * back.
   */
  [[nodiscard]] backend_transaction *active(context const &ctx) const;

  /// Number of savepoints open in the active transaction in @c ctx.
  /** Zero if only the real transaction is open, or if there is none.
   */
  [[nodiscard]] std::size_t depth(context const &ctx) const;

  /// The backend on which this coordinator opens transactions.
  [[nodiscard]] backend &db() const noexcept { return m_db; }

  /// Pass a message to the notice handler.
  void process_notice(zview) noexcept;

private:
  context end_scope(context const &ctx, bool keep);

  /// Commit @c scope; if that fails, roll it back and rethrow.
  void finish(context const &scope);

  /// Roll @c scope back after an error.  Failure only produces a notice.
  void abandon(context const &scope) noexcept;

  backend &m_db;
  internal::binding_key const m_key;
  notice_handler m_notices;
  statement_tracer m_tracer;
};


template<typename CALLBACK>
inline auto coordinator::run_in(context const &ctx, CALLBACK &&callback)
  -> std::invoke_result_t<CALLBACK, context const &>
{
  using return_type = std::invoke_result_t<CALLBACK, context const &>;

  context const scope{start(ctx)};
  if constexpr (std::is_void_v<return_type>)
  {
    try
    {
      std::invoke(std::forward<CALLBACK>(callback), scope);
    }
    catch (...)
    {
      abandon(scope);
      throw;
    }
    finish(scope);
  }
  else
  {
    return_type value{[&]() -> return_type {
      try
      {
        return std::invoke(std::forward<CALLBACK>(callback), scope);
      }
      catch (...)
      {
        abandon(scope);
        throw;
      }
    }()};
    finish(scope);
    return value;
  }
}

//@}
} // namespace pqnest
#endif
