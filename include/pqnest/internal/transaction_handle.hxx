/* Shared state of one coordinated transaction.
 *
 * DO NOT INCLUDE THIS FILE when building client programs.
 *
 * Copyright (c) 2000-2024, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#ifndef PQNEST_H_TRANSACTION_HANDLE
#define PQNEST_H_TRANSACTION_HANDLE

#include <cstddef>
#include <iterator>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

#include "pqnest/backend.hxx"
#include "pqnest/except.hxx"


namespace pqnest::internal
{
/// A real transaction, plus the stack of savepoints opened on top of it.
/** Every context that a coordinator derives from the same outermost
 * @c start shares one of these.
 *
 * Apart from construction, call the members only while holding @c mutex().
 * The coordinator holds it across each pair of "issue savepoint statement"
 * and "update bookkeeping," so that concurrent callers can't get the two
 * out of step.
 */
class PQNEST_PRIVATE transaction_handle
{
public:
  using savepoint_id = unsigned long;

  explicit transaction_handle(std::unique_ptr<backend_transaction> tx) :
          m_trans{std::move(tx)}
  {
    if (not m_trans)
      throw internal_error{"Creating transaction handle without transaction."};
  }

  transaction_handle(transaction_handle const &) = delete;
  transaction_handle &operator=(transaction_handle const &) = delete;

  [[nodiscard]] std::mutex &mutex() const noexcept { return m_mutex; }

  /// Has the real transaction been committed or rolled back?
  [[nodiscard]] bool finalized() const noexcept { return not m_trans; }

  /// Number of savepoints currently open.
  [[nodiscard]] std::size_t depth() const noexcept
  {
    return std::size(m_savepoints);
  }

  [[nodiscard]] backend_transaction &real() const
  {
    if (not m_trans)
      throw internal_error{"Using a finalised transaction handle."};
    return *m_trans;
  }

  /// Draw the next savepoint number.  Numbers are never handed out twice.
  [[nodiscard]] savepoint_id next_savepoint() noexcept
  {
    return ++m_last_savepoint;
  }

  /// Record that savepoint @c id now exists in the database.
  void push_savepoint(savepoint_id id) { m_savepoints.push_back(id); }

  /// The innermost open savepoint.
  [[nodiscard]] savepoint_id top_savepoint() const
  {
    if (std::empty(m_savepoints))
      throw internal_error{"No savepoint open."};
    return m_savepoints.back();
  }

  /// Forget the innermost savepoint, after it was released or rolled back.
  void pop_savepoint()
  {
    if (std::empty(m_savepoints))
      throw internal_error{"Popping savepoint off empty stack."};
    m_savepoints.pop_back();
  }

  /// Mark the handle finalised, and hand back the real transaction.
  /** Once the caller lets go of the returned object, the transaction's
   * resources go back to wherever it came from.
   */
  [[nodiscard]] std::unique_ptr<backend_transaction> finalize() noexcept
  {
    m_savepoints.clear();
    return std::move(m_trans);
  }

private:
  mutable std::mutex m_mutex;
  std::unique_ptr<backend_transaction> m_trans;
  std::vector<savepoint_id> m_savepoints;
  savepoint_id m_last_savepoint = 0;
};
} // namespace pqnest::internal
#endif
