/* Definition of the pqnest::context class.
 *
 * pqnest::context carries active transactions down a call chain.
 *
 * Copyright (c) 2000-2024, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#ifndef PQNEST_H_CONTEXT
#define PQNEST_H_CONTEXT

#include "pqnest/compiler-public.hxx"

#include <cstddef>
#include <cstdint>
#include <memory>


namespace pqnest::internal
{
class transaction_handle;

/// Identifies one coordinator's binding within a context.
using binding_key = std::uint64_t;
} // namespace pqnest::internal


namespace pqnest::internal::gate
{
class context_coordinator;
} // namespace pqnest::internal::gate


namespace pqnest
{
/// Immutable value carrying the active transaction(s) down a call chain.
/** Pass a context into every function that may want to do transactional
 * work, the way you'd pass a connection.  A @ref coordinator reads the
 * transaction bound in the context, and returns a new context whenever the
 * binding changes.
 *
 * A default-constructed context is empty: no transaction is active.
 *
 * Contexts are cheap to copy.  A copy shares its bindings with the original:
 * the transaction it refers to is the very same object, never a copy.  Since
 * a context never changes once created, you can copy it and pass it to other
 * threads freely.
 *
 * A context can hold bindings for any number of coordinators at the same
 * time, but at most one per coordinator.
 */
class PQNEST_LIBEXPORT context
{
public:
  context() noexcept = default;
  context(context const &) noexcept = default;
  context(context &&) noexcept = default;
  context &operator=(context const &) noexcept = default;
  context &operator=(context &&) noexcept = default;
  ~context() noexcept;

  /// Number of transactions bound in this context.
  /** A binding whose transaction has since been committed or rolled back
   * still counts until a coordinator replaces or clears it.
   */
  [[nodiscard]] std::size_t size() const noexcept;

  /// Is this context free of any bindings?
  [[nodiscard]] bool empty() const noexcept { return m_head == nullptr; }

private:
  struct node;

  friend class pqnest::internal::gate::context_coordinator;

  explicit context(std::shared_ptr<node const> head) noexcept;

  /// Look up the handle bound under @c key, or null.
  [[nodiscard]] std::shared_ptr<internal::transaction_handle>
  find(internal::binding_key key) const noexcept;

  /// Return a context like this one, but with @c key bound to @c handle.
  /** Passing a null @c handle clears the binding.
   */
  [[nodiscard]] context bind(
    internal::binding_key key,
    std::shared_ptr<internal::transaction_handle> handle) const;

  std::shared_ptr<node const> m_head;
};
} // namespace pqnest
#endif
