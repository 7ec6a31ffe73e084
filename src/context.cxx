/** Implementation of the pqnest::context class.
 *
 * pqnest::context carries active transactions down a call chain.
 *
 * Copyright (c) 2000-2024, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#include "pqnest-source.hxx"

#include <iterator>
#include <utility>
#include <vector>

#include "pqnest/context.hxx"


/// One binding in a context's list.  Nodes never change once linked in.
struct pqnest::context::node
{
  node(
    internal::binding_key k, std::shared_ptr<internal::transaction_handle> h,
    std::shared_ptr<node const> n) noexcept :
          key{k}, handle{std::move(h)}, next{std::move(n)}
  {}

  internal::binding_key const key;
  std::shared_ptr<internal::transaction_handle> const handle;
  std::shared_ptr<node const> const next;
};


pqnest::context::context(std::shared_ptr<node const> head) noexcept :
        m_head{std::move(head)}
{}


pqnest::context::~context() noexcept = default;


std::size_t pqnest::context::size() const noexcept
{
  std::size_t count{0};
  for (auto n{m_head.get()}; n != nullptr; n = n->next.get()) ++count;
  return count;
}


std::shared_ptr<pqnest::internal::transaction_handle>
pqnest::context::find(internal::binding_key key) const noexcept
{
  for (auto n{m_head.get()}; n != nullptr; n = n->next.get())
    if (n->key == key)
      return n->handle;
  return nullptr;
}


pqnest::context pqnest::context::bind(
  internal::binding_key key,
  std::shared_ptr<internal::transaction_handle> handle) const
{
  // The list never holds more than one node per key, no matter how many
  // transactions a long-lived context has seen come and go.
  std::vector<node const *> prefix;
  auto n{m_head.get()};
  while ((n != nullptr) and (n->key != key))
  {
    prefix.push_back(n);
    n = n->next.get();
  }

  std::shared_ptr<node const> tail;
  if (n == nullptr)
  {
    // No existing binding for this key.  Share the whole list.
    tail = m_head;
  }
  else
  {
    // Copy the nodes in front of the old binding; share everything behind it.
    tail = n->next;
    for (auto i{std::rbegin(prefix)}; i != std::rend(prefix); ++i)
      tail = std::make_shared<node const>((*i)->key, (*i)->handle, tail);
  }

  if (handle)
    tail = std::make_shared<node const>(key, std::move(handle), tail);
  return context{std::move(tail)};
}
