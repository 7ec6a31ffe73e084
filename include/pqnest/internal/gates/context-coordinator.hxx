#include <pqnest/internal/callgate.hxx>

namespace pqnest::internal::gate
{
class PQNEST_PRIVATE context_coordinator final : callgate<context const>
{
  friend class pqnest::coordinator;

  context_coordinator(reference x) noexcept : super(x) {}

  [[nodiscard]] std::shared_ptr<transaction_handle>
  find(binding_key key) const noexcept
  {
    return home().find(key);
  }

  [[nodiscard]] context
  bind(binding_key key, std::shared_ptr<transaction_handle> handle) const
  {
    return home().bind(key, std::move(handle));
  }

  [[nodiscard]] context unbind(binding_key key) const
  {
    return home().bind(key, nullptr);
  }
};
} // namespace pqnest::internal::gate
