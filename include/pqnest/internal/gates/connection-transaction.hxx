#include <pqnest/internal/callgate.hxx>

namespace pqnest::internal::gate
{
class PQNEST_PRIVATE connection_transaction final : callgate<connection>
{
  friend class pqnest::transaction;

  connection_transaction(reference x) noexcept : super(x) {}

  result exec(zview query) { return home().exec(query); }

  void register_transaction(transaction *t)
  {
    home().register_transaction(t);
  }
  void unregister_transaction(transaction *t) noexcept
  {
    home().unregister_transaction(t);
  }

  [[nodiscard]] bool is_open() const noexcept { return home().is_open(); }
  void process_notice(zview msg) noexcept { home().process_notice(msg); }
};
} // namespace pqnest::internal::gate
