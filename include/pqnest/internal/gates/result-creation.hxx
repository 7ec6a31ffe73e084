#include <pqnest/internal/callgate.hxx>

namespace pqnest::internal::gate
{
class PQNEST_PRIVATE result_creation final : callgate<result const>
{
  friend class pqnest::connection;

  result_creation(reference x) noexcept : super(x) {}

  static result create(
    internal::pq::PGresult *rhs, std::shared_ptr<std::string const> const &query)
  {
    return result{rhs, query};
  }

  void check_status() const { home().check_status(); }
};
} // namespace pqnest::internal::gate
