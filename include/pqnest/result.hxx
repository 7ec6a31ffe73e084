/* Definition of the pqnest::result class.
 *
 * pqnest::result holds the outcome of one SQL statement.
 *
 * Copyright (c) 2000-2024, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#ifndef PQNEST_H_RESULT
#define PQNEST_H_RESULT

#include "pqnest/compiler-public.hxx"

#include <memory>
#include <string>
#include <string_view>

#include "pqnest/except.hxx"
#include "pqnest/internal/libpq-forward.hxx"
#include "pqnest/zview.hxx"


namespace pqnest::internal
{
PQNEST_LIBEXPORT void clear_result(pq::PGresult const *) noexcept;
} // namespace pqnest::internal


namespace pqnest::internal::gate
{
class result_creation;
} // namespace pqnest::internal::gate


namespace pqnest
{
/// Result set containing data returned by a statement.
/** Result objects are lightweight, reference-counted wrappers around libpq's
 * result data.  They're cheap to copy, and copies share the same data.
 *
 * A default-constructed result is empty: no rows, no columns.  That is also
 * what a backend without real result data (such as a test double) returns for
 * transaction-control statements.
 *
 * @warning The result set that a result object points to is not thread-safe.
 * Never copy, destroy, or query a result while another thread may be doing
 * the same to the same underlying result set.
 */
class PQNEST_LIBEXPORT result
{
public:
  using size_type = int;

  result() noexcept = default;
  result(result const &rhs) noexcept = default;
  result(result &&rhs) noexcept = default;
  result &operator=(result const &rhs) noexcept = default;
  result &operator=(result &&rhs) noexcept = default;

  /// Number of rows.
  [[nodiscard]] PQNEST_PURE size_type size() const noexcept;
  [[nodiscard]] PQNEST_PURE bool empty() const noexcept;
  /// Number of columns.
  [[nodiscard]] PQNEST_PURE size_type columns() const noexcept;

  /// If command was INSERT, UPDATE, or DELETE: number of affected rows.
  /** @return Number of affected rows if last command was INSERT, UPDATE, or
   * DELETE; zero for all other commands.
   */
  [[nodiscard]] size_type affected_rows() const;

  /// Is the field at the given row and column null?
  [[nodiscard]] bool is_null(size_type row, size_type col) const;

  /// Text of the field at the given row and column.
  /** The view stays valid for as long as any copy of this result exists.
   * A null field reads as an empty string; use @ref is_null to tell the
   * difference.
   */
  [[nodiscard]] std::string_view at(size_type row, size_type col) const;

  /// Name of column with this number.
  [[nodiscard]] char const *column_name(size_type col) const;

  /// Command status tag from the server, e.g. "INSERT 0 1" or "COMMIT".
  /** Empty if there is none.
   */
  [[nodiscard]] zview cmd_status() const noexcept;

  /// Query that produced this result, if available (empty string otherwise)
  [[nodiscard]] PQNEST_PURE std::string const &query() const & noexcept;

private:
  using data_pointer = std::shared_ptr<internal::pq::PGresult const>;

  /// Underlying libpq result set.
  data_pointer m_data;

  /// Query string.
  std::shared_ptr<std::string const> m_query;

  static std::string const s_empty_string;

  friend class pqnest::internal::gate::result_creation;
  result(
    internal::pq::PGresult *rhs, std::shared_ptr<std::string const> query);

  /// Throw if this result reports an error.
  void check_status() const;
  [[nodiscard]] std::string status_error() const;
  [[noreturn]] PQNEST_PRIVATE void
  throw_sql_error(std::string const &Err, std::string const &Query) const;

  void check_bounds(size_type row, size_type col) const;
};
} // namespace pqnest
#endif
