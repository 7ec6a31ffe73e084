#if !defined(PQNEST_H_TEST_RECORDING_BACKEND)
#  define PQNEST_H_TEST_RECORDING_BACKEND

#  include <cstddef>
#  include <functional>
#  include <memory>
#  include <mutex>
#  include <set>
#  include <string>
#  include <utility>
#  include <vector>

#  include <pqnest/backend.hxx>
#  include <pqnest/except.hxx>

namespace pqnest::test
{
/// Journal of every statement a @c recording_backend saw.
/** Thread-safe.  Also decides which statements fail.
 */
class journal
{
public:
  /// Record @c stmt.  Throw @c sql_error if it's one we were told to fail.
  void record(std::string const &stmt)
  {
    std::lock_guard<std::mutex> const lock{m_lock};
    m_log.push_back(stmt);
    if (m_failing.find(stmt) != std::end(m_failing))
      throw sql_error{"Simulated failure.", stmt, "XX000"};
  }

  /// Make every future attempt at @c stmt fail.
  void fail(std::string const &stmt)
  {
    std::lock_guard<std::mutex> const lock{m_lock};
    m_failing.insert(stmt);
  }

  /// Make @c stmt succeed again.
  void heal(std::string const &stmt)
  {
    std::lock_guard<std::mutex> const lock{m_lock};
    m_failing.erase(stmt);
  }

  std::vector<std::string> log() const
  {
    std::lock_guard<std::mutex> const lock{m_lock};
    return m_log;
  }

  void clear()
  {
    std::lock_guard<std::mutex> const lock{m_lock};
    m_log.clear();
  }

  /// Count of recorded statements equal to @c stmt.
  std::size_t count(std::string const &stmt) const
  {
    std::lock_guard<std::mutex> const lock{m_lock};
    std::size_t n{0};
    for (auto const &s : m_log)
      if (s == stmt)
        ++n;
    return n;
  }

  /// Number of transactions begun but not yet destroyed.
  int live() const
  {
    std::lock_guard<std::mutex> const lock{m_lock};
    return m_live;
  }

  void add_live(int n)
  {
    std::lock_guard<std::mutex> const lock{m_lock};
    m_live += n;
  }

private:
  mutable std::mutex m_lock;
  std::vector<std::string> m_log;
  std::set<std::string> m_failing;
  int m_live = 0;
};


/// Fake transaction that writes each statement to a @c journal.
class recording_transaction final : public backend_transaction
{
public:
  explicit recording_transaction(std::shared_ptr<journal> j) :
          m_journal{std::move(j)}
  {
    m_journal->add_live(1);
  }

  ~recording_transaction() noexcept override { m_journal->add_live(-1); }

  result exec(zview query) override
  {
    if (not m_open)
      throw usage_error{"Executing in closed transaction."};
    m_journal->record(std::string{query});
    return result{};
  }

  void commit() override
  {
    if (not m_open)
      throw usage_error{"Committing closed transaction."};
    m_journal->record("COMMIT");
    m_open = false;
  }

  void rollback() override
  {
    if (not m_open)
      return;
    m_open = false;
    m_journal->record("ROLLBACK");
  }

  bool is_open() const noexcept { return m_open; }

private:
  std::shared_ptr<journal> m_journal;
  bool m_open = true;
};


/// Fake backend.  Records "BEGIN" for every transaction it opens.
class recording_backend final : public backend
{
public:
  recording_backend() : m_journal{std::make_shared<journal>()} {}

  std::unique_ptr<backend_transaction> begin() override
  {
    m_journal->record("BEGIN");
    return std::make_unique<recording_transaction>(m_journal);
  }

  /// A transaction not obtained through @c begin, e.g. for adoption.
  std::unique_ptr<recording_transaction> make_transaction()
  {
    return std::make_unique<recording_transaction>(m_journal);
  }

  journal &log() noexcept { return *m_journal; }

private:
  std::shared_ptr<journal> m_journal;
};


/// Collects notices, for tests that check them.
class notice_collector
{
public:
  /// A notice handler feeding this collector.  The collector must outlive it.
  std::function<void(zview)> handler()
  {
    return [this](zview msg) { add(msg); };
  }

  void add(zview msg)
  {
    std::lock_guard<std::mutex> const lock{m_lock};
    m_notices.emplace_back(msg);
  }

  std::vector<std::string> notices() const
  {
    std::lock_guard<std::mutex> const lock{m_lock};
    return m_notices;
  }

private:
  mutable std::mutex m_lock;
  std::vector<std::string> m_notices;
};
} // namespace pqnest::test
#endif
