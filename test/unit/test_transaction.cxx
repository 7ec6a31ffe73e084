#include <functional>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include <pqnest/except.hxx>
#include <pqnest/transaction_base.hxx>

#include "../helpers.hxx"

// A real transaction's status machine, driven through a scripted connection.

namespace
{
/// What a scripted transaction did, and what it should do.
struct script
{
  std::vector<std::string> statements;
  std::vector<std::string> notices;
  int closes = 0;

  /// Does the connection look usable?
  bool online = true;

  /// Run @c action (which should throw) instead of executing @c stmt, once.
  void fail(std::string const &stmt, std::function<void()> action)
  {
    failures[stmt] = std::move(action);
  }

  std::map<std::string, std::function<void()>> failures;
};


class scripted_transaction final : public pqnest::transaction_base
{
public:
  explicit scripted_transaction(script &s) : m_script{s} {}
  ~scripted_transaction() noexcept override { close(); }

private:
  pqnest::result do_exec(pqnest::zview query) override
  {
    m_script.statements.emplace_back(query);
    if (auto const f{m_script.failures.find(std::string{query})};
        f != std::end(m_script.failures))
    {
      auto const action{f->second};
      m_script.failures.erase(f);
      action();
    }
    return {};
  }

  bool connection_open() const noexcept override { return m_script.online; }

  void process_notice(pqnest::zview msg) noexcept override
  {
    m_script.notices.emplace_back(msg);
  }

  void do_close() noexcept override { ++m_script.closes; }

  script &m_script;
};


bool mentions(std::vector<std::string> const &notices, std::string const &text)
{
  for (auto const &n : notices)
    if (n.find(text) != std::string::npos)
      return true;
  return false;
}


void test_commit()
{
  script s;
  {
    scripted_transaction tx{s};
    tx.exec("SELECT 1");
    tx.commit();
    PQNEST_CHECK(not tx.is_open(), "Committed transaction still open.");
    PQNEST_CHECK(not tx.in_doubt(), "Clean commit left us in doubt.");
    PQNEST_CHECK_EQUAL(s.closes, 1, "Commit did not close.");

    PQNEST_CHECK_SUCCEEDS(tx.commit(), "Second commit failed.");
    PQNEST_CHECK(
      mentions(s.notices, "committed more than once"),
      "Second commit went unremarked.");
    PQNEST_CHECK_THROWS(
      tx.rollback(), pqnest::usage_error,
      "Rolled back a committed transaction.");
    PQNEST_CHECK_THROWS(
      tx.exec("SELECT 2"), pqnest::usage_error,
      "Executed in a committed transaction.");
  }
  PQNEST_CHECK_EQUAL(s.statements.size(), 2u, "Wrong statement count.");
  PQNEST_CHECK_EQUAL(s.statements[0], std::string{"SELECT 1"}, "Bad SQL.");
  PQNEST_CHECK_EQUAL(s.statements[1], std::string{"COMMIT"}, "Bad SQL.");
  PQNEST_CHECK_EQUAL(s.closes, 1, "Closed more than once.");
}


void test_commit_after_rollback()
{
  script s;
  scripted_transaction tx{s};
  tx.rollback();
  PQNEST_CHECK(not tx.is_open(), "Rolled-back transaction still open.");
  PQNEST_CHECK_SUCCEEDS(tx.rollback(), "Second rollback failed.");
  PQNEST_CHECK_THROWS(
    tx.commit(), pqnest::usage_error,
    "Committed a rolled-back transaction.");
  PQNEST_CHECK_EQUAL(s.statements.size(), 1u, "Rolled back more than once.");
  PQNEST_CHECK_EQUAL(s.statements[0], std::string{"ROLLBACK"}, "Bad SQL.");
}


void test_commit_of_unknown_outcome()
{
  script s;
  s.fail("COMMIT", [] {
    throw pqnest::statement_completion_unknown{"Lost it.", "COMMIT", "40003"};
  });
  {
    scripted_transaction tx{s};
    PQNEST_CHECK_THROWS(
      tx.commit(), pqnest::in_doubt_error,
      "Unknown commit outcome was not in doubt.");
    PQNEST_CHECK(tx.in_doubt(), "Transaction does not know it's in doubt.");
    PQNEST_CHECK(not tx.is_open(), "In-doubt transaction still open.");
    PQNEST_CHECK(
      mentions(s.notices, "Commit of transaction is unknown"),
      "No warning about the unknown commit.");

    PQNEST_CHECK_THROWS(
      tx.commit(), pqnest::in_doubt_error,
      "Committed an in-doubt transaction again.");
    PQNEST_CHECK_THROWS(
      tx.exec("SELECT 1"), pqnest::usage_error,
      "Executed in an in-doubt transaction.");

    PQNEST_CHECK_SUCCEEDS(tx.rollback(), "In-doubt rollback failed.");
    PQNEST_CHECK(
      mentions(s.notices, "indeterminate state"),
      "In-doubt rollback went unremarked.");
  }
  // Nothing is sent after the commit: the server may have committed.
  PQNEST_CHECK_EQUAL(s.statements.size(), 1u, "Sent more than the COMMIT.");
}


void test_connection_lost_during_commit()
{
  script s;
  s.fail("COMMIT", [&s] {
    s.online = false;
    throw pqnest::broken_connection{};
  });
  scripted_transaction tx{s};
  PQNEST_CHECK_THROWS(
    tx.commit(), pqnest::in_doubt_error,
    "Connection loss during commit was not in doubt.");
  PQNEST_CHECK(tx.in_doubt(), "Transaction does not know it's in doubt.");
  PQNEST_CHECK(
    mentions(s.notices, "Connection lost while committing"),
    "No warning about the lost connection.");
}


void test_connection_lost_before_commit()
{
  script s;
  scripted_transaction tx{s};
  s.online = false;
  PQNEST_CHECK_THROWS(
    tx.commit(), pqnest::broken_connection,
    "Commit on a dead connection did not fail.");
  PQNEST_CHECK(not tx.in_doubt(), "Unsent commit is in doubt.");
  PQNEST_CHECK(s.statements.empty(), "Sent a statement to a dead connection.");
  PQNEST_CHECK_SUCCEEDS(tx.rollback(), "Rollback after failed commit failed.");
}


void test_failed_commit()
{
  script s;
  s.fail("COMMIT", [] {
    throw pqnest::serialization_failure{"Conflict.", "COMMIT", "40001"};
  });
  {
    scripted_transaction tx{s};
    PQNEST_CHECK_THROWS(
      tx.commit(), pqnest::serialization_failure,
      "Commit failure was not passed on.");
    PQNEST_CHECK(not tx.in_doubt(), "Server-side failure is in doubt.");
    PQNEST_CHECK(not tx.is_open(), "Failed commit left transaction open.");
    PQNEST_CHECK_SUCCEEDS(tx.rollback(), "Rollback after failed commit.");
    PQNEST_CHECK_THROWS(
      tx.commit(), pqnest::usage_error, "Committed after a failed commit.");
  }
  PQNEST_CHECK_EQUAL(s.statements.size(), 1u, "Sent more than the COMMIT.");
  PQNEST_CHECK_EQUAL(s.closes, 1, "Wrong number of closes.");
}


void test_broken_connection_ends_transaction()
{
  script s;
  s.fail("SELECT 1", [] { throw pqnest::broken_connection{}; });
  scripted_transaction tx{s};
  PQNEST_CHECK_THROWS(
    tx.exec("SELECT 1"), pqnest::broken_connection,
    "Broken connection was not passed on.");
  PQNEST_CHECK(not tx.is_open(), "Transaction survived a broken connection.");
  PQNEST_CHECK_EQUAL(s.closes, 1, "Broken connection did not close.");
  PQNEST_CHECK_THROWS(
    tx.commit(), pqnest::usage_error, "Committed after losing connection.");
}


void test_destructor_rolls_back()
{
  script s;
  {
    scripted_transaction tx{s};
    tx.exec("SELECT 1");
  }
  PQNEST_CHECK_EQUAL(s.statements.size(), 2u, "Wrong statement count.");
  PQNEST_CHECK_EQUAL(
    s.statements[1], std::string{"ROLLBACK"}, "Destructor did not roll back.");
  PQNEST_CHECK_EQUAL(s.closes, 1, "Destructor did not close.");
  PQNEST_CHECK(s.notices.empty(), "Clean rollback produced notices.");
}


void test_destructor_reports_failed_rollback()
{
  script s;
  s.fail("ROLLBACK", [] { throw pqnest::test::deliberate_error{}; });
  PQNEST_CHECK_SUCCEEDS(
    { scripted_transaction tx{s}; }, "Destructor let an exception out.");
  PQNEST_CHECK(
    mentions(s.notices, "Deliberate error."),
    "Failed rollback in destructor went unreported.");
  PQNEST_CHECK_EQUAL(s.closes, 1, "Failed rollback did not close.");
}


void test_transaction()
{
  test_commit();
  test_commit_after_rollback();
  test_commit_of_unknown_outcome();
  test_connection_lost_during_commit();
  test_connection_lost_before_commit();
  test_failed_commit();
  test_broken_connection_ends_transaction();
  test_destructor_rolls_back();
  test_destructor_reports_failed_rollback();
}


PQNEST_REGISTER_TEST(test_transaction);
} // namespace
