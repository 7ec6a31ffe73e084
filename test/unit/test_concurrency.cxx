#include <set>
#include <string>
#include <thread>
#include <vector>

#include <pqnest/coordinator.hxx>

#include "../helpers.hxx"
#include "../recording_backend.hxx"

namespace
{
using pqnest::test::recording_backend;


void test_concurrent_starts_use_distinct_savepoints()
{
  constexpr int threads{8}, per_thread{50};
  recording_backend db;
  pqnest::coordinator co{db};

  auto const ctx{co.start(pqnest::context{})};

  std::vector<std::thread> pool;
  for (int t{0}; t < threads; ++t)
    pool.emplace_back([&co, ctx]() {
      // Each thread works on its own copy of the context.
      pqnest::context const mine{ctx};
      for (int i{0}; i < per_thread; ++i) static_cast<void>(co.start(mine));
    });
  for (auto &th : pool) th.join();

  std::size_t const total{threads * per_thread};
  PQNEST_CHECK_EQUAL(co.depth(ctx), total, "Lost savepoints.");

  auto const log{db.log().log()};
  PQNEST_CHECK_EQUAL(std::size(log), total + 1, "Wrong statement count.");
  PQNEST_CHECK_EQUAL(log[0], std::string{"BEGIN"}, "Expected BEGIN first.");

  // Numbers are handed out under the lock, so the log is in order.
  std::set<std::string> seen;
  for (std::size_t i{1}; i < std::size(log); ++i)
  {
    PQNEST_CHECK_EQUAL(
      log[i], "SAVEPOINT SP" + std::to_string(i),
      "Savepoints out of order.");
    PQNEST_CHECK(seen.insert(log[i]).second, "Savepoint issued twice.");
  }

  for (std::size_t i{0}; i < total; ++i) co.commit(ctx);
  PQNEST_CHECK_EQUAL(co.depth(ctx), 0u, "Savepoints left open.");
  co.commit(ctx);
}


void test_concurrent_scopes_balance()
{
  constexpr int threads{4}, rounds{100};
  recording_backend db;
  pqnest::coordinator co{db};

  auto const ctx{co.start(pqnest::context{})};
  std::vector<std::thread> pool;
  for (int t{0}; t < threads; ++t)
    pool.emplace_back([&co, ctx, t]() {
      for (int i{0}; i < rounds; ++i)
      {
        auto const inner{co.start(ctx)};
        if ((i + t) % 2 == 0)
          co.commit(inner);
        else
          co.rollback(inner);
      }
    });
  for (auto &th : pool) th.join();

  PQNEST_CHECK_EQUAL(co.depth(ctx), 0u, "Scopes did not balance.");
  PQNEST_CHECK_EQUAL(
    db.log().count("COMMIT"), 0u, "Nested scope ended real transaction.");
  co.commit(ctx);
  PQNEST_CHECK_EQUAL(db.log().count("COMMIT"), 1u, "Missing final commit.");
}


void test_concurrency()
{
  test_concurrent_starts_use_distinct_savepoints();
  test_concurrent_scopes_balance();
}


PQNEST_REGISTER_TEST(test_concurrency);
} // namespace
