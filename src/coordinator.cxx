/** Implementation of the pqnest::coordinator class.
 *
 * pqnest::coordinator maps nested transaction scopes onto one real
 * transaction plus savepoints.
 *
 * Copyright (c) 2000-2024, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#include "pqnest-source.hxx"

#include <atomic>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>

#include "pqnest/coordinator.hxx"

#include "pqnest/internal/concat.hxx"
#include "pqnest/internal/transaction_handle.hxx"

#include "pqnest/internal/gates/context-coordinator.hxx"


namespace
{
using clock_type = std::chrono::steady_clock;


/// Binding key for the next coordinator to be constructed.
std::atomic<pqnest::internal::binding_key> last_key{0};


void default_notice_handler(pqnest::zview msg) noexcept
{
  std::cerr << msg;
}


/// Reports one statement to a tracer.
/** Declare this before taking any lock: the report goes out from the
 * destructor, and tracers may call back into the coordinator.  Whether the
 * statement succeeded or not, it gets reported as long as it was timed.
 */
class statement_trace
{
public:
  explicit statement_trace(pqnest::statement_tracer const &report) noexcept :
          m_report{report}
  {}

  ~statement_trace() noexcept
  {
    if (m_report and m_timed)
      m_report(m_statement, m_elapsed);
  }

  statement_trace(statement_trace const &) = delete;
  statement_trace &operator=(statement_trace const &) = delete;

  /// Measures how long a statement takes, for as long as it's in scope.
  class stopwatch
  {
  public:
    explicit stopwatch(statement_trace &trace) noexcept :
            m_trace{trace}, m_start{clock_type::now()}
    {}

    ~stopwatch() noexcept
    {
      m_trace.m_elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        clock_type::now() - m_start);
      m_trace.m_timed = true;
    }

    stopwatch(stopwatch const &) = delete;
    stopwatch &operator=(stopwatch const &) = delete;

  private:
    statement_trace &m_trace;
    clock_type::time_point const m_start;
  };

  /// Start timing @c statement.
  [[nodiscard]] stopwatch time(std::string statement)
  {
    m_statement = std::move(statement);
    return stopwatch{*this};
  }

private:
  pqnest::statement_tracer const &m_report;
  std::string m_statement;
  std::chrono::microseconds m_elapsed{0};
  bool m_timed = false;
};
} // namespace


pqnest::coordinator::coordinator(
  backend &db, notice_handler notices, statement_tracer tracer) :
        m_db{db},
        m_key{++last_key},
        m_notices{std::move(notices)},
        m_tracer{std::move(tracer)}
{
  if (not m_notices)
    m_notices = default_notice_handler;
}


pqnest::coordinator::~coordinator() noexcept = default;


pqnest::context pqnest::coordinator::start(context const &ctx)
{
  internal::gate::context_coordinator const gate{ctx};
  statement_trace trace{m_tracer};

  if (auto const handle{gate.find(m_key)}; handle)
  {
    std::lock_guard<std::mutex> const lock{handle->mutex()};
    // The handle may have been finalised.  In that case there's no active
    // transaction, so fall through and begin a new one.
    if (not handle->finalized())
    {
      // Draw the number first.  If the statement fails, we'll never use this
      // number, but that's fine.  Depth only goes up once the savepoint
      // really exists.
      auto const id{handle->next_savepoint()};
      auto const stmt{internal::concat("SAVEPOINT SP", id)};
      {
        auto const timing{trace.time(stmt)};
        handle->real().exec(stmt);
      }
      handle->push_savepoint(id);
      return ctx;
    }
  }

  std::unique_ptr<backend_transaction> tx;
  {
    auto const timing{trace.time("BEGIN")};
    tx = m_db.begin();
  }
  if (not tx)
    throw internal_error{"Backend began a null transaction."};
  return gate.bind(
    m_key, std::make_shared<internal::transaction_handle>(std::move(tx)));
}


pqnest::context pqnest::coordinator::commit(context const &ctx)
{
  return end_scope(ctx, true);
}


pqnest::context pqnest::coordinator::rollback(context const &ctx)
{
  return end_scope(ctx, false);
}


pqnest::context pqnest::coordinator::end_scope(context const &ctx, bool keep)
{
  internal::gate::context_coordinator const gate{ctx};
  auto const handle{gate.find(m_key)};
  if (not handle)
    throw no_transaction_error{};

  // Once finalised, the real transaction lives here until we've let go of the
  // handle's lock.
  std::unique_ptr<backend_transaction> done;
  statement_trace trace{m_tracer};
  {
    std::lock_guard<std::mutex> const lock{handle->mutex()};
    if (handle->finalized())
      throw no_transaction_error{};

    if (handle->depth() > 0)
    {
      // Rolling back to a savepoint leaves the savepoint in place in the
      // database, but we won't be using it again.  No need to release it.
      auto const stmt{internal::concat(
        keep ? "RELEASE SAVEPOINT SP" : "ROLLBACK TO SAVEPOINT SP",
        handle->top_savepoint())};
      {
        auto const timing{trace.time(stmt)};
        handle->real().exec(stmt);
      }
      handle->pop_savepoint();
      return ctx;
    }

    {
      auto const timing{trace.time(keep ? "COMMIT" : "ROLLBACK")};
      if (keep)
      {
        // If this fails, the transaction stays active so it can be rolled
        // back.
        handle->real().commit();
      }
      else
      {
        try
        {
          handle->real().rollback();
        }
        catch (...)
        {
          // A failed rollback still ends the transaction.
          done = handle->finalize();
          throw;
        }
      }
    }
    done = handle->finalize();
  }
  return gate.unbind(m_key);
}


pqnest::context pqnest::coordinator::adopt(
  context const &ctx, std::unique_ptr<backend_transaction> tx)
{
  if (not tx)
    throw argument_error{"No transaction provided."};

  internal::gate::context_coordinator const gate{ctx};
  if (auto const handle{gate.find(m_key)}; handle)
  {
    std::lock_guard<std::mutex> const lock{handle->mutex()};
    if (not handle->finalized())
      throw transaction_active_error{};
  }

  return gate.bind(
    m_key, std::make_shared<internal::transaction_handle>(std::move(tx)));
}


pqnest::backend_transaction *
pqnest::coordinator::active(context const &ctx) const
{
  auto const handle{internal::gate::context_coordinator{ctx}.find(m_key)};
  if (not handle)
    return nullptr;
  std::lock_guard<std::mutex> const lock{handle->mutex()};
  return handle->finalized() ? nullptr : &handle->real();
}


std::size_t pqnest::coordinator::depth(context const &ctx) const
{
  auto const handle{internal::gate::context_coordinator{ctx}.find(m_key)};
  if (not handle)
    return 0u;
  std::lock_guard<std::mutex> const lock{handle->mutex()};
  return handle->depth();
}


void pqnest::coordinator::finish(context const &scope)
{
  try
  {
    commit(scope);
  }
  catch (...)
  {
    abandon(scope);
    throw;
  }
}


void pqnest::coordinator::abandon(context const &scope) noexcept
{
  try
  {
    rollback(scope);
  }
  catch (std::exception const &e)
  {
    process_notice(internal::concat(
      "Rollback after failed transaction scope also failed: ", e.what(),
      "\n"));
  }
  catch (...)
  {
    process_notice(
      "Rollback after failed transaction scope also failed, "
      "with an unknown exception.\n");
  }
}


void pqnest::coordinator::process_notice(zview msg) noexcept
{
  if (not msg.empty())
    m_notices(msg);
}

