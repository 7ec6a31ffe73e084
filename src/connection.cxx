/** Implementation of the pqnest::connection class.
 *
 * pqnest::connection encapsulates a connection to a database.
 *
 * Copyright (c) 2000-2024, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#include "pqnest-source.hxx"

#include <iostream>
#include <memory>
#include <new>
#include <stdexcept>
#include <utility>

extern "C"
{
#include <libpq-fe.h>
}

#include "pqnest/connection.hxx"
#include "pqnest/except.hxx"
#include "pqnest/result.hxx"
#include "pqnest/transaction.hxx"

#include "pqnest/internal/concat.hxx"
#include "pqnest/internal/gates/result-creation.hxx"


namespace
{
void process_notice_raw(
  pqnest::internal::notice_waiters *waiters, pqnest::zview msg) noexcept
{
  if ((waiters != nullptr) and not msg.empty() and waiters->notice_handler)
    waiters->notice_handler(msg);
}


void default_notice_handler(pqnest::zview msg) noexcept
{
  std::cerr << msg;
}
} // namespace


extern "C"
{
  // The PQnoticeProcessor that receives an error or warning from libpq and
  // sends it to the appropriate connection for processing.
  static void pqnest_notice_processor(void *cx, char const *msg) noexcept
  {
    process_notice_raw(
      reinterpret_cast<pqnest::internal::notice_waiters *>(cx),
      pqnest::zview{msg});
  }
} // extern "C"


pqnest::connection::connection(zview options) :
        m_conn{PQconnectdb(options.c_str())}
{
  internal::check_version();
  if (m_conn == nullptr)
    throw std::bad_alloc{};

  set_up_notice_handlers();

  if (not is_open())
  {
    std::string const msg{PQerrorMessage(m_conn)};
    PQfinish(m_conn);
    m_conn = nullptr;
    throw broken_connection{msg};
  }
}


pqnest::connection::~connection()
{
  close();
}


void pqnest::connection::set_up_notice_handlers()
{
  if (not m_notice_waiters)
  {
    m_notice_waiters = std::make_shared<internal::notice_waiters>();
    m_notice_waiters->notice_handler = default_notice_handler;
  }

  // Our notice processor gets a pointer to our notice_waiters.  We can't
  // just pass "this" to it, because libpq owns the registration.
  if (m_conn != nullptr)
    PQsetNoticeProcessor(
      m_conn, pqnest_notice_processor, m_notice_waiters.get());
}


void pqnest::connection::set_notice_handler(
  std::function<void(zview)> handler)
{
  m_notice_waiters->notice_handler = std::move(handler);
}


void pqnest::connection::process_notice(zview msg) noexcept
{
  process_notice_raw(m_notice_waiters.get(), msg);
}


bool pqnest::connection::is_open() const noexcept
{
  return (m_conn != nullptr) and (PQstatus(m_conn) == CONNECTION_OK);
}


void pqnest::connection::check_open() const
{
  if (m_conn == nullptr)
    throw broken_connection{"Connection is closed."};
}


char const *PQNEST_COLD pqnest::connection::dbname() const
{
  check_open();
  return PQdb(m_conn);
}


int PQNEST_COLD pqnest::connection::server_version() const noexcept
{
  return (m_conn == nullptr) ? 0 : PQserverVersion(m_conn);
}


void pqnest::connection::set_transaction_options(
  isolation_level isolation, write_policy rw)
{
  m_isolation = isolation;
  m_write_policy = rw;
}


std::unique_ptr<pqnest::backend_transaction> pqnest::connection::begin()
{
  return std::make_unique<transaction>(*this);
}


void pqnest::connection::register_transaction(transaction *t)
{
  if (m_trans != nullptr)
    throw usage_error{
      "Started a transaction while another one is still open on the same "
      "connection."};
  m_trans = t;
}


void pqnest::connection::unregister_transaction(transaction *t) noexcept
{
  if (m_trans != t)
    process_notice(
      "Closing a transaction that was not registered with its connection.\n");
  m_trans = nullptr;
}


pqnest::result pqnest::connection::exec(zview query)
{
  check_open();
  auto const q{std::make_shared<std::string const>(query)};
  auto const pgr{PQexec(m_conn, q->c_str())};
  if (pgr == nullptr)
  {
    if (is_open())
      throw failure{PQerrorMessage(m_conn)};
    else
      throw broken_connection{"Lost connection to the database server."};
  }
  auto r{internal::gate::result_creation::create(pgr, q)};
  internal::gate::result_creation{r}.check_status();
  return r;
}


void pqnest::connection::close()
{
  // Just in case PQfinish() doesn't handle nullptr nicely.
  if (m_conn == nullptr)
    return;

  if (m_trans != nullptr)
    process_notice(
      "Closing connection while a transaction is still open.\n");

  PQfinish(m_conn);
  m_conn = nullptr;
}
