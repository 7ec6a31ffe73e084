/** Implementation of the pqnest::transaction class.
 *
 * pqnest::transaction represents a real database transaction over libpq.
 *
 * Copyright (c) 2000-2024, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#include "pqnest-source.hxx"

#include <stdexcept>

#include "pqnest/connection.hxx"
#include "pqnest/result.hxx"
#include "pqnest/transaction.hxx"

#include "pqnest/internal/gates/connection-transaction.hxx"


pqnest::transaction::transaction(connection &cx) :
        transaction{cx, cx.default_isolation(), cx.default_write_policy()}
{}


pqnest::transaction::transaction(
  connection &cx, isolation_level isolation, write_policy rw) :
        m_conn{cx}
{
  internal::gate::connection_transaction gate{m_conn};
  gate.register_transaction(this);
  m_registered = true;
  try
  {
    gate.exec(internal::begin_cmd(isolation, rw));
  }
  catch (std::exception const &)
  {
    mark_aborted();
    throw;
  }
}


pqnest::result pqnest::transaction::do_exec(zview query)
{
  return internal::gate::connection_transaction{m_conn}.exec(query);
}


bool pqnest::transaction::connection_open() const noexcept
{
  return internal::gate::connection_transaction{m_conn}.is_open();
}


void pqnest::transaction::process_notice(zview msg) noexcept
{
  internal::gate::connection_transaction{m_conn}.process_notice(msg);
}


void pqnest::transaction::do_close() noexcept
{
  if (m_registered)
  {
    m_registered = false;
    internal::gate::connection_transaction{m_conn}.unregister_transaction(
      this);
  }
}
