/** Common code and definitions for the transaction classes.
 *
 * pqnest::transaction_base tracks a real transaction's status, and decides
 * what commit and rollback mean in each state.
 *
 * Copyright (c) 2000-2024, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#include "pqnest-source.hxx"

#include <stdexcept>
#include <string>

#include "pqnest/except.hxx"
#include "pqnest/result.hxx"
#include "pqnest/transaction_base.hxx"

#include "pqnest/internal/concat.hxx"


pqnest::transaction_base::transaction_base() noexcept = default;


pqnest::transaction_base::~transaction_base() noexcept = default;


pqnest::result pqnest::transaction_base::exec(zview query)
{
  switch (m_status)
  {
  case status::active: break;
  case status::committed:
  case status::aborted:
  case status::in_doubt:
    throw usage_error{internal::concat(
      "Could not execute command: transaction is already closed.  "
      "Query was: ",
      query)};
  }

  try
  {
    return do_exec(query);
  }
  catch (broken_connection const &)
  {
    // No point continuing; the server has already dropped the transaction.
    end(status::aborted);
    throw;
  }
}


void pqnest::transaction_base::commit()
{
  switch (m_status)
  {
  case status::active: break;

  case status::aborted:
    throw usage_error{"Attempt to commit previously aborted transaction."};

  case status::committed:
    // Multiple commits are accepted, though under protest.  Throwing would
    // suggest that a rollback is needed.
    process_notice("Transaction committed more than once.\n");
    return;

  case status::in_doubt:
    throw in_doubt_error{
      "Transaction committed again while in an indeterminate state."};
  }

  // If the connection was broken already, the commit would fail anyway.  But
  // this way at least we know the backend never got the commit order.
  if (not connection_open())
  {
    end(status::aborted);
    throw broken_connection{
      "Broken connection to backend; cannot complete transaction."};
  }

  result r;
  try
  {
    r = do_exec("COMMIT");
  }
  catch (statement_completion_unknown const &e)
  {
    process_notice(internal::concat(e.what(), "\n"));
    std::string const msg{
      "WARNING: Commit of transaction is unknown.  "
      "There is no way to tell whether the transaction succeeded "
      "or was aborted except to check manually."};
    process_notice(internal::concat(msg, "\n"));
    end(status::in_doubt);
    throw in_doubt_error{msg};
  }
  catch (std::exception const &e)
  {
    if (not connection_open())
    {
      // We lost the connection while committing.  There's no telling what
      // happened on the other end.
      process_notice(internal::concat(e.what(), "\n"));
      std::string const msg{
        "WARNING: Connection lost while committing transaction.  "
        "There is no way to tell whether the transaction succeeded "
        "or was aborted except to check manually."};
      process_notice(internal::concat(msg, "\n"));
      end(status::in_doubt);
      throw in_doubt_error{msg};
    }
    end(status::aborted);
    throw;
  }

  // A transaction in which a statement failed can't commit.  The server
  // accepts the COMMIT, but rolls back instead.
  if (r.cmd_status() == "ROLLBACK")
  {
    end(status::aborted);
    throw transaction_rollback{
      "Transaction was rolled back instead of committed, because an earlier "
      "statement in it failed.",
      "COMMIT"};
  }

  end(status::committed);
}


void pqnest::transaction_base::rollback()
{
  switch (m_status)
  {
  case status::active: break;

  // Quietly accept multiple rollbacks, to simplify emergency bailout code.
  case status::aborted: return;

  case status::committed:
    throw usage_error{"Attempt to roll back previously committed transaction."};

  case status::in_doubt:
    // Rolling back an in-doubt transaction is a reasonably sane response to
    // an insane situation.  Log it, but do not fail.
    process_notice(
      "Warning: transaction rolled back after going into indeterminate "
      "state; it may have been executed anyway.\n");
    return;
  }

  // Whatever happens, the transaction is over after this.
  try
  {
    do_exec("ROLLBACK");
  }
  catch (std::exception const &)
  {
    end(status::aborted);
    throw;
  }
  end(status::aborted);
}


void pqnest::transaction_base::mark_aborted() noexcept
{
  end(status::aborted);
}


void pqnest::transaction_base::end(status s) noexcept
{
  m_status = s;
  if (not m_closed)
  {
    m_closed = true;
    do_close();
  }
}


void pqnest::transaction_base::close() noexcept
{
  if (m_status == status::active)
  {
    try
    {
      rollback();
    }
    catch (std::exception const &e)
    {
      process_notice(internal::concat(e.what(), "\n"));
    }
  }

  if (not m_closed)
  {
    m_closed = true;
    do_close();
  }
}
