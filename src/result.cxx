/** Implementation of the pqnest::result class.
 *
 * pqnest::result holds the outcome of one SQL statement.
 *
 * Copyright (c) 2000-2024, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#include "pqnest-source.hxx"

#include <cstdlib>
#include <utility>

extern "C"
{
#include <libpq-fe.h>
}

#include "pqnest/except.hxx"
#include "pqnest/internal/concat.hxx"
#include "pqnest/result.hxx"


std::string const pqnest::result::s_empty_string;


/// C++ wrapper for libpq's PQclear.
void pqnest::internal::clear_result(pq::PGresult const *data) noexcept
{
  // This acts as a destructor, though implemented as a regular function so we
  // can pass it into a smart pointer.  That's why I think it's kind of fair
  // to treat the PGresult as const.
  PQclear(const_cast<pq::PGresult *>(data));
}


pqnest::result::result(
  internal::pq::PGresult *rhs, std::shared_ptr<std::string const> query) :
        m_data{rhs, internal::clear_result}, m_query{std::move(query)}
{}


pqnest::result::size_type pqnest::result::size() const noexcept
{
  return (m_data.get() == nullptr) ? 0 : PQntuples(m_data.get());
}


bool pqnest::result::empty() const noexcept
{
  return size() == 0;
}


pqnest::result::size_type pqnest::result::columns() const noexcept
{
  return (m_data.get() == nullptr) ? 0 : PQnfields(m_data.get());
}


pqnest::result::size_type pqnest::result::affected_rows() const
{
  if (m_data.get() == nullptr)
    return 0;
  // PQcmdTuples() can't take a PGresult const * because it returns a non-const
  // pointer into the PGresult's data, and that can't be changed without
  // breaking compatibility.
  auto const rows_str{
    PQcmdTuples(const_cast<internal::pq::PGresult *>(m_data.get()))};
  return (rows_str[0] == '\0') ? 0 : size_type(std::atoi(rows_str));
}


pqnest::zview pqnest::result::cmd_status() const noexcept
{
  if (m_data.get() == nullptr)
    return ""_zv;
  // PQcmdStatus() can't take a PGresult const * either.
  return zview{PQcmdStatus(const_cast<internal::pq::PGresult *>(m_data.get()))};
}


void pqnest::result::check_bounds(size_type row, size_type col) const
{
  if ((row < 0) or (row >= size()))
    throw range_error{internal::concat(
      "Row number out of range: ", row, " (result has ", size(), " rows).")};
  if ((col < 0) or (col >= columns()))
    throw range_error{internal::concat(
      "Column number out of range: ", col, " (result has ", columns(),
      " columns).")};
}


bool pqnest::result::is_null(size_type row, size_type col) const
{
  check_bounds(row, col);
  return PQgetisnull(m_data.get(), row, col) != 0;
}


std::string_view pqnest::result::at(size_type row, size_type col) const
{
  check_bounds(row, col);
  return std::string_view{
    PQgetvalue(m_data.get(), row, col),
    static_cast<std::size_t>(PQgetlength(m_data.get(), row, col))};
}


char const *pqnest::result::column_name(size_type col) const
{
  if ((col < 0) or (col >= columns()))
    throw range_error{internal::concat(
      "Invalid column number: ", col, " (maximum is ", columns() - 1, ").")};
  return PQfname(m_data.get(), col);
}


std::string const &pqnest::result::query() const & noexcept
{
  return (m_query == nullptr) ? s_empty_string : *m_query;
}


void PQNEST_COLD pqnest::result::throw_sql_error(
  std::string const &Err, std::string const &Query) const
{
  internal::throw_sql_error(
    Err, Query, PQresultErrorField(m_data.get(), PG_DIAG_SQLSTATE));
}


void pqnest::result::check_status() const
{
  if (auto err{status_error()}; not std::empty(err))
    throw_sql_error(err, query());
}


std::string pqnest::result::status_error() const
{
  if (m_data.get() == nullptr)
    throw failure{"No result set given."};

  std::string err;

  switch (PQresultStatus(m_data.get()))
  {
  case PGRES_EMPTY_QUERY: // The string sent to the backend was empty.
  case PGRES_COMMAND_OK:  // Successful completion, no result data.
  case PGRES_TUPLES_OK:   // The query successfully executed.
    break;

  case PGRES_COPY_OUT:  // Copy Out (from server) data transfer started.
  case PGRES_COPY_IN:   // Copy In (to server) data transfer started.
  case PGRES_COPY_BOTH: // Copy In/Out.  Used for streaming replication.
    throw feature_not_supported{"Not supported: COPY statements."};

  case PGRES_BAD_RESPONSE: // The server's response was not understood.
  case PGRES_NONFATAL_ERROR:
  case PGRES_FATAL_ERROR:
    err = PQresultErrorMessage(m_data.get());
    break;

  default:
    throw internal_error{internal::concat(
      "pqnest::result: Unrecognized result status code ",
      static_cast<int>(PQresultStatus(m_data.get())))};
  }
  return err;
}
