/* Abstract database driver interface for the transaction coordinator.
 *
 * Copyright (c) 2000-2024, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#ifndef PQNEST_H_BACKEND
#define PQNEST_H_BACKEND

#include "pqnest/compiler-public.hxx"

#include <memory>

#include "pqnest/result.hxx"
#include "pqnest/zview.hxx"


namespace pqnest
{
/**
 * @defgroup backend Driver interface
 *
 * The coordinator does not talk to libpq directly.  It needs exactly two
 * things from a database driver: a way to open a real transaction, and a
 * transaction that can run a statement, commit, and roll back.
 *
 * @ref connection implements these on top of libpq.  Tests, or applications
 * with their own connection management, can supply their own.
 */
//@{

/// A real, open database transaction.
/** Implementations must not throw from their destructor.  A transaction that
 * is destroyed while still open should roll back.
 *
 * Objects of this type are not thread-safe.  The coordinator serialises its
 * own statements against a transaction, but not those of its callers.
 */
class PQNEST_LIBEXPORT backend_transaction
{
public:
  backend_transaction() = default;
  backend_transaction(backend_transaction const &) = delete;
  backend_transaction &operator=(backend_transaction const &) = delete;
  virtual ~backend_transaction();

  /// Execute a statement inside this transaction.
  /** Throws a @ref failure (usually an @ref sql_error) if it fails.
   */
  virtual result exec(zview query) = 0;

  /// Commit the transaction.  Afterwards the transaction is closed.
  virtual void commit() = 0;

  /// Roll the transaction back.  Afterwards the transaction is closed.
  virtual void rollback() = 0;
};


/// Source of real transactions: a database connection, or a pool.
class PQNEST_LIBEXPORT backend
{
public:
  backend() = default;
  backend(backend const &) = delete;
  backend &operator=(backend const &) = delete;
  virtual ~backend();

  /// Open a new real transaction.
  virtual std::unique_ptr<backend_transaction> begin() = 0;
};

//@}
} // namespace pqnest
#endif
