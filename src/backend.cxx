/** Out-of-line members of the pqnest::backend interfaces.
 *
 * Copyright (c) 2000-2024, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#include "pqnest-source.hxx"

#include "pqnest/backend.hxx"


pqnest::backend_transaction::~backend_transaction() = default;


pqnest::backend::~backend() = default;
