// Copyright (C) 2020-2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef FHETRADE_SCHEMA_HPP
#define FHETRADE_SCHEMA_HPP

#include "fhetrade/database.hpp"

namespace fhetrade
{

/**
 * Sets up the database schema (if it is not already present) on the given
 * SQLite connection.
 */
void SetupDatabaseSchema (SQLiteDatabase& db);

} // namespace fhetrade

#endif // FHETRADE_SCHEMA_HPP
