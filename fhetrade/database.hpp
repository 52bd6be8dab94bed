// Copyright (C) 2018-2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef FHETRADE_DATABASE_HPP
#define FHETRADE_DATABASE_HPP

#include <fheutil/uint256.hpp>

#include <sqlite3.h>

#include <cstdint>
#include <map>
#include <memory>
#include <string>

namespace fhetrade
{

/**
 * Wrapper around the SQLite connection that holds the market state.  It owns
 * the sqlite3* handle and keeps a cache of prepared statements.
 *
 * The instance is not synchronised internally.  All access (including
 * reads from RPC threads) goes through Market, which holds its lock while
 * using the database.
 */
class SQLiteDatabase
{

public:

  class Statement;

private:

  struct CachedStatement;

  /** The SQLite handle, opened in the constructor.  */
  sqlite3* db;

  /**
   * Prepared statements keyed by their SQL.  The same SQL can have more
   * than one entry, if a statement is needed while another instance
   * of it is still in use (e.g. while iterating over results).
   */
  mutable std::multimap<std::string, std::unique_ptr<CachedStatement>>
      statements;

  /**
   * Performs the process-wide SQLite configuration (error logging)
   * the first time a database is opened.
   */
  static void ConfigureSQLite ();

public:

  /**
   * Opens the database at the given filename.  The flags are passed on
   * to sqlite3_open_v2.
   */
  explicit SQLiteDatabase (const std::string& file, int flags);

  ~SQLiteDatabase ();

  SQLiteDatabase () = delete;
  SQLiteDatabase (const SQLiteDatabase&) = delete;
  void operator= (const SQLiteDatabase&) = delete;

  /**
   * Exposes the raw database handle, e.g. for tests.
   */
  sqlite3*
  operator* ()
  {
    return db;
  }

  /**
   * Runs one or more SQL statements directly that do not return
   * any rows.  This is used to set up the schema.
   */
  void Execute (const std::string& sql);

  /**
   * Returns a prepared statement for the given SQL, reusing a free one from
   * the cache if possible.  The statement is reset and its bindings are
   * cleared.  It is given back to the cache when the returned instance
   * goes out of scope.
   */
  Statement Prepare (const std::string& sql);

  /**
   * Prepares a statement like Prepare, for read-only queries on a
   * const database.
   */
  Statement PrepareRo (const std::string& sql) const;

};

/**
 * Entry of the statement cache.  It finalises the statement on destruction.
 */
struct SQLiteDatabase::CachedStatement
{

  sqlite3_stmt* const stmt;

  /** Set while a Statement instance refers to this entry.  */
  bool used = false;

  explicit CachedStatement (sqlite3_stmt* s)
    : stmt(s)
  {}

  CachedStatement () = delete;
  CachedStatement (const CachedStatement&) = delete;
  void operator= (const CachedStatement&) = delete;

  ~CachedStatement ();

};

/**
 * A prepared statement taken from the cache of an SQLiteDatabase.  It has
 * typed helpers for binding parameters and reading columns, and returns
 * the statement to the cache when destructed.
 */
class SQLiteDatabase::Statement
{

private:

  /** The cache entry, or null for an empty instance.  */
  CachedStatement* entry = nullptr;

  /** Number of steps done so far (for logging).  */
  unsigned steps = 0;

  explicit Statement (CachedStatement& e);

  /**
   * Gives the statement back to the cache and makes this instance empty.
   */
  void Release ();

  void BindInt64 (int ind, int64_t val);
  int64_t GetInt64 (int ind, int64_t minValue, int64_t maxValue) const;

  friend class SQLiteDatabase;

public:

  Statement () = default;
  Statement (Statement&& o);
  Statement& operator= (Statement&& o);
  ~Statement ();

  Statement (const Statement&) = delete;
  void operator= (const Statement&) = delete;

  /**
   * Exposes the underlying SQLite handle.
   */
  sqlite3_stmt* operator* () const;

  /**
   * Executes a statement that returns no rows.
   */
  void Execute ();

  /**
   * Steps the statement.  Returns true if a row is available and false
   * when the statement is done.  Errors are fatal.
   */
  bool Step ();

  /**
   * Resets the statement so that it can be stepped again, keeping the
   * parameter bindings.
   */
  void Reset ();

  /**
   * Returns the SQL of this statement, for logging.
   */
  std::string GetSql () const;

  void BindNull (int ind);

  /**
   * Binds a typed value to a numbered parameter.  Supported are
   * int64_t, uint64_t, int, unsigned and bool (as integers), uint256
   * (as 32-byte blob) and std::string (as text).
   */
  template <typename T>
    void Bind (int ind, const T& val);

  /**
   * Binds a byte string as BLOB.
   */
  void BindBlob (int ind, const std::string& val);

  bool IsNull (int ind) const;

  /**
   * Reads a typed value from a column of the current row.  The types
   * are the same as for Bind.  Values out of range for the requested
   * type are fatal.
   */
  template <typename T>
    T Get (int ind) const;

  /**
   * Reads a BLOB column as byte string.
   */
  std::string GetBlob (int ind) const;

};

/**
 * RAII scope for one atomic market operation.  It opens a savepoint when
 * constructed.  The savepoint is released if SetSuccess() has been called
 * when the scope ends, and rolled back otherwise (including when an
 * exception unwinds through it).
 */
class ActiveTransaction
{

private:

  SQLiteDatabase& db;

  bool success = false;

public:

  explicit ActiveTransaction (SQLiteDatabase& d);
  ~ActiveTransaction ();

  ActiveTransaction () = delete;
  ActiveTransaction (const ActiveTransaction&) = delete;
  void operator= (const ActiveTransaction&) = delete;

  void
  SetSuccess ()
  {
    success = true;
  }

};

} // namespace fhetrade

#endif // FHETRADE_DATABASE_HPP
