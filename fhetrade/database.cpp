// Copyright (C) 2018-2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "database.hpp"

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <chrono>
#include <limits>
#include <mutex>

DEFINE_int32 (fhetrade_sqlite_slow_query_ms, 0,
              "if non-zero, warn about SQL statements whose steps take"
              " longer than this many milliseconds");

namespace fhetrade
{

namespace
{

/** Name of the savepoint used by ActiveTransaction.  */
const std::string SAVEPOINT = "`fhetrade-operation`";

/**
 * Logs a finished step of an SQL statement.  Slow steps are warned about,
 * everything else goes to the verbose log.
 */
void
LogStep (const std::string& sql, const unsigned step,
         const std::chrono::microseconds duration)
{
  const int slowMs = FLAGS_fhetrade_sqlite_slow_query_ms;
  if (slowMs > 0 && duration >= std::chrono::milliseconds (slowMs))
    {
      LOG (WARNING)
          << "Slow SQL step " << step << " (" << duration.count () << " us):\n"
          << sql;
      return;
    }

  VLOG (step == 1 ? 1 : 2)
      << "SQL step " << step << " (" << duration.count () << " us):\n"
      << sql;
}

/**
 * Error callback for SQLite, which logs through glog.
 */
void
LogSQLiteError (void* arg, const int errCode, const char* msg)
{
  LOG (ERROR) << "SQLite error " << errCode << ": " << msg;
}

/**
 * Callback for sqlite3_exec, which is not expected to produce rows.
 */
int
FailOnResultRow (void* data, int columns, char** strs, char** names)
{
  LOG (FATAL) << "Unexpected result row from SQL execution";
  return 1;
}

} // anonymous namespace

/* ************************************************************************** */

SQLiteDatabase::Statement::Statement (CachedStatement& e)
  : entry(&e)
{
  CHECK (!entry->used) << "Cached statement is already in use";
  entry->used = true;
}

SQLiteDatabase::Statement::Statement (Statement&& o)
  : entry(o.entry), steps(o.steps)
{
  o.entry = nullptr;
}

SQLiteDatabase::Statement&
SQLiteDatabase::Statement::operator= (Statement&& o)
{
  if (this != &o)
    {
      Release ();
      entry = o.entry;
      steps = o.steps;
      o.entry = nullptr;
    }

  return *this;
}

SQLiteDatabase::Statement::~Statement ()
{
  Release ();
}

void
SQLiteDatabase::Statement::Release ()
{
  if (entry == nullptr)
    return;

  VLOG (2) << "Giving back SQL statement " << entry->stmt;
  entry->used = false;
  entry = nullptr;
}

sqlite3_stmt*
SQLiteDatabase::Statement::operator* () const
{
  CHECK (entry != nullptr) << "Statement is empty";
  return entry->stmt;
}

void
SQLiteDatabase::Statement::Execute ()
{
  CHECK (!Step ()) << "Statement returned rows:\n" << GetSql ();
}

bool
SQLiteDatabase::Statement::Step ()
{
  using Clock = std::chrono::steady_clock;

  const auto start = Clock::now ();
  const int rc = sqlite3_step (**this);
  ++steps;
  LogStep (GetSql (), steps,
           std::chrono::duration_cast<std::chrono::microseconds> (
               Clock::now () - start));

  if (rc == SQLITE_ROW)
    return true;
  if (rc == SQLITE_DONE)
    return false;

  LOG (FATAL)
      << "SQLite step failed with " << rc << " for:\n" << GetSql ();
  return false;
}

void
SQLiteDatabase::Statement::Reset ()
{
  /* The return value is the error of the previous evaluation, which
     has been handled already in Step.  */
  sqlite3_reset (**this);
  steps = 0;
}

std::string
SQLiteDatabase::Statement::GetSql () const
{
  return sqlite3_sql (**this);
}

void
SQLiteDatabase::Statement::BindNull (const int ind)
{
  CHECK_EQ (sqlite3_bind_null (**this, ind), SQLITE_OK);
}

void
SQLiteDatabase::Statement::BindInt64 (const int ind, const int64_t val)
{
  CHECK_EQ (sqlite3_bind_int64 (**this, ind, val), SQLITE_OK);
}

void
SQLiteDatabase::Statement::BindBlob (const int ind, const std::string& val)
{
  CHECK_EQ (sqlite3_bind_blob (**this, ind, val.data (), val.size (),
                               SQLITE_TRANSIENT),
            SQLITE_OK);
}

template <>
  void
  SQLiteDatabase::Statement::Bind<int64_t> (const int ind, const int64_t& val)
{
  BindInt64 (ind, val);
}

template <>
  void
  SQLiteDatabase::Statement::Bind<uint64_t> (const int ind, const uint64_t& val)
{
  CHECK_LE (val, static_cast<uint64_t> (std::numeric_limits<int64_t>::max ()));
  BindInt64 (ind, static_cast<int64_t> (val));
}

template <>
  void
  SQLiteDatabase::Statement::Bind<int> (const int ind, const int& val)
{
  BindInt64 (ind, val);
}

template <>
  void
  SQLiteDatabase::Statement::Bind<unsigned> (const int ind, const unsigned& val)
{
  BindInt64 (ind, val);
}

template <>
  void
  SQLiteDatabase::Statement::Bind<bool> (const int ind, const bool& val)
{
  BindInt64 (ind, val ? 1 : 0);
}

template <>
  void
  SQLiteDatabase::Statement::Bind<uint256> (const int ind, const uint256& val)
{
  BindBlob (ind, val.GetBinaryString ());
}

template <>
  void
  SQLiteDatabase::Statement::Bind<std::string> (const int ind,
                                                const std::string& val)
{
  CHECK_EQ (sqlite3_bind_text (**this, ind, val.data (), val.size (),
                               SQLITE_TRANSIENT),
            SQLITE_OK);
}

bool
SQLiteDatabase::Statement::IsNull (const int ind) const
{
  return sqlite3_column_type (**this, ind) == SQLITE_NULL;
}

int64_t
SQLiteDatabase::Statement::GetInt64 (const int ind, const int64_t minValue,
                                     const int64_t maxValue) const
{
  const int64_t val = sqlite3_column_int64 (**this, ind);
  CHECK (val >= minValue && val <= maxValue)
      << "Column " << ind << " value " << val << " is out of range";
  return val;
}

template <>
  int64_t
  SQLiteDatabase::Statement::Get<int64_t> (const int ind) const
{
  return GetInt64 (ind, std::numeric_limits<int64_t>::min (),
                   std::numeric_limits<int64_t>::max ());
}

template <>
  uint64_t
  SQLiteDatabase::Statement::Get<uint64_t> (const int ind) const
{
  return GetInt64 (ind, 0, std::numeric_limits<int64_t>::max ());
}

template <>
  int
  SQLiteDatabase::Statement::Get<int> (const int ind) const
{
  return GetInt64 (ind, std::numeric_limits<int>::min (),
                   std::numeric_limits<int>::max ());
}

template <>
  unsigned
  SQLiteDatabase::Statement::Get<unsigned> (const int ind) const
{
  return GetInt64 (ind, 0, std::numeric_limits<unsigned>::max ());
}

template <>
  bool
  SQLiteDatabase::Statement::Get<bool> (const int ind) const
{
  return GetInt64 (ind, 0, 1) != 0;
}

template <>
  uint256
  SQLiteDatabase::Statement::Get<uint256> (const int ind) const
{
  const std::string bytes = GetBlob (ind);
  CHECK_EQ (bytes.size (), uint256::NUM_BYTES)
      << "Column " << ind << " is not a valid uint256";

  uint256 res;
  res.FromBlob (reinterpret_cast<const unsigned char*> (bytes.data ()));
  return res;
}

template <>
  std::string
  SQLiteDatabase::Statement::Get<std::string> (const int ind) const
{
  const unsigned char* str = sqlite3_column_text (**this, ind);
  const int len = sqlite3_column_bytes (**this, ind);
  if (len == 0)
    return std::string ();

  CHECK (str != nullptr);
  return std::string (reinterpret_cast<const char*> (str), len);
}

std::string
SQLiteDatabase::Statement::GetBlob (const int ind) const
{
  const void* data = sqlite3_column_blob (**this, ind);
  const int len = sqlite3_column_bytes (**this, ind);
  if (len == 0)
    return std::string ();

  CHECK (data != nullptr);
  return std::string (static_cast<const char*> (data), len);
}

/* ************************************************************************** */

SQLiteDatabase::CachedStatement::~CachedStatement ()
{
  CHECK (!used) << "Cached statement is still in use";

  /* The return value refers to the last evaluation of the statement,
     not to the finalisation itself.  */
  sqlite3_finalize (stmt);
}

void
SQLiteDatabase::ConfigureSQLite ()
{
  static std::once_flag configured;
  std::call_once (configured, [] ()
    {
      LOG (INFO)
          << "Using SQLite " << SQLITE_VERSION
          << " (library " << sqlite3_libversion () << ")";
      CHECK_EQ (SQLITE_VERSION_NUMBER, sqlite3_libversion_number ())
          << "SQLite header and library versions differ";

      const int rc
          = sqlite3_config (SQLITE_CONFIG_LOG, &LogSQLiteError, nullptr);
      if (rc != SQLITE_OK)
        LOG (WARNING) << "Could not install SQLite error logger: " << rc;
    });
}

SQLiteDatabase::SQLiteDatabase (const std::string& file, const int flags)
  : db(nullptr)
{
  ConfigureSQLite ();

  const int rc = sqlite3_open_v2 (file.c_str (), &db, flags, nullptr);
  if (rc != SQLITE_OK)
    LOG (FATAL) << "Could not open SQLite database " << file << ": " << rc;

  CHECK (db != nullptr);
  LOG (INFO) << "Opened SQLite database " << file;
}

SQLiteDatabase::~SQLiteDatabase ()
{
  statements.clear ();

  CHECK (db != nullptr);
  if (sqlite3_close (db) != SQLITE_OK)
    LOG (ERROR) << "Failed to close the SQLite database";
}

void
SQLiteDatabase::Execute (const std::string& sql)
{
  CHECK_EQ (sqlite3_exec (db, sql.c_str (), &FailOnResultRow,
                          nullptr, nullptr),
            SQLITE_OK)
      << "Failed to execute SQL:\n" << sql;
}

SQLiteDatabase::Statement
SQLiteDatabase::Prepare (const std::string& sql)
{
  return PrepareRo (sql);
}

SQLiteDatabase::Statement
SQLiteDatabase::PrepareRo (const std::string& sql) const
{
  CHECK (db != nullptr);

  auto range = statements.equal_range (sql);
  for (auto it = range.first; it != range.second; ++it)
    if (!it->second->used)
      {
        CHECK_EQ (sqlite3_clear_bindings (it->second->stmt), SQLITE_OK);
        Statement res(*it->second);
        res.Reset ();
        return res;
      }

  sqlite3_stmt* stmt = nullptr;
  CHECK_EQ (sqlite3_prepare_v2 (db, sql.c_str (), sql.size () + 1,
                                &stmt, nullptr),
            SQLITE_OK)
      << "Failed to prepare SQL:\n" << sql;

  VLOG (2) << "Prepared new SQL statement " << stmt << ":\n" << sql;

  auto it = statements.emplace (sql, std::make_unique<CachedStatement> (stmt));
  return Statement (*it->second);
}

/* ************************************************************************** */

ActiveTransaction::ActiveTransaction (SQLiteDatabase& d)
  : db(d)
{
  db.Prepare ("SAVEPOINT " + SAVEPOINT).Execute ();
}

ActiveTransaction::~ActiveTransaction ()
{
  if (!success)
    {
      LOG (INFO) << "Rolling back failed operation";
      db.Prepare ("ROLLBACK TO " + SAVEPOINT).Execute ();
    }
  else
    VLOG (1) << "Committing successful operation";

  db.Prepare ("RELEASE " + SAVEPOINT).Execute ();
}

} // namespace fhetrade
