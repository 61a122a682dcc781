// Ticket: 0001_workout_store_core

#include "lift-db/src/Database.hpp"

#include "lift-db/src/Statement.hpp"

namespace lift_db
{

Database::Database(std::string dbUrl,
                   std::shared_ptr<spdlog::logger> logger,
                   DBOpenCondition openCond,
                   JournalMode journalMode)
  : logger_{std::move(logger)}, dbUrl_{std::move(dbUrl)}
{
  logger_->debug("Opening database: {}", dbUrl_);

  sqlite3* rawDb = nullptr;
  int rc = sqlite3_open_v2(
    dbUrl_.c_str(), &rawDb, static_cast<int>(openCond), nullptr);

  if (rc != SQLITE_OK)
  {
    const char* errMsg = rawDb ? sqlite3_errmsg(rawDb) : nullptr;
    std::string errorStr = errMsg ? errMsg : sqlite3_errstr(rc);

    logger_->error("Failed to open database: {}", errorStr);

    // Close the database if it was partially opened
    if (rawDb)
    {
      sqlite3_close(rawDb);
    }

    throw std::runtime_error("Failed to open database " + dbUrl_ + ": " +
                             errorStr);
  }

  // Move ownership to the smart pointer
  db_.reset(rawDb);
  sqlite3_extended_result_codes(db_.get(), 1);

  logger_->info("Database opened successfully: {}", dbUrl_);

  if (!enableForeignKeys(true))
  {
    throw std::runtime_error("Failed to enable foreign keys on " + dbUrl_);
  }

  if (openCond != DBOpenCondition::OpenReadOnly)
  {
    setJournalMode(journalMode);
  }
}

Database::~Database()
{
  if (db_)
  {
    logger_->debug("Closing database: {}", dbUrl_);
  }
}

Database::Database(Database&& other) noexcept
  : db_{std::move(other.db_)},
    logger_{std::move(other.logger_)},
    dbUrl_{std::move(other.dbUrl_)},
    transactionDepth_{other.transactionDepth_}
{
  other.transactionDepth_ = 0;
  logger_->trace("Database moved via move constructor");
}

Database& Database::operator=(Database&& other) noexcept
{
  if (this != &other)
  {
    // First log with our current logger before we lose it
    if (logger_)
    {
      logger_->trace("Database moved via move assignment from: {}",
                     other.dbUrl_);
    }

    db_ = std::move(other.db_);
    logger_ = std::move(other.logger_);
    dbUrl_ = std::move(other.dbUrl_);
    transactionDepth_ = other.transactionDepth_;
    other.transactionDepth_ = 0;
  }
  return *this;
}

bool Database::executeQuery(const std::string& query)
{
  logger_->debug("Executing query: {}", query);

  char* errMsg = nullptr;
  int rc = sqlite3_exec(db_.get(), query.c_str(), nullptr, nullptr, &errMsg);

  if (rc != SQLITE_OK)
  {
    if (errMsg)
    {
      logger_->error("SQL error: {}", errMsg);
      sqlite3_free(errMsg);
    }
    else
    {
      logger_->error("Unknown SQL error");
    }
    return false;
  }

  logger_->trace("Query executed successfully");
  return true;
}

void Database::execute(const std::string& sql)
{
  logger_->debug("Executing: {}", sql);

  char* errMsg = nullptr;
  int rc = sqlite3_exec(db_.get(), sql.c_str(), nullptr, nullptr, &errMsg);

  if (rc != SQLITE_OK)
  {
    std::string message = errMsg ? errMsg : sqlite3_errstr(rc);
    sqlite3_free(errMsg);
    logger_->error("SQL error: {}", message);
    throw DatabaseError{
      "SQL error: " + message, rc & 0xff, sqlite3_extended_errcode(db_.get())};
  }
}

bool Database::enableForeignKeys(bool enable)
{
  logger_->debug("Setting foreign keys to: {}",
                 enable ? "enabled" : "disabled");

  std::string query = "PRAGMA foreign_keys = ";
  query += enable ? "ON" : "OFF";
  query += ";";

  return executeQuery(query);
}

bool Database::setJournalMode(JournalMode mode)
{
  return executeQuery(mode == JournalMode::Wal ? "PRAGMA journal_mode = WAL;"
                                               : "PRAGMA journal_mode = DELETE;");
}

bool Database::checkpoint()
{
  logger_->debug("Checkpointing write-ahead log");
  return executeQuery("PRAGMA wal_checkpoint(TRUNCATE);");
}

bool Database::tableExists(const std::string& table)
{
  Statement stmt{*this,
                 "SELECT count(*) FROM sqlite_master WHERE type = 'table' "
                 "AND name = ?;"};
  stmt.bind(1, table);
  return stmt.step() && stmt.columnInt64(0) > 0;
}

int Database::changes() const
{
  return sqlite3_changes(db_.get());
}

DatabaseError Database::lastError(const std::string& context) const
{
  int const extended = sqlite3_extended_errcode(db_.get());
  return DatabaseError{context + ": " + sqlite3_errmsg(db_.get()),
                       extended & 0xff,
                       extended};
}

}  // namespace lift_db
