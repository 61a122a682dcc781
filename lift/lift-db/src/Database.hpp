// Ticket: 0001_workout_store_core

#ifndef LIFT_DB_DATABASE_HPP
#define LIFT_DB_DATABASE_HPP

#include <exception>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>
#include <sqlite3.h>

#include "lift-db/src/DatabaseError.hpp"

namespace lift_db
{

/*!
 * @brief Enum class for SQLite open conditions
 */
enum class DBOpenCondition : int
{
  OpenReadOnly = SQLITE_OPEN_READONLY,
  OpenReadWrite = SQLITE_OPEN_READWRITE,
  OpenCreate = SQLITE_OPEN_CREATE | SQLITE_OPEN_READWRITE,
};

/*!
 * @brief SQLite journal modes the store supports
 */
enum class JournalMode
{
  Delete,
  Wal,
};

/**
 * @brief Wraps a SQLite database connection with integrated logging
 *
 * Foreign key enforcement is switched on for every connection. Two error
 * styles are offered: the bool-returning executeQuery()/transaction calls for
 * best-effort statements, and execute()/withTransaction() which throw
 * DatabaseError and are what the store uses for every write.
 */
class Database
{
public:
  /**
   * @brief Constructs a database connection
   *
   * @param dbUrl URL to the SQLite database
   * @param logger Shared pointer to a logger instance
   * @param openCond Condition to open the database with
   * @param journalMode Journal mode applied after opening
   * @throws std::runtime_error if the database cannot be opened
   */
  Database(std::string dbUrl,
           std::shared_ptr<spdlog::logger> logger,
           DBOpenCondition openCond = DBOpenCondition::OpenReadWrite,
           JournalMode journalMode = JournalMode::Delete);

  /**
   * @brief Destructor automatically closes the database connection
   */
  ~Database();

  // Delete copy constructor and copy assignment
  Database(const Database&) = delete;
  Database& operator=(const Database&) = delete;

  // Allow move constructor and move assignment
  Database(Database&& other) noexcept;
  Database& operator=(Database&& other) noexcept;

  /**
   * @brief Get the raw SQLite database pointer
   */
  sqlite3* getRawDb() const
  {
    return db_.get();
  }

  /**
   * @brief Path the connection was opened with
   */
  const std::string& path() const
  {
    return dbUrl_;
  }

  /**
   * @brief Execute a raw SQL query
   *
   * @param query SQL query to execute
   * @return true if successful, false otherwise (the error is logged)
   */
  bool executeQuery(const std::string& query);

  /**
   * @brief Execute one or more SQL statements, throwing on failure
   *
   * @throws DatabaseError with the engine's result codes
   */
  void execute(const std::string& sql);

  /**
   * @brief Enable or disable foreign key constraints
   */
  bool enableForeignKeys(bool enable = true);

  /**
   * @brief Switch the journal mode
   */
  bool setJournalMode(JournalMode mode);

  /**
   * @brief Flush and truncate the write-ahead log, if any
   *
   * A no-op in rollback-journal mode. After this the main database file
   * holds every committed change.
   */
  bool checkpoint();

  /**
   * @brief Run a callable inside a transaction
   *
   * Commits when the callable returns and rolls back when it throws; the
   * exception is rethrown unchanged. Calls nest through savepoints, so an
   * inner failure only undoes the inner work if the outer caller catches it.
   *
   * @throws DatabaseError if the savepoint cannot be opened or released
   */
  template <typename Fn>
  void withTransaction(Fn&& fn)
  {
    std::string const savepoint =
      "lift_txn_" + std::to_string(transactionDepth_);
    execute("SAVEPOINT " + savepoint + ";");
    ++transactionDepth_;

    try
    {
      fn();
    }
    catch (...)
    {
      --transactionDepth_;
      logger_->debug("Rolling back {}", savepoint);
      executeQuery("ROLLBACK TO " + savepoint + ";");
      executeQuery("RELEASE " + savepoint + ";");
      throw;
    }

    --transactionDepth_;
    execute("RELEASE " + savepoint + ";");
  }

  /**
   * @brief True if a table with this name exists in the main schema
   */
  bool tableExists(const std::string& table);

  /**
   * @brief Rows modified by the most recent INSERT/UPDATE/DELETE
   */
  int changes() const;

  /**
   * @brief Build a DatabaseError from the connection's current error state
   */
  DatabaseError lastError(const std::string& context) const;

  /**
   * @brief Get the logger instance
   */
  std::shared_ptr<spdlog::logger> getLogger() const
  {
    return logger_;
  }

private:
  // Custom deleter for sqlite3 pointer
  struct Sqlite3Deleter
  {
    void operator()(sqlite3* db) const
    {
      if (db)
      {
        sqlite3_close(db);
      }
    }
  };

  // SQLite database smart pointer with custom deleter
  std::unique_ptr<sqlite3, Sqlite3Deleter> db_;

  std::shared_ptr<spdlog::logger> logger_;

  // Database URL (useful for logging)
  std::string dbUrl_;

  int transactionDepth_{0};
};

}  // namespace lift_db

#endif  // LIFT_DB_DATABASE_HPP
