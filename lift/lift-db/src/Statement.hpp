// Ticket: 0001_workout_store_core

#ifndef LIFT_DB_STATEMENT_HPP
#define LIFT_DB_STATEMENT_HPP

#include <cstdint>
#include <optional>
#include <string>

#include <sqlite3.h>

namespace lift_db
{

class Database;

/**
 * @brief Owning wrapper around a prepared sqlite3_stmt
 *
 * Parameters are 1-based, columns are 0-based (as in the C API). Every
 * engine failure is raised as DatabaseError; a Statement never reports
 * failure through a return value.
 */
class Statement
{
public:
  /**
   * @throws DatabaseError if the SQL cannot be prepared
   */
  Statement(Database& database, const std::string& sql);
  ~Statement();

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;
  Statement(Statement&& other) noexcept;
  Statement& operator=(Statement&& other) noexcept;

  void bind(int index, int value);
  void bind(int index, int64_t value);
  void bind(int index, double value);
  void bind(int index, const std::string& value);
  void bindNull(int index);

  /// Binds NULL for an empty optional
  template <typename T>
  void bind(int index, const std::optional<T>& value)
  {
    if (value)
    {
      bind(index, *value);
    }
    else
    {
      bindNull(index);
    }
  }

  /**
   * @brief Advance to the next row
   *
   * @return true if a row is available, false once the statement is done
   * @throws DatabaseError on any other result
   */
  bool step();

  /**
   * @brief Execute a statement that returns no rows
   *
   * @throws DatabaseError on failure (including constraint violations)
   */
  void run();

  /// Reset for re-execution and clear all bindings
  void reset();

  [[nodiscard]] bool columnIsNull(int column) const;
  [[nodiscard]] int64_t columnInt64(int column) const;
  [[nodiscard]] int columnInt(int column) const;
  [[nodiscard]] double columnDouble(int column) const;
  [[nodiscard]] std::string columnText(int column) const;

  [[nodiscard]] std::optional<int> columnOptionalInt(int column) const;
  [[nodiscard]] std::optional<double> columnOptionalDouble(int column) const;
  [[nodiscard]] std::optional<std::string> columnOptionalText(int column) const;

private:
  void check(int rc, const char* what) const;

  Database* database_;
  sqlite3_stmt* stmt_{nullptr};
  std::string sql_;
};

}  // namespace lift_db

#endif  // LIFT_DB_STATEMENT_HPP
