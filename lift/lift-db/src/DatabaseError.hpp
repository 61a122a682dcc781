#ifndef LIFT_DB_DATABASE_ERROR_HPP
#define LIFT_DB_DATABASE_ERROR_HPP

#include <stdexcept>
#include <string>

#include <sqlite3.h>

namespace lift_db
{

/**
 * @brief Error reported by the SQLite engine
 *
 * Carries the primary and extended result codes so callers can tell integrity
 * failures (foreign key, UNIQUE, CHECK) apart from I/O or usage errors.
 */
class DatabaseError : public std::runtime_error
{
public:
  DatabaseError(const std::string& message, int resultCode, int extendedCode)
    : std::runtime_error{message},
      resultCode_{resultCode},
      extendedCode_{extendedCode}
  {
  }

  [[nodiscard]] int resultCode() const noexcept
  {
    return resultCode_;
  }

  [[nodiscard]] int extendedCode() const noexcept
  {
    return extendedCode_;
  }

  /// True for foreign key, UNIQUE, NOT NULL and CHECK violations
  [[nodiscard]] bool isConstraintViolation() const noexcept
  {
    return resultCode_ == SQLITE_CONSTRAINT;
  }

private:
  int resultCode_;
  int extendedCode_;
};

}  // namespace lift_db

#endif  // LIFT_DB_DATABASE_ERROR_HPP
