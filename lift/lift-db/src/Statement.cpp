// Ticket: 0001_workout_store_core

#include "lift-db/src/Statement.hpp"

#include <utility>

#include "lift-db/src/Database.hpp"

namespace lift_db
{

Statement::Statement(Database& database, const std::string& sql)
  : database_{&database}, sql_{sql}
{
  int rc = sqlite3_prepare_v2(
    database_->getRawDb(), sql_.c_str(), -1, &stmt_, nullptr);
  if (rc != SQLITE_OK)
  {
    auto error = database_->lastError("Failed to prepare '" + sql_ + "'");
    database_->getLogger()->error("{}", error.what());
    sqlite3_finalize(stmt_);
    stmt_ = nullptr;
    throw error;
  }
}

Statement::~Statement()
{
  if (stmt_)
  {
    sqlite3_finalize(stmt_);
  }
}

Statement::Statement(Statement&& other) noexcept
  : database_{other.database_},
    stmt_{std::exchange(other.stmt_, nullptr)},
    sql_{std::move(other.sql_)}
{
}

Statement& Statement::operator=(Statement&& other) noexcept
{
  if (this != &other)
  {
    if (stmt_)
    {
      sqlite3_finalize(stmt_);
    }
    database_ = other.database_;
    stmt_ = std::exchange(other.stmt_, nullptr);
    sql_ = std::move(other.sql_);
  }
  return *this;
}

void Statement::bind(int index, int value)
{
  check(sqlite3_bind_int(stmt_, index, value), "bind int");
}

void Statement::bind(int index, int64_t value)
{
  check(sqlite3_bind_int64(stmt_, index, value), "bind int64");
}

void Statement::bind(int index, double value)
{
  check(sqlite3_bind_double(stmt_, index, value), "bind double");
}

void Statement::bind(int index, const std::string& value)
{
  check(sqlite3_bind_text(stmt_,
                          index,
                          value.c_str(),
                          static_cast<int>(value.size()),
                          SQLITE_TRANSIENT),
        "bind text");
}

void Statement::bindNull(int index)
{
  check(sqlite3_bind_null(stmt_, index), "bind null");
}

bool Statement::step()
{
  int rc = sqlite3_step(stmt_);
  if (rc == SQLITE_ROW)
  {
    return true;
  }
  if (rc == SQLITE_DONE)
  {
    return false;
  }

  auto error = database_->lastError("Failed to execute '" + sql_ + "'");
  database_->getLogger()->error("{}", error.what());
  sqlite3_reset(stmt_);
  throw error;
}

void Statement::run()
{
  while (step())
  {
  }
}

void Statement::reset()
{
  sqlite3_reset(stmt_);
  sqlite3_clear_bindings(stmt_);
}

bool Statement::columnIsNull(int column) const
{
  return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
}

int64_t Statement::columnInt64(int column) const
{
  return sqlite3_column_int64(stmt_, column);
}

int Statement::columnInt(int column) const
{
  return sqlite3_column_int(stmt_, column);
}

double Statement::columnDouble(int column) const
{
  return sqlite3_column_double(stmt_, column);
}

std::string Statement::columnText(int column) const
{
  const unsigned char* text = sqlite3_column_text(stmt_, column);
  if (!text)
  {
    return {};
  }
  return std::string{reinterpret_cast<const char*>(text),
                     static_cast<size_t>(sqlite3_column_bytes(stmt_, column))};
}

std::optional<int> Statement::columnOptionalInt(int column) const
{
  if (columnIsNull(column))
  {
    return std::nullopt;
  }
  return columnInt(column);
}

std::optional<double> Statement::columnOptionalDouble(int column) const
{
  if (columnIsNull(column))
  {
    return std::nullopt;
  }
  return columnDouble(column);
}

std::optional<std::string> Statement::columnOptionalText(int column) const
{
  if (columnIsNull(column))
  {
    return std::nullopt;
  }
  return columnText(column);
}

void Statement::check(int rc, const char* what) const
{
  if (rc != SQLITE_OK)
  {
    throw database_->lastError(std::string{what} + " on '" + sql_ + "'");
  }
}

}  // namespace lift_db
