// Ticket: 0001_workout_store_core

#ifndef LIFT_STORE_STORE_ERRORS_HPP
#define LIFT_STORE_STORE_ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace lift_store
{

/**
 * @brief Caller input rejected before any write was attempted
 */
class ValidationError : public std::invalid_argument
{
public:
  using std::invalid_argument::invalid_argument;
};

/**
 * @brief A schema migration failed and was rolled back
 *
 * The store must not be used after this; the stored version is left at the
 * last migration that succeeded.
 */
class MigrationError : public std::runtime_error
{
public:
  MigrationError(int version, std::string name, const std::string& cause)
    : std::runtime_error{"Migration " + std::to_string(version) + " (" + name +
                         ") failed: " + cause},
      version_{version},
      name_{std::move(name)}
  {
  }

  int version() const noexcept
  {
    return version_;
  }

  const std::string& name() const noexcept
  {
    return name_;
  }

private:
  int version_;
  std::string name_;
};

/**
 * @brief A mutating call overlapped another one on the same store
 */
class ConcurrentWriteError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

class BackupError : public std::runtime_error
{
public:
  enum class Reason : uint8_t
  {
    SourceMissing,
    ValidationFailed,
    CopyFailed
  };

  BackupError(Reason reason, const std::string& message)
    : std::runtime_error{message}, reason_{reason}
  {
  }

  Reason reason() const noexcept
  {
    return reason_;
  }

private:
  Reason reason_;
};

/**
 * @brief Export could not produce a file (no data, or the write failed)
 */
class ExportError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

}  // namespace lift_store

#endif  // LIFT_STORE_STORE_ERRORS_HPP
