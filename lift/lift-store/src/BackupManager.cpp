// Ticket: 0008_backup_restore

#include "lift-store/src/BackupManager.hpp"

#include <array>
#include <fstream>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "lift-store/src/StoreErrors.hpp"
#include "lift-store/src/WorkoutStore.hpp"
#include "lift-utils/src/DateUtils.hpp"
#include "lift-utils/src/PathUtils.hpp"

namespace lift_store
{

namespace
{

// The first 16 bytes of every SQLite 3 database file, NUL included
constexpr std::array<char, 16> kSqliteHeader{
  'S', 'Q', 'L', 'i', 't', 'e', ' ', 'f', 'o', 'r', 'm', 'a', 't', ' ', '3', '\0'};

bool hasSqliteHeader(const std::filesystem::path& path)
{
  std::ifstream in{path, std::ios::binary};
  std::array<char, 16> header{};
  if (!in.read(header.data(), static_cast<std::streamsize>(header.size())))
  {
    return false;
  }
  return header == kSqliteHeader;
}

// Rename, falling back to copy and remove across filesystems
void moveFile(const std::filesystem::path& from,
              const std::filesystem::path& to,
              std::error_code& ec)
{
  std::filesystem::rename(from, to, ec);
  if (!ec)
  {
    return;
  }
  std::filesystem::copy_file(
    from, to, std::filesystem::copy_options::overwrite_existing, ec);
  if (!ec)
  {
    std::filesystem::remove(from, ec);
  }
}

}  // namespace

BackupManager::BackupManager(Config config, std::shared_ptr<spdlog::logger> logger)
  : config_{std::move(config)}, logger_{std::move(logger)}
{
}

BackupResult BackupManager::createBackup(WorkoutStore& store)
{
  return store.withExclusiveAccess(
    [&]
    {
      auto const validation = store.validateSchema();
      if (!validation.valid)
      {
        logger_->error("Refusing to back up {}: {} table(s) missing",
                       store.config().databasePath,
                       validation.missingTables.size());
        throw BackupError{BackupError::Reason::ValidationFailed,
                          "Database validation failed. Cannot create backup."};
      }

      // Everything committed must be in the main file before it is copied
      if (!store.database().checkpoint())
      {
        logger_->warn("WAL checkpoint failed before backup");
      }

      BackupResult result;
      result.fileName = backupFileName(std::chrono::system_clock::now());
      result.path = config_.backupDirectory / result.fileName;

      std::error_code ec;
      std::filesystem::create_directories(config_.backupDirectory, ec);
      if (ec)
      {
        throw BackupError{BackupError::Reason::CopyFailed,
                          "Cannot create backup directory " +
                            config_.backupDirectory.string() + ": " +
                            ec.message()};
      }

      // Never replace an earlier backup taken within the same second
      std::filesystem::copy_file(store.config().databasePath,
                                 result.path,
                                 std::filesystem::copy_options::none,
                                 ec);
      if (ec == std::errc::file_exists)
      {
        logger_->error("Backup {} already exists", result.path.string());
        throw BackupError{BackupError::Reason::CopyFailed,
                          "Backup already exists: " + result.path.string()};
      }
      if (ec)
      {
        logger_->error("Backup copy failed: {}", ec.message());
        throw BackupError{BackupError::Reason::CopyFailed,
                          "Backup copy failed: " + ec.message()};
      }

      result.fileSize = lift_utils::fileSizeOrZero(result.path);
      logger_->info("Created backup {} ({})",
                    result.path.string(),
                    formatFileSize(result.fileSize));
      return result;
    });
}

RestoreResult BackupManager::restoreFromBackup(
  const std::filesystem::path& source)
{
  validateBackupFile(source);

  RestoreResult result;
  result.safetyCopy = makeSafetyCopy();

  std::filesystem::path const staging =
    config_.storePath.string() + ".restore-tmp";

  std::error_code ec;
  std::filesystem::copy_file(
    source, staging, std::filesystem::copy_options::overwrite_existing, ec);
  if (ec)
  {
    logger_->error("Restore copy failed: {}", ec.message());
    throw BackupError{BackupError::Reason::CopyFailed,
                      "Restore copy failed: " + ec.message()};
  }

  // Journal files from the old store would be replayed against the new one.
  // They are parked until the new file is in place so a failed rename leaves
  // the old store with its journal.
  std::vector<std::pair<std::filesystem::path, std::filesystem::path>> parked;
  auto const unpark = [&]
  {
    for (const auto& [sidecar, aside] : parked)
    {
      std::error_code undo;
      std::filesystem::rename(aside, sidecar, undo);
      if (undo)
      {
        logger_->error("Could not put back {}: {}", sidecar.string(), undo.message());
      }
    }
  };

  for (const auto& sidecar : lift_utils::sidecarPaths(config_.storePath))
  {
    if (!std::filesystem::exists(sidecar, ec))
    {
      continue;
    }
    std::filesystem::path const aside = sidecar.string() + ".pre-restore";
    std::filesystem::rename(sidecar, aside, ec);
    if (ec)
    {
      logger_->error("Could not move {} aside: {}", sidecar.string(), ec.message());
      unpark();
      std::error_code cleanup;
      std::filesystem::remove(staging, cleanup);
      throw BackupError{BackupError::Reason::CopyFailed,
                        "Restore failed: " + ec.message()};
    }
    parked.emplace_back(sidecar, aside);
  }

  std::filesystem::rename(staging, config_.storePath, ec);
  if (ec)
  {
    logger_->error("Restore rename failed: {}", ec.message());
    unpark();
    std::error_code cleanup;
    std::filesystem::remove(staging, cleanup);
    throw BackupError{BackupError::Reason::CopyFailed,
                      "Restore failed: " + ec.message()};
  }

  // The old journal belongs with the safety copy of the old store
  auto const storeName = config_.storePath.string();
  for (const auto& [sidecar, aside] : parked)
  {
    if (result.safetyCopy)
    {
      std::filesystem::path const target =
        result.safetyCopy->string() + sidecar.string().substr(storeName.size());
      moveFile(aside, target, ec);
      if (!ec)
      {
        continue;
      }
      logger_->warn("Could not keep {} with the safety copy: {}",
                    sidecar.filename().string(),
                    ec.message());
    }
    std::filesystem::remove(aside, ec);
    if (ec)
    {
      logger_->warn("Could not remove {}: {}", aside.string(), ec.message());
    }
  }

  logger_->info("Restored {} from {}", config_.storePath.string(), source.string());
  result.requiresRestart = true;
  return result;
}

void BackupManager::validateBackupFile(
  const std::filesystem::path& candidate) const
{
  std::error_code ec;
  if (!std::filesystem::exists(candidate, ec))
  {
    throw BackupError{BackupError::Reason::SourceMissing,
                      "File not found: " + candidate.string()};
  }

  if (lift_utils::fileSizeOrZero(candidate) < config_.minimumStoreSize)
  {
    throw BackupError{BackupError::Reason::ValidationFailed,
                      "File too small to be a valid database"};
  }

  if (!hasSqliteHeader(candidate))
  {
    throw BackupError{BackupError::Reason::ValidationFailed,
                      "File is not a SQLite database"};
  }
}

uintmax_t BackupManager::storeSize() const
{
  return lift_utils::fileSizeOrZero(config_.storePath);
}

std::string BackupManager::backupFileName(
  std::chrono::system_clock::time_point when)
{
  return "workout-backup-" + lift_utils::fileTimestamp(when) + ".db";
}

std::optional<std::filesystem::path> BackupManager::makeSafetyCopy()
{
  std::error_code ec;
  if (!std::filesystem::exists(config_.storePath, ec))
  {
    return std::nullopt;
  }

  std::filesystem::path const target =
    config_.safetyDirectory /
    fmt::format("pre-restore-backup-{}.db", lift_utils::nowMillis());

  std::filesystem::create_directories(config_.safetyDirectory, ec);
  if (!ec)
  {
    std::filesystem::copy_file(config_.storePath,
                               target,
                               std::filesystem::copy_options::overwrite_existing,
                               ec);
  }

  if (ec)
  {
    logger_->warn("Safety copy before restore failed: {}", ec.message());
    return std::nullopt;
  }

  logger_->info("Safety copy written to {}", target.string());
  return target;
}

std::string formatFileSize(uintmax_t bytes)
{
  if (bytes == 0)
  {
    return "0 B";
  }

  constexpr std::array<const char*, 4> kUnits{"B", "KB", "MB", "GB"};
  double value = static_cast<double>(bytes);
  std::size_t unit = 0;
  while (value >= 1024.0 && unit + 1 < kUnits.size())
  {
    value /= 1024.0;
    ++unit;
  }

  std::string number = fmt::format("{:.2f}", value);
  while (number.back() == '0')
  {
    number.pop_back();
  }
  if (number.back() == '.')
  {
    number.pop_back();
  }
  return number + " " + kUnits[unit];
}

}  // namespace lift_store
