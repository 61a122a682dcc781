// Ticket: 0008_backup_restore

#ifndef LIFT_STORE_BACKUP_MANAGER_HPP
#define LIFT_STORE_BACKUP_MANAGER_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

namespace lift_store
{

class WorkoutStore;

struct BackupResult
{
  std::filesystem::path path;
  std::string fileName;
  uintmax_t fileSize{0};  // [bytes]
};

struct RestoreResult
{
  std::optional<std::filesystem::path> safetyCopy;  // Absent if none was made
  bool requiresRestart{true};
};

/**
 * @brief File-level backup and restore of the store
 *
 * A backup is a byte-identical copy of the store file taken while the store
 * holds its write guard. A restore replaces the store file by copying the
 * candidate next to it and renaming it into place, so the live path either
 * keeps the old file or gets the complete new one. Restore expects the store
 * to be closed and always asks the caller to reopen it.
 *
 * @ticket 0008_backup_restore
 */
class BackupManager
{
public:
  struct Config
  {
    std::filesystem::path storePath;        // Live store file (restore target)
    std::filesystem::path backupDirectory;  // Where createBackup() writes
    std::filesystem::path safetyDirectory;  // Where pre-restore copies go
    uintmax_t minimumStoreSize{4096};       // Smallest plausible store [bytes]
  };

  BackupManager(Config config, std::shared_ptr<spdlog::logger> logger);

  /**
   * @brief Copy the store to workout-backup-<UTC timestamp>.db
   *
   * @throws BackupError(ValidationFailed) if the schema is missing tables
   * @throws BackupError(CopyFailed) if the copy cannot be written or a backup
   *         with the same name already exists
   */
  BackupResult createBackup(WorkoutStore& store);

  /**
   * @brief Replace the store file with @p source
   *
   * The current store is first copied to the safety directory; a failure to
   * do so is logged and the restore continues.
   *
   * @throws BackupError(SourceMissing) if @p source does not exist
   * @throws BackupError(ValidationFailed) if @p source is not a SQLite file
   * @throws BackupError(CopyFailed) if the store file cannot be replaced
   */
  RestoreResult restoreFromBackup(const std::filesystem::path& source);

  /**
   * @brief Check that @p candidate exists, is large enough and starts with
   * the SQLite header
   *
   * @throws BackupError describing the first failed check
   */
  void validateBackupFile(const std::filesystem::path& candidate) const;

  /**
   * @brief Size of the live store file, 0 if it is missing
   */
  uintmax_t storeSize() const;

  static std::string backupFileName(std::chrono::system_clock::time_point when);

  const Config& config() const
  {
    return config_;
  }

private:
  std::optional<std::filesystem::path> makeSafetyCopy();

  Config config_;
  std::shared_ptr<spdlog::logger> logger_;
};

/**
 * @brief Human-readable size, e.g. "1.5 KB"
 */
std::string formatFileSize(uintmax_t bytes);

}  // namespace lift_store

#endif  // LIFT_STORE_BACKUP_MANAGER_HPP
