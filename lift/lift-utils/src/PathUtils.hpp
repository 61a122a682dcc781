#ifndef LIFT_UTILS_PATH_UTILS_HPP
#define LIFT_UTILS_PATH_UTILS_HPP

#include <array>
#include <cstdint>
#include <filesystem>

namespace lift_utils
{

/**
 * SQLite sidecar files that may sit next to a database file: the
 * write-ahead log, its shared-memory index and the rollback journal.
 *
 * Example:
 *   For /data/lift.db returns /data/lift.db-wal, /data/lift.db-shm and
 *   /data/lift.db-journal
 */
std::array<std::filesystem::path, 3> sidecarPaths(
  const std::filesystem::path& dbPath);

/**
 * Size of a regular file in bytes, or 0 if it does not exist.
 */
uintmax_t fileSizeOrZero(const std::filesystem::path& path);

}  // namespace lift_utils

#endif  // LIFT_UTILS_PATH_UTILS_HPP
