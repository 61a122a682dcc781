#include "lift-utils/src/PathUtils.hpp"

#include <string>
#include <system_error>

namespace lift_utils
{

std::array<std::filesystem::path, 3> sidecarPaths(
  const std::filesystem::path& dbPath)
{
  std::string const base = dbPath.string();
  return {std::filesystem::path{base + "-wal"},
          std::filesystem::path{base + "-shm"},
          std::filesystem::path{base + "-journal"}};
}

uintmax_t fileSizeOrZero(const std::filesystem::path& path)
{
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec))
  {
    return 0;
  }

  auto const size = std::filesystem::file_size(path, ec);
  return ec ? 0 : size;
}

}  // namespace lift_utils
