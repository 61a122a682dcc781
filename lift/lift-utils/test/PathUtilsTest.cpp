#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "lift-utils/src/PathUtils.hpp"

namespace lift_utils
{
namespace test
{

TEST(PathUtilsTest, SidecarPaths)
{
  auto paths = sidecarPaths("/data/lift.db");

  EXPECT_EQ(paths[0], std::filesystem::path{"/data/lift.db-wal"});
  EXPECT_EQ(paths[1], std::filesystem::path{"/data/lift.db-shm"});
  EXPECT_EQ(paths[2], std::filesystem::path{"/data/lift.db-journal"});
}

TEST(PathUtilsTest, FileSizeOrZero)
{
  auto path = std::filesystem::temp_directory_path() / "lift_path_utils_size.bin";
  {
    std::ofstream out{path, std::ios::binary};
    out << "12345";
  }

  EXPECT_EQ(fileSizeOrZero(path), 5u);
  std::filesystem::remove(path);
  EXPECT_EQ(fileSizeOrZero(path), 0u);
  EXPECT_EQ(fileSizeOrZero(std::filesystem::temp_directory_path()), 0u);
}

}  // namespace test
}  // namespace lift_utils
