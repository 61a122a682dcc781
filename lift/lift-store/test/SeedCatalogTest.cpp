// Ticket: 0006_seed_catalog
// Test: default catalog contents

#include <gtest/gtest.h>

#include <set>
#include <string>

#include "lift-metrics/src/ExerciseType.hpp"
#include "lift-store/src/SeedCatalog.hpp"
#include "lift-utils/src/StringUtils.hpp"

namespace lift_store
{
namespace test
{

TEST(SeedCatalogTest, NamesAreUniqueIgnoringCase)
{
  std::set<std::string> names;
  for (const auto& definition : defaultCatalog())
  {
    EXPECT_TRUE(names.insert(lift_utils::normalizedName(definition.name)).second)
      << definition.name;
  }
}

TEST(SeedCatalogTest, CoversEveryExerciseType)
{
  std::set<lift_metrics::ExerciseType> types;
  for (const auto& definition : defaultCatalog())
  {
    types.insert(definition.type);
  }
  EXPECT_EQ(types.size(), lift_metrics::kAllExerciseTypes.size());
}

TEST(SeedCatalogTest, EntriesHaveRequiredText)
{
  for (const auto& definition : defaultCatalog())
  {
    EXPECT_FALSE(definition.name.empty());
    EXPECT_FALSE(definition.category.empty());
    EXPECT_FALSE(definition.unit.empty());
  }
}

}  // namespace test
}  // namespace lift_store
