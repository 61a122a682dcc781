#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>

#include "lift-utils/src/DateUtils.hpp"

namespace lift_utils
{
namespace test
{

// ========== parseIsoDate ==========

TEST(DateUtilsTest, ParseIsoDate_AcceptsRealDate)
{
  auto date = parseIsoDate("2026-01-24");
  ASSERT_TRUE(date.has_value());
  EXPECT_EQ(static_cast<int>(date->year()), 2026);
  EXPECT_EQ(static_cast<unsigned>(date->month()), 1u);
  EXPECT_EQ(static_cast<unsigned>(date->day()), 24u);
}

TEST(DateUtilsTest, ParseIsoDate_RejectsMalformedText)
{
  EXPECT_FALSE(isIsoDate(""));
  EXPECT_FALSE(isIsoDate("2026-1-24"));
  EXPECT_FALSE(isIsoDate("2026/01/24"));
  EXPECT_FALSE(isIsoDate("2026-01-24T10:00"));
  EXPECT_FALSE(isIsoDate("20a6-01-24"));
}

TEST(DateUtilsTest, ParseIsoDate_RejectsImpossibleDay)
{
  EXPECT_FALSE(isIsoDate("2026-02-30"));
  EXPECT_FALSE(isIsoDate("2026-13-01"));
  EXPECT_FALSE(isIsoDate("2025-02-29"));
  EXPECT_TRUE(isIsoDate("2024-02-29"));
}

// ========== addDays ==========

TEST(DateUtilsTest, AddDays_CrossesMonthAndYearBoundaries)
{
  EXPECT_EQ(addDays("2026-01-31", 1), "2026-02-01");
  EXPECT_EQ(addDays("2026-01-01", -1), "2025-12-31");
  EXPECT_EQ(addDays("2024-02-28", 1), "2024-02-29");
  EXPECT_EQ(addDays("2026-03-10", 0), "2026-03-10");
}

TEST(DateUtilsTest, AddDays_InvalidDate_Throws)
{
  EXPECT_THROW(addDays("not-a-date", 1), std::invalid_argument);
}

// ========== calendarRange ==========

TEST(DateUtilsTest, CalendarRange_SpansBufferMonths)
{
  auto [start, end] = calendarRange("2026-03-14", 1);
  EXPECT_EQ(start, "2026-02-01");
  EXPECT_EQ(end, "2026-04-30");
}

TEST(DateUtilsTest, CalendarRange_WrapsYear)
{
  auto [start, end] = calendarRange("2026-01-05", 1);
  EXPECT_EQ(start, "2025-12-01");
  EXPECT_EQ(end, "2026-02-28");
}

// ========== today / fileTimestamp ==========

TEST(DateUtilsTest, Today_IsValidIsoDate)
{
  EXPECT_TRUE(isIsoDate(today()));
}

TEST(DateUtilsTest, FileTimestamp_HasNoColons)
{
  std::chrono::sys_days const day{std::chrono::year{2026} /
                                  std::chrono::January / 24};
  auto const when = day + std::chrono::hours{10} + std::chrono::minutes{30} +
                    std::chrono::seconds{5};

  EXPECT_EQ(fileTimestamp(when), "2026-01-24T10-30-05");
}

}  // namespace test
}  // namespace lift_utils
