// Ticket: 0001_workout_store_core

#include "lift-utils/src/DateUtils.hpp"

#include <cctype>
#include <ctime>
#include <stdexcept>

#include <fmt/format.h>

namespace lift_utils
{

namespace
{

std::optional<int> parseDigits(std::string_view text)
{
  int value = 0;
  for (char const c : text)
  {
    if (!std::isdigit(static_cast<unsigned char>(c)))
    {
      return std::nullopt;
    }
    value = value * 10 + (c - '0');
  }
  return value;
}

std::chrono::year_month_day requireIsoDate(const std::string& isoDate)
{
  auto parsed = parseIsoDate(isoDate);
  if (!parsed)
  {
    throw std::invalid_argument("Invalid ISO date: '" + isoDate + "'");
  }
  return *parsed;
}

}  // namespace

std::optional<std::chrono::year_month_day> parseIsoDate(std::string_view text)
{
  if (text.size() != 10 || text[4] != '-' || text[7] != '-')
  {
    return std::nullopt;
  }

  auto year = parseDigits(text.substr(0, 4));
  auto month = parseDigits(text.substr(5, 2));
  auto day = parseDigits(text.substr(8, 2));
  if (!year || !month || !day)
  {
    return std::nullopt;
  }

  std::chrono::year_month_day const date{
    std::chrono::year{*year},
    std::chrono::month{static_cast<unsigned>(*month)},
    std::chrono::day{static_cast<unsigned>(*day)}};

  if (!date.ok())
  {
    return std::nullopt;
  }
  return date;
}

bool isIsoDate(std::string_view text)
{
  return parseIsoDate(text).has_value();
}

std::string toIsoDate(const std::chrono::year_month_day& date)
{
  return fmt::format("{:04}-{:02}-{:02}",
                     static_cast<int>(date.year()),
                     static_cast<unsigned>(date.month()),
                     static_cast<unsigned>(date.day()));
}

std::string addDays(const std::string& isoDate, int days)
{
  auto const base = std::chrono::sys_days{requireIsoDate(isoDate)};
  return toIsoDate(std::chrono::year_month_day{base + std::chrono::days{days}});
}

std::string today()
{
  std::time_t const now =
    std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm local{};
  localtime_r(&now, &local);

  return fmt::format("{:04}-{:02}-{:02}",
                     local.tm_year + 1900,
                     local.tm_mon + 1,
                     local.tm_mday);
}

std::pair<std::string, std::string> calendarRange(const std::string& monthDate,
                                                  int bufferMonths)
{
  auto const date = requireIsoDate(monthDate);
  std::chrono::year_month const month{date.year(), date.month()};

  auto const firstMonth = month - std::chrono::months{bufferMonths};
  auto const lastMonth = month + std::chrono::months{bufferMonths};

  std::chrono::year_month_day const start{firstMonth / std::chrono::day{1}};
  std::chrono::year_month_day const end{lastMonth / std::chrono::last};

  return {toIsoDate(start), toIsoDate(end)};
}

int64_t nowMillis()
{
  return std::chrono::duration_cast<std::chrono::milliseconds>(
           std::chrono::system_clock::now().time_since_epoch())
    .count();
}

std::string fileTimestamp(std::chrono::system_clock::time_point when)
{
  std::time_t const t = std::chrono::system_clock::to_time_t(when);
  std::tm utc{};
  gmtime_r(&t, &utc);

  return fmt::format("{:04}-{:02}-{:02}T{:02}-{:02}-{:02}",
                     utc.tm_year + 1900,
                     utc.tm_mon + 1,
                     utc.tm_mday,
                     utc.tm_hour,
                     utc.tm_min,
                     utc.tm_sec);
}

}  // namespace lift_utils
