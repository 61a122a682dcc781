// Ticket: 0001_workout_store_core

#ifndef LIFT_UTILS_DATE_UTILS_HPP
#define LIFT_UTILS_DATE_UTILS_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace lift_utils
{

/**
 * @brief Parse a calendar date in ISO "YYYY-MM-DD" form
 *
 * Rejects anything that is not exactly ten characters of the form
 * digit{4} '-' digit{2} '-' digit{2}, and anything that does not name a real
 * day (e.g. "2026-02-30").
 *
 * @param text Candidate date string
 * @return The parsed date, or std::nullopt if the text is not a valid date
 */
std::optional<std::chrono::year_month_day> parseIsoDate(std::string_view text);

/**
 * @brief True if parseIsoDate() would accept the text
 */
bool isIsoDate(std::string_view text);

/**
 * @brief Format a calendar date as "YYYY-MM-DD"
 */
std::string toIsoDate(const std::chrono::year_month_day& date);

/**
 * @brief Shift an ISO date by a number of days
 *
 * @param isoDate Base date ("YYYY-MM-DD")
 * @param days Days to add (negative to subtract)
 * @return The shifted date as "YYYY-MM-DD"
 * @throws std::invalid_argument if isoDate is not a valid date
 */
std::string addDays(const std::string& isoDate, int days);

/**
 * @brief Today's date in the local time zone as "YYYY-MM-DD"
 */
std::string today();

/**
 * @brief First and last day of the window spanning a month +/- a buffer
 *
 * Used for calendar marking: for "2026-03-14" with a buffer of 1 the window is
 * 2026-02-01 .. 2026-04-30.
 *
 * @throws std::invalid_argument if monthDate is not a valid date
 */
std::pair<std::string, std::string> calendarRange(const std::string& monthDate,
                                                  int bufferMonths = 1);

/**
 * @brief Milliseconds since the Unix epoch (wall clock)
 */
int64_t nowMillis();

/**
 * @brief Filesystem-safe UTC timestamp, e.g. "2026-01-24T10-30-00"
 */
std::string fileTimestamp(std::chrono::system_clock::time_point when);

}  // namespace lift_utils

#endif  // LIFT_UTILS_DATE_UTILS_HPP
