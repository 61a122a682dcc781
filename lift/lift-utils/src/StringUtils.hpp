// Ticket: 0005_definition_import

#ifndef LIFT_UTILS_STRING_UTILS_HPP
#define LIFT_UTILS_STRING_UTILS_HPP

#include <string>
#include <string_view>

namespace lift_utils
{

/**
 * @brief Copy of @p text without leading/trailing ASCII whitespace
 */
std::string trim(std::string_view text);

/**
 * @brief ASCII lower-case copy of @p text
 */
std::string toLower(std::string_view text);

/**
 * @brief Key used to match exercise names: trimmed, ASCII lower-cased
 *
 * "  Bench Press " and "bench press" share a key.
 */
std::string normalizedName(std::string_view name);

}  // namespace lift_utils

#endif  // LIFT_UTILS_STRING_UTILS_HPP
