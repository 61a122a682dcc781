// Ticket: 0001_workout_store_core

#ifndef LIFT_UTILS_ID_UTILS_HPP
#define LIFT_UTILS_ID_UTILS_HPP

#include <string>

namespace lift_utils
{

/**
 * @brief New opaque row id (random v4 UUID, canonical 36-char form)
 */
std::string newId();

}  // namespace lift_utils

#endif  // LIFT_UTILS_ID_UTILS_HPP
