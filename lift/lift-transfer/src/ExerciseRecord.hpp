// Ticket: 0001_workout_store_core

#ifndef LIFT_TRANSFER_EXERCISE_RECORD_HPP
#define LIFT_TRANSFER_EXERCISE_RECORD_HPP

#include <cstdint>
#include <string>

namespace lift_transfer
{

/**
 * @brief Row of the exercises table: one definition logged on one date
 *
 * References ExerciseDefinitionRecord via definition_id. Deleting the
 * definition removes this row and its sets.
 *
 * @ticket 0001_workout_store_core
 */
struct ExerciseRecord
{
  std::string id;
  std::string definition_id;
  std::string date;       // ISO YYYY-MM-DD
  int64_t created_at{0};  // [ms since epoch]
};

}  // namespace lift_transfer

#endif  // LIFT_TRANSFER_EXERCISE_RECORD_HPP
