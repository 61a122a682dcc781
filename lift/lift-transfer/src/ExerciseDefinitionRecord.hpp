// Ticket: 0001_workout_store_core

#ifndef LIFT_TRANSFER_EXERCISE_DEFINITION_RECORD_HPP
#define LIFT_TRANSFER_EXERCISE_DEFINITION_RECORD_HPP

#include <cstdint>
#include <optional>
#include <string>

#include "lift-metrics/src/ExerciseType.hpp"

namespace lift_transfer
{

/**
 * @brief Row of the exercise_definitions table
 *
 * A catalog entry. Names are unique as stored; the importer compares them
 * case-insensitively.
 *
 * @ticket 0001_workout_store_core
 */
struct ExerciseDefinitionRecord
{
  std::string id;        // Random UUID
  std::string name;
  std::string category;
  lift_metrics::ExerciseType type{lift_metrics::ExerciseType::WeightReps};
  std::string unit;      // Display unit, e.g. "kg" or "reps"
  std::optional<std::string> description;
  int64_t created_at{0};  // [ms since epoch]
};

}  // namespace lift_transfer

#endif  // LIFT_TRANSFER_EXERCISE_DEFINITION_RECORD_HPP
