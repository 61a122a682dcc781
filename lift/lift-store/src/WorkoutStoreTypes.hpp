// Ticket: 0001_workout_store_core

#ifndef LIFT_STORE_WORKOUT_STORE_TYPES_HPP
#define LIFT_STORE_WORKOUT_STORE_TYPES_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "lift-metrics/src/ExerciseType.hpp"
#include "lift-transfer/src/Records.hpp"

namespace lift_store
{

/**
 * @brief Input for a new catalog entry (id and createdAt are generated)
 */
struct NewDefinition
{
  std::string name;
  std::string category;
  lift_metrics::ExerciseType type{lift_metrics::ExerciseType::WeightReps};
  std::string unit;
  std::optional<std::string> description;
};

/**
 * @brief Partial definition update; only engaged fields are written
 */
struct DefinitionUpdate
{
  std::optional<std::string> name;
  std::optional<std::string> category;
  std::optional<lift_metrics::ExerciseType> type;
  std::optional<std::string> unit;
  std::optional<std::string> description;
};

/**
 * @brief Input for a new set
 *
 * timestamp defaults to the current time when not given.
 */
struct NewSet
{
  std::optional<double> weight;
  std::optional<int> reps;
  std::optional<double> distance;
  std::optional<int> time;
  std::optional<std::string> note;
  std::optional<int64_t> timestamp;
};

/**
 * @brief Partial set update; only engaged fields are written
 */
struct SetUpdate
{
  std::optional<double> weight;
  std::optional<int> reps;
  std::optional<double> distance;
  std::optional<int> time;
  std::optional<std::string> note;
};

/**
 * @brief A set as returned by the composite reads
 *
 * isPersonalBest is computed at read time and never stored.
 */
struct LoggedSet
{
  lift_transfer::SetRecord set;
  bool isPersonalBest{false};
};

/**
 * @brief A logged exercise joined with its definition and its sets
 */
struct ExerciseWithSets
{
  lift_transfer::ExerciseRecord exercise;
  std::string name;
  std::string category;
  lift_metrics::ExerciseType type{lift_metrics::ExerciseType::WeightReps};
  std::vector<LoggedSet> sets;  // timestamp ascending
};

struct UsedExercise
{
  std::string name;
  lift_metrics::ExerciseType type{lift_metrics::ExerciseType::WeightReps};
};

struct PersonalBest
{
  lift_transfer::SetRecord set;
  std::string date;
  lift_metrics::ExerciseType type{lift_metrics::ExerciseType::WeightReps};
};

/**
 * @brief One row of the flat history join (definition, exercise, set)
 */
struct HistoryRow
{
  std::string date;
  lift_metrics::ExerciseType type{lift_metrics::ExerciseType::WeightReps};
  lift_transfer::SetRecord set;
};

/**
 * @brief One row of the export join, in export order
 */
struct ExportRow
{
  std::string date;
  std::string name;
  std::string category;
  lift_metrics::ExerciseType type{lift_metrics::ExerciseType::WeightReps};
  lift_transfer::SetRecord set;
};

}  // namespace lift_store

#endif  // LIFT_STORE_WORKOUT_STORE_TYPES_HPP
