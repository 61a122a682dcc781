// Ticket: 0002_metric_comparator

#ifndef LIFT_METRICS_EXERCISE_TYPE_HPP
#define LIFT_METRICS_EXERCISE_TYPE_HPP

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace lift_metrics
{

/**
 * @brief Which of {weight, reps, distance, time} an exercise measures.
 *
 * The persisted form is the snake_case tag returned by toString(). The two
 * time variants differ only in ranking direction: a hold (TimeDuration) is
 * better when longer, a trial (TimeSpeed) is better when shorter.
 *
 * @ticket 0002_metric_comparator
 */
enum class ExerciseType : uint8_t
{
  WeightReps,     ///< weight_reps
  Weight,         ///< weight
  Reps,           ///< reps
  Distance,       ///< distance
  TimeDuration,   ///< time_duration (also parsed from legacy "time")
  TimeSpeed,      ///< time_speed
  DistanceTime,   ///< distance_time
  WeightTime,     ///< weight_time
  RepsTime,       ///< reps_time
  WeightDistance, ///< weight_distance
  RepsDistance    ///< reps_distance
};

/**
 * @brief Fields a set of a given type is expected to carry
 */
struct FieldMask
{
  bool weight{false};
  bool reps{false};
  bool distance{false};
  bool time{false};
};

inline constexpr std::array<ExerciseType, 11> kAllExerciseTypes{
  ExerciseType::WeightReps,
  ExerciseType::Weight,
  ExerciseType::Reps,
  ExerciseType::Distance,
  ExerciseType::TimeDuration,
  ExerciseType::TimeSpeed,
  ExerciseType::DistanceTime,
  ExerciseType::WeightTime,
  ExerciseType::RepsTime,
  ExerciseType::WeightDistance,
  ExerciseType::RepsDistance};

/**
 * @brief Persisted tag, e.g. "weight_reps"
 */
std::string toString(ExerciseType type);

/**
 * @brief Parse a persisted tag
 *
 * Accepts the eleven tags plus the legacy "time" (read as TimeDuration).
 *
 * @return std::nullopt for any other text
 */
std::optional<ExerciseType> parseExerciseType(std::string_view text);

/**
 * @brief Human-readable label, e.g. "Weight & Reps"
 */
std::string displayLabel(ExerciseType type);

FieldMask requiredFields(ExerciseType type);

/**
 * @brief True for the time_speed type, where less time ranks higher
 */
constexpr bool lowerTimeIsBetter(ExerciseType type)
{
  return type == ExerciseType::TimeSpeed;
}

}  // namespace lift_metrics

#endif  // LIFT_METRICS_EXERCISE_TYPE_HPP
