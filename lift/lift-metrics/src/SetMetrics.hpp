// Ticket: 0002_metric_comparator

#ifndef LIFT_METRICS_SET_METRICS_HPP
#define LIFT_METRICS_SET_METRICS_HPP

#include <optional>
#include <variant>

#include "lift-metrics/src/ExerciseType.hpp"

namespace lift_metrics
{

/**
 * @brief Flat four-field row as stored in the sets table
 *
 * Units: weight in kg, distance in km, time in whole seconds. Any field may be
 * absent; which ones matter depends on the exercise type.
 */
struct Measurements
{
  std::optional<double> weight;
  std::optional<int> reps;
  std::optional<double> distance;
  std::optional<int> time;
};

// One alternative per exercise type, carrying only the fields it measures.
// Fields stay optional: a logged set may be partial.

struct WeightReps
{
  std::optional<double> weight;
  std::optional<int> reps;
};

struct WeightOnly
{
  std::optional<double> weight;
};

struct RepsOnly
{
  std::optional<int> reps;
};

struct DistanceOnly
{
  std::optional<double> distance;
};

/// Hold duration, longer is better
struct Duration
{
  std::optional<int> time;
};

/// Timed trial, shorter is better
struct TimeTrial
{
  std::optional<int> time;
};

struct DistanceTime
{
  std::optional<double> distance;
  std::optional<int> time;
};

struct WeightTime
{
  std::optional<double> weight;
  std::optional<int> time;
};

struct RepsTime
{
  std::optional<int> reps;
  std::optional<int> time;
};

struct WeightDistance
{
  std::optional<double> weight;
  std::optional<double> distance;
};

struct RepsDistance
{
  std::optional<int> reps;
  std::optional<double> distance;
};

/**
 * @brief Type-tagged set values
 *
 * Alternative order matches the ExerciseType enumerators, so index() maps
 * directly onto kAllExerciseTypes.
 */
using SetMetrics = std::variant<WeightReps,
                                WeightOnly,
                                RepsOnly,
                                DistanceOnly,
                                Duration,
                                TimeTrial,
                                DistanceTime,
                                WeightTime,
                                RepsTime,
                                WeightDistance,
                                RepsDistance>;

/**
 * @brief Project a flat row onto the alternative for @p type
 *
 * Fields the type does not measure are dropped.
 */
SetMetrics toMetrics(ExerciseType type, const Measurements& m);

/**
 * @brief Flatten back to the stored row shape
 */
Measurements toMeasurements(const SetMetrics& metrics);

ExerciseType typeOf(const SetMetrics& metrics);

}  // namespace lift_metrics

#endif  // LIFT_METRICS_SET_METRICS_HPP
