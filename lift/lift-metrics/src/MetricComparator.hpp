// Ticket: 0002_metric_comparator

#ifndef LIFT_METRICS_METRIC_COMPARATOR_HPP
#define LIFT_METRICS_METRIC_COMPARATOR_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "lift-metrics/src/ExerciseType.hpp"
#include "lift-metrics/src/SetMetrics.hpp"

namespace lift_metrics
{

enum class Comparison : uint8_t
{
  Less,
  Equal,
  Greater
};

/**
 * @brief Scalar a set is ranked by, before direction is applied
 *
 * Single-metric types rank by that metric. Paired types rank by a composite
 * score:
 * - weight_reps: weight * reps (volume)
 * - weight_distance: weight * distance
 * - reps_distance: reps * distance
 * - weight_time: weight * seconds
 * - distance_time: distance * seconds
 * - reps_time: reps * seconds
 *
 * @return std::nullopt when the set is unranked: a required field is
 *         missing, or a time_speed time is not positive.
 */
std::optional<double> rankingKey(const SetMetrics& metrics);

/**
 * @brief Order two sets of the same type
 *
 * Any ranked set is Greater than an unranked one; two unranked sets are
 * Equal. For time_speed a smaller key is Greater.
 *
 * @throws std::invalid_argument if the alternatives differ
 */
Comparison compareMetrics(const SetMetrics& a, const SetMetrics& b);

/**
 * @brief Order two stored rows under the rules of @p type
 */
Comparison compareSets(const Measurements& a,
                       const Measurements& b,
                       ExerciseType type);

/**
 * @brief Index of the best set, keeping the earliest on ties
 *
 * @return std::nullopt for an empty input
 */
std::optional<std::size_t> findBestSet(const std::vector<Measurements>& sets,
                                       ExerciseType type);

/**
 * @brief True when there is no current best or @p candidate beats it strictly
 */
bool isNewPersonalBest(const Measurements& candidate,
                       const std::optional<Measurements>& currentBest,
                       ExerciseType type);

/**
 * @brief One-line explanation of how sets of this type are ranked
 */
std::string comparisonDescription(ExerciseType type);

}  // namespace lift_metrics

#endif  // LIFT_METRICS_METRIC_COMPARATOR_HPP
