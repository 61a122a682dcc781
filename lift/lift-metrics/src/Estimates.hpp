// Ticket: 0003_set_estimates

#ifndef LIFT_METRICS_ESTIMATES_HPP
#define LIFT_METRICS_ESTIMATES_HPP

#include <optional>

#include "lift-metrics/src/ExerciseType.hpp"
#include "lift-metrics/src/SetMetrics.hpp"

namespace lift_metrics
{

/// Rep range the Epley estimate is trusted for
inline constexpr int kMaxEstimateReps = 10;

/**
 * @brief Estimated one-rep max using the Epley formula, w * (1 + reps / 30)
 *
 * A single rep is its own maximum and returns @p weight unchanged.
 *
 * @return std::nullopt when weight <= 0 or reps is outside [1, 10]
 */
std::optional<double> estimateOneRepMax(double weight, int reps);

/**
 * @brief Estimate for a stored row, if it carries both weight and reps
 */
std::optional<double> estimateOneRepMax(const Measurements& m);

/**
 * @brief True when every field the type requires is present and positive
 */
bool isCompleteSet(ExerciseType type, const Measurements& m);

}  // namespace lift_metrics

#endif  // LIFT_METRICS_ESTIMATES_HPP
