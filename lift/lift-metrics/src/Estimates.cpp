// Ticket: 0003_set_estimates

#include "lift-metrics/src/Estimates.hpp"

namespace lift_metrics
{

std::optional<double> estimateOneRepMax(double weight, int reps)
{
  if (weight <= 0.0 || reps < 1 || reps > kMaxEstimateReps)
  {
    return std::nullopt;
  }
  if (reps == 1)
  {
    return weight;
  }
  return weight * (1.0 + static_cast<double>(reps) / 30.0);
}

std::optional<double> estimateOneRepMax(const Measurements& m)
{
  if (!m.weight || !m.reps)
  {
    return std::nullopt;
  }
  return estimateOneRepMax(*m.weight, *m.reps);
}

bool isCompleteSet(ExerciseType type, const Measurements& m)
{
  FieldMask const mask = requiredFields(type);

  if (mask.weight && !(m.weight && *m.weight > 0.0))
  {
    return false;
  }
  if (mask.reps && !(m.reps && *m.reps > 0))
  {
    return false;
  }
  if (mask.distance && !(m.distance && *m.distance > 0.0))
  {
    return false;
  }
  if (mask.time && !(m.time && *m.time > 0))
  {
    return false;
  }
  return true;
}

}  // namespace lift_metrics
