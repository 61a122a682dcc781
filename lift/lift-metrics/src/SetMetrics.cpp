// Ticket: 0002_metric_comparator

#include "lift-metrics/src/SetMetrics.hpp"

#include <stdexcept>

namespace lift_metrics
{

SetMetrics toMetrics(ExerciseType type, const Measurements& m)
{
  switch (type)
  {
    case ExerciseType::WeightReps:
      return WeightReps{m.weight, m.reps};
    case ExerciseType::Weight:
      return WeightOnly{m.weight};
    case ExerciseType::Reps:
      return RepsOnly{m.reps};
    case ExerciseType::Distance:
      return DistanceOnly{m.distance};
    case ExerciseType::TimeDuration:
      return Duration{m.time};
    case ExerciseType::TimeSpeed:
      return TimeTrial{m.time};
    case ExerciseType::DistanceTime:
      return DistanceTime{m.distance, m.time};
    case ExerciseType::WeightTime:
      return WeightTime{m.weight, m.time};
    case ExerciseType::RepsTime:
      return RepsTime{m.reps, m.time};
    case ExerciseType::WeightDistance:
      return WeightDistance{m.weight, m.distance};
    case ExerciseType::RepsDistance:
      return RepsDistance{m.reps, m.distance};
  }
  throw std::invalid_argument{"Unknown exercise type"};
}

Measurements toMeasurements(const SetMetrics& metrics)
{
  return std::visit(
    [](const auto& alt)
    {
      Measurements out;
      if constexpr (requires { alt.weight; })
      {
        out.weight = alt.weight;
      }
      if constexpr (requires { alt.reps; })
      {
        out.reps = alt.reps;
      }
      if constexpr (requires { alt.distance; })
      {
        out.distance = alt.distance;
      }
      if constexpr (requires { alt.time; })
      {
        out.time = alt.time;
      }
      return out;
    },
    metrics);
}

ExerciseType typeOf(const SetMetrics& metrics)
{
  return kAllExerciseTypes.at(metrics.index());
}

}  // namespace lift_metrics
