// Ticket: 0002_metric_comparator

#include "lift-metrics/src/ExerciseType.hpp"

#include <stdexcept>

namespace lift_metrics
{

std::string toString(ExerciseType type)
{
  switch (type)
  {
    case ExerciseType::WeightReps:
      return "weight_reps";
    case ExerciseType::Weight:
      return "weight";
    case ExerciseType::Reps:
      return "reps";
    case ExerciseType::Distance:
      return "distance";
    case ExerciseType::TimeDuration:
      return "time_duration";
    case ExerciseType::TimeSpeed:
      return "time_speed";
    case ExerciseType::DistanceTime:
      return "distance_time";
    case ExerciseType::WeightTime:
      return "weight_time";
    case ExerciseType::RepsTime:
      return "reps_time";
    case ExerciseType::WeightDistance:
      return "weight_distance";
    case ExerciseType::RepsDistance:
      return "reps_distance";
  }
  throw std::invalid_argument{"Unknown exercise type"};
}

std::optional<ExerciseType> parseExerciseType(std::string_view text)
{
  // Stores written before the duration/speed split used a bare "time"
  if (text == "time")
  {
    return ExerciseType::TimeDuration;
  }

  for (ExerciseType type : kAllExerciseTypes)
  {
    if (text == toString(type))
    {
      return type;
    }
  }
  return std::nullopt;
}

std::string displayLabel(ExerciseType type)
{
  switch (type)
  {
    case ExerciseType::WeightReps:
      return "Weight & Reps";
    case ExerciseType::Weight:
      return "Weight Only";
    case ExerciseType::Reps:
      return "Reps Only";
    case ExerciseType::Distance:
      return "Distance Only";
    case ExerciseType::TimeDuration:
      return "Duration";
    case ExerciseType::TimeSpeed:
      return "Time Trial";
    case ExerciseType::DistanceTime:
      return "Distance & Time";
    case ExerciseType::WeightTime:
      return "Weight & Time";
    case ExerciseType::RepsTime:
      return "Reps & Time";
    case ExerciseType::WeightDistance:
      return "Weight & Distance";
    case ExerciseType::RepsDistance:
      return "Reps & Distance";
  }
  throw std::invalid_argument{"Unknown exercise type"};
}

FieldMask requiredFields(ExerciseType type)
{
  FieldMask mask;
  switch (type)
  {
    case ExerciseType::WeightReps:
      mask.weight = true;
      mask.reps = true;
      break;
    case ExerciseType::Weight:
      mask.weight = true;
      break;
    case ExerciseType::Reps:
      mask.reps = true;
      break;
    case ExerciseType::Distance:
      mask.distance = true;
      break;
    case ExerciseType::TimeDuration:
    case ExerciseType::TimeSpeed:
      mask.time = true;
      break;
    case ExerciseType::DistanceTime:
      mask.distance = true;
      mask.time = true;
      break;
    case ExerciseType::WeightTime:
      mask.weight = true;
      mask.time = true;
      break;
    case ExerciseType::RepsTime:
      mask.reps = true;
      mask.time = true;
      break;
    case ExerciseType::WeightDistance:
      mask.weight = true;
      mask.distance = true;
      break;
    case ExerciseType::RepsDistance:
      mask.reps = true;
      mask.distance = true;
      break;
  }
  return mask;
}

}  // namespace lift_metrics
