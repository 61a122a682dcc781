// Ticket: 0002_metric_comparator

#include "lift-metrics/src/MetricComparator.hpp"

#include <stdexcept>
#include <variant>

namespace lift_metrics
{

namespace
{

template <typename... Ts>
struct Overloaded : Ts...
{
  using Ts::operator()...;
};
template <typename... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

template <typename T>
std::optional<double> value(const std::optional<T>& field)
{
  if (!field)
  {
    return std::nullopt;
  }
  return static_cast<double>(*field);
}

template <typename A, typename B>
std::optional<double> product(const std::optional<A>& a,
                              const std::optional<B>& b)
{
  if (!a || !b)
  {
    return std::nullopt;
  }
  return static_cast<double>(*a) * static_cast<double>(*b);
}

}  // namespace

std::optional<double> rankingKey(const SetMetrics& metrics)
{
  return std::visit(
    Overloaded{
      [](const WeightReps& m) { return product(m.weight, m.reps); },
      [](const WeightOnly& m) { return value(m.weight); },
      [](const RepsOnly& m) { return value(m.reps); },
      [](const DistanceOnly& m) { return value(m.distance); },
      [](const Duration& m) { return value(m.time); },
      [](const TimeTrial& m) -> std::optional<double>
      {
        if (!m.time || *m.time <= 0)
        {
          return std::nullopt;
        }
        return static_cast<double>(*m.time);
      },
      [](const DistanceTime& m) { return product(m.distance, m.time); },
      [](const WeightTime& m) { return product(m.weight, m.time); },
      [](const RepsTime& m) { return product(m.reps, m.time); },
      [](const WeightDistance& m) { return product(m.weight, m.distance); },
      [](const RepsDistance& m) { return product(m.reps, m.distance); }},
    metrics);
}

Comparison compareMetrics(const SetMetrics& a, const SetMetrics& b)
{
  if (a.index() != b.index())
  {
    throw std::invalid_argument{"Cannot compare sets of different exercise types"};
  }

  auto const keyA = rankingKey(a);
  auto const keyB = rankingKey(b);

  if (!keyA && !keyB)
  {
    return Comparison::Equal;
  }
  if (!keyB)
  {
    return Comparison::Greater;
  }
  if (!keyA)
  {
    return Comparison::Less;
  }
  if (*keyA == *keyB)
  {
    return Comparison::Equal;
  }

  bool const aHigher = *keyA > *keyB;
  if (lowerTimeIsBetter(typeOf(a)))
  {
    return aHigher ? Comparison::Less : Comparison::Greater;
  }
  return aHigher ? Comparison::Greater : Comparison::Less;
}

Comparison compareSets(const Measurements& a,
                       const Measurements& b,
                       ExerciseType type)
{
  return compareMetrics(toMetrics(type, a), toMetrics(type, b));
}

std::optional<std::size_t> findBestSet(const std::vector<Measurements>& sets,
                                       ExerciseType type)
{
  if (sets.empty())
  {
    return std::nullopt;
  }

  std::size_t best = 0;
  for (std::size_t i = 1; i < sets.size(); ++i)
  {
    if (compareSets(sets[i], sets[best], type) == Comparison::Greater)
    {
      best = i;
    }
  }
  return best;
}

bool isNewPersonalBest(const Measurements& candidate,
                       const std::optional<Measurements>& currentBest,
                       ExerciseType type)
{
  if (!currentBest)
  {
    return true;
  }
  return compareSets(candidate, *currentBest, type) == Comparison::Greater;
}

std::string comparisonDescription(ExerciseType type)
{
  switch (type)
  {
    case ExerciseType::WeightReps:
      return "Higher volume (weight x reps) is better.";
    case ExerciseType::Weight:
      return "Higher weight is better.";
    case ExerciseType::Reps:
      return "More reps is better.";
    case ExerciseType::Distance:
      return "Longer distance is better.";
    case ExerciseType::TimeDuration:
      return "Longer duration is better (holds/planks).";
    case ExerciseType::TimeSpeed:
      return "Faster time is better (sprints).";
    case ExerciseType::DistanceTime:
      return "Higher distance x time is better.";
    case ExerciseType::WeightTime:
      return "Higher weight x time is better.";
    case ExerciseType::RepsTime:
      return "Higher reps x time is better.";
    case ExerciseType::WeightDistance:
      return "Higher weight x distance is better.";
    case ExerciseType::RepsDistance:
      return "Higher reps x distance is better.";
  }
  throw std::invalid_argument{"Unknown exercise type"};
}

}  // namespace lift_metrics
