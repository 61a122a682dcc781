// Ticket: 0007_history_charts

#include "lift-store/src/HistoryAggregator.hpp"

#include <algorithm>
#include <utility>

#include "lift-metrics/src/ExerciseType.hpp"
#include "lift-store/src/StoreErrors.hpp"
#include "lift-store/src/WorkoutStore.hpp"
#include "lift-utils/src/DateUtils.hpp"

namespace lift_store
{

namespace
{

template <typename T, typename Better>
void keepBest(std::optional<T>& best, const std::optional<T>& value, Better better)
{
  if (value && (!best || better(*value, *best)))
  {
    best = value;
  }
}

void accumulate(ChartPoint& point,
                const lift_transfer::SetRecord& set,
                lift_metrics::ExerciseType type)
{
  auto const greater = [](auto a, auto b) { return a > b; };
  auto const less = [](auto a, auto b) { return a < b; };

  keepBest(point.bestWeight, set.weight, greater);
  keepBest(point.bestReps, set.reps, greater);
  keepBest(point.bestDistance, set.distance, greater);

  if (lift_metrics::lowerTimeIsBetter(type))
  {
    // A zero-second trial is not a result
    if (set.time && *set.time > 0)
    {
      keepBest(point.bestTime, set.time, less);
    }
  }
  else
  {
    keepBest(point.bestTime, set.time, greater);
  }

  if (set.weight && set.reps)
  {
    point.totalVolume += *set.weight * static_cast<double>(*set.reps);
  }
  ++point.setCount;
}

}  // namespace

std::optional<double> metricValue(const ChartPoint& point, ChartMetric metric)
{
  switch (metric)
  {
    case ChartMetric::BestWeight:
      return point.bestWeight;
    case ChartMetric::BestReps:
      if (point.bestReps)
      {
        return static_cast<double>(*point.bestReps);
      }
      return std::nullopt;
    case ChartMetric::BestDistance:
      return point.bestDistance;
    case ChartMetric::BestTime:
      if (point.bestTime)
      {
        return static_cast<double>(*point.bestTime);
      }
      return std::nullopt;
    case ChartMetric::TotalVolume:
      return point.totalVolume;
    case ChartMetric::SetCount:
      return static_cast<double>(point.setCount);
  }
  return std::nullopt;
}

HistoryAggregator::HistoryAggregator(WorkoutStore& store,
                                     std::shared_ptr<spdlog::logger> logger)
  : store_{store}, logger_{std::move(logger)}
{
}

std::vector<ChartPoint> HistoryAggregator::exerciseHistoryForChart(
  const std::string& name,
  const std::string& start,
  const std::string& end)
{
  auto points = aggregate(store_.historyRows(name, start, end));
  logger_->debug("Chart for '{}' [{}, {}]: {} points",
                 name,
                 start,
                 end,
                 points.size());
  return points;
}

std::vector<ChartPoint> HistoryAggregator::exerciseHistoryForPeriod(
  const std::string& name,
  int periodDays,
  const std::string& endDate)
{
  if (periodDays <= 0)
  {
    throw ValidationError{"Chart period must be at least one day"};
  }
  if (!lift_utils::isIsoDate(endDate))
  {
    throw ValidationError{"Invalid date '" + endDate + "', expected YYYY-MM-DD"};
  }

  std::string const start = lift_utils::addDays(endDate, -(periodDays - 1));
  return exerciseHistoryForChart(name, start, endDate);
}

std::vector<DayHistory> HistoryAggregator::exerciseHistoryWithSets(
  const std::string& name,
  int limitDays)
{
  if (limitDays <= 0)
  {
    return {};
  }
  return groupByDay(store_.exercisesByName(name), limitDays);
}

std::vector<DayHistory> HistoryAggregator::exerciseHistoryWithSets(
  const std::string& name,
  const std::string& start,
  const std::string& end)
{
  return groupByDay(store_.exercisesByName(name, start, end), std::nullopt);
}

std::vector<ChartPoint> HistoryAggregator::aggregate(
  const std::vector<HistoryRow>& rows)
{
  std::vector<ChartPoint> points;
  for (const auto& row : rows)
  {
    if (points.empty() || points.back().date != row.date)
    {
      ChartPoint point;
      point.date = row.date;
      points.push_back(std::move(point));
    }
    accumulate(points.back(), row.set, row.type);
  }
  return points;
}

std::vector<DayHistory> HistoryAggregator::groupByDay(
  const std::vector<ExerciseWithSets>& exercises,
  std::optional<int> limitDays) const
{
  // Input is date descending; several exercises on one date share a day.
  // Exercises without sets open no day.
  std::vector<DayHistory> days;
  for (const auto& exercise : exercises)
  {
    if (exercise.sets.empty())
    {
      continue;
    }
    if (days.empty() || days.back().date != exercise.exercise.date)
    {
      if (limitDays && static_cast<int>(days.size()) == *limitDays)
      {
        break;
      }
      days.push_back(DayHistory{exercise.exercise.date, {}});
    }
    for (const auto& logged : exercise.sets)
    {
      days.back().sets.push_back(logged.set);
    }
  }

  for (auto& day : days)
  {
    std::stable_sort(day.sets.begin(),
                     day.sets.end(),
                     [](const lift_transfer::SetRecord& a,
                        const lift_transfer::SetRecord& b)
                     { return a.timestamp < b.timestamp; });
  }
  return days;
}

}  // namespace lift_store
