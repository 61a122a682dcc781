// Ticket: 0007_history_charts

#ifndef LIFT_STORE_HISTORY_AGGREGATOR_HPP
#define LIFT_STORE_HISTORY_AGGREGATOR_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "lift-store/src/WorkoutStoreTypes.hpp"

namespace lift_store
{

class WorkoutStore;

/**
 * @brief Per-day summary of one exercise for progress charts
 *
 * Each best is taken independently over the day's sets and is absent when no
 * set carries that field. bestTime is the shortest time for time_speed
 * exercises and the longest otherwise.
 */
struct ChartPoint
{
  std::string date;
  std::optional<double> bestWeight;
  std::optional<int> bestReps;
  std::optional<double> bestDistance;
  std::optional<int> bestTime;
  double totalVolume{0.0};  // Sum of weight * reps over sets having both
  int setCount{0};
};

/**
 * @brief All sets of one exercise logged on one day, timestamp ascending
 */
struct DayHistory
{
  std::string date;
  std::vector<lift_transfer::SetRecord> sets;
};

enum class ChartMetric : uint8_t
{
  BestWeight,
  BestReps,
  BestDistance,
  BestTime,
  TotalVolume,
  SetCount
};

/**
 * @brief Value plotted for @p metric, absent when the day has none
 */
std::optional<double> metricValue(const ChartPoint& point, ChartMetric metric);

/**
 * @brief Read-only chart and history views over a WorkoutStore
 *
 * Unknown exercise names produce empty results.
 *
 * @ticket 0007_history_charts
 */
class HistoryAggregator
{
public:
  HistoryAggregator(WorkoutStore& store, std::shared_ptr<spdlog::logger> logger);

  /**
   * @brief One point per logged date in [start, end], date ascending
   */
  std::vector<ChartPoint> exerciseHistoryForChart(const std::string& name,
                                                  const std::string& start,
                                                  const std::string& end);

  /**
   * @brief Chart over the @p periodDays days ending at @p endDate (inclusive)
   */
  std::vector<ChartPoint> exerciseHistoryForPeriod(const std::string& name,
                                                   int periodDays,
                                                   const std::string& endDate);

  /**
   * @brief Most recent @p limitDays logged days with full sets, date descending
   */
  std::vector<DayHistory> exerciseHistoryWithSets(const std::string& name,
                                                  int limitDays);

  /**
   * @brief Logged days in [start, end] with full sets, date descending
   */
  std::vector<DayHistory> exerciseHistoryWithSets(const std::string& name,
                                                  const std::string& start,
                                                  const std::string& end);

  /**
   * @brief Fold flat history rows (date ascending) into chart points
   */
  static std::vector<ChartPoint> aggregate(const std::vector<HistoryRow>& rows);

private:
  std::vector<DayHistory> groupByDay(
    const std::vector<ExerciseWithSets>& exercises,
    std::optional<int> limitDays) const;

  WorkoutStore& store_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace lift_store

#endif  // LIFT_STORE_HISTORY_AGGREGATOR_HPP
