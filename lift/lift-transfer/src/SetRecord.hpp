// Ticket: 0001_workout_store_core

#ifndef LIFT_TRANSFER_SET_RECORD_HPP
#define LIFT_TRANSFER_SET_RECORD_HPP

#include <cstdint>
#include <optional>
#include <string>

#include "lift-metrics/src/SetMetrics.hpp"

namespace lift_transfer
{

/**
 * @brief Row of the sets table
 *
 * All four measurement columns are nullable; which ones are meaningful is
 * decided by the owning definition's exercise type.
 *
 * @ticket 0001_workout_store_core
 */
struct SetRecord
{
  std::string id;
  std::string exercise_id;
  std::optional<double> weight;    // [kg]
  std::optional<int> reps;
  std::optional<double> distance;  // [km]
  std::optional<int> time;         // [seconds]
  std::optional<std::string> note;
  int64_t timestamp{0};            // [ms since epoch], insertion order

  lift_metrics::Measurements measurements() const
  {
    return lift_metrics::Measurements{weight, reps, distance, time};
  }
};

}  // namespace lift_transfer

#endif  // LIFT_TRANSFER_SET_RECORD_HPP
