// Ticket: 0009_csv_export

#ifndef LIFT_STORE_CSV_EXPORTER_HPP
#define LIFT_STORE_CSV_EXPORTER_HPP

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

#include "lift-store/src/WorkoutStoreTypes.hpp"

namespace lift_store
{

class WorkoutStore;

struct ExportResult
{
  std::filesystem::path path;
  std::string fileName;
  std::size_t recordCount{0};
};

/**
 * @brief Flat one-row-per-set CSV export of every logged set
 *
 * @ticket 0009_csv_export
 */
class CsvExporter
{
public:
  static constexpr std::string_view kHeader{
    "Date,Exercise,Category,Type,Set #,Weight,Reps,Distance,Time (seconds),"
    "Time (formatted)"};

  explicit CsvExporter(std::shared_ptr<spdlog::logger> logger);

  /**
   * @brief Render @p rows (in export order) as CSV text, header included
   *
   * Set # restarts at 1 whenever the (date, name) pair changes.
   */
  static std::string toCsv(const std::vector<ExportRow>& rows);

  /**
   * @brief Write workout-export-<today>.csv into @p directory
   *
   * @throws ExportError if the store has no sets or the file cannot be written
   */
  ExportResult exportToFile(WorkoutStore& store,
                            const std::filesystem::path& directory);

  /**
   * @brief Quote @p field if it holds a delimiter, quote or line break
   */
  static std::string escapeField(std::string_view field);

  /**
   * @brief Seconds as m:ss, e.g. 90 -> "1:30"
   */
  static std::string formatDuration(int seconds);

private:
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace lift_store

#endif  // LIFT_STORE_CSV_EXPORTER_HPP
