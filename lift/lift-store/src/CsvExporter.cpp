// Ticket: 0009_csv_export

#include "lift-store/src/CsvExporter.hpp"

#include <fstream>
#include <optional>
#include <system_error>
#include <utility>

#include <fmt/format.h>

#include "lift-metrics/src/ExerciseType.hpp"
#include "lift-store/src/StoreErrors.hpp"
#include "lift-store/src/WorkoutStore.hpp"
#include "lift-utils/src/DateUtils.hpp"

namespace lift_store
{

namespace
{

template <typename T>
std::string optionalField(const std::optional<T>& value)
{
  return value ? fmt::format("{}", *value) : std::string{};
}

void appendRow(std::string& out, const std::vector<std::string>& fields)
{
  for (std::size_t i = 0; i < fields.size(); ++i)
  {
    if (i > 0)
    {
      out += ',';
    }
    out += CsvExporter::escapeField(fields[i]);
  }
  out += '\n';
}

}  // namespace

CsvExporter::CsvExporter(std::shared_ptr<spdlog::logger> logger)
  : logger_{std::move(logger)}
{
}

std::string CsvExporter::toCsv(const std::vector<ExportRow>& rows)
{
  std::string out{kHeader};
  out += '\n';

  const ExportRow* previous = nullptr;
  int setNumber = 0;
  for (const auto& row : rows)
  {
    if (previous && previous->date == row.date && previous->name == row.name)
    {
      ++setNumber;
    }
    else
    {
      setNumber = 1;
    }
    previous = &row;

    const auto& set = row.set;
    std::string formatted;
    if (set.time && *set.time > 0)
    {
      formatted = formatDuration(*set.time);
    }

    appendRow(out,
              {row.date,
               row.name,
               row.category,
               lift_metrics::displayLabel(row.type),
               std::to_string(setNumber),
               optionalField(set.weight),
               optionalField(set.reps),
               optionalField(set.distance),
               optionalField(set.time),
               formatted});
  }
  return out;
}

ExportResult CsvExporter::exportToFile(WorkoutStore& store,
                                       const std::filesystem::path& directory)
{
  auto const rows = store.exportRows();
  if (rows.empty())
  {
    throw ExportError{"No workout data to export"};
  }
  logger_->info("Exporting {} sets", rows.size());

  std::error_code ec;
  std::filesystem::create_directories(directory, ec);
  if (ec)
  {
    throw ExportError{"Cannot create export directory " + directory.string() +
                      ": " + ec.message()};
  }

  ExportResult result;
  result.fileName = "workout-export-" + lift_utils::today() + ".csv";
  result.path = directory / result.fileName;
  result.recordCount = rows.size();

  std::ofstream out{result.path, std::ios::binary | std::ios::trunc};
  if (!out)
  {
    throw ExportError{"Cannot open " + result.path.string() + " for writing"};
  }
  out << toCsv(rows);
  out.close();
  if (!out)
  {
    throw ExportError{"Failed writing " + result.path.string()};
  }

  logger_->info("Created CSV {}", result.path.string());
  return result;
}

std::string CsvExporter::escapeField(std::string_view field)
{
  if (field.find_first_of(",\"\r\n") == std::string_view::npos)
  {
    return std::string{field};
  }

  std::string quoted;
  quoted.reserve(field.size() + 2);
  quoted += '"';
  for (char c : field)
  {
    if (c == '"')
    {
      quoted += '"';
    }
    quoted += c;
  }
  quoted += '"';
  return quoted;
}

std::string CsvExporter::formatDuration(int seconds)
{
  return fmt::format("{}:{:02}", seconds / 60, seconds % 60);
}

}  // namespace lift_store
