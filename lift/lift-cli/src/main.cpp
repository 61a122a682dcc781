// Ticket: 0010_cli

#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "lift-metrics/src/Estimates.hpp"
#include "lift-metrics/src/ExerciseType.hpp"
#include "lift-metrics/src/MetricComparator.hpp"
#include "lift-store/src/BackupManager.hpp"
#include "lift-store/src/CsvExporter.hpp"
#include "lift-store/src/DefinitionImporter.hpp"
#include "lift-store/src/HistoryAggregator.hpp"
#include "lift-store/src/StoreErrors.hpp"
#include "lift-store/src/WorkoutStore.hpp"
#include "lift-utils/src/DateUtils.hpp"

/**
 * @brief Command-line front end over the workout store
 *
 * Usage: lift-cli <store.db> <command> [args]
 *
 * Log verbosity follows SPDLOG_LEVEL (e.g. SPDLOG_LEVEL=debug).
 */

namespace
{

using lift_store::WorkoutStore;

void printUsage(const char* program)
{
  std::cerr << "Usage: " << program << " <store.db> <command> [args]\n"
            << "Commands:\n"
            << "  validate\n"
            << "  categories\n"
            << "  calendar <date>\n"
            << "  day <date>\n"
            << "  log <name> <date> [weight=] [reps=] [distance=] [time=] "
               "[note=]\n"
            << "  pb <name> [exclude-date]\n"
            << "  history <name> <start> <end>\n"
            << "  backup <dir>\n"
            << "  restore <file> <safety-dir>\n"
            << "  export <dir>\n"
            << "  import <payload.json> [merge|replace]\n"
            << "  seed\n"
            << "  clear-workouts\n"
            << "  reset\n";
}

std::string describeSet(const lift_transfer::SetRecord& set)
{
  std::vector<std::string> parts;
  if (set.weight)
  {
    parts.push_back(fmt::format("{} kg", *set.weight));
  }
  if (set.reps)
  {
    parts.push_back(fmt::format("{} reps", *set.reps));
  }
  if (set.distance)
  {
    parts.push_back(fmt::format("{} km", *set.distance));
  }
  if (set.time)
  {
    parts.push_back(lift_store::CsvExporter::formatDuration(*set.time));
  }

  std::string text = fmt::format("{}", fmt::join(parts, " x "));
  if (auto const oneRepMax = lift_metrics::estimateOneRepMax(set.measurements()))
  {
    text += fmt::format(" (e1RM {:.1f} kg)", *oneRepMax);
  }
  if (set.note)
  {
    text += " \"" + *set.note + "\"";
  }
  return text;
}

std::string readFile(const std::filesystem::path& path)
{
  std::ifstream in{path, std::ios::binary};
  if (!in)
  {
    throw std::runtime_error{"Cannot read " + path.string()};
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

lift_store::NewSet parseSetArgs(const std::vector<std::string>& args)
{
  lift_store::NewSet set;
  for (const auto& arg : args)
  {
    auto const eq = arg.find('=');
    if (eq == std::string::npos)
    {
      throw lift_store::ValidationError{"Expected key=value, got '" + arg + "'"};
    }
    std::string const key = arg.substr(0, eq);
    std::string const value = arg.substr(eq + 1);

    if (key == "weight")
    {
      set.weight = std::stod(value);
    }
    else if (key == "reps")
    {
      set.reps = std::stoi(value);
    }
    else if (key == "distance")
    {
      set.distance = std::stod(value);
    }
    else if (key == "time")
    {
      set.time = std::stoi(value);
    }
    else if (key == "note")
    {
      set.note = value;
    }
    else
    {
      throw lift_store::ValidationError{"Unknown set field '" + key + "'"};
    }
  }
  return set;
}

int runValidate(WorkoutStore& store)
{
  auto const result = store.validateSchema();
  std::cout << "Schema version: " << result.storedVersion << " (target "
            << result.targetVersion << ")\n";
  for (const auto& table : result.missingTables)
  {
    std::cout << "Missing table: " << table << "\n";
  }
  std::cout << "Definitions: " << store.definitionCount()
            << ", exercises: " << store.exerciseCount()
            << ", sets: " << store.setCount() << "\n";
  return result.valid ? 0 : 1;
}

int runCategories(WorkoutStore& store)
{
  for (const auto& category : store.categories())
  {
    std::cout << category << "\n";
    for (const auto& definition : store.definitionsInCategory(category))
    {
      std::cout << "  " << definition.name << " ["
                << lift_metrics::displayLabel(definition.type) << ", "
                << definition.unit << "]\n";
    }
  }
  return 0;
}

int runCalendar(WorkoutStore& store, const std::string& date)
{
  auto const [start, end] = lift_utils::calendarRange(date);
  for (const auto& day : store.datesWithExercises(start, end))
  {
    std::cout << day << "\n";
  }
  return 0;
}

int runDay(WorkoutStore& store, const std::string& date)
{
  auto const exercises = store.exercisesForDate(date);
  if (exercises.empty())
  {
    std::cout << "No exercises on " << date << "\n";
    return 0;
  }

  for (const auto& exercise : exercises)
  {
    std::cout << exercise.name << " (" << exercise.category << ")\n";
    int number = 1;
    for (const auto& logged : exercise.sets)
    {
      std::cout << "  " << number++ << ". " << describeSet(logged.set)
                << (logged.isPersonalBest ? "  PB" : "") << "\n";
    }
  }
  return 0;
}

int runLog(WorkoutStore& store,
           const std::string& name,
           const std::string& date,
           const std::vector<std::string>& fields)
{
  auto const definition = store.definitionByName(name);
  if (!definition)
  {
    std::cerr << "Unknown exercise: " << name << "\n";
    return 1;
  }

  auto const values = parseSetArgs(fields);
  auto const previous = store.personalBestForExercise(name);
  auto const set = store.logSet(definition->id, date, values);

  if (!lift_metrics::isCompleteSet(definition->type, set.measurements()))
  {
    std::cout << "Note: set is incomplete for "
              << lift_metrics::displayLabel(definition->type) << "\n";
  }

  std::optional<lift_metrics::Measurements> previousBest;
  if (previous)
  {
    previousBest = previous->set.measurements();
  }
  bool const pb = lift_metrics::isNewPersonalBest(
    set.measurements(), previousBest, definition->type);

  std::cout << "Logged " << describeSet(set) << (pb ? "  NEW PB" : "") << "\n";
  return 0;
}

int runPersonalBest(WorkoutStore& store,
                    const std::string& name,
                    const std::optional<std::string>& excludeDate)
{
  auto const best = store.personalBestForExercise(name, excludeDate);
  if (!best)
  {
    std::cout << "No sets logged for " << name << "\n";
    return 0;
  }
  std::cout << name << ": " << describeSet(best->set) << " on " << best->date
            << "\n"
            << lift_metrics::comparisonDescription(best->type) << "\n";
  return 0;
}

int runHistory(WorkoutStore& store,
               const std::shared_ptr<spdlog::logger>& logger,
               const std::string& name,
               const std::string& start,
               const std::string& end)
{
  lift_store::HistoryAggregator history{store, logger};
  std::cout << "date,best_weight,best_reps,best_distance,best_time,volume,sets\n";
  for (const auto& point : history.exerciseHistoryForChart(name, start, end))
  {
    auto const field = [&](lift_store::ChartMetric metric)
    {
      auto const value = lift_store::metricValue(point, metric);
      return value ? fmt::format("{}", *value) : std::string{};
    };
    std::cout << point.date << "," << field(lift_store::ChartMetric::BestWeight)
              << "," << field(lift_store::ChartMetric::BestReps) << ","
              << field(lift_store::ChartMetric::BestDistance) << ","
              << field(lift_store::ChartMetric::BestTime) << ","
              << field(lift_store::ChartMetric::TotalVolume) << ","
              << field(lift_store::ChartMetric::SetCount) << "\n";
  }
  return 0;
}

int runImport(WorkoutStore& store,
              const std::shared_ptr<spdlog::logger>& logger,
              const std::filesystem::path& payload,
              const std::string& mode)
{
  lift_store::ImportMode importMode;
  if (mode == "merge")
  {
    importMode = lift_store::ImportMode::Merge;
  }
  else if (mode == "replace")
  {
    importMode = lift_store::ImportMode::Replace;
  }
  else
  {
    std::cerr << "Unknown import mode: " << mode << "\n";
    return 1;
  }

  lift_store::DefinitionImporter importer{store, logger};
  auto const records = lift_store::DefinitionImporter::parsePayload(readFile(payload));
  auto const summary = importer.apply(records, importMode);

  std::cout << "Added " << summary.added << ", already existing "
            << summary.alreadyExisting << ", failed " << summary.failed << "\n";
  for (const auto& name : summary.failedNames)
  {
    std::cout << "  failed: " << name << "\n";
  }
  return summary.failed == 0 ? 0 : 2;
}

}  // namespace

int main(int argc, char* argv[])
{
  if (argc < 3)
  {
    printUsage(argv[0]);
    return 1;
  }

  spdlog::cfg::load_env_levels();
  auto logger = spdlog::stderr_color_mt("lift");
  logger->set_level(spdlog::get_level());

  const std::string dbPath = argv[1];
  const std::string command = argv[2];
  std::vector<std::string> const args(argv + 3, argv + argc);

  auto const need = [&](std::size_t count)
  {
    if (args.size() < count)
    {
      printUsage(argv[0]);
      return false;
    }
    return true;
  };

  try
  {
    // Restore replaces the file, so the store must not be open
    if (command == "restore")
    {
      if (!need(2))
      {
        return 1;
      }
      lift_store::BackupManager::Config config;
      config.storePath = dbPath;
      config.safetyDirectory = args[1];
      lift_store::BackupManager backups{config, logger};
      auto const result = backups.restoreFromBackup(args[0]);
      if (result.safetyCopy)
      {
        std::cout << "Previous store saved to " << result.safetyCopy->string()
                  << "\n";
      }
      std::cout << "Restored " << dbPath << " ("
                << lift_store::formatFileSize(backups.storeSize()) << ")\n";
      return 0;
    }

    WorkoutStore::Config config;
    config.databasePath = dbPath;
    WorkoutStore store{config, logger};

    if (command == "validate")
    {
      return runValidate(store);
    }
    if (command == "categories")
    {
      return runCategories(store);
    }
    if (command == "calendar")
    {
      return need(1) ? runCalendar(store, args[0]) : 1;
    }
    if (command == "day")
    {
      return need(1) ? runDay(store, args[0]) : 1;
    }
    if (command == "log")
    {
      if (!need(2))
      {
        return 1;
      }
      return runLog(store,
                    args[0],
                    args[1],
                    std::vector<std::string>(args.begin() + 2, args.end()));
    }
    if (command == "pb")
    {
      if (!need(1))
      {
        return 1;
      }
      std::optional<std::string> exclude;
      if (args.size() > 1)
      {
        exclude = args[1];
      }
      return runPersonalBest(store, args[0], exclude);
    }
    if (command == "history")
    {
      return need(3) ? runHistory(store, logger, args[0], args[1], args[2]) : 1;
    }
    if (command == "backup")
    {
      if (!need(1))
      {
        return 1;
      }
      lift_store::BackupManager::Config backupConfig;
      backupConfig.storePath = dbPath;
      backupConfig.backupDirectory = args[0];
      lift_store::BackupManager backups{backupConfig, logger};
      auto const result = backups.createBackup(store);
      std::cout << "Backup written to " << result.path.string() << " ("
                << lift_store::formatFileSize(result.fileSize) << ")\n";
      return 0;
    }
    if (command == "export")
    {
      if (!need(1))
      {
        return 1;
      }
      lift_store::CsvExporter exporter{logger};
      auto const result = exporter.exportToFile(store, args[0]);
      std::cout << "Exported " << result.recordCount << " sets to "
                << result.path.string() << "\n";
      return 0;
    }
    if (command == "import")
    {
      if (!need(1))
      {
        return 1;
      }
      return runImport(store, logger, args[0], args.size() > 1 ? args[1] : "merge");
    }
    if (command == "seed")
    {
      std::cout << "Seeded " << store.seedDefaults() << " definitions\n";
      return 0;
    }
    if (command == "clear-workouts")
    {
      store.clearWorkoutData();
      std::cout << "Cleared all exercises and sets\n";
      return 0;
    }
    if (command == "reset")
    {
      std::cout << "Reset to " << store.resetToDefaults()
                << " default definitions\n";
      return 0;
    }

    std::cerr << "Unknown command: " << command << "\n";
    printUsage(argv[0]);
    return 1;
  }
  catch (const std::exception& e)
  {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
