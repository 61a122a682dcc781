// Ticket: 0009_csv_export
// Test: CSV rendering and export file

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <spdlog/sinks/null_sink.h>

#include "lift-store/src/CsvExporter.hpp"
#include "lift-store/src/StoreErrors.hpp"
#include "lift-store/src/WorkoutStore.hpp"
#include "lift-utils/src/DateUtils.hpp"

namespace lift_store
{
namespace test
{

using lift_metrics::ExerciseType;

namespace
{

std::vector<std::string> lines(const std::string& text)
{
  std::vector<std::string> result;
  std::istringstream in{text};
  std::string line;
  while (std::getline(in, line))
  {
    result.push_back(line);
  }
  return result;
}

ExportRow row(const std::string& date,
              const std::string& name,
              ExerciseType type,
              int64_t timestamp)
{
  ExportRow r;
  r.date = date;
  r.name = name;
  r.category = "Test";
  r.type = type;
  r.set.timestamp = timestamp;
  return r;
}

}  // namespace

class CsvExporterTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    auto nullSink = std::make_shared<spdlog::sinks::null_sink_mt>();
    logger_ = std::make_shared<spdlog::logger>("test_logger", nullSink);

    root_ = std::filesystem::temp_directory_path() /
            ("lift_csv_test_" +
             std::to_string(
               std::chrono::steady_clock::now().time_since_epoch().count()));
    std::filesystem::create_directories(root_);

    WorkoutStore::Config config;
    config.databasePath = (root_ / "workouts.db").string();
    config.seedOnCreate = false;
    store_ = std::make_unique<WorkoutStore>(config, logger_);
  }

  void TearDown() override
  {
    store_.reset();
    std::filesystem::remove_all(root_);
  }

  std::shared_ptr<spdlog::logger> logger_;
  std::filesystem::path root_;
  std::unique_ptr<WorkoutStore> store_;
};

// ========== Rendering ==========

TEST(CsvRenderTest, HeaderOnlyForNoRows)
{
  EXPECT_EQ(CsvExporter::toCsv({}), std::string{CsvExporter::kHeader} + "\n");
}

TEST(CsvRenderTest, SetNumberResetsOnDateOrNameChange)
{
  std::vector<ExportRow> rows{row("2024-02-02", "Bench", ExerciseType::WeightReps, 1),
                              row("2024-02-02", "Bench", ExerciseType::WeightReps, 2),
                              row("2024-02-02", "Squat", ExerciseType::WeightReps, 3),
                              row("2024-02-01", "Squat", ExerciseType::WeightReps, 4),
                              row("2024-02-01", "Squat", ExerciseType::WeightReps, 5)};

  auto const out = lines(CsvExporter::toCsv(rows));
  ASSERT_EQ(out.size(), 6u);
  EXPECT_EQ(out[1], "2024-02-02,Bench,Test,Weight & Reps,1,,,,,");
  EXPECT_NE(out[2].find(",2,"), std::string::npos);
  EXPECT_NE(out[3].find("Squat,Test,Weight & Reps,1,"), std::string::npos);
  EXPECT_NE(out[4].find("Squat,Test,Weight & Reps,1,"), std::string::npos);
  EXPECT_NE(out[5].find("Squat,Test,Weight & Reps,2,"), std::string::npos);
}

TEST(CsvRenderTest, NumericAndDurationColumns)
{
  auto lift = row("2024-02-01", "Squat", ExerciseType::WeightReps, 1);
  lift.set.weight = 62.5;
  lift.set.reps = 8;

  auto hold = row("2024-02-01", "Plank", ExerciseType::TimeDuration, 2);
  hold.set.time = 90;

  auto const out = lines(CsvExporter::toCsv({hold, lift}));
  ASSERT_EQ(out.size(), 3u);
  EXPECT_EQ(out[1], "2024-02-01,Plank,Test,Duration,1,,,,90,1:30");
  EXPECT_EQ(out[2], "2024-02-01,Squat,Test,Weight & Reps,1,62.5,8,,,");
}

TEST(CsvRenderTest, ZeroTimeHasNoFormattedValue)
{
  auto trial = row("2024-02-01", "Sprint", ExerciseType::TimeSpeed, 1);
  trial.set.time = 0;

  auto const out = lines(CsvExporter::toCsv({trial}));
  ASSERT_EQ(out.size(), 2u);
  EXPECT_EQ(out[1], "2024-02-01,Sprint,Test,Time Trial,1,,,,0,");
}

TEST(CsvRenderTest, EscapesDelimitersQuotesAndLineBreaks)
{
  EXPECT_EQ(CsvExporter::escapeField("plain"), "plain");
  EXPECT_EQ(CsvExporter::escapeField("Curl, EZ bar"), "\"Curl, EZ bar\"");
  EXPECT_EQ(CsvExporter::escapeField("The \"Big\" One"), "\"The \"\"Big\"\" One\"");
  EXPECT_EQ(CsvExporter::escapeField("two\nlines"), "\"two\nlines\"");
  EXPECT_EQ(CsvExporter::escapeField("cr\rhere"), "\"cr\rhere\"");
  EXPECT_EQ(CsvExporter::escapeField(""), "");
}

TEST(CsvRenderTest, FormatDuration)
{
  EXPECT_EQ(CsvExporter::formatDuration(5), "0:05");
  EXPECT_EQ(CsvExporter::formatDuration(60), "1:00");
  EXPECT_EQ(CsvExporter::formatDuration(754), "12:34");
}

// ========== Export file ==========

TEST_F(CsvExporterTest, ThreeSets_GiveThreeNumberedRows)
{
  auto const squat = store_->addDefinition(
    NewDefinition{"Squat", "Legs", ExerciseType::WeightReps, "kg", {}});
  auto const exercise = store_->addExercise(squat.id, "2024-02-01");
  for (int i = 0; i < 3; ++i)
  {
    NewSet set;
    set.weight = 100.0;
    set.reps = 5 - i;
    set.timestamp = 100 + i;
    store_->addSet(exercise.id, set);
  }

  CsvExporter exporter{logger_};
  auto const result = exporter.exportToFile(*store_, root_ / "out");

  EXPECT_EQ(result.recordCount, 3u);
  EXPECT_EQ(result.fileName, "workout-export-" + lift_utils::today() + ".csv");
  ASSERT_TRUE(std::filesystem::exists(result.path));

  std::ifstream in{result.path, std::ios::binary};
  std::stringstream buffer;
  buffer << in.rdbuf();
  auto const out = lines(buffer.str());

  ASSERT_EQ(out.size(), 4u);
  EXPECT_EQ(out[0], CsvExporter::kHeader);
  EXPECT_EQ(out[1], "2024-02-01,Squat,Legs,Weight & Reps,1,100,5,,,");
  EXPECT_EQ(out[2], "2024-02-01,Squat,Legs,Weight & Reps,2,100,4,,,");
  EXPECT_EQ(out[3], "2024-02-01,Squat,Legs,Weight & Reps,3,100,3,,,");
}

TEST_F(CsvExporterTest, ExercisesWithoutSets_ContributeNoRows)
{
  auto const squat = store_->addDefinition(
    NewDefinition{"Squat", "Legs", ExerciseType::WeightReps, "kg", {}});
  auto const bench = store_->addDefinition(
    NewDefinition{"Bench", "Chest", ExerciseType::WeightReps, "kg", {}});
  store_->addExercise(bench.id, "2024-02-01");
  auto const exercise = store_->addExercise(squat.id, "2024-02-01");
  NewSet set;
  set.weight = 100.0;
  set.reps = 5;
  store_->addSet(exercise.id, set);

  CsvExporter exporter{logger_};
  EXPECT_EQ(exporter.exportToFile(*store_, root_).recordCount, 1u);
}

TEST_F(CsvExporterTest, EmptyStore_ThrowsExportError)
{
  CsvExporter exporter{logger_};
  EXPECT_THROW(exporter.exportToFile(*store_, root_ / "out"), ExportError);
  EXPECT_FALSE(std::filesystem::exists(root_ / "out"));
}

}  // namespace test
}  // namespace lift_store
