// Ticket: 0008_backup_restore
// Test: backup, validation and restore of the store file

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <spdlog/sinks/null_sink.h>

#include "lift-store/src/BackupManager.hpp"
#include "lift-store/src/StoreErrors.hpp"
#include "lift-store/src/WorkoutStore.hpp"

namespace lift_store
{
namespace test
{

using lift_metrics::ExerciseType;

class BackupManagerTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    auto nullSink = std::make_shared<spdlog::sinks::null_sink_mt>();
    logger_ = std::make_shared<spdlog::logger>("test_logger", nullSink);

    root_ = std::filesystem::temp_directory_path() /
            ("lift_backup_test_" +
             std::to_string(
               std::chrono::steady_clock::now().time_since_epoch().count()));
    std::filesystem::create_directories(root_);

    storeConfig_.databasePath = (root_ / "workouts.db").string();

    backupConfig_.storePath = storeConfig_.databasePath;
    backupConfig_.backupDirectory = root_ / "backups";
    backupConfig_.safetyDirectory = root_ / "safety";
  }

  void TearDown() override
  {
    std::filesystem::remove_all(root_);
  }

  std::unique_ptr<WorkoutStore> openStore()
  {
    return std::make_unique<WorkoutStore>(storeConfig_, logger_);
  }

  static void logWorkout(WorkoutStore& store, const std::string& date)
  {
    auto definition = store.definitionByName("Squat");
    if (!definition)
    {
      definition = store.addDefinition(
        NewDefinition{"Squat", "Legs", ExerciseType::WeightReps, "kg", {}});
    }
    auto const exercise = store.findOrCreateExercise(definition->id, date);
    NewSet set;
    set.weight = 100.0;
    set.reps = 5;
    store.addSet(exercise.id, set);
  }

  // Flattened view of every row in the three data tables
  static std::vector<std::string> snapshot(WorkoutStore& store)
  {
    std::vector<std::string> rows;
    for (const auto& definition : store.allDefinitions())
    {
      rows.push_back(definition.id + "|" + definition.name + "|" +
                     definition.category);
    }
    for (const auto& exercise : store.allExercisesWithSets())
    {
      rows.push_back(exercise.exercise.id + "|" + exercise.exercise.date);
      for (const auto& logged : exercise.sets)
      {
        rows.push_back(logged.set.id + "|" +
                       std::to_string(logged.set.timestamp));
      }
    }
    return rows;
  }

  static void writeFile(const std::filesystem::path& path,
                        const std::string& contents)
  {
    std::ofstream out{path, std::ios::binary};
    out << contents;
  }

  std::shared_ptr<spdlog::logger> logger_;
  std::filesystem::path root_;
  WorkoutStore::Config storeConfig_;
  BackupManager::Config backupConfig_;
};

// ========== Backup ==========

TEST_F(BackupManagerTest, CreateBackup_WritesTimestampedCopy)
{
  auto store = openStore();
  logWorkout(*store, "2024-06-01");

  BackupManager backups{backupConfig_, logger_};
  auto const result = backups.createBackup(*store);

  EXPECT_TRUE(std::filesystem::exists(result.path));
  EXPECT_EQ(result.path.parent_path(), backupConfig_.backupDirectory);
  EXPECT_EQ(result.fileName.rfind("workout-backup-", 0), 0u);
  EXPECT_EQ(result.path.extension(), ".db");
  EXPECT_GE(result.fileSize, backupConfig_.minimumStoreSize);
  EXPECT_NO_THROW(backups.validateBackupFile(result.path));
}

TEST_F(BackupManagerTest, CreateBackup_MissingTables_FailsValidation)
{
  auto store = openStore();
  store->database().execute("DROP TABLE sets;");

  BackupManager backups{backupConfig_, logger_};
  try
  {
    backups.createBackup(*store);
    FAIL() << "Expected BackupError";
  }
  catch (const BackupError& e)
  {
    EXPECT_EQ(e.reason(), BackupError::Reason::ValidationFailed);
  }
  EXPECT_FALSE(std::filesystem::exists(backupConfig_.backupDirectory));
}

TEST_F(BackupManagerTest, CreateBackup_ExistingName_IsNotOverwritten)
{
  auto store = openStore();
  logWorkout(*store, "2024-06-01");

  // Occupy every name the backup could take while this test runs
  std::filesystem::create_directories(backupConfig_.backupDirectory);
  auto const now = std::chrono::system_clock::now();
  std::vector<std::filesystem::path> taken;
  for (int offset = 0; offset < 3; ++offset)
  {
    taken.push_back(backupConfig_.backupDirectory /
                    BackupManager::backupFileName(now + std::chrono::seconds{offset}));
    writeFile(taken.back(), "earlier backup");
  }

  BackupManager backups{backupConfig_, logger_};
  try
  {
    backups.createBackup(*store);
    FAIL() << "Expected BackupError";
  }
  catch (const BackupError& e)
  {
    EXPECT_EQ(e.reason(), BackupError::Reason::CopyFailed);
  }

  for (const auto& path : taken)
  {
    EXPECT_EQ(std::filesystem::file_size(path), std::string{"earlier backup"}.size());
  }
}

TEST_F(BackupManagerTest, BackupFileName_UsesUtcTimestamp)
{
  using namespace std::chrono;
  auto const when = sys_days{year{2024} / January / 2} + hours{3} +
                    minutes{4} + seconds{5};
  EXPECT_EQ(BackupManager::backupFileName(time_point_cast<system_clock::duration>(when)),
            "workout-backup-2024-01-02T03-04-05.db");
}

// ========== Restore ==========

TEST_F(BackupManagerTest, BackupThenRestore_ReproducesRows)
{
  BackupManager backups{backupConfig_, logger_};
  std::vector<std::string> before;
  std::filesystem::path backupPath;
  {
    auto store = openStore();
    logWorkout(*store, "2024-06-01");
    logWorkout(*store, "2024-06-02");
    before = snapshot(*store);
    backupPath = backups.createBackup(*store).path;
  }

  auto const result = backups.restoreFromBackup(backupPath);
  EXPECT_TRUE(result.requiresRestart);

  auto reopened = openStore();
  EXPECT_EQ(snapshot(*reopened), before);
}

TEST_F(BackupManagerTest, Restore_DiscardsLaterChangesAndKeepsSafetyCopy)
{
  BackupManager backups{backupConfig_, logger_};
  std::vector<std::string> before;
  std::filesystem::path backupPath;
  {
    auto store = openStore();
    logWorkout(*store, "2024-06-01");
    before = snapshot(*store);
    backupPath = backups.createBackup(*store).path;

    logWorkout(*store, "2024-06-05");
    ASSERT_NE(snapshot(*store), before);
  }

  auto const result = backups.restoreFromBackup(backupPath);
  ASSERT_TRUE(result.safetyCopy.has_value());
  EXPECT_TRUE(std::filesystem::exists(*result.safetyCopy));
  EXPECT_EQ(result.safetyCopy->parent_path(), backupConfig_.safetyDirectory);
  EXPECT_FALSE(
    std::filesystem::exists(backupConfig_.storePath.string() + ".restore-tmp"));

  auto reopened = openStore();
  EXPECT_EQ(snapshot(*reopened), before);
}

TEST_F(BackupManagerTest, Restore_OldJournalMovesBesideSafetyCopy)
{
  BackupManager backups{backupConfig_, logger_};
  std::vector<std::string> before;
  std::filesystem::path backupPath;
  {
    auto store = openStore();
    logWorkout(*store, "2024-06-01");
    before = snapshot(*store);
    backupPath = backups.createBackup(*store).path;
  }
  auto const journal = backupConfig_.storePath.string() + "-journal";
  writeFile(journal, "old journal");

  auto const result = backups.restoreFromBackup(backupPath);
  ASSERT_TRUE(result.safetyCopy.has_value());
  EXPECT_FALSE(std::filesystem::exists(journal));
  EXPECT_FALSE(std::filesystem::exists(journal + ".pre-restore"));

  auto const keptJournal = result.safetyCopy->string() + "-journal";
  ASSERT_TRUE(std::filesystem::exists(keptJournal));
  EXPECT_EQ(std::filesystem::file_size(keptJournal),
            std::string{"old journal"}.size());

  auto reopened = openStore();
  EXPECT_EQ(snapshot(*reopened), before);
}

TEST_F(BackupManagerTest, Restore_FailedRename_KeepsOldJournal)
{
  BackupManager backups{backupConfig_, logger_};
  std::filesystem::path backupPath;
  {
    auto store = openStore();
    logWorkout(*store, "2024-06-01");
    backupPath = backups.createBackup(*store).path;
  }

  // A non-empty directory at the store path cannot be renamed over
  std::filesystem::remove(backupConfig_.storePath);
  std::filesystem::create_directories(backupConfig_.storePath);
  writeFile(backupConfig_.storePath / "occupied", "x");
  auto const journal = backupConfig_.storePath.string() + "-journal";
  writeFile(journal, "hot journal");

  try
  {
    backups.restoreFromBackup(backupPath);
    FAIL() << "Expected BackupError";
  }
  catch (const BackupError& e)
  {
    EXPECT_EQ(e.reason(), BackupError::Reason::CopyFailed);
  }

  ASSERT_TRUE(std::filesystem::exists(journal));
  EXPECT_EQ(std::filesystem::file_size(journal), std::string{"hot journal"}.size());
  EXPECT_FALSE(std::filesystem::exists(journal + ".pre-restore"));
  EXPECT_FALSE(
    std::filesystem::exists(backupConfig_.storePath.string() + ".restore-tmp"));
}

TEST_F(BackupManagerTest, Restore_MissingSource_ReportsSourceMissing)
{
  { openStore(); }
  auto const sizeBefore = std::filesystem::file_size(backupConfig_.storePath);

  BackupManager backups{backupConfig_, logger_};
  try
  {
    backups.restoreFromBackup(root_ / "nope.db");
    FAIL() << "Expected BackupError";
  }
  catch (const BackupError& e)
  {
    EXPECT_EQ(e.reason(), BackupError::Reason::SourceMissing);
  }
  EXPECT_EQ(std::filesystem::file_size(backupConfig_.storePath), sizeBefore);
  EXPECT_FALSE(std::filesystem::exists(backupConfig_.safetyDirectory));
}

TEST_F(BackupManagerTest, Restore_TooSmallFile_FailsValidation)
{
  auto const candidate = root_ / "tiny.db";
  writeFile(candidate, "SQLite format 3");

  BackupManager backups{backupConfig_, logger_};
  try
  {
    backups.restoreFromBackup(candidate);
    FAIL() << "Expected BackupError";
  }
  catch (const BackupError& e)
  {
    EXPECT_EQ(e.reason(), BackupError::Reason::ValidationFailed);
  }
}

TEST_F(BackupManagerTest, Restore_WrongHeader_FailsValidation)
{
  auto const candidate = root_ / "notes.db";
  writeFile(candidate, std::string(8192, 'x'));

  BackupManager backups{backupConfig_, logger_};
  try
  {
    backups.validateBackupFile(candidate);
    FAIL() << "Expected BackupError";
  }
  catch (const BackupError& e)
  {
    EXPECT_EQ(e.reason(), BackupError::Reason::ValidationFailed);
  }
}

TEST_F(BackupManagerTest, Restore_WithoutExistingStore_HasNoSafetyCopy)
{
  BackupManager backups{backupConfig_, logger_};
  std::filesystem::path backupPath;
  {
    auto store = openStore();
    logWorkout(*store, "2024-06-01");
    backupPath = backups.createBackup(*store).path;
  }
  std::filesystem::remove(backupConfig_.storePath);

  auto const result = backups.restoreFromBackup(backupPath);
  EXPECT_FALSE(result.safetyCopy.has_value());
  EXPECT_TRUE(std::filesystem::exists(backupConfig_.storePath));
}

TEST_F(BackupManagerTest, StoreSize_ZeroWhenMissing)
{
  BackupManager backups{backupConfig_, logger_};
  EXPECT_EQ(backups.storeSize(), 0u);
  { openStore(); }
  EXPECT_GT(backups.storeSize(), 0u);
}

// ========== Formatting ==========

TEST(FormatFileSizeTest, ScalesUnits)
{
  EXPECT_EQ(formatFileSize(0), "0 B");
  EXPECT_EQ(formatFileSize(512), "512 B");
  EXPECT_EQ(formatFileSize(1536), "1.5 KB");
  EXPECT_EQ(formatFileSize(4096), "4 KB");
  EXPECT_EQ(formatFileSize(1048576), "1 MB");
  EXPECT_EQ(formatFileSize(1288490189), "1.2 GB");
}

}  // namespace test
}  // namespace lift_store
