// Ticket: 0001_workout_store_core

#ifndef LIFT_STORE_WORKOUT_STORE_HPP
#define LIFT_STORE_WORKOUT_STORE_HPP

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>

#include "lift-db/src/Database.hpp"
#include "lift-store/src/SchemaManager.hpp"
#include "lift-store/src/WorkoutStoreTypes.hpp"

namespace lift_db
{
class Statement;
}

namespace lift_store
{

/**
 * @brief Relational workout store: exercise catalog, logged exercises, sets
 *
 * Owns one SQLite connection. Construction opens (or creates) the file,
 * applies the schema and pending migrations, and seeds the default catalog
 * into an empty store when configured to.
 *
 * Ownership runs definition -> exercises -> sets. Deletes remove children
 * first inside one transaction, so no set is ever orphaned.
 *
 * Every mutating call takes an exclusive write guard. A mutating call from
 * another thread that overlaps one in progress fails with
 * ConcurrentWriteError; calls made from inside a guarded call (for example
 * from a withExclusiveAccess() callable) nest.
 *
 * Errors:
 * - ValidationError: rejected input, thrown before anything is written
 * - lift_db::DatabaseError: engine failure such as a foreign key or UNIQUE
 *   violation; the failed write leaves no change behind
 *
 * Lookups of unknown ids or names return std::nullopt or empty vectors.
 *
 * @ticket 0001_workout_store_core
 */
class WorkoutStore
{
public:
  struct Config
  {
    std::string databasePath;  // Path to the SQLite store file
    lift_db::JournalMode journalMode{lift_db::JournalMode::Delete};
    bool seedOnCreate{true};  // Seed the default catalog into an empty store
  };

  /**
   * @throws std::runtime_error if the file cannot be opened
   * @throws MigrationError if a pending migration fails
   */
  WorkoutStore(Config config, std::shared_ptr<spdlog::logger> logger);

  /**
   * @brief Construct with an explicit migration list and target version
   */
  WorkoutStore(Config config,
               std::shared_ptr<spdlog::logger> logger,
               std::vector<Migration> migrations,
               int targetVersion);

  WorkoutStore(const WorkoutStore&) = delete;
  WorkoutStore& operator=(const WorkoutStore&) = delete;
  WorkoutStore(WorkoutStore&&) = delete;
  WorkoutStore& operator=(WorkoutStore&&) = delete;

  // ========== Definitions ==========

  lift_transfer::ExerciseDefinitionRecord addDefinition(
    const NewDefinition& definition);

  /**
   * @return false if no definition has this id
   */
  bool updateDefinition(const std::string& id, const DefinitionUpdate& update);

  /**
   * @brief Delete a definition together with its exercises and their sets
   *
   * @return false if no definition has this id
   */
  bool deleteDefinition(const std::string& id);

  std::optional<lift_transfer::ExerciseDefinitionRecord> definitionById(
    const std::string& id);
  std::optional<lift_transfer::ExerciseDefinitionRecord> definitionByName(
    const std::string& name);

  /// Name ascending
  std::vector<lift_transfer::ExerciseDefinitionRecord> allDefinitions();

  std::vector<lift_transfer::ExerciseDefinitionRecord> definitionsInCategory(
    const std::string& category);

  /// Distinct categories, ascending
  std::vector<std::string> categories();

  // ========== Exercises ==========

  lift_transfer::ExerciseRecord addExercise(const std::string& definitionId,
                                            const std::string& date);

  /**
   * @brief Return the earliest exercise for (definition, date), creating one
   * if none exists
   */
  lift_transfer::ExerciseRecord findOrCreateExercise(
    const std::string& definitionId,
    const std::string& date);

  bool updateExerciseDate(const std::string& exerciseId,
                          const std::string& date);

  /**
   * @brief Delete an exercise and its sets
   */
  bool deleteExercise(const std::string& exerciseId);

  std::optional<lift_transfer::ExerciseRecord> exerciseById(
    const std::string& exerciseId);

  // ========== Sets ==========

  /**
   * @brief Log a set against an exercise
   *
   * Values must be non-negative, may only use the fields the exercise type
   * measures, and must fill at least one of them.
   */
  lift_transfer::SetRecord addSet(const std::string& exerciseId,
                                  const NewSet& set);

  /**
   * @brief Change only the engaged fields of a set
   *
   * The merged result is validated as in addSet().
   */
  bool updateSet(const std::string& setId, const SetUpdate& update);

  bool deleteSet(const std::string& setId);

  std::optional<lift_transfer::SetRecord> setById(const std::string& setId);

  /// Timestamp ascending
  std::vector<lift_transfer::SetRecord> setsForExercise(
    const std::string& exerciseId);

  /**
   * @brief Log a set under the (definition, date) exercise in one step
   *
   * Finds or creates the exercise and adds the set in one transaction, so a
   * rejected set leaves no new exercise behind.
   */
  lift_transfer::SetRecord logSet(const std::string& definitionId,
                                  const std::string& date,
                                  const NewSet& set);

  // ========== Composite queries ==========

  /**
   * @brief Exercises logged on @p date with their sets
   *
   * Exercises in creation order, sets in timestamp order. Exercises without
   * sets are included with an empty list. The best set of each exercise is
   * flagged when it beats the best set from every other date.
   */
  std::vector<ExerciseWithSets> exercisesForDate(const std::string& date);

  /// Distinct dates in [start, end], ascending
  std::vector<std::string> datesWithExercises(const std::string& start,
                                              const std::string& end);

  /**
   * @brief Most recent exercise for a name (date desc, then createdAt desc)
   */
  std::optional<ExerciseWithSets> lastExerciseByName(
    const std::string& name,
    const std::optional<std::string>& excludeDate = std::nullopt);

  /**
   * @brief Best set ever logged for a name, earliest wins on ties
   */
  std::optional<PersonalBest> personalBestForExercise(
    const std::string& name,
    const std::optional<std::string>& excludeDate = std::nullopt);

  /// Every logged exercise with its sets, date descending
  std::vector<ExerciseWithSets> allExercisesWithSets();

  /**
   * @brief Logged exercises for one name, date descending
   *
   * Optional bounds are inclusive.
   */
  std::vector<ExerciseWithSets> exercisesByName(
    const std::string& name,
    const std::optional<std::string>& start = std::nullopt,
    const std::optional<std::string>& end = std::nullopt);

  /// Distinct (name, type) of definitions that have been logged, name ascending
  std::vector<UsedExercise> usedExercises();

  /**
   * @brief Flat set history for one name, date then timestamp ascending
   */
  std::vector<HistoryRow> historyRows(
    const std::string& name,
    const std::optional<std::string>& start = std::nullopt,
    const std::optional<std::string>& end = std::nullopt);

  /**
   * @brief Every set joined with its exercise and definition
   *
   * Ordered date desc, name asc, timestamp asc.
   */
  std::vector<ExportRow> exportRows();

  int64_t definitionCount();
  int64_t exerciseCount();
  int64_t setCount();

  // ========== Maintenance ==========

  /**
   * @brief Delete every set and exercise; the catalog is kept
   */
  void clearWorkoutData();

  /**
   * @brief Wipe everything and reseed the default catalog (one transaction)
   *
   * @return Number of definitions seeded
   */
  int resetToDefaults();

  /**
   * @brief Seed the default catalog if the catalog is empty
   *
   * @return Number of definitions inserted (0 on a non-empty catalog)
   */
  int seedDefaults();

  /**
   * @brief Wipe everything and insert @p definitions (one transaction)
   *
   * Names are deduplicated case-insensitively, first occurrence wins. Any
   * failure rolls the whole replacement back and is rethrown.
   *
   * @return Number of definitions inserted
   */
  int replaceAllDefinitions(const std::vector<NewDefinition>& definitions);

  // ========== Whole-store access ==========

  /**
   * @brief Run @p fn while holding the write guard
   *
   * Used by long-running whole-store operations (backup) so no write can
   * interleave. Store calls made by @p fn on this thread are allowed.
   */
  template <typename Fn>
  auto withExclusiveAccess(Fn&& fn) -> decltype(fn())
  {
    WriteGuard guard{*this};
    return fn();
  }

  SchemaValidation validateSchema();

  int schemaVersion();

  const Config& config() const
  {
    return config_;
  }

  lift_db::Database& database()
  {
    return db_;
  }

  std::shared_ptr<spdlog::logger> getLogger() const
  {
    return logger_;
  }

private:
  class WriteGuard
  {
  public:
    explicit WriteGuard(WorkoutStore& store);
    ~WriteGuard();

    WriteGuard(const WriteGuard&) = delete;
    WriteGuard& operator=(const WriteGuard&) = delete;

  private:
    WorkoutStore& store_;
  };

  lift_transfer::ExerciseDefinitionRecord insertDefinition(
    const NewDefinition& definition);
  int insertCatalog(const std::vector<NewDefinition>& definitions);
  void deleteEverything();

  std::optional<lift_metrics::ExerciseType> typeForExercise(
    const std::string& exerciseId);

  lift_metrics::ExerciseType readType(const std::string& tag) const;
  lift_transfer::ExerciseDefinitionRecord readDefinition(
    lift_db::Statement& stmt) const;
  lift_transfer::SetRecord readSet(lift_db::Statement& stmt, int first) const;
  std::vector<ExerciseWithSets> collectExercises(lift_db::Statement& stmt) const;
  int64_t count(const std::string& table);

  Config config_;
  std::shared_ptr<spdlog::logger> logger_;
  lift_db::Database db_;
  SchemaManager schema_;

  std::atomic<std::thread::id> writer_{};
  int writeDepth_{0};  // Only touched by the writer thread
};

}  // namespace lift_store

#endif  // LIFT_STORE_WORKOUT_STORE_HPP
