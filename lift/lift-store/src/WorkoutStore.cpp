// Ticket: 0001_workout_store_core

#include "lift-store/src/WorkoutStore.hpp"

#include <set>
#include <utility>

#include "lift-db/src/Statement.hpp"
#include "lift-metrics/src/MetricComparator.hpp"
#include "lift-store/src/SeedCatalog.hpp"
#include "lift-store/src/StoreErrors.hpp"
#include "lift-utils/src/DateUtils.hpp"
#include "lift-utils/src/IdUtils.hpp"
#include "lift-utils/src/StringUtils.hpp"

namespace lift_store
{

namespace
{

// Column order shared by every query that goes through collectExercises()
constexpr const char* kExerciseJoinColumns =
  "SELECT e.id, e.definitionId, e.date, e.createdAt, d.name, d.category, "
  "d.type, s.id, s.exerciseId, s.weight, s.reps, s.distance, s.time, s.note, "
  "s.timestamp "
  "FROM exercises e "
  "JOIN exercise_definitions d ON e.definitionId = d.id "
  "LEFT JOIN sets s ON s.exerciseId = e.id ";

constexpr const char* kDefinitionColumns =
  "SELECT id, name, category, type, unit, description, createdAt "
  "FROM exercise_definitions ";

constexpr const char* kSetColumns =
  "SELECT id, exerciseId, weight, reps, distance, time, note, timestamp "
  "FROM sets ";

void requireText(const std::string& value, const char* field)
{
  if (lift_utils::trim(value).empty())
  {
    throw ValidationError{std::string{field} + " must not be empty"};
  }
}

void requireDate(const std::string& date)
{
  if (!lift_utils::isIsoDate(date))
  {
    throw ValidationError{"Invalid date '" + date + "', expected YYYY-MM-DD"};
  }
}

template <typename T>
void requireNonNegative(const std::optional<T>& value, const char* field)
{
  if (value && *value < 0)
  {
    throw ValidationError{std::string{field} + " must not be negative"};
  }
}

void validateDefinition(const NewDefinition& definition)
{
  requireText(definition.name, "name");
  requireText(definition.category, "category");
  requireText(definition.unit, "unit");
}

void validateSetValues(lift_metrics::ExerciseType type,
                       const lift_metrics::Measurements& m)
{
  requireNonNegative(m.weight, "weight");
  requireNonNegative(m.reps, "reps");
  requireNonNegative(m.distance, "distance");
  requireNonNegative(m.time, "time");

  lift_metrics::FieldMask const mask = lift_metrics::requiredFields(type);
  auto const label = lift_metrics::toString(type);

  if ((m.weight && !mask.weight) || (m.reps && !mask.reps) ||
      (m.distance && !mask.distance) || (m.time && !mask.time))
  {
    throw ValidationError{"Set has a field that " + label +
                          " exercises do not measure"};
  }

  if (!(m.weight || m.reps || m.distance || m.time))
  {
    throw ValidationError{"Set must record at least one value for " + label};
  }
}

}  // namespace

// ========== Write guard ==========

WorkoutStore::WriteGuard::WriteGuard(WorkoutStore& store) : store_{store}
{
  auto const self = std::this_thread::get_id();
  if (store_.writer_.load() == self)
  {
    ++store_.writeDepth_;
    return;
  }

  std::thread::id idle{};
  if (!store_.writer_.compare_exchange_strong(idle, self))
  {
    store_.logger_->warn("Rejected write: another write is in progress");
    throw ConcurrentWriteError{
      "Another write to " + store_.config_.databasePath + " is in progress"};
  }
  store_.writeDepth_ = 1;
}

WorkoutStore::WriteGuard::~WriteGuard()
{
  if (--store_.writeDepth_ == 0)
  {
    store_.writer_.store(std::thread::id{});
  }
}

// ========== Construction ==========

WorkoutStore::WorkoutStore(Config config, std::shared_ptr<spdlog::logger> logger)
  : WorkoutStore{std::move(config),
                 std::move(logger),
                 SchemaManager::builtinMigrations(),
                 SchemaManager::kCurrentVersion}
{
}

WorkoutStore::WorkoutStore(Config config,
                           std::shared_ptr<spdlog::logger> logger,
                           std::vector<Migration> migrations,
                           int targetVersion)
  : config_{std::move(config)},
    logger_{std::move(logger)},
    db_{config_.databasePath,
        logger_,
        lift_db::DBOpenCondition::OpenCreate,
        config_.journalMode},
    schema_{db_, logger_, std::move(migrations), targetVersion}
{
  int const applied = schema_.initialize();
  if (applied > 0)
  {
    logger_->info("Applied {} migration(s) to {}", applied, config_.databasePath);
  }

  if (config_.seedOnCreate)
  {
    seedDefaults();
  }
}

// ========== Definitions ==========

lift_transfer::ExerciseDefinitionRecord WorkoutStore::addDefinition(
  const NewDefinition& definition)
{
  WriteGuard guard{*this};
  return insertDefinition(definition);
}

bool WorkoutStore::updateDefinition(const std::string& id,
                                    const DefinitionUpdate& update)
{
  WriteGuard guard{*this};

  std::vector<std::string> assignments;
  if (update.name)
  {
    requireText(*update.name, "name");
    assignments.emplace_back("name = ?");
  }
  if (update.category)
  {
    requireText(*update.category, "category");
    assignments.emplace_back("category = ?");
  }
  if (update.type)
  {
    assignments.emplace_back("type = ?");
  }
  if (update.unit)
  {
    requireText(*update.unit, "unit");
    assignments.emplace_back("unit = ?");
  }
  if (update.description)
  {
    assignments.emplace_back("description = ?");
  }

  if (assignments.empty())
  {
    return definitionById(id).has_value();
  }

  std::string sql = "UPDATE exercise_definitions SET ";
  for (std::size_t i = 0; i < assignments.size(); ++i)
  {
    sql += (i == 0 ? "" : ", ") + assignments[i];
  }
  sql += " WHERE id = ?;";

  lift_db::Statement stmt{db_, sql};
  int index = 1;
  if (update.name)
  {
    stmt.bind(index++, lift_utils::trim(*update.name));
  }
  if (update.category)
  {
    stmt.bind(index++, lift_utils::trim(*update.category));
  }
  if (update.type)
  {
    stmt.bind(index++, lift_metrics::toString(*update.type));
  }
  if (update.unit)
  {
    stmt.bind(index++, *update.unit);
  }
  if (update.description)
  {
    stmt.bind(index++, *update.description);
  }
  stmt.bind(index, id);
  stmt.run();

  return db_.changes() > 0;
}

bool WorkoutStore::deleteDefinition(const std::string& id)
{
  WriteGuard guard{*this};

  bool deleted = false;
  db_.withTransaction(
    [&]
    {
      lift_db::Statement sets{
        db_,
        "DELETE FROM sets WHERE exerciseId IN "
        "(SELECT id FROM exercises WHERE definitionId = ?);"};
      sets.bind(1, id);
      sets.run();

      lift_db::Statement exercises{db_,
                                   "DELETE FROM exercises WHERE definitionId = ?;"};
      exercises.bind(1, id);
      exercises.run();

      lift_db::Statement definition{
        db_, "DELETE FROM exercise_definitions WHERE id = ?;"};
      definition.bind(1, id);
      definition.run();
      deleted = db_.changes() > 0;
    });

  if (deleted)
  {
    logger_->debug("Deleted definition {}", id);
  }
  return deleted;
}

std::optional<lift_transfer::ExerciseDefinitionRecord>
WorkoutStore::definitionById(const std::string& id)
{
  lift_db::Statement stmt{db_, std::string{kDefinitionColumns} + "WHERE id = ?;"};
  stmt.bind(1, id);
  if (!stmt.step())
  {
    return std::nullopt;
  }
  return readDefinition(stmt);
}

std::optional<lift_transfer::ExerciseDefinitionRecord>
WorkoutStore::definitionByName(const std::string& name)
{
  lift_db::Statement stmt{db_,
                         std::string{kDefinitionColumns} +
                           "WHERE name = ? LIMIT 1;"};
  stmt.bind(1, name);
  if (!stmt.step())
  {
    return std::nullopt;
  }
  return readDefinition(stmt);
}

std::vector<lift_transfer::ExerciseDefinitionRecord> WorkoutStore::allDefinitions()
{
  lift_db::Statement stmt{db_,
                         std::string{kDefinitionColumns} + "ORDER BY name ASC;"};

  std::vector<lift_transfer::ExerciseDefinitionRecord> result;
  while (stmt.step())
  {
    result.push_back(readDefinition(stmt));
  }
  return result;
}

std::vector<lift_transfer::ExerciseDefinitionRecord>
WorkoutStore::definitionsInCategory(const std::string& category)
{
  lift_db::Statement stmt{
    db_, std::string{kDefinitionColumns} + "WHERE category = ? ORDER BY name ASC;"};
  stmt.bind(1, category);

  std::vector<lift_transfer::ExerciseDefinitionRecord> result;
  while (stmt.step())
  {
    result.push_back(readDefinition(stmt));
  }
  return result;
}

std::vector<std::string> WorkoutStore::categories()
{
  lift_db::Statement stmt{
    db_,
    "SELECT DISTINCT category FROM exercise_definitions ORDER BY category ASC;"};

  std::vector<std::string> result;
  while (stmt.step())
  {
    result.push_back(stmt.columnText(0));
  }
  return result;
}

// ========== Exercises ==========

lift_transfer::ExerciseRecord WorkoutStore::addExercise(
  const std::string& definitionId,
  const std::string& date)
{
  WriteGuard guard{*this};
  requireDate(date);

  lift_transfer::ExerciseRecord record;
  record.id = lift_utils::newId();
  record.definition_id = definitionId;
  record.date = date;
  record.created_at = lift_utils::nowMillis();

  lift_db::Statement stmt{
    db_,
    "INSERT INTO exercises (id, definitionId, date, createdAt) "
    "VALUES (?, ?, ?, ?);"};
  stmt.bind(1, record.id);
  stmt.bind(2, record.definition_id);
  stmt.bind(3, record.date);
  stmt.bind(4, record.created_at);
  stmt.run();

  logger_->debug("Added exercise {} on {}", record.id, record.date);
  return record;
}

lift_transfer::ExerciseRecord WorkoutStore::findOrCreateExercise(
  const std::string& definitionId,
  const std::string& date)
{
  WriteGuard guard{*this};
  requireDate(date);

  lift_db::Statement stmt{
    db_,
    "SELECT id, definitionId, date, createdAt FROM exercises "
    "WHERE definitionId = ? AND date = ? "
    "ORDER BY createdAt ASC, rowid ASC LIMIT 1;"};
  stmt.bind(1, definitionId);
  stmt.bind(2, date);
  if (stmt.step())
  {
    lift_transfer::ExerciseRecord record;
    record.id = stmt.columnText(0);
    record.definition_id = stmt.columnText(1);
    record.date = stmt.columnText(2);
    record.created_at = stmt.columnInt64(3);
    return record;
  }

  return addExercise(definitionId, date);
}

bool WorkoutStore::updateExerciseDate(const std::string& exerciseId,
                                      const std::string& date)
{
  WriteGuard guard{*this};
  requireDate(date);

  lift_db::Statement stmt{db_, "UPDATE exercises SET date = ? WHERE id = ?;"};
  stmt.bind(1, date);
  stmt.bind(2, exerciseId);
  stmt.run();
  return db_.changes() > 0;
}

bool WorkoutStore::deleteExercise(const std::string& exerciseId)
{
  WriteGuard guard{*this};

  bool deleted = false;
  db_.withTransaction(
    [&]
    {
      lift_db::Statement sets{db_, "DELETE FROM sets WHERE exerciseId = ?;"};
      sets.bind(1, exerciseId);
      sets.run();

      lift_db::Statement exercise{db_, "DELETE FROM exercises WHERE id = ?;"};
      exercise.bind(1, exerciseId);
      exercise.run();
      deleted = db_.changes() > 0;
    });
  return deleted;
}

std::optional<lift_transfer::ExerciseRecord> WorkoutStore::exerciseById(
  const std::string& exerciseId)
{
  lift_db::Statement stmt{
    db_, "SELECT id, definitionId, date, createdAt FROM exercises WHERE id = ?;"};
  stmt.bind(1, exerciseId);
  if (!stmt.step())
  {
    return std::nullopt;
  }

  lift_transfer::ExerciseRecord record;
  record.id = stmt.columnText(0);
  record.definition_id = stmt.columnText(1);
  record.date = stmt.columnText(2);
  record.created_at = stmt.columnInt64(3);
  return record;
}

// ========== Sets ==========

lift_transfer::SetRecord WorkoutStore::addSet(const std::string& exerciseId,
                                              const NewSet& set)
{
  WriteGuard guard{*this};

  lift_metrics::Measurements const values{
    set.weight, set.reps, set.distance, set.time};

  // An unknown exercise is left to the foreign key to reject
  auto const type = typeForExercise(exerciseId);
  if (type)
  {
    validateSetValues(*type, values);
  }
  else
  {
    requireNonNegative(values.weight, "weight");
    requireNonNegative(values.reps, "reps");
    requireNonNegative(values.distance, "distance");
    requireNonNegative(values.time, "time");
  }

  lift_transfer::SetRecord record;
  record.id = lift_utils::newId();
  record.exercise_id = exerciseId;
  record.weight = set.weight;
  record.reps = set.reps;
  record.distance = set.distance;
  record.time = set.time;
  record.note = set.note;
  record.timestamp = set.timestamp.value_or(lift_utils::nowMillis());

  lift_db::Statement stmt{
    db_,
    "INSERT INTO sets (id, exerciseId, weight, reps, distance, time, note, "
    "timestamp) VALUES (?, ?, ?, ?, ?, ?, ?, ?);"};
  stmt.bind(1, record.id);
  stmt.bind(2, record.exercise_id);
  stmt.bind(3, record.weight);
  stmt.bind(4, record.reps);
  stmt.bind(5, record.distance);
  stmt.bind(6, record.time);
  stmt.bind(7, record.note);
  stmt.bind(8, record.timestamp);
  stmt.run();

  return record;
}

lift_transfer::SetRecord WorkoutStore::logSet(const std::string& definitionId,
                                              const std::string& date,
                                              const NewSet& set)
{
  WriteGuard guard{*this};

  lift_transfer::SetRecord logged;
  db_.withTransaction(
    [&]
    {
      auto const exercise = findOrCreateExercise(definitionId, date);
      logged = addSet(exercise.id, set);
    });
  return logged;
}

bool WorkoutStore::updateSet(const std::string& setId, const SetUpdate& update)
{
  WriteGuard guard{*this};

  auto existing = setById(setId);
  if (!existing)
  {
    return false;
  }

  lift_metrics::Measurements merged = existing->measurements();
  if (update.weight)
  {
    merged.weight = update.weight;
  }
  if (update.reps)
  {
    merged.reps = update.reps;
  }
  if (update.distance)
  {
    merged.distance = update.distance;
  }
  if (update.time)
  {
    merged.time = update.time;
  }

  auto const type = typeForExercise(existing->exercise_id);
  if (type)
  {
    validateSetValues(*type, merged);
  }

  lift_db::Statement stmt{
    db_,
    "UPDATE sets SET weight = ?, reps = ?, distance = ?, time = ?, note = ? "
    "WHERE id = ?;"};
  stmt.bind(1, merged.weight);
  stmt.bind(2, merged.reps);
  stmt.bind(3, merged.distance);
  stmt.bind(4, merged.time);
  stmt.bind(5, update.note ? update.note : existing->note);
  stmt.bind(6, setId);
  stmt.run();

  return db_.changes() > 0;
}

bool WorkoutStore::deleteSet(const std::string& setId)
{
  WriteGuard guard{*this};

  lift_db::Statement stmt{db_, "DELETE FROM sets WHERE id = ?;"};
  stmt.bind(1, setId);
  stmt.run();
  return db_.changes() > 0;
}

std::optional<lift_transfer::SetRecord> WorkoutStore::setById(
  const std::string& setId)
{
  lift_db::Statement stmt{db_, std::string{kSetColumns} + "WHERE id = ?;"};
  stmt.bind(1, setId);
  if (!stmt.step())
  {
    return std::nullopt;
  }
  return readSet(stmt, 0);
}

std::vector<lift_transfer::SetRecord> WorkoutStore::setsForExercise(
  const std::string& exerciseId)
{
  lift_db::Statement stmt{
    db_,
    std::string{kSetColumns} +
      "WHERE exerciseId = ? ORDER BY timestamp ASC, rowid ASC;"};
  stmt.bind(1, exerciseId);

  std::vector<lift_transfer::SetRecord> result;
  while (stmt.step())
  {
    result.push_back(readSet(stmt, 0));
  }
  return result;
}

// ========== Composite queries ==========

std::vector<ExerciseWithSets> WorkoutStore::exercisesForDate(
  const std::string& date)
{
  lift_db::Statement stmt{
    db_,
    std::string{kExerciseJoinColumns} +
      "WHERE e.date = ? "
      "ORDER BY e.createdAt ASC, e.rowid ASC, s.timestamp ASC, s.rowid ASC;"};
  stmt.bind(1, date);

  auto exercises = collectExercises(stmt);
  logger_->debug("Found {} exercises on {}", exercises.size(), date);

  for (auto& exercise : exercises)
  {
    if (exercise.sets.empty())
    {
      continue;
    }

    std::vector<lift_metrics::Measurements> values;
    values.reserve(exercise.sets.size());
    for (const auto& logged : exercise.sets)
    {
      values.push_back(logged.set.measurements());
    }

    auto const bestIndex = lift_metrics::findBestSet(values, exercise.type);
    auto const previous = personalBestForExercise(exercise.name, date);

    std::optional<lift_metrics::Measurements> previousBest;
    if (previous)
    {
      previousBest = previous->set.measurements();
    }

    if (bestIndex && lift_metrics::isNewPersonalBest(
                       values[*bestIndex], previousBest, exercise.type))
    {
      exercise.sets[*bestIndex].isPersonalBest = true;
    }
  }

  return exercises;
}

std::vector<std::string> WorkoutStore::datesWithExercises(
  const std::string& start,
  const std::string& end)
{
  lift_db::Statement stmt{
    db_,
    "SELECT DISTINCT date FROM exercises WHERE date >= ? AND date <= ? "
    "ORDER BY date ASC;"};
  stmt.bind(1, start);
  stmt.bind(2, end);

  std::vector<std::string> result;
  while (stmt.step())
  {
    result.push_back(stmt.columnText(0));
  }
  return result;
}

std::optional<ExerciseWithSets> WorkoutStore::lastExerciseByName(
  const std::string& name,
  const std::optional<std::string>& excludeDate)
{
  lift_db::Statement latest{
    db_,
    "SELECT e.id FROM exercises e "
    "JOIN exercise_definitions d ON e.definitionId = d.id "
    "WHERE d.name = ?1 AND (?2 IS NULL OR e.date != ?2) "
    "ORDER BY e.date DESC, e.createdAt DESC, e.rowid DESC LIMIT 1;"};
  latest.bind(1, name);
  latest.bind(2, excludeDate);
  if (!latest.step())
  {
    return std::nullopt;
  }
  std::string const exerciseId = latest.columnText(0);

  lift_db::Statement stmt{
    db_,
    std::string{kExerciseJoinColumns} +
      "WHERE e.id = ? ORDER BY s.timestamp ASC, s.rowid ASC;"};
  stmt.bind(1, exerciseId);

  auto exercises = collectExercises(stmt);
  if (exercises.empty())
  {
    return std::nullopt;
  }
  return std::move(exercises.front());
}

std::optional<PersonalBest> WorkoutStore::personalBestForExercise(
  const std::string& name,
  const std::optional<std::string>& excludeDate)
{
  lift_db::Statement stmt{
    db_,
    "SELECT s.id, s.exerciseId, s.weight, s.reps, s.distance, s.time, s.note, "
    "s.timestamp, e.date, d.type "
    "FROM sets s "
    "JOIN exercises e ON s.exerciseId = e.id "
    "JOIN exercise_definitions d ON e.definitionId = d.id "
    "WHERE d.name = ?1 AND (?2 IS NULL OR e.date != ?2) "
    "ORDER BY e.date ASC, s.timestamp ASC, s.rowid ASC;"};
  stmt.bind(1, name);
  stmt.bind(2, excludeDate);

  std::vector<PersonalBest> candidates;
  while (stmt.step())
  {
    PersonalBest candidate;
    candidate.set = readSet(stmt, 0);
    candidate.date = stmt.columnText(8);
    candidate.type = readType(stmt.columnText(9));
    candidates.push_back(std::move(candidate));
  }

  if (candidates.empty())
  {
    return std::nullopt;
  }

  std::vector<lift_metrics::Measurements> values;
  values.reserve(candidates.size());
  for (const auto& candidate : candidates)
  {
    values.push_back(candidate.set.measurements());
  }

  auto const best = lift_metrics::findBestSet(values, candidates.front().type);
  return candidates.at(best.value_or(0));
}

std::vector<ExerciseWithSets> WorkoutStore::allExercisesWithSets()
{
  lift_db::Statement stmt{
    db_,
    std::string{kExerciseJoinColumns} +
      "ORDER BY e.date DESC, e.createdAt ASC, e.rowid ASC, s.timestamp ASC, "
      "s.rowid ASC;"};
  return collectExercises(stmt);
}

std::vector<ExerciseWithSets> WorkoutStore::exercisesByName(
  const std::string& name,
  const std::optional<std::string>& start,
  const std::optional<std::string>& end)
{
  lift_db::Statement stmt{
    db_,
    std::string{kExerciseJoinColumns} +
      "WHERE d.name = ?1 AND (?2 IS NULL OR e.date >= ?2) "
      "AND (?3 IS NULL OR e.date <= ?3) "
      "ORDER BY e.date DESC, e.createdAt ASC, e.rowid ASC, s.timestamp ASC, "
      "s.rowid ASC;"};
  stmt.bind(1, name);
  stmt.bind(2, start);
  stmt.bind(3, end);
  return collectExercises(stmt);
}

std::vector<UsedExercise> WorkoutStore::usedExercises()
{
  lift_db::Statement stmt{
    db_,
    "SELECT DISTINCT d.name, d.type FROM exercise_definitions d "
    "JOIN exercises e ON e.definitionId = d.id ORDER BY d.name ASC;"};

  std::vector<UsedExercise> result;
  while (stmt.step())
  {
    result.push_back(UsedExercise{stmt.columnText(0), readType(stmt.columnText(1))});
  }
  return result;
}

std::vector<HistoryRow> WorkoutStore::historyRows(
  const std::string& name,
  const std::optional<std::string>& start,
  const std::optional<std::string>& end)
{
  lift_db::Statement stmt{
    db_,
    "SELECT s.id, s.exerciseId, s.weight, s.reps, s.distance, s.time, s.note, "
    "s.timestamp, e.date, d.type "
    "FROM exercise_definitions d "
    "JOIN exercises e ON e.definitionId = d.id "
    "JOIN sets s ON s.exerciseId = e.id "
    "WHERE d.name = ?1 AND (?2 IS NULL OR e.date >= ?2) "
    "AND (?3 IS NULL OR e.date <= ?3) "
    "ORDER BY e.date ASC, s.timestamp ASC, s.rowid ASC;"};
  stmt.bind(1, name);
  stmt.bind(2, start);
  stmt.bind(3, end);

  std::vector<HistoryRow> result;
  while (stmt.step())
  {
    HistoryRow row;
    row.set = readSet(stmt, 0);
    row.date = stmt.columnText(8);
    row.type = readType(stmt.columnText(9));
    result.push_back(std::move(row));
  }
  return result;
}

std::vector<ExportRow> WorkoutStore::exportRows()
{
  lift_db::Statement stmt{
    db_,
    "SELECT s.id, s.exerciseId, s.weight, s.reps, s.distance, s.time, s.note, "
    "s.timestamp, e.date, d.name, d.category, d.type "
    "FROM exercises e "
    "JOIN exercise_definitions d ON e.definitionId = d.id "
    "JOIN sets s ON s.exerciseId = e.id "
    "ORDER BY e.date DESC, d.name ASC, s.timestamp ASC, s.rowid ASC;"};

  std::vector<ExportRow> result;
  while (stmt.step())
  {
    ExportRow row;
    row.set = readSet(stmt, 0);
    row.date = stmt.columnText(8);
    row.name = stmt.columnText(9);
    row.category = stmt.columnText(10);
    row.type = readType(stmt.columnText(11));
    result.push_back(std::move(row));
  }
  return result;
}

int64_t WorkoutStore::definitionCount()
{
  return count("exercise_definitions");
}

int64_t WorkoutStore::exerciseCount()
{
  return count("exercises");
}

int64_t WorkoutStore::setCount()
{
  return count("sets");
}

// ========== Maintenance ==========

void WorkoutStore::clearWorkoutData()
{
  WriteGuard guard{*this};

  db_.withTransaction(
    [&]
    {
      db_.execute("DELETE FROM sets;");
      db_.execute("DELETE FROM exercises;");
    });
  logger_->info("Cleared workout data from {}", config_.databasePath);
}

int WorkoutStore::resetToDefaults()
{
  WriteGuard guard{*this};

  int inserted = 0;
  db_.withTransaction(
    [&]
    {
      deleteEverything();
      inserted = insertCatalog(defaultCatalog());
    });
  logger_->info("Reset {} to {} default definitions",
                config_.databasePath,
                inserted);
  return inserted;
}

int WorkoutStore::seedDefaults()
{
  WriteGuard guard{*this};

  if (definitionCount() > 0)
  {
    return 0;
  }

  int inserted = 0;
  db_.withTransaction([&] { inserted = insertCatalog(defaultCatalog()); });
  logger_->info("Seeded {} default definitions", inserted);
  return inserted;
}

int WorkoutStore::replaceAllDefinitions(
  const std::vector<NewDefinition>& definitions)
{
  WriteGuard guard{*this};

  int inserted = 0;
  db_.withTransaction(
    [&]
    {
      deleteEverything();
      inserted = insertCatalog(definitions);
    });
  logger_->info("Replaced catalog with {} definitions", inserted);
  return inserted;
}

SchemaValidation WorkoutStore::validateSchema()
{
  return schema_.validate();
}

int WorkoutStore::schemaVersion()
{
  return schema_.storedVersion();
}

// ========== Private helpers ==========

lift_transfer::ExerciseDefinitionRecord WorkoutStore::insertDefinition(
  const NewDefinition& definition)
{
  validateDefinition(definition);

  lift_transfer::ExerciseDefinitionRecord record;
  record.id = lift_utils::newId();
  record.name = lift_utils::trim(definition.name);
  record.category = lift_utils::trim(definition.category);
  record.type = definition.type;
  record.unit = definition.unit;
  record.description = definition.description;
  record.created_at = lift_utils::nowMillis();

  lift_db::Statement stmt{
    db_,
    "INSERT INTO exercise_definitions "
    "(id, name, category, type, unit, description, createdAt) "
    "VALUES (?, ?, ?, ?, ?, ?, ?);"};
  stmt.bind(1, record.id);
  stmt.bind(2, record.name);
  stmt.bind(3, record.category);
  stmt.bind(4, lift_metrics::toString(record.type));
  stmt.bind(5, record.unit);
  stmt.bind(6, record.description);
  stmt.bind(7, record.created_at);
  stmt.run();

  logger_->debug("Added definition '{}' ({})", record.name, record.id);
  return record;
}

int WorkoutStore::insertCatalog(const std::vector<NewDefinition>& definitions)
{
  std::set<std::string> seen;
  int inserted = 0;
  for (const auto& definition : definitions)
  {
    if (!seen.insert(lift_utils::normalizedName(definition.name)).second)
    {
      logger_->debug("Skipping duplicate definition '{}'", definition.name);
      continue;
    }
    insertDefinition(definition);
    ++inserted;
  }
  return inserted;
}

void WorkoutStore::deleteEverything()
{
  db_.execute("DELETE FROM sets;");
  db_.execute("DELETE FROM exercises;");
  db_.execute("DELETE FROM exercise_definitions;");
}

std::optional<lift_metrics::ExerciseType> WorkoutStore::typeForExercise(
  const std::string& exerciseId)
{
  lift_db::Statement stmt{
    db_,
    "SELECT d.type FROM exercises e "
    "JOIN exercise_definitions d ON e.definitionId = d.id WHERE e.id = ?;"};
  stmt.bind(1, exerciseId);
  if (!stmt.step())
  {
    return std::nullopt;
  }
  return readType(stmt.columnText(0));
}

lift_metrics::ExerciseType WorkoutStore::readType(const std::string& tag) const
{
  auto type = lift_metrics::parseExerciseType(tag);
  if (!type)
  {
    logger_->warn("Unknown exercise type '{}', ranking as weight_reps", tag);
    return lift_metrics::ExerciseType::WeightReps;
  }
  return *type;
}

lift_transfer::ExerciseDefinitionRecord WorkoutStore::readDefinition(
  lift_db::Statement& stmt) const
{
  lift_transfer::ExerciseDefinitionRecord record;
  record.id = stmt.columnText(0);
  record.name = stmt.columnText(1);
  record.category = stmt.columnText(2);
  record.type = readType(stmt.columnText(3));
  record.unit = stmt.columnText(4);
  record.description = stmt.columnOptionalText(5);
  record.created_at = stmt.columnInt64(6);
  return record;
}

lift_transfer::SetRecord WorkoutStore::readSet(lift_db::Statement& stmt,
                                               int first) const
{
  lift_transfer::SetRecord record;
  record.id = stmt.columnText(first);
  record.exercise_id = stmt.columnText(first + 1);
  record.weight = stmt.columnOptionalDouble(first + 2);
  record.reps = stmt.columnOptionalInt(first + 3);
  record.distance = stmt.columnOptionalDouble(first + 4);
  record.time = stmt.columnOptionalInt(first + 5);
  record.note = stmt.columnOptionalText(first + 6);
  record.timestamp = stmt.columnInt64(first + 7);
  return record;
}

std::vector<ExerciseWithSets> WorkoutStore::collectExercises(
  lift_db::Statement& stmt) const
{
  // Rows arrive grouped by exercise; a NULL set id marks an exercise with no
  // sets (left join)
  std::vector<ExerciseWithSets> result;
  while (stmt.step())
  {
    std::string const exerciseId = stmt.columnText(0);
    if (result.empty() || result.back().exercise.id != exerciseId)
    {
      ExerciseWithSets entry;
      entry.exercise.id = exerciseId;
      entry.exercise.definition_id = stmt.columnText(1);
      entry.exercise.date = stmt.columnText(2);
      entry.exercise.created_at = stmt.columnInt64(3);
      entry.name = stmt.columnText(4);
      entry.category = stmt.columnText(5);
      entry.type = readType(stmt.columnText(6));
      result.push_back(std::move(entry));
    }

    if (!stmt.columnIsNull(7))
    {
      result.back().sets.push_back(LoggedSet{readSet(stmt, 7), false});
    }
  }
  return result;
}

int64_t WorkoutStore::count(const std::string& table)
{
  lift_db::Statement stmt{db_, "SELECT COUNT(*) FROM " + table + ";"};
  if (!stmt.step())
  {
    return 0;
  }
  return stmt.columnInt64(0);
}

}  // namespace lift_store
