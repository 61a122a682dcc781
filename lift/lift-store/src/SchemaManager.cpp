// Ticket: 0004_schema_migrations

#include "lift-store/src/SchemaManager.hpp"

#include <algorithm>
#include <exception>

#include "lift-db/src/Statement.hpp"
#include "lift-store/src/StoreErrors.hpp"
#include "lift-utils/src/DateUtils.hpp"

namespace lift_store
{

namespace
{

constexpr const char* kSchemaDdl = R"(
CREATE TABLE IF NOT EXISTS schema_version (
  id INTEGER PRIMARY KEY CHECK (id = 1),
  version INTEGER NOT NULL,
  updatedAt INTEGER NOT NULL
);

CREATE TABLE IF NOT EXISTS exercise_definitions (
  id TEXT PRIMARY KEY,
  name TEXT NOT NULL UNIQUE,
  category TEXT NOT NULL,
  type TEXT NOT NULL,
  unit TEXT NOT NULL,
  description TEXT,
  createdAt INTEGER NOT NULL
);

CREATE TABLE IF NOT EXISTS exercises (
  id TEXT PRIMARY KEY,
  definitionId TEXT NOT NULL,
  date TEXT NOT NULL,
  createdAt INTEGER NOT NULL,
  FOREIGN KEY(definitionId) REFERENCES exercise_definitions(id) ON DELETE CASCADE
);

CREATE TABLE IF NOT EXISTS sets (
  id TEXT PRIMARY KEY,
  exerciseId TEXT NOT NULL,
  weight REAL,
  reps INTEGER,
  distance REAL,
  time INTEGER,
  note TEXT,
  timestamp INTEGER NOT NULL,
  FOREIGN KEY(exerciseId) REFERENCES exercises(id) ON DELETE CASCADE
);

CREATE INDEX IF NOT EXISTS idx_exercises_date ON exercises(date);
CREATE INDEX IF NOT EXISTS idx_exercises_definitionId ON exercises(definitionId);
CREATE INDEX IF NOT EXISTS idx_sets_exerciseId ON sets(exerciseId);
CREATE INDEX IF NOT EXISTS idx_exercise_definitions_name ON exercise_definitions(name);
)";

}  // namespace

std::vector<Migration> SchemaManager::builtinMigrations()
{
  return {
    Migration{2,
              "Add note column to sets",
              [](lift_db::Database& db)
              { db.execute("ALTER TABLE sets ADD COLUMN note TEXT;"); }},
  };
}

const std::vector<std::string>& SchemaManager::expectedTables()
{
  static const std::vector<std::string> tables{
    "schema_version", "exercise_definitions", "exercises", "sets"};
  return tables;
}

SchemaManager::SchemaManager(lift_db::Database& db,
                             std::shared_ptr<spdlog::logger> logger,
                             std::vector<Migration> migrations,
                             int targetVersion)
  : db_{db},
    logger_{std::move(logger)},
    migrations_{std::move(migrations)},
    targetVersion_{targetVersion}
{
  std::sort(migrations_.begin(),
            migrations_.end(),
            [](const Migration& a, const Migration& b)
            { return a.version < b.version; });
}

int SchemaManager::initialize()
{
  // Tables without a version row were written before versioning existed
  bool const unversioned =
    db_.tableExists("sets") && !db_.tableExists("schema_version");

  createTables();
  ensureVersionRow(unversioned ? 1 : targetVersion_);
  return migrate();
}

int SchemaManager::migrate()
{
  int const current = storedVersion();

  if (current > targetVersion_)
  {
    logger_->warn("Store schema version {} is newer than supported version {}",
                  current,
                  targetVersion_);
    return 0;
  }

  if (current == targetVersion_)
  {
    logger_->debug("Schema is up to date (version {})", current);
    return 0;
  }

  std::vector<const Migration*> pending;
  for (const auto& migration : migrations_)
  {
    if (migration.version > current && migration.version <= targetVersion_)
    {
      pending.push_back(&migration);
    }
  }

  if (pending.empty())
  {
    setVersion(targetVersion_);
    logger_->info("Bumped schema version to {}", targetVersion_);
    return 0;
  }

  for (const Migration* migration : pending)
  {
    logger_->info(
      "Running migration {}: {}", migration->version, migration->name);
    try
    {
      db_.withTransaction(
        [&]
        {
          migration->apply(db_);
          setVersion(migration->version);
        });
    }
    catch (const std::exception& e)
    {
      logger_->error(
        "Migration {} failed: {}", migration->version, e.what());
      throw MigrationError{migration->version, migration->name, e.what()};
    }
  }

  // Registered migrations may stop short of the target
  if (storedVersion() < targetVersion_)
  {
    setVersion(targetVersion_);
  }

  return static_cast<int>(pending.size());
}

int SchemaManager::storedVersion()
{
  if (!db_.tableExists("schema_version"))
  {
    return 0;
  }

  lift_db::Statement stmt{db_, "SELECT version FROM schema_version WHERE id = 1;"};
  if (!stmt.step())
  {
    return 0;
  }
  return stmt.columnInt(0);
}

SchemaValidation SchemaManager::validate()
{
  SchemaValidation result;
  result.targetVersion = targetVersion_;

  for (const auto& table : expectedTables())
  {
    if (!db_.tableExists(table))
    {
      logger_->error("Missing table: {}", table);
      result.missingTables.push_back(table);
    }
  }

  result.storedVersion = storedVersion();
  if (result.storedVersion != targetVersion_)
  {
    logger_->warn("Schema version mismatch: expected {}, got {}",
                  targetVersion_,
                  result.storedVersion);
  }

  result.valid = result.missingTables.empty();
  return result;
}

void SchemaManager::createTables()
{
  db_.execute(kSchemaDdl);
}

void SchemaManager::ensureVersionRow(int initialVersion)
{
  lift_db::Statement select{db_, "SELECT version FROM schema_version WHERE id = 1;"};
  if (select.step())
  {
    return;
  }

  lift_db::Statement insert{
    db_, "INSERT INTO schema_version (id, version, updatedAt) VALUES (1, ?, ?);"};
  insert.bind(1, initialVersion);
  insert.bind(2, lift_utils::nowMillis());
  insert.run();

  logger_->info("Initialized schema version to {}", initialVersion);
}

void SchemaManager::setVersion(int version)
{
  lift_db::Statement stmt{
    db_, "UPDATE schema_version SET version = ?, updatedAt = ? WHERE id = 1;"};
  stmt.bind(1, version);
  stmt.bind(2, lift_utils::nowMillis());
  stmt.run();
}

}  // namespace lift_store
