// Ticket: 0004_schema_migrations

#ifndef LIFT_STORE_SCHEMA_MANAGER_HPP
#define LIFT_STORE_SCHEMA_MANAGER_HPP

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "lift-db/src/Database.hpp"

namespace lift_store
{

/**
 * @brief One forward-only schema change
 *
 * A migration brings a store from version - 1 to version. It runs inside a
 * transaction together with the version bump.
 */
struct Migration
{
  int version{0};
  std::string name;
  std::function<void(lift_db::Database&)> apply;
};

/**
 * @brief Result of SchemaManager::validate()
 */
struct SchemaValidation
{
  bool valid{false};
  std::vector<std::string> missingTables;
  int storedVersion{0};
  int targetVersion{0};
};

/**
 * @brief Creates the store schema and applies pending migrations
 *
 * The base DDL always describes the latest table shapes, so a brand-new store
 * is stamped with the target version and never runs a migration. Migrations
 * only matter for stores written by an older build; a store that has tables
 * but no schema_version table is treated as version 1.
 *
 * @ticket 0004_schema_migrations
 */
class SchemaManager
{
public:
  static constexpr int kCurrentVersion = 2;

  /**
   * @brief Migrations shipped with the store
   *
   * Version 2 adds the sets.note column.
   */
  static std::vector<Migration> builtinMigrations();

  /**
   * @param db Connection to manage (must outlive this object)
   * @param logger Logger for lifecycle messages
   * @param migrations Registered migrations, any order
   * @param targetVersion Version the store should end up at
   */
  SchemaManager(lift_db::Database& db,
                std::shared_ptr<spdlog::logger> logger,
                std::vector<Migration> migrations = builtinMigrations(),
                int targetVersion = kCurrentVersion);

  /**
   * @brief Create tables, ensure the version row, then migrate
   *
   * Idempotent: on a current store nothing is written and no migration runs.
   *
   * @return Number of migrations applied
   * @throws MigrationError if a migration fails (rolled back)
   * @throws lift_db::DatabaseError if the DDL cannot be applied
   */
  int initialize();

  /**
   * @brief Apply registered migrations in (stored, target], ascending
   *
   * @return Number of migrations applied
   * @throws MigrationError if a migration fails (rolled back)
   */
  int migrate();

  /**
   * @brief Stored schema version, 0 when the table or row is missing
   */
  int storedVersion();

  int targetVersion() const
  {
    return targetVersion_;
  }

  /**
   * @brief Check that every expected table is present
   *
   * A version mismatch is logged but does not make the result invalid.
   */
  SchemaValidation validate();

  static const std::vector<std::string>& expectedTables();

private:
  void createTables();
  void ensureVersionRow(int initialVersion);
  void setVersion(int version);

  lift_db::Database& db_;
  std::shared_ptr<spdlog::logger> logger_;
  std::vector<Migration> migrations_;
  int targetVersion_;
};

}  // namespace lift_store

#endif  // LIFT_STORE_SCHEMA_MANAGER_HPP
