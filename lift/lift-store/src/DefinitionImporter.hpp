// Ticket: 0005_definition_import

#ifndef LIFT_STORE_DEFINITION_IMPORTER_HPP
#define LIFT_STORE_DEFINITION_IMPORTER_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "lift-store/src/WorkoutStoreTypes.hpp"

namespace lift_store
{

class WorkoutStore;

enum class ImportMode : uint8_t
{
  Merge,   // Add names not yet in the catalog, keep everything else
  Replace  // Wipe all workout data and the catalog, then insert the batch
};

/**
 * @brief Split of an import batch against the current catalog
 *
 * A record is "existing" when its trimmed, lower-cased name matches a stored
 * definition or an earlier record of the same batch.
 */
struct ImportPreview
{
  std::vector<NewDefinition> toAdd;
  std::vector<NewDefinition> existing;
};

struct ImportSummary
{
  int added{0};
  int failed{0};
  int alreadyExisting{0};  // Merge: matched the store or the batch; Replace: batch duplicates
  std::vector<std::string> failedNames;
};

/**
 * @brief Bulk import of exercise definitions from a JSON payload
 *
 * The payload is an array of {name, category, type, unit, description?}
 * objects. Validation is all-or-nothing and happens before any write.
 *
 * @ticket 0005_definition_import
 */
class DefinitionImporter
{
public:
  DefinitionImporter(WorkoutStore& store, std::shared_ptr<spdlog::logger> logger);

  /**
   * @brief Parse and validate a payload
   *
   * @throws ValidationError on malformed JSON, a non-array or empty array, a
   * record missing a required field, or an unknown type
   */
  static std::vector<NewDefinition> parsePayload(const std::string& text);

  ImportPreview preview(const std::vector<NewDefinition>& records);

  /**
   * @brief Import @p records
   *
   * Merge continues past records that fail to insert and counts them.
   * Replace is one transaction; any failure restores the previous catalog and
   * is rethrown.
   */
  ImportSummary apply(const std::vector<NewDefinition>& records, ImportMode mode);

private:
  WorkoutStore& store_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace lift_store

#endif  // LIFT_STORE_DEFINITION_IMPORTER_HPP
