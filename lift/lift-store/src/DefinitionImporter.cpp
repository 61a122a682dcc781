// Ticket: 0005_definition_import

#include "lift-store/src/DefinitionImporter.hpp"

#include <set>
#include <utility>

#include <json/json.h>

#include "lift-db/src/DatabaseError.hpp"
#include "lift-metrics/src/ExerciseType.hpp"
#include "lift-store/src/StoreErrors.hpp"
#include "lift-store/src/WorkoutStore.hpp"
#include "lift-utils/src/StringUtils.hpp"

namespace lift_store
{

namespace
{

bool hasText(const Json::Value& record, const char* field)
{
  const Json::Value& value = record[field];
  return value.isString() && !lift_utils::trim(value.asString()).empty();
}

NewDefinition readRecord(const Json::Value& record, Json::ArrayIndex index)
{
  std::string const where = "Record " + std::to_string(index);
  if (!record.isObject())
  {
    throw ValidationError{where + " is not an object"};
  }

  for (const char* field : {"name", "category", "type", "unit"})
  {
    if (!hasText(record, field))
    {
      throw ValidationError{where + " is missing required field '" + field +
                            "'"};
    }
  }

  std::string const tag = record["type"].asString();
  auto const type = lift_metrics::parseExerciseType(tag);
  if (!type)
  {
    throw ValidationError{where + " has unknown type '" + tag + "'"};
  }

  NewDefinition definition;
  definition.name = record["name"].asString();
  definition.category = record["category"].asString();
  definition.type = *type;
  definition.unit = record["unit"].asString();
  if (record["description"].isString())
  {
    definition.description = record["description"].asString();
  }
  return definition;
}

}  // namespace

DefinitionImporter::DefinitionImporter(WorkoutStore& store,
                                       std::shared_ptr<spdlog::logger> logger)
  : store_{store}, logger_{std::move(logger)}
{
}

std::vector<NewDefinition> DefinitionImporter::parsePayload(
  const std::string& text)
{
  Json::CharReaderBuilder builder;
  builder["collectComments"] = false;
  std::unique_ptr<Json::CharReader> const reader{builder.newCharReader()};

  Json::Value root;
  std::string errors;
  if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors))
  {
    throw ValidationError{"Invalid JSON: " + errors};
  }
  if (!root.isArray())
  {
    throw ValidationError{"Import payload is not an array"};
  }
  if (root.empty())
  {
    throw ValidationError{"Import payload is empty"};
  }

  std::vector<NewDefinition> records;
  records.reserve(root.size());
  for (Json::ArrayIndex i = 0; i < root.size(); ++i)
  {
    records.push_back(readRecord(root[i], i));
  }
  return records;
}

ImportPreview DefinitionImporter::preview(
  const std::vector<NewDefinition>& records)
{
  std::set<std::string> known;
  for (const auto& definition : store_.allDefinitions())
  {
    known.insert(lift_utils::normalizedName(definition.name));
  }

  ImportPreview result;
  for (const auto& record : records)
  {
    if (known.insert(lift_utils::normalizedName(record.name)).second)
    {
      result.toAdd.push_back(record);
    }
    else
    {
      result.existing.push_back(record);
    }
  }

  logger_->info("Import preview: {} new, {} existing",
                result.toAdd.size(),
                result.existing.size());
  return result;
}

ImportSummary DefinitionImporter::apply(const std::vector<NewDefinition>& records,
                                        ImportMode mode)
{
  ImportSummary summary;

  if (mode == ImportMode::Replace)
  {
    // The current catalog is discarded, so only repeats within the batch count
    summary.added = store_.replaceAllDefinitions(records);
    summary.alreadyExisting = static_cast<int>(records.size()) - summary.added;
    logger_->info("Replace import added {} definitions, skipped {} duplicates",
                  summary.added,
                  summary.alreadyExisting);
    return summary;
  }

  ImportPreview const split = preview(records);
  summary.alreadyExisting = static_cast<int>(split.existing.size());

  for (const auto& record : split.toAdd)
  {
    try
    {
      store_.addDefinition(record);
      ++summary.added;
    }
    catch (const lift_db::DatabaseError& e)
    {
      ++summary.failed;
      summary.failedNames.push_back(record.name);
      logger_->error("Could not import '{}': {}", record.name, e.what());
    }
    catch (const ValidationError& e)
    {
      ++summary.failed;
      summary.failedNames.push_back(record.name);
      logger_->error("Could not import '{}': {}", record.name, e.what());
    }
  }

  logger_->info("Merge import added {}, failed {}, kept {}",
                summary.added,
                summary.failed,
                summary.alreadyExisting);
  return summary;
}

}  // namespace lift_store
