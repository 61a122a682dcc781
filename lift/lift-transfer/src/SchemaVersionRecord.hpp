// Ticket: 0004_schema_migrations

#ifndef LIFT_TRANSFER_SCHEMA_VERSION_RECORD_HPP
#define LIFT_TRANSFER_SCHEMA_VERSION_RECORD_HPP

#include <cstdint>

namespace lift_transfer
{

/**
 * @brief The single row of schema_version (id is pinned to 1)
 */
struct SchemaVersionRecord
{
  int version{0};
  int64_t updated_at{0};  // [ms since epoch]
};

}  // namespace lift_transfer

#endif  // LIFT_TRANSFER_SCHEMA_VERSION_RECORD_HPP
