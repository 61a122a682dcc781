#ifndef LIFT_TRANSFER_RECORDS_HPP
#define LIFT_TRANSFER_RECORDS_HPP

/**
 * @file Records.hpp
 * @brief Convenience header including all persisted row records
 *
 * This header provides a single include point for all lift-transfer records.
 * Use this when you need access to the complete store schema.
 */

#include "lift-transfer/src/ExerciseDefinitionRecord.hpp"
#include "lift-transfer/src/ExerciseRecord.hpp"
#include "lift-transfer/src/SchemaVersionRecord.hpp"
#include "lift-transfer/src/SetRecord.hpp"

#endif  // LIFT_TRANSFER_RECORDS_HPP
