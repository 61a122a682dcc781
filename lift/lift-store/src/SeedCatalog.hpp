// Ticket: 0006_seed_catalog

#ifndef LIFT_STORE_SEED_CATALOG_HPP
#define LIFT_STORE_SEED_CATALOG_HPP

#include <vector>

#include "lift-store/src/WorkoutStoreTypes.hpp"

namespace lift_store
{

/**
 * @brief Built-in catalog seeded into an empty store and on reset
 *
 * Names are unique (case-insensitively) and every exercise type appears at
 * least once.
 */
const std::vector<NewDefinition>& defaultCatalog();

}  // namespace lift_store

#endif  // LIFT_STORE_SEED_CATALOG_HPP
