// Ticket: 0001_workout_store_core

#include "lift-utils/src/IdUtils.hpp"

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace lift_utils
{

std::string newId()
{
  thread_local boost::uuids::random_generator generator;
  return boost::uuids::to_string(generator());
}

}  // namespace lift_utils
