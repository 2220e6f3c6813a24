#pragma once

// StrataCore - small ORM over one embedded SQLite connection
//
// Usage:
//   #include <StrataCore.hpp>
//
//   struct Trip {
//       static void define(strata::entity_builder& e) {
//           e.table("trip");
//           e.field<std::string>("name").unique();
//           e.field<int64_t>("days").default_value(1);
//       }
//   };
//   STRATA_ENTITY(Trip);
//
//   int main() {
//       auto db = strata::strata_db::init({.path = "trips.db"});
//
//       // Full construction inserts immediately
//       auto trip = db.create<Trip>({{"name", "Costa Rica"}, {"days", 10}});
//       trip.set("days", 12).save();
//
//       for (auto t : db.all<Trip>().where("days__gte", 5).order_by({"-days"})) {
//           std::cout << t.get<std::string>("name") << std::endl;
//       }
//   }

#include "strata/types.hpp"
#include "strata/errors.hpp"
#include "strata/log.hpp"
#include "strata/converter.hpp"
#include "strata/db.hpp"
#include "strata/schema.hpp"
#include "strata/extension_map.hpp"
#include "strata/managed.hpp"
#include "strata/cascade.hpp"
#include "strata/query.hpp"
#include "strata/strata.hpp"
