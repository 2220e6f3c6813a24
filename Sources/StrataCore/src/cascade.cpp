#include "strata/cascade.hpp"
#include "strata/log.hpp"

namespace strata {

namespace {

std::vector<primary_key_t> dependent_ids(database& db, const reference_edge& edge, primary_key_t id) {
    query_spec spec;
    spec.table = edge.source->table_name();
    spec.filters.push_back({edge.field->column(), cmp_op::eq, id});
    spec.order.push_back({"id", sort_order::ascending});

    std::vector<primary_key_t> ids;
    for (const auto& row : db.select({"id"}, spec)) {
        ids.push_back(std::get<int64_t>(row.at("id")));
    }
    return ids;
}

void cascade_into(database& db, const entity_schema& schema, primary_key_t id, cascade_stats& stats) {
    if (db.delete_by_key(schema.table_name(), id) == 0) {
        // removed earlier in this cascade, or by someone else
        LOG_DEBUG("cascade", "%s id=%lld already gone", schema.name().c_str(), static_cast<long long>(id));
        return;
    }
    ++stats.deleted;
    LOG_DEBUG("cascade", "Deleted %s id=%lld", schema.name().c_str(), static_cast<long long>(id));

    for (const auto& edge : schema_registry::instance().dependents_of(schema)) {
        auto ids = dependent_ids(db, edge, id);
        if (ids.empty()) {
            continue;
        }

        if (edge.field->nullable) {
            for (auto dependent : ids) {
                stats.nulled += static_cast<size_t>(
                    db.update_by_key(edge.source->table_name(), dependent,
                                     {{edge.field->column(), nullptr}}));
            }
            LOG_DEBUG("cascade", "Cleared %s.%s on %zu rows",
                      edge.source->name().c_str(), edge.field->name.c_str(), ids.size());
        } else {
            for (auto dependent : ids) {
                cascade_into(db, *edge.source, dependent, stats);
            }
        }
    }
}

} // namespace

cascade_stats cascade_delete(database& db, const entity_schema& schema, primary_key_t id) {
    // every declared entity must contribute its edges before we walk them
    schema_registry::instance().resolve_declared();

    cascade_stats stats;
    cascade_into(db, schema, id, stats);
    if (stats.deleted > 1 || stats.nulled > 0) {
        LOG_INFO("cascade", "Deleting %s id=%lld removed %zu rows, cleared %zu references",
                 schema.name().c_str(), static_cast<long long>(id), stats.deleted, stats.nulled);
    }
    return stats;
}

} // namespace strata
