#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "db.hpp"
#include "schema.hpp"

namespace strata {

struct cascade_stats {
    size_t deleted = 0;    // rows removed, the starting row included
    size_t nulled = 0;     // dependent rows whose reference was cleared
};

/// Deletes row `id` of `schema`, then follows every reference into it:
/// non-nullable references delete the dependent row (recursively),
/// nullable ones are set to NULL. A row that is already gone is a no-op.
/// Each step is its own statement; there is no enclosing transaction.
cascade_stats cascade_delete(database& db, const entity_schema& schema, primary_key_t id);

} // namespace strata

#endif // __cplusplus
