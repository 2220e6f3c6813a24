#pragma once

#ifdef __cplusplus

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace strata {

// Timestamp type (microsecond resolution, stored as REAL seconds since epoch)
using timestamp_t = std::chrono::time_point<std::chrono::system_clock, std::chrono::microseconds>;

// Primary key type
using primary_key_t = int64_t;

// Raw byte sequence (stored as BLOB)
using bytes_t = std::vector<uint8_t>;

// Storage primitives as they travel to and from the engine
using column_value_t = std::variant<
    std::nullptr_t,
    int64_t,
    double,
    std::string,
    bytes_t
>;

// Column type enumeration
enum class column_type {
    integer,
    real,
    text,
    blob
};

inline const char* column_type_sql(column_type type) {
    switch (type) {
        case column_type::integer: return "INTEGER";
        case column_type::real: return "REAL";
        case column_type::text: return "TEXT";
        case column_type::blob: return "BLOB";
    }
    return "BLOB";
}

// Comparison operators accepted by filters
enum class cmp_op {
    eq,
    lt,
    lte,
    gt,
    gte
};

inline const char* cmp_op_sql(cmp_op op) {
    switch (op) {
        case cmp_op::eq: return "=";
        case cmp_op::lt: return "<";
        case cmp_op::lte: return "<=";
        case cmp_op::gt: return ">";
        case cmp_op::gte: return ">=";
    }
    return "=";
}

inline const char* cmp_op_name(cmp_op op) {
    switch (op) {
        case cmp_op::eq: return "eq";
        case cmp_op::lt: return "lt";
        case cmp_op::lte: return "lte";
        case cmp_op::gt: return "gt";
        case cmp_op::gte: return "gte";
    }
    return "eq";
}

enum class sort_order {
    ascending,
    descending
};

// Column definition for schema
struct column_def {
    std::string name;
    column_type type;
    bool nullable = false;
    bool is_primary_key = false;
    bool is_unique = false;
    std::optional<std::string> foreign_key_table;
};

// Table schema
struct table_schema {
    std::string name;
    std::vector<column_def> columns;
};

// One conjunctive predicate of a table scan
struct filter_term {
    std::string column;
    cmp_op op = cmp_op::eq;
    column_value_t value;
};

struct sort_key {
    std::string column;
    sort_order order = sort_order::ascending;
};

// Schema-agnostic description of a single-table scan.
// limit == nullopt means unbounded; offset applies after filtering and ordering.
struct query_spec {
    std::string table;
    std::vector<filter_term> filters;
    std::vector<sort_key> order;
    int64_t offset = 0;
    std::optional<int64_t> limit;

    bool has_window() const { return offset != 0 || limit.has_value(); }
};

} // namespace strata

#endif // __cplusplus
