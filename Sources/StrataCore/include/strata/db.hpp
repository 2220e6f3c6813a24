#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "errors.hpp"

#include <sqlite3.h>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace strata {

/// One process-wide connection. Opened in serialized mode so any number of
/// threads may issue statements through the same handle without extra locking.
class database {
public:
    explicit database(const std::string& path);
    ~database();

    // Non-copyable
    database(const database&) = delete;
    database& operator=(const database&) = delete;

    using row_t = std::unordered_map<std::string, column_value_t>;
    using values_t = std::vector<std::pair<std::string, column_value_t>>;
    using trace_fn = std::function<void(const std::string& sql)>;

    // Raw statement escape hatch.
    // execute() returns the new rowid for INSERT/REPLACE statements that added a row.
    std::optional<primary_key_t> execute(const std::string& sql,
                                         const std::vector<column_value_t>& params = {});
    std::vector<row_t> fetch(const std::string& sql,
                             const std::vector<column_value_t>& params = {});

    // Schema management
    void create_table(const table_schema& schema);
    bool table_exists(const std::string& name) const;

    // Helpers built from a query_spec; values are always bound, never interpolated
    std::vector<row_t> select(const std::vector<std::string>& columns, const query_spec& spec);
    int64_t count_matching(const query_spec& spec);
    int64_t delete_matching(const query_spec& spec);
    // Ignores the spec's order and window
    int64_t update_matching(const query_spec& spec, const values_t& values);

    primary_key_t insert(const std::string& table, const values_t& values);
    int64_t update_by_key(const std::string& table, primary_key_t id, const values_t& values);
    int64_t delete_by_key(const std::string& table, primary_key_t id);

    /// Called with the text of every statement before it runs.
    void set_trace(trace_fn fn);

    const std::string& path() const { return path_; }

    // Raw access (use sparingly)
    sqlite3* handle() const { return db_; }

private:
    sqlite3* db_ = nullptr;
    std::string path_;
    trace_fn trace_;

    sqlite3_stmt* prepare(const std::string& sql);
    void bind_value(sqlite3_stmt* stmt, int index, const column_value_t& value);
    column_value_t extract_column(sqlite3_stmt* stmt, int index);
    struct run_result {
        int64_t changes = 0;
        std::optional<primary_key_t> last_insert_id;
    };
    // Runs a statement that returns no rows under the connection mutex, so the
    // change count and rowid belong to this statement. Maps constraint failures.
    run_result run(const std::string& sql, const std::vector<column_value_t>& params);
    void append_where(std::string& sql, const query_spec& spec,
                      std::vector<column_value_t>& params) const;
    void append_order_and_window(std::string& sql, const query_spec& spec,
                                 std::vector<column_value_t>& params) const;
};

/// Verifies the linked engine was built with thread support. Runs once per process.
void check_engine_threading();

} // namespace strata

#endif // __cplusplus
