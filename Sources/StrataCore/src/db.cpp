#include "strata/db.hpp"
#include "strata/log.hpp"

#include <algorithm>
#include <cctype>
#include <mutex>
#include <sstream>

namespace strata {

namespace {

std::once_flag g_threading_checked;

bool starts_with_keyword(const std::string& sql, const char* keyword) {
    auto pos = sql.find_first_not_of(" \t\r\n(");
    if (pos == std::string::npos) return false;
    size_t len = std::char_traits<char>::length(keyword);
    if (sql.size() - pos < len) return false;
    for (size_t i = 0; i < len; ++i) {
        if (std::toupper(static_cast<unsigned char>(sql[pos + i])) != keyword[i]) {
            return false;
        }
    }
    return true;
}

// Holds the connection mutex so step results and sqlite3_errmsg belong to one statement
class connection_lock {
public:
    explicit connection_lock(sqlite3* db) : mutex_(sqlite3_db_mutex(db)) {
        sqlite3_mutex_enter(mutex_);
    }
    ~connection_lock() { sqlite3_mutex_leave(mutex_); }

    connection_lock(const connection_lock&) = delete;
    connection_lock& operator=(const connection_lock&) = delete;

private:
    sqlite3_mutex* mutex_;
};

} // namespace

void check_engine_threading() {
    std::call_once(g_threading_checked, [] {
        if (sqlite3_threadsafe() == 0) {
            LOG_ERROR("db", "SQLite was built without thread support");
            throw startup_error("SQLite was built with SQLITE_THREADSAFE=0; serialized access is unavailable");
        }
        LOG_DEBUG("db", "SQLite %s threadsafe=%d", sqlite3_libversion(), sqlite3_threadsafe());
    });
}

database::database(const std::string& path) : path_(path) {
    check_engine_threading();

    // Always use serialized threading mode
    int flags = SQLITE_OPEN_FULLMUTEX | SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
    int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        sqlite3_close(db_);
        db_ = nullptr;
        LOG_ERROR("db", "Failed to open database: %s", error.c_str());
        throw db_error("Failed to open database: " + error);
    }

    // A connection without its own mutex is not serialized
    if (sqlite3_db_mutex(db_) == nullptr) {
        sqlite3_close(db_);
        db_ = nullptr;
        LOG_ERROR("db", "Connection to %s is not in serialized mode", path.c_str());
        throw startup_error("Database connection is not in serialized mode");
    }

    // Referential actions are applied by the cascade engine, row by row
    execute("PRAGMA foreign_keys = OFF");

    if (path != ":memory:") {
        execute("PRAGMA journal_mode = WAL");
    }
    execute("PRAGMA temp_store = MEMORY");

    // Set busy timeout to handle lock contention (5 seconds)
    sqlite3_busy_timeout(db_, 5000);

    LOG_INFO("db", "Opened %s", path.c_str());
}

database::~database() {
    if (db_) {
        sqlite3_close_v2(db_);
    }
}

void database::set_trace(trace_fn fn) {
    trace_ = std::move(fn);
}

sqlite3_stmt* database::prepare(const std::string& sql) {
    if (trace_) {
        trace_(sql);
    }
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        auto error = std::string(sqlite3_errmsg(db_));
        LOG_ERROR("db", "Failed to prepare statement: %s (SQL: %s)", error.c_str(), sql.c_str());
        throw db_error("Failed to prepare statement: " + error + " (SQL: " + sql + ")");
    }
    return stmt;
}

database::run_result database::run(const std::string& sql,
                                   const std::vector<column_value_t>& params) {
    LOG_DEBUG("db", "%s [%zu params]", sql.c_str(), params.size());

    int rc = SQLITE_OK;
    run_result result;
    int extended = SQLITE_OK;
    std::string error;
    {
        connection_lock lock(db_);
        sqlite3_stmt* stmt = prepare(sql);
        int index = 1;
        for (const auto& param : params) {
            bind_value(stmt, index++, param);
        }

        rc = sqlite3_step(stmt);
        if (rc == SQLITE_DONE || rc == SQLITE_ROW) {
            result.changes = sqlite3_changes(db_);
            if ((starts_with_keyword(sql, "INSERT") || starts_with_keyword(sql, "REPLACE")) &&
                result.changes > 0) {
                result.last_insert_id = sqlite3_last_insert_rowid(db_);
            }
        } else {
            extended = sqlite3_extended_errcode(db_);
            error = sqlite3_errmsg(db_);
        }
        sqlite3_finalize(stmt);
    }

    if (rc == SQLITE_DONE || rc == SQLITE_ROW) {
        return result;
    }
    if (extended == SQLITE_CONSTRAINT_UNIQUE || extended == SQLITE_CONSTRAINT_PRIMARYKEY) {
        LOG_DEBUG("db", "Unique constraint rejected statement: %s", error.c_str());
        throw already_exists_error(error);
    }
    LOG_ERROR("db", "Execution failed: %s (SQL: %s)", error.c_str(), sql.c_str());
    throw db_error("Execution failed: " + error);
}

std::optional<primary_key_t> database::execute(const std::string& sql,
                                               const std::vector<column_value_t>& params) {
    return run(sql, params).last_insert_id;
}

std::vector<database::row_t> database::fetch(const std::string& sql,
                                             const std::vector<column_value_t>& params) {
    LOG_DEBUG("db", "%s [%zu params]", sql.c_str(), params.size());

    connection_lock lock(db_);
    sqlite3_stmt* stmt = prepare(sql);
    int index = 1;
    for (const auto& param : params) {
        bind_value(stmt, index++, param);
    }

    std::vector<row_t> results;
    int col_count = sqlite3_column_count(stmt);

    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        row_t row;
        for (int i = 0; i < col_count; ++i) {
            const char* name = sqlite3_column_name(stmt, i);
            row[name] = extract_column(stmt, i);
        }
        results.push_back(std::move(row));
    }

    if (rc != SQLITE_DONE) {
        auto error = std::string(sqlite3_errmsg(db_));
        sqlite3_finalize(stmt);
        LOG_ERROR("db", "Query failed: %s (SQL: %s)", error.c_str(), sql.c_str());
        throw db_error("Query failed: " + error);
    }
    sqlite3_finalize(stmt);

    return results;
}

bool database::table_exists(const std::string& name) const {
    const char* sql = "SELECT name FROM sqlite_master WHERE type='table' AND name=?";
    sqlite3_stmt* stmt = nullptr;
    connection_lock lock(db_);

    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR("db", "Failed to prepare table_exists statement: %s", sqlite3_errmsg(db_));
        throw db_error("Failed to prepare statement");
    }

    sqlite3_bind_text(stmt, 1, name.c_str(), -1, SQLITE_TRANSIENT);
    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
        throw db_error("table_exists failed: " + std::string(sqlite3_errmsg(db_)));
    }
    return rc == SQLITE_ROW;
}

void database::create_table(const table_schema& schema) {
    std::ostringstream sql;
    sql << "CREATE TABLE " << schema.name << " (";

    bool first = true;
    for (const auto& col : schema.columns) {
        if (!first) sql << ", ";
        first = false;
        sql << col.name << " " << column_type_sql(col.type);

        if (col.is_primary_key) {
            sql << " PRIMARY KEY";
            continue;
        }
        sql << (col.nullable ? " NULL" : " NOT NULL");
        if (col.is_unique) {
            sql << " UNIQUE";
        }
        if (col.foreign_key_table) {
            sql << " REFERENCES " << *col.foreign_key_table << "(id)";
        }
    }

    sql << ")";
    execute(sql.str());
}

void database::append_where(std::string& sql, const query_spec& spec,
                            std::vector<column_value_t>& params) const {
    bool first = true;
    for (const auto& term : spec.filters) {
        sql += first ? " WHERE " : " AND ";
        first = false;
        if (term.op == cmp_op::eq && std::holds_alternative<std::nullptr_t>(term.value)) {
            sql += term.column + " IS NULL";
            continue;
        }
        sql += term.column;
        sql += " ";
        sql += cmp_op_sql(term.op);
        sql += " ?";
        params.push_back(term.value);
    }
}

void database::append_order_and_window(std::string& sql, const query_spec& spec,
                                       std::vector<column_value_t>& params) const {
    bool first = true;
    for (const auto& key : spec.order) {
        sql += first ? " ORDER BY " : ", ";
        first = false;
        sql += key.column;
        sql += key.order == sort_order::ascending ? " ASC" : " DESC";
    }
    if (spec.has_window()) {
        // SQLite wants LIMIT before OFFSET; -1 means unbounded
        sql += " LIMIT ? OFFSET ?";
        params.push_back(spec.limit.value_or(-1));
        params.push_back(spec.offset);
    }
}

std::vector<database::row_t> database::select(const std::vector<std::string>& columns,
                                              const query_spec& spec) {
    std::string sql = "SELECT ";
    for (size_t i = 0; i < columns.size(); ++i) {
        if (i) sql += ", ";
        sql += columns[i];
    }
    sql += " FROM " + spec.table;

    std::vector<column_value_t> params;
    append_where(sql, spec, params);
    append_order_and_window(sql, spec, params);
    return fetch(sql, params);
}

int64_t database::count_matching(const query_spec& spec) {
    std::string sql = "SELECT COUNT(*) AS n FROM " + spec.table;
    std::vector<column_value_t> params;
    append_where(sql, spec, params);

    auto rows = fetch(sql, params);
    if (rows.empty()) {
        throw db_error("COUNT returned no rows for " + spec.table);
    }
    return std::get<int64_t>(rows.front().at("n"));
}

int64_t database::delete_matching(const query_spec& spec) {
    std::string sql = "DELETE FROM " + spec.table;
    std::vector<column_value_t> params;

    if (spec.has_window() || !spec.order.empty()) {
        // DELETE ... ORDER BY/LIMIT is a compile-time option; select the rowids instead
        sql += " WHERE rowid IN (SELECT rowid FROM " + spec.table;
        append_where(sql, spec, params);
        append_order_and_window(sql, spec, params);
        sql += ")";
    } else {
        append_where(sql, spec, params);
    }

    return run(sql, params).changes;
}

primary_key_t database::insert(const std::string& table, const values_t& values) {
    std::string sql = "INSERT INTO " + table;
    std::vector<column_value_t> params;
    params.reserve(values.size());

    if (values.empty()) {
        sql += " DEFAULT VALUES";
    } else {
        std::string cols;
        std::string marks;
        for (const auto& [col, val] : values) {
            if (!cols.empty()) {
                cols += ", ";
                marks += ", ";
            }
            cols += col;
            marks += "?";
            params.push_back(val);
        }
        sql += " (" + cols + ") VALUES (" + marks + ")";
    }

    auto id = execute(sql, params);
    if (!id) {
        throw db_error("Insert into " + table + " produced no row");
    }
    return *id;
}

int64_t database::update_by_key(const std::string& table, primary_key_t id, const values_t& values) {
    if (values.empty()) return 0;

    std::string sql = "UPDATE " + table + " SET ";
    std::vector<column_value_t> params;
    params.reserve(values.size() + 1);

    bool first = true;
    for (const auto& [col, val] : values) {
        if (!first) sql += ", ";
        first = false;
        sql += col + " = ?";
        params.push_back(val);
    }
    sql += " WHERE id = ?";
    params.push_back(id);

    return run(sql, params).changes;
}

int64_t database::update_matching(const query_spec& spec, const values_t& values) {
    if (values.empty()) return 0;

    std::string sql = "UPDATE " + spec.table + " SET ";
    std::vector<column_value_t> params;
    bool first = true;
    for (const auto& [col, val] : values) {
        if (!first) sql += ", ";
        first = false;
        sql += col + " = ?";
        params.push_back(val);
    }
    append_where(sql, spec, params);
    return run(sql, params).changes;
}

int64_t database::delete_by_key(const std::string& table, primary_key_t id) {
    return run("DELETE FROM " + table + " WHERE id = ?", {id}).changes;
}

void database::bind_value(sqlite3_stmt* stmt, int index, const column_value_t& value) {
    std::visit([&](auto&& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            sqlite3_bind_null(stmt, index);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            sqlite3_bind_int64(stmt, index, v);
        } else if constexpr (std::is_same_v<T, double>) {
            sqlite3_bind_double(stmt, index, v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            sqlite3_bind_text(stmt, index, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
        } else if constexpr (std::is_same_v<T, bytes_t>) {
            if (v.empty()) {
                sqlite3_bind_zeroblob(stmt, index, 0);
            } else {
                sqlite3_bind_blob(stmt, index, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
            }
        }
    }, value);
}

column_value_t database::extract_column(sqlite3_stmt* stmt, int index) {
    int type = sqlite3_column_type(stmt, index);
    switch (type) {
        case SQLITE_INTEGER:
            return static_cast<int64_t>(sqlite3_column_int64(stmt, index));
        case SQLITE_FLOAT:
            return sqlite3_column_double(stmt, index);
        case SQLITE_TEXT: {
            const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, index));
            int size = sqlite3_column_bytes(stmt, index);
            return std::string(text ? text : "", text ? static_cast<size_t>(size) : 0);
        }
        case SQLITE_BLOB: {
            const void* data = sqlite3_column_blob(stmt, index);
            int size = sqlite3_column_bytes(stmt, index);
            const uint8_t* bytes = static_cast<const uint8_t*>(data);
            return bytes ? bytes_t(bytes, bytes + size) : bytes_t{};
        }
        case SQLITE_NULL:
        default:
            return nullptr;
    }
}

} // namespace strata
