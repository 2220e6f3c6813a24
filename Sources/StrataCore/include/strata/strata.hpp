#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "db.hpp"
#include "schema.hpp"
#include "managed.hpp"
#include "cascade.hpp"
#include "query.hpp"

#include <nlohmann/json.hpp>

#include <concepts>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace strata {

class strata_db;

// ============================================================================
// Configuration
// ============================================================================

struct configuration {
    /// Database file path. Use ":memory:" for an in-memory database.
    std::string path;

    /// Used when neither `path` nor the DB_PATH environment variable is set.
    std::string default_path;

    /// Applied by apply_logging() when set.
    std::optional<log_level> level;

    /// Tags switched to debug output by apply_logging().
    std::vector<std::string> debug_tags;

    /// Explicit path, then $DB_PATH, then default_path. Throws configuration_error
    /// when none is available.
    std::string resolve_path() const;

    void apply_logging() const;

    /// Keys: "path", "default_path", "log_level", "debug_tags". Unknown keys are ignored.
    static configuration from_json(const nlohmann::json& j);
    static configuration load_file(const std::string& file);
};

// ============================================================================
// Initialization hooks - run once, by ascending priority, after tables exist
// ============================================================================

class init_hook_registry {
public:
    using hook_fn = std::function<void(strata_db&)>;

    static init_hook_registry& instance();

    void add(int priority, std::string name, hook_fn hook);
    /// Runs every hook; equal priorities keep registration order.
    void run_all(strata_db& db) const;
    size_t size() const;
    void clear();

private:
    init_hook_registry() = default;

    struct entry {
        int priority;
        size_t sequence;
        std::string name;
        hook_fn hook;
    };

    mutable std::mutex mutex_;
    std::vector<entry> hooks_;
    size_t next_sequence_ = 0;
};

struct init_hook_registrar {
    init_hook_registrar(int priority, const char* name, init_hook_registry::hook_fn hook) {
        init_hook_registry::instance().add(priority, name, std::move(hook));
    }
};

// ============================================================================
// strata_db - the explicit handle every component receives
// ============================================================================

class strata_db {
public:
    explicit strata_db(std::shared_ptr<database> db);

    /// Open an existing database. A missing file is a startup_error.
    static strata_db open(const configuration& config);

    /// Create a new database: tables for every declared entity, then init hooks.
    /// An existing file is a startup_error unless `force`, which deletes it first.
    static strata_db init(const configuration& config, bool force = false);

    /// Create missing tables for every declared entity.
    void ensure_tables();

    template<typename T>
    void ensure_table() {
        ensure_schema_table(schema_registry::instance().schema_for<T>());
    }

    // ========================================================================
    // Objects
    // ========================================================================

    /// Full construction with named values; inserts immediately.
    /// Usage: db.create<Sample>({{"name", "a"}, {"count", 3}})
    template<typename T>
    managed<T> create(const field_args& values) {
        auto object = make<T>();
        object->assign({}, values);
        object->save();
        return managed<T>(std::move(object));
    }

    /// Full construction with values in declaration order; inserts immediately.
    template<typename T, typename... Args>
        requires (!(std::is_same_v<std::remove_cvref_t<Args>, field_args> || ...))
    managed<T> create(Args&&... values) {
        auto object = make<T>();
        object->assign(std::vector<field_value>{field_value(std::forward<Args>(values))...}, {});
        object->save();
        return managed<T>(std::move(object));
    }

    /// Transient instance with only defaults populated; nothing is written until save().
    template<typename T>
    managed<T> new_empty() {
        auto object = make<T>();
        object->apply_defaults();
        return managed<T>(std::move(object));
    }

    template<typename T>
    query<T> all() {
        return query<T>(db_, schema_registry::instance().schema_for<T>());
    }

    template<typename T>
    query<T> filter(const std::string& key, const field_value& value) {
        return all<T>().where(key, value);
    }

    /// Instance with the given id; not_found_error when absent.
    template<typename T>
    managed<T> find(primary_key_t id) {
        return all<T>().where("id", id).get_one();
    }

    // ========================================================================
    // Raw statement escape hatch
    // ========================================================================

    std::optional<primary_key_t> execute(const std::string& sql,
                                         const std::vector<column_value_t>& params = {}) {
        return db_->execute(sql, params);
    }

    std::vector<database::row_t> fetch(const std::string& sql,
                                       const std::vector<column_value_t>& params = {}) {
        return db_->fetch(sql, params);
    }

    database& db() { return *db_; }
    const std::shared_ptr<database>& handle() const { return db_; }
    const std::string& path() const { return db_->path(); }

private:
    template<typename T>
    std::shared_ptr<model_base> make() {
        return std::make_shared<model_base>(db_, schema_registry::instance().schema_for<T>());
    }

    void ensure_schema_table(const entity_schema& schema);

    std::shared_ptr<database> db_;
};

} // namespace strata

#define STRATA_CONCAT_INNER(a, b) a##b
#define STRATA_CONCAT(a, b) STRATA_CONCAT_INNER(a, b)

/// Registers an init hook at static-initialization time.
/// Usage: STRATA_INIT_HOOK(10, seed_defaults);  with  void seed_defaults(strata::strata_db&);
#define STRATA_INIT_HOOK(priority, fn) \
    static ::strata::init_hook_registrar STRATA_CONCAT(_strata_init_hook_, __LINE__) { priority, #fn, fn }

#endif // __cplusplus
