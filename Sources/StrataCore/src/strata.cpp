#include "strata/strata.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace strata {

namespace {

bool is_memory_path(const std::string& path) {
    return path == ":memory:";
}

} // namespace

// ============================================================================
// configuration
// ============================================================================

std::string configuration::resolve_path() const {
    if (!path.empty()) {
        return path;
    }
    if (const char* env = std::getenv("DB_PATH"); env && *env) {
        return env;
    }
    if (!default_path.empty()) {
        return default_path;
    }
    LOG_ERROR("config", "No database path: set configuration::path, DB_PATH or default_path");
    throw configuration_error("No database path configured (set a path, DB_PATH, or a default path)");
}

void configuration::apply_logging() const {
    if (level) {
        set_log_level(*level);
    }
    set_debug_tags(debug_tags);
}

configuration configuration::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw configuration_error("Configuration must be a JSON object");
    }

    configuration config;
    try {
        config.path = j.value("path", std::string());
        config.default_path = j.value("default_path", std::string());
        if (j.contains("log_level")) {
            config.level = parse_log_level(j.at("log_level").get<std::string>());
        }
        if (j.contains("debug_tags")) {
            config.debug_tags = j.at("debug_tags").get<std::vector<std::string>>();
        }
    } catch (const nlohmann::json::exception& e) {
        throw configuration_error(std::string("Invalid configuration: ") + e.what());
    }
    return config;
}

configuration configuration::load_file(const std::string& file) {
    std::ifstream in(file);
    if (!in) {
        throw configuration_error("Cannot read configuration file " + file);
    }

    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw configuration_error("Cannot parse configuration file " + file + ": " + e.what());
    }
    LOG_DEBUG("config", "Loaded configuration from %s", file.c_str());
    return from_json(j);
}

// ============================================================================
// init_hook_registry
// ============================================================================

init_hook_registry& init_hook_registry::instance() {
    static init_hook_registry registry;
    return registry;
}

void init_hook_registry::add(int priority, std::string name, hook_fn hook) {
    if (!hook) {
        throw configuration_error("Init hook " + name + " has no callable");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    hooks_.push_back({priority, next_sequence_++, std::move(name), std::move(hook)});
}

void init_hook_registry::run_all(strata_db& db) const {
    std::vector<entry> hooks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        hooks = hooks_;
    }
    std::sort(hooks.begin(), hooks.end(), [](const entry& a, const entry& b) {
        return a.priority != b.priority ? a.priority < b.priority : a.sequence < b.sequence;
    });

    for (const auto& h : hooks) {
        LOG_INFO("config", "Running init hook %s (priority %d)", h.name.c_str(), h.priority);
        h.hook(db);
    }
}

size_t init_hook_registry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hooks_.size();
}

void init_hook_registry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    hooks_.clear();
}

// ============================================================================
// strata_db
// ============================================================================

strata_db::strata_db(std::shared_ptr<database> db) : db_(std::move(db)) {
    if (!db_) {
        throw validation_error("strata_db requires a database");
    }
}

strata_db strata_db::open(const configuration& config) {
    auto path = config.resolve_path();
    if (!is_memory_path(path) && !std::filesystem::exists(path)) {
        LOG_ERROR("db", "Database %s does not exist", path.c_str());
        throw startup_error("Database " + path + " does not exist; initialize it first");
    }
    return strata_db(std::make_shared<database>(path));
}

strata_db strata_db::init(const configuration& config, bool force) {
    auto path = config.resolve_path();
    if (!is_memory_path(path) && std::filesystem::exists(path)) {
        if (!force) {
            throw startup_error("Database " + path + " already exists");
        }
        LOG_WARN("db", "Erasing existing database %s", path.c_str());
        for (const auto& file : {path, path + "-wal", path + "-shm"}) {
            std::error_code ec;
            std::filesystem::remove(file, ec);
            if (ec) {
                LOG_ERROR("db", "Failed to erase %s: %s", file.c_str(), ec.message().c_str());
                throw startup_error("Failed to erase " + file + ": " + ec.message());
            }
        }
    }

    // surface declaration errors before anything is written
    schema_registry::instance().resolve_all();

    strata_db db(std::make_shared<database>(path));
    db.ensure_tables();
    init_hook_registry::instance().run_all(db);
    LOG_INFO("db", "Initialized %s", path.c_str());
    return db;
}

void strata_db::ensure_tables() {
    auto& registry = schema_registry::instance();
    registry.resolve_all();
    for (const auto* schema : registry.all_schemas()) {
        ensure_schema_table(*schema);
    }
}

void strata_db::ensure_schema_table(const entity_schema& schema) {
    if (!db_->table_exists(schema.table_name())) {
        LOG_DEBUG("schema", "Creating table %s", schema.table_name().c_str());
        db_->create_table(schema.table());
    }
}

} // namespace strata
