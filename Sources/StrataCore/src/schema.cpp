#include "strata/schema.hpp"
#include "strata/log.hpp"

#include <cxxabi.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <memory>
#include <set>

namespace strata {

std::string readable_type_name(const std::type_info& type) {
    int status = 0;
    std::unique_ptr<char, void (*)(void*)> demangled(
        abi::__cxa_demangle(type.name(), nullptr, nullptr, &status), std::free);
    if (status != 0 || !demangled) {
        return type.name();
    }
    return demangled.get();
}

namespace {

// Names the engine or the row layout already claims
const std::set<std::string> k_reserved_names = {
    "id", "rowid", "oid", "_rowid_",
    "abort", "add", "all", "alter", "and", "as", "asc", "between", "by", "case",
    "check", "collate", "column", "commit", "constraint", "create", "cross",
    "default", "delete", "desc", "distinct", "drop", "else", "end", "escape",
    "except", "exists", "foreign", "from", "full", "glob", "group", "having",
    "in", "index", "inner", "insert", "intersect", "into", "is", "isnull", "join",
    "key", "left", "like", "limit", "match", "natural", "not", "notnull", "null",
    "offset", "on", "or", "order", "outer", "primary", "references", "regexp",
    "replace", "right", "rollback", "select", "set", "table", "then", "to",
    "transaction", "union", "unique", "update", "using", "values", "when",
    "where", "with"
};

bool is_valid_field_name(const std::string& name) {
    if (name.empty() || !std::islower(static_cast<unsigned char>(name[0]))) {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](char c) {
        auto u = static_cast<unsigned char>(c);
        return std::islower(u) || std::isdigit(u) || c == '_';
    });
}

bool is_valid_table_name(const std::string& name) {
    if (name.empty() || std::isdigit(static_cast<unsigned char>(name[0]))) {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](char c) {
        auto u = static_cast<unsigned char>(c);
        return std::isalnum(u) || c == '_';
    });
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

// ============================================================================
// entity_schema
// ============================================================================

const field_descriptor* entity_schema::find_field(const std::string& name) const {
    for (const auto& f : fields_) {
        if (f.name == name) {
            return &f;
        }
    }
    return nullptr;
}

const field_descriptor& entity_schema::field(const std::string& name) const {
    auto f = find_field(name);
    if (!f) {
        throw validation_error(name_ + " has no field '" + name + "'");
    }
    return *f;
}

std::vector<std::string> entity_schema::column_names() const {
    std::vector<std::string> columns;
    columns.reserve(fields_.size() + 1);
    columns.push_back("id");
    for (const auto& f : fields_) {
        columns.push_back(f.column());
    }
    return columns;
}

table_schema entity_schema::table() const {
    table_schema ts;
    ts.name = table_name_;

    column_def id;
    id.name = "id";
    id.type = column_type::integer;
    id.is_primary_key = true;
    ts.columns.push_back(id);

    for (const auto& f : fields_) {
        column_def col;
        col.name = f.column();
        col.nullable = f.nullable;
        col.is_unique = f.unique;
        if (f.is_reference()) {
            col.type = column_type::integer;
            if (f.target) {
                col.foreign_key_table = f.target->table_name();
            }
        } else {
            col.type = f.conv ? f.conv->storage : column_type::blob;
        }
        ts.columns.push_back(std::move(col));
    }
    return ts;
}

// ============================================================================
// schema_registry
// ============================================================================

schema_registry& schema_registry::instance() {
    static schema_registry registry;
    return registry;
}

entity_schema& schema_registry::add(std::type_index type, entity_builder builder) {
    auto schema = std::make_unique<entity_schema>(std::move(builder.schema_));
    schema->type_ = type;

    if (!is_valid_table_name(schema->table_name_)) {
        throw declaration_error("Entity " + std::string(type.name()) +
                                " declares invalid table name '" + schema->table_name_ + "'");
    }
    if (schema->name_.empty()) {
        schema->name_ = schema->table_name_;
    }
    const auto& entity = schema->name_;

    for (const auto& [_, existing] : schemas_) {
        if (lower(existing->table_name_) == lower(schema->table_name_)) {
            throw declaration_error("Table name '" + schema->table_name_ + "' of " + entity +
                                    " is already used by " + existing->name_);
        }
    }

    std::set<std::string> columns;
    bool seen_default = false;
    for (const auto& f : schema->fields_) {
        if (f.name == "id") {
            throw declaration_error(entity + ": field name 'id' is reserved");
        }
        if (!f.name.empty() && f.name[0] == '_') {
            throw declaration_error(entity + ": field '" + f.name + "' must not start with '_'");
        }
        if (!is_valid_field_name(f.name)) {
            throw declaration_error(entity + ": field '" + f.name + "' must be a lowercase identifier");
        }
        if (k_reserved_names.count(f.name)) {
            throw declaration_error(entity + ": field name '" + f.name + "' is reserved");
        }
        if (!columns.insert(f.column()).second || f.column() == "id") {
            throw declaration_error(entity + ": duplicate field or column '" + f.column() + "'");
        }
        if (f.has_default()) {
            seen_default = true;
        } else if (seen_default && !schema->kw_only_) {
            throw declaration_error(entity + ": field '" + f.name +
                                    "' without default follows a defaulted field");
        }
    }

    LOG_DEBUG("schema", "Declared %s (table %s, %zu fields)",
              entity.c_str(), schema->table_name_.c_str(), schema->fields_.size());

    auto* raw = schema.get();
    schemas_.emplace(type, std::move(schema));
    declaration_order_.push_back(raw);
    return *raw;
}

void schema_registry::resolve(entity_schema& schema) {
    // resolved, or in progress further up the stack: the pointer is the forward handle
    if (schema.state_ != entity_schema::state::declared) {
        return;
    }

    schema.state_ = entity_schema::state::resolving;
    std::vector<std::pair<entity_schema*, reference_edge>> edges;
    try {
        for (auto& f : schema.fields_) {
            if (f.is_reference()) {
                entity_schema* target = nullptr;
                try {
                    target = &f.target_thunk();
                } catch (const declaration_error& e) {
                    throw declaration_error(schema.name_ + ": reference field '" + f.name +
                                            "' targets an invalid entity: " + e.what());
                }
                f.target = target;
                resolve(*target);
                edges.push_back({target, reference_edge{&schema, &f}});
            } else {
                f.conv = converter_registry::instance().find(f.type);
                if (!f.conv) {
                    LOG_ERROR("schema", "%s: field '%s' has unregistered type %s",
                              schema.name_.c_str(), f.name.c_str(), f.type_name.c_str());
                    throw declaration_error(schema.name_ + ": field '" + f.name +
                                            "' has a type with no registered converter (" +
                                            f.type_name + ")");
                }
            }
        }
    } catch (const db_error&) {
        schema.state_ = entity_schema::state::declared;
        throw;
    }

    for (auto& [target, edge] : edges) {
        target->dependents_.push_back(edge);
    }
    schema.state_ = entity_schema::state::resolved;
    LOG_DEBUG("schema", "Resolved %s", schema.name_.c_str());
}

void schema_registry::resolve_all() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    // resolving may declare more entities, so index rather than iterate
    for (size_t i = 0; i < declaration_order_.size(); ++i) {
        resolve(*declaration_order_[i]);
    }
}

void schema_registry::resolve_declared() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    for (size_t i = 0; i < declaration_order_.size(); ++i) {
        try {
            resolve(*declaration_order_[i]);
        } catch (const declaration_error& e) {
            LOG_WARN("schema", "Leaving %s out of the reference graph: %s",
                     declaration_order_[i]->name_.c_str(), e.what());
        }
    }
}

bool schema_registry::is_resolved(const entity_schema& schema) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return schema.resolved();
}

std::vector<reference_edge> schema_registry::dependents_of(const entity_schema& schema) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return schema.dependents_;
}

const entity_schema* schema_registry::find(std::type_index type) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = schemas_.find(type);
    if (it == schemas_.end()) {
        return nullptr;
    }
    return it->second.get();
}

const entity_schema* schema_registry::find(const std::string& table_name) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    for (const auto* schema : declaration_order_) {
        if (schema->table_name_ == table_name) {
            return schema;
        }
    }
    return nullptr;
}

std::vector<const entity_schema*> schema_registry::all_schemas() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return {declaration_order_.begin(), declaration_order_.end()};
}

} // namespace strata
