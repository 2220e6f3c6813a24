#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "errors.hpp"
#include "converter.hpp"

#include <any>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace strata {

class entity_schema;

/// Demangled name of a C++ type, for messages.
std::string readable_type_name(const std::type_info& type);

// Property kind - distinguishes stored values from references to other entities
enum class field_kind {
    value,       // stored through a converter
    reference    // foreign key column holding the referenced row's id
};

// Field descriptor (runtime info about a declared field)
struct field_descriptor {
    std::string name;
    field_kind kind = field_kind::value;
    std::type_index type = typeid(void);        // value type, or referenced entity type
    std::string type_name;
    bool nullable = false;
    bool unique = false;
    std::function<std::any()> default_factory;  // fixed defaults are wrapped as factories

    // for references: declares the target entity and returns its schema
    std::function<entity_schema&()> target_thunk;

    // filled in on first use
    const converter* conv = nullptr;
    entity_schema* target = nullptr;

    bool has_default() const { return static_cast<bool>(default_factory); }
    bool is_reference() const { return kind == field_kind::reference; }
    std::string column() const { return is_reference() ? name + "_id" : name; }
};

// Edge of the reverse reference graph: `source.field` references the owning schema
struct reference_edge {
    const entity_schema* source;
    const field_descriptor* field;
};

class entity_schema {
public:
    const std::string& name() const { return name_; }
    const std::string& table_name() const { return table_name_; }
    bool kw_only() const { return kw_only_; }
    std::type_index type() const { return type_; }

    const std::vector<field_descriptor>& fields() const { return fields_; }
    const field_descriptor* find_field(const std::string& name) const;
    /// Throws validation_error naming the entity when the field does not exist.
    const field_descriptor& field(const std::string& name) const;
    size_t field_index(const field_descriptor& f) const {
        return static_cast<size_t>(&f - fields_.data());
    }

    /// Entities with a reference field pointing at this one. Unsynchronized; other
    /// threads use schema_registry::dependents_of.
    const std::vector<reference_edge>& dependents() const { return dependents_; }

    bool resolved() const { return state_ == state::resolved; }

    /// id column followed by every field column, in declaration order.
    std::vector<std::string> column_names() const;
    table_schema table() const;

private:
    friend class schema_registry;
    friend class entity_builder;

    enum class state { declared, resolving, resolved };

    std::string name_;
    std::string table_name_;
    bool kw_only_ = false;
    std::type_index type_ = typeid(void);
    std::vector<field_descriptor> fields_;
    std::vector<reference_edge> dependents_;
    state state_ = state::declared;
};

class entity_builder;

// Chained options for a value field
template<typename V>
class field_options {
public:
    field_options(entity_builder& builder, size_t index) : builder_(builder), index_(index) {}

    field_options& unique();
    field_options& nullable();
    field_options& default_value(V value);
    field_options& default_factory(std::function<V()> factory);

private:
    field_descriptor& desc();
    entity_builder& builder_;
    size_t index_;
};

// Chained options for a reference field
class reference_options {
public:
    reference_options(entity_builder& builder, size_t index) : builder_(builder), index_(index) {}

    reference_options& nullable();
    reference_options& unique();

private:
    field_descriptor& desc();
    entity_builder& builder_;
    size_t index_;
};

/// Collects an entity's declaration. Each entity type provides
///   static void define(strata::entity_builder& e);
/// which sets the table name and lists fields in order.
class entity_builder {
public:
    entity_builder& table(std::string name) {
        schema_.table_name_ = std::move(name);
        return *this;
    }

    /// Display name used in messages; defaults to the table name.
    entity_builder& name(std::string display_name) {
        schema_.name_ = std::move(display_name);
        return *this;
    }

    /// Allow defaulted fields anywhere; positional construction is then refused.
    entity_builder& kw_only(bool value = true) {
        schema_.kw_only_ = value;
        return *this;
    }

    template<typename V>
    field_options<V> field(std::string name) {
        field_descriptor desc;
        desc.name = std::move(name);
        desc.kind = field_kind::value;
        desc.type = std::type_index(typeid(V));
        desc.type_name = readable_type_name(typeid(V));
        schema_.fields_.push_back(std::move(desc));
        return field_options<V>(*this, schema_.fields_.size() - 1);
    }

    template<typename U>
    reference_options reference(std::string name);

private:
    friend class schema_registry;
    template<typename V> friend class field_options;
    friend class reference_options;

    field_descriptor& field_at(size_t index) { return schema_.fields_[index]; }

    entity_schema schema_;
};

// Global schema registry
class schema_registry {
public:
    static schema_registry& instance();

    /// Runs T::define and records the declaration. Local checks (names, defaults
    /// order, table name clash) fail here; type checks wait for first use.
    template<typename T>
    entity_schema& declare() {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        auto it = schemas_.find(std::type_index(typeid(T)));
        if (it != schemas_.end()) {
            return *it->second;
        }
        entity_builder builder;
        T::define(builder);
        return add(std::type_index(typeid(T)), std::move(builder));
    }

    /// Declared schema with every field type and reference validated.
    template<typename T>
    const entity_schema& schema_for() {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        auto& schema = declare<T>();
        resolve(schema);
        return schema;
    }

    const entity_schema* find(std::type_index type) const;
    const entity_schema* find(const std::string& table_name) const;

    /// Resolves every declared schema. Called before tables are created and before
    /// cascades so the reverse reference graph is complete.
    void resolve_all();

    /// Resolves what it can for building the reference graph. A schema that fails
    /// is logged and left unresolved, so it has no table and no edges.
    void resolve_declared();

    bool is_resolved(const entity_schema& schema) const;

    /// Copy of schema.dependents() taken under the registry lock.
    std::vector<reference_edge> dependents_of(const entity_schema& schema) const;

    std::vector<const entity_schema*> all_schemas() const;

private:
    schema_registry() = default;

    entity_schema& add(std::type_index type, entity_builder builder);
    void resolve(entity_schema& schema);

    mutable std::recursive_mutex mutex_;
    std::unordered_map<std::type_index, std::unique_ptr<entity_schema>> schemas_;
    std::vector<entity_schema*> declaration_order_;
};

// Helper to declare an entity at static init time
template<typename T>
struct entity_registrar {
    entity_registrar() {
        schema_registry::instance().declare<T>();
    }
};

// ============================================================================
// Template implementations
// ============================================================================

template<typename V>
field_descriptor& field_options<V>::desc() {
    return builder_.field_at(index_);
}

template<typename V>
field_options<V>& field_options<V>::unique() {
    desc().unique = true;
    return *this;
}

template<typename V>
field_options<V>& field_options<V>::nullable() {
    desc().nullable = true;
    return *this;
}

template<typename V>
field_options<V>& field_options<V>::default_value(V value) {
    desc().default_factory = [value]() { return std::any(value); };
    return *this;
}

template<typename V>
field_options<V>& field_options<V>::default_factory(std::function<V()> factory) {
    desc().default_factory = [factory]() { return std::any(factory()); };
    return *this;
}

inline field_descriptor& reference_options::desc() {
    return builder_.field_at(index_);
}

inline reference_options& reference_options::nullable() {
    desc().nullable = true;
    return *this;
}

inline reference_options& reference_options::unique() {
    desc().unique = true;
    return *this;
}

template<typename U>
reference_options entity_builder::reference(std::string name) {
    field_descriptor desc;
    desc.name = std::move(name);
    desc.kind = field_kind::reference;
    desc.type = std::type_index(typeid(U));
    desc.type_name = readable_type_name(typeid(U));
    desc.target_thunk = []() -> entity_schema& {
        return schema_registry::instance().declare<U>();
    };
    schema_.fields_.push_back(std::move(desc));
    return reference_options(*this, schema_.fields_.size() - 1);
}

} // namespace strata

// ============================================================================
// STRATA_ENTITY Macro
//
// Usage:
//   struct Trip {
//       static void define(strata::entity_builder& e) {
//           e.table("trip");
//           e.field<std::string>("name").unique();
//           e.field<int64_t>("days").default_value(1);
//       }
//   };
//   STRATA_ENTITY(Trip);
// ============================================================================

#define STRATA_ENTITY(cls) \
    static ::strata::entity_registrar<cls> _strata_registrar_##cls {}

#endif // __cplusplus
