#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "errors.hpp"
#include "db.hpp"
#include "schema.hpp"
#include "extension_map.hpp"

#include <nlohmann/json.hpp>

#include <any>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace strata {

class model_base;
template<typename T> class managed;

template<typename T> struct is_managed : std::false_type {};
template<typename T> struct is_managed<managed<T>> : std::true_type {};

// ============================================================================
// field_value - a value on its way into a field, a constructor or a filter
// ============================================================================

class field_value {
public:
    field_value(std::nullptr_t) : kind_(kind::null) {}

    template<typename V>
        requires (!is_managed<std::remove_cvref_t<V>>::value &&
                  !std::is_same_v<std::remove_cvref_t<V>, field_value> &&
                  !std::is_same_v<std::remove_cvref_t<V>, std::nullptr_t>)
    field_value(V value) : kind_(kind::value), value_(normalize(std::move(value))) {}

    template<typename U>
    field_value(const managed<U>& object);

    bool is_null() const { return kind_ == kind::null; }
    bool is_value() const { return kind_ == kind::value; }
    bool is_object() const { return kind_ == kind::object; }

    const std::any& value() const { return value_; }
    const std::shared_ptr<model_base>& object() const { return object_; }

private:
    enum class kind { null, value, object };

    // Literals take the library's canonical types: text -> std::string,
    // integers -> int64_t, floating point -> double.
    template<typename V>
    static std::any normalize(V value) {
        using D = std::decay_t<V>;
        if constexpr (std::is_same_v<D, const char*> || std::is_same_v<D, char*> ||
                      std::is_same_v<D, std::string_view>) {
            return std::string(value);
        } else if constexpr (std::is_integral_v<D> && !std::is_same_v<D, bool>) {
            return static_cast<int64_t>(value);
        } else if constexpr (std::is_floating_point_v<D>) {
            return static_cast<double>(value);
        } else {
            return D(std::move(value));
        }
    }

    kind kind_;
    std::any value_;
    std::shared_ptr<model_base> object_;
};

using field_args = std::vector<std::pair<std::string, field_value>>;

// ============================================================================
// model_base - one row's worth of fields plus its lifecycle state
// ============================================================================

enum class object_state {
    transient,   // no row yet
    persisted,   // backed by a row
    stale        // the row was deleted
};

class model_base {
public:
    model_base(std::shared_ptr<database> db, const entity_schema& schema);
    virtual ~model_base() = default;

    model_base(const model_base&) = delete;
    model_base& operator=(const model_base&) = delete;

    /// Materialize a persisted instance from a row holding every schema column.
    static std::shared_ptr<model_base> from_row(std::shared_ptr<database> db,
                                                const entity_schema& schema,
                                                const database::row_t& row);

    const entity_schema& schema() const { return *schema_; }
    object_state state() const { return state_; }
    bool is_persisted() const { return state_ == object_state::persisted; }
    bool is_stale() const { return state_ == object_state::stale; }

    std::optional<primary_key_t> id() const { return id_; }
    /// Explicit id: used for the insert of a transient instance, or re-keys the
    /// row of a persisted one on its next save.
    void set_id(primary_key_t id);

    /// Populate every defaulted field (each factory runs once).
    void apply_defaults();
    /// Full construction: positional values in declaration order, then named ones;
    /// remaining fields take their defaults. Does not save.
    void assign(const std::vector<field_value>& positional, const field_args& named);

    bool has_value(const std::string& name) const;
    bool is_null(const std::string& name) const;
    /// Stored value of a non-reference field; throws when missing or null.
    const std::any& value_any(const std::string& name) const;

    template<typename V>
    V get(const std::string& name) const {
        const std::any& value = value_any(name);
        if (auto p = std::any_cast<V>(&value)) {
            return *p;
        }
        throw validation_error(schema_->name() + "." + name + " does not hold the requested type");
    }

    template<typename V>
    std::optional<V> get_opt(const std::string& name) const {
        if (is_null(name)) {
            return std::nullopt;
        }
        return get<V>(name);
    }

    void set(const std::string& name, const field_value& value);
    void set_null(const std::string& name);

    /// Loads the referenced row on first call and memoizes it. Empty for a null reference.
    std::shared_ptr<model_base> resolve_ref(const std::string& name);
    std::optional<primary_key_t> ref_id(const std::string& name) const;

    /// Insert (transient) or full-row update (persisted).
    void save();
    /// Cascade-delete the backing row, then mark this instance stale.
    void remove();

    nlohmann::json to_json() const;
    /// e.g. "sample.get_one(id=3)", "sample(<unsaved>)", "sample(<deleted>)"
    std::string describe() const;

    extension_map& extensions() { return extensions_; }
    const extension_map& extensions() const { return extensions_; }

    database& db() const { return *db_; }
    const std::shared_ptr<database>& db_handle() const { return db_; }

private:
    struct unresolved_ref {
        primary_key_t id;
    };

    // missing | null | value | reference not yet loaded | loaded reference
    using slot_t = std::variant<std::monostate, std::nullptr_t, std::any,
                                unresolved_ref, std::shared_ptr<model_base>>;

    const field_descriptor& field(const std::string& name) const;
    const slot_t& slot(const std::string& name) const;
    void require_not_stale(const char* action) const;
    database::values_t collect_values() const;
    void require_target_row(const field_descriptor& f, primary_key_t id) const;
    // points references held by other rows at the new id after a re-key
    void repoint_dependents(primary_key_t old_id, primary_key_t new_id);

    std::shared_ptr<database> db_;
    const entity_schema* schema_;
    std::vector<slot_t> slots_;
    std::optional<primary_key_t> id_;       // desired id
    std::optional<primary_key_t> db_id_;    // id of the backing row
    object_state state_ = object_state::transient;
    extension_map extensions_;
};

// ============================================================================
// managed<T> - typed handle; copies share the same instance
// ============================================================================

template<typename T>
class managed {
public:
    explicit managed(std::shared_ptr<model_base> base) : base_(std::move(base)) {
        if (!base_) {
            throw validation_error("managed handle requires an instance");
        }
    }

    std::optional<primary_key_t> id() const { return base_->id(); }
    object_state state() const { return base_->state(); }
    bool is_persisted() const { return base_->is_persisted(); }
    bool is_stale() const { return base_->is_stale(); }

    template<typename V>
    V get(const std::string& name) const { return base_->get<V>(name); }

    template<typename V>
    std::optional<V> get_opt(const std::string& name) const { return base_->get_opt<V>(name); }

    bool is_null(const std::string& name) const { return base_->is_null(name); }
    bool has_value(const std::string& name) const { return base_->has_value(name); }

    managed& set(const std::string& name, const field_value& value) {
        base_->set(name, value);
        return *this;
    }

    managed& set_null(const std::string& name) {
        base_->set_null(name);
        return *this;
    }

    managed& set_id(primary_key_t id) {
        base_->set_id(id);
        return *this;
    }

    /// Referenced instance; throws validation_error if the reference is null.
    template<typename U>
    managed<U> ref(const std::string& name) const {
        auto result = ref_opt<U>(name);
        if (!result) {
            throw validation_error(base_->schema().name() + "." + name + " is null");
        }
        return *result;
    }

    template<typename U>
    std::optional<managed<U>> ref_opt(const std::string& name) const {
        const auto& f = base_->schema().field(name);
        if (f.target != &schema_registry::instance().schema_for<U>()) {
            throw validation_error(base_->schema().name() + "." + name +
                                   " does not reference the requested entity");
        }
        auto target = base_->resolve_ref(name);
        if (!target) {
            return std::nullopt;
        }
        return managed<U>(std::move(target));
    }

    std::optional<primary_key_t> ref_id(const std::string& name) const { return base_->ref_id(name); }

    void save() { base_->save(); }
    void remove() { base_->remove(); }

    nlohmann::json to_json() const { return base_->to_json(); }
    std::string describe() const { return base_->describe(); }

    extension_map& extensions() { return base_->extensions(); }
    const extension_map& extensions() const { return base_->extensions(); }

    const std::shared_ptr<model_base>& base() const { return base_; }

    /// Same instance, or two persisted instances of the same row.
    bool operator==(const managed& other) const {
        if (base_ == other.base_) return true;
        return base_->is_persisted() && other.base_->is_persisted() && id() == other.id();
    }

private:
    std::shared_ptr<model_base> base_;
};

template<typename U>
field_value::field_value(const managed<U>& object) : kind_(kind::object), object_(object.base()) {}

} // namespace strata

#endif // __cplusplus
