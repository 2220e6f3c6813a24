#include "strata/managed.hpp"
#include "strata/cascade.hpp"
#include "strata/log.hpp"

#include <cstdio>

namespace strata {

namespace {

nlohmann::json storage_to_json(const column_value_t& value) {
    return std::visit([](auto&& v) -> nlohmann::json {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return nullptr;
        } else if constexpr (std::is_same_v<T, bytes_t>) {
            std::string hex;
            hex.reserve(v.size() * 2);
            char buf[3];
            for (auto b : v) {
                std::snprintf(buf, sizeof(buf), "%02x", b);
                hex += buf;
            }
            return hex;
        } else {
            return v;
        }
    }, value);
}

bool row_exists(database& db, const std::string& table, primary_key_t id) {
    query_spec spec;
    spec.table = table;
    spec.filters.push_back({"id", cmp_op::eq, id});
    return db.count_matching(spec) > 0;
}

} // namespace

model_base::model_base(std::shared_ptr<database> db, const entity_schema& schema)
    : db_(std::move(db)), schema_(&schema), slots_(schema.fields().size()) {
    if (!db_) {
        throw validation_error("Instances of " + schema.name() + " need a database");
    }
    if (!schema_registry::instance().is_resolved(schema)) {
        throw declaration_error("Schema of " + schema.name() + " used before it was resolved");
    }
}

std::shared_ptr<model_base> model_base::from_row(std::shared_ptr<database> db,
                                                 const entity_schema& schema,
                                                 const database::row_t& row) {
    auto object = std::make_shared<model_base>(std::move(db), schema);

    auto id_it = row.find("id");
    if (id_it == row.end() || !std::holds_alternative<int64_t>(id_it->second)) {
        throw consistency_error("Row of " + schema.name() + " has no integer id");
    }
    object->id_ = std::get<int64_t>(id_it->second);
    object->db_id_ = object->id_;

    const auto& fields = schema.fields();
    for (size_t i = 0; i < fields.size(); ++i) {
        const auto& f = fields[i];
        auto it = row.find(f.column());
        if (it == row.end()) {
            throw consistency_error("Row of " + schema.name() + " lacks column " + f.column());
        }
        const auto& value = it->second;
        if (std::holds_alternative<std::nullptr_t>(value)) {
            object->slots_[i] = nullptr;
        } else if (f.is_reference()) {
            if (!std::holds_alternative<int64_t>(value)) {
                throw consistency_error(schema.name() + "." + f.name + " holds a non-integer reference");
            }
            object->slots_[i] = unresolved_ref{std::get<int64_t>(value)};
        } else {
            object->slots_[i] = f.conv->from_storage(value);
        }
    }

    object->state_ = object_state::persisted;
    return object;
}

const field_descriptor& model_base::field(const std::string& name) const {
    return schema_->field(name);
}

const model_base::slot_t& model_base::slot(const std::string& name) const {
    return slots_[schema_->field_index(field(name))];
}

void model_base::require_not_stale(const char* action) const {
    if (state_ == object_state::stale) {
        LOG_ERROR("object", "Attempt to %s %s", action, describe().c_str());
        throw consistency_error(std::string("Cannot ") + action + " " + describe() +
                                ": its row was deleted");
    }
}

void model_base::set_id(primary_key_t id) {
    require_not_stale("re-key");
    if (id < 0) {
        throw validation_error(schema_->name() + ": id must not be negative");
    }
    id_ = id;
}

void model_base::apply_defaults() {
    const auto& fields = schema_->fields();
    for (size_t i = 0; i < fields.size(); ++i) {
        if (fields[i].has_default()) {
            slots_[i] = fields[i].default_factory();
        }
    }
}

void model_base::assign(const std::vector<field_value>& positional, const field_args& named) {
    const auto& fields = schema_->fields();
    const auto& entity = schema_->name();

    if (!positional.empty() && schema_->kw_only()) {
        throw validation_error(entity + " accepts named values only");
    }
    if (positional.size() > fields.size()) {
        throw validation_error(entity + " takes at most " + std::to_string(fields.size()) +
                               " values, got " + std::to_string(positional.size()));
    }

    std::vector<bool> assigned(fields.size(), false);
    for (size_t i = 0; i < positional.size(); ++i) {
        set(fields[i].name, positional[i]);
        assigned[i] = true;
    }

    bool id_assigned = false;
    for (const auto& [name, value] : named) {
        if (name == "id") {
            if (id_assigned) {
                throw validation_error(entity + " got multiple values for 'id'");
            }
            auto id = value.is_value() ? std::any_cast<int64_t>(&value.value()) : nullptr;
            if (!id) {
                throw validation_error(entity + ": id must be an integer");
            }
            set_id(*id);
            id_assigned = true;
            continue;
        }
        auto f = schema_->find_field(name);
        if (!f) {
            throw validation_error(entity + " got an unexpected field '" + name + "'");
        }
        auto index = schema_->field_index(*f);
        if (assigned[index]) {
            throw validation_error(entity + " got multiple values for field '" + name + "'");
        }
        set(name, value);
        assigned[index] = true;
    }

    std::string missing;
    for (size_t i = 0; i < fields.size(); ++i) {
        if (assigned[i]) continue;
        if (fields[i].has_default()) {
            slots_[i] = fields[i].default_factory();
        } else {
            missing += missing.empty() ? "" : ", ";
            missing += fields[i].name;
        }
    }
    if (!missing.empty()) {
        throw validation_error(entity + " is missing values for: " + missing);
    }
}

bool model_base::has_value(const std::string& name) const {
    return !std::holds_alternative<std::monostate>(slot(name));
}

bool model_base::is_null(const std::string& name) const {
    return std::holds_alternative<std::nullptr_t>(slot(name));
}

const std::any& model_base::value_any(const std::string& name) const {
    const auto& f = field(name);
    if (f.is_reference()) {
        throw validation_error(schema_->name() + "." + name + " is a reference; use ref()");
    }
    const auto& s = slots_[schema_->field_index(f)];
    if (std::holds_alternative<std::monostate>(s)) {
        throw validation_error(schema_->name() + "." + name + " has no value");
    }
    if (std::holds_alternative<std::nullptr_t>(s)) {
        throw validation_error(schema_->name() + "." + name + " is null");
    }
    return std::get<std::any>(s);
}

void model_base::set(const std::string& name, const field_value& value) {
    const auto& f = field(name);
    auto& s = slots_[schema_->field_index(f)];

    if (value.is_null()) {
        set_null(name);
        return;
    }

    if (f.is_reference()) {
        if (!value.is_object()) {
            throw validation_error(schema_->name() + "." + name + " takes an instance of " +
                                   f.target->name());
        }
        const auto& target = value.object();
        if (&target->schema() != f.target) {
            throw validation_error(schema_->name() + "." + name + " takes " + f.target->name() +
                                   ", not " + target->schema().name());
        }
        if (!target->is_persisted()) {
            throw validation_error(schema_->name() + "." + name + ": " + target->describe() +
                                   " must be saved before it can be referenced");
        }
        s = target;
        return;
    }

    if (!value.is_value()) {
        throw validation_error(schema_->name() + "." + name + " does not take an instance");
    }
    const auto& v = value.value();
    if (std::type_index(v.type()) == f.type) {
        s = v;
    } else if (f.type == std::type_index(typeid(double)) && v.type() == typeid(int64_t)) {
        s = std::any(static_cast<double>(std::any_cast<int64_t>(v)));
    } else {
        throw validation_error(schema_->name() + "." + name + " expects " + f.conv->type_name);
    }
}

void model_base::set_null(const std::string& name) {
    const auto& f = field(name);
    if (!f.nullable) {
        throw validation_error(schema_->name() + "." + name + " is not nullable");
    }
    slots_[schema_->field_index(f)] = nullptr;
}

std::shared_ptr<model_base> model_base::resolve_ref(const std::string& name) {
    const auto& f = field(name);
    if (!f.is_reference()) {
        throw validation_error(schema_->name() + "." + name + " is not a reference");
    }
    require_not_stale("resolve a reference of");

    auto& s = slots_[schema_->field_index(f)];
    if (std::holds_alternative<std::monostate>(s)) {
        throw validation_error(schema_->name() + "." + name + " has no value");
    }
    if (std::holds_alternative<std::nullptr_t>(s)) {
        return nullptr;
    }
    if (auto loaded = std::get_if<std::shared_ptr<model_base>>(&s)) {
        return *loaded;
    }

    auto target_id = std::get<unresolved_ref>(s).id;
    query_spec spec;
    spec.table = f.target->table_name();
    spec.filters.push_back({"id", cmp_op::eq, target_id});

    auto rows = db_->select(f.target->column_names(), spec);
    if (rows.empty()) {
        LOG_ERROR("object", "%s.%s references missing %s id=%lld", describe().c_str(),
                  name.c_str(), f.target->name().c_str(), static_cast<long long>(target_id));
        throw consistency_error(describe() + "." + name + " references " + f.target->name() +
                                " id=" + std::to_string(target_id) + ", which does not exist");
    }

    auto target = from_row(db_, *f.target, rows.front());
    s = target;
    return target;
}

std::optional<primary_key_t> model_base::ref_id(const std::string& name) const {
    const auto& f = field(name);
    if (!f.is_reference()) {
        throw validation_error(schema_->name() + "." + name + " is not a reference");
    }
    const auto& s = slots_[schema_->field_index(f)];
    if (auto unresolved = std::get_if<unresolved_ref>(&s)) {
        return unresolved->id;
    }
    if (auto loaded = std::get_if<std::shared_ptr<model_base>>(&s)) {
        return (*loaded)->id();
    }
    return std::nullopt;
}

void model_base::require_target_row(const field_descriptor& f, primary_key_t id) const {
    if (!row_exists(*db_, f.target->table_name(), id)) {
        LOG_ERROR("object", "%s.%s references missing %s id=%lld", describe().c_str(),
                  f.name.c_str(), f.target->name().c_str(), static_cast<long long>(id));
        throw consistency_error(describe() + "." + f.name + " references " + f.target->name() +
                                " id=" + std::to_string(id) + ", which does not exist");
    }
}

void model_base::repoint_dependents(primary_key_t old_id, primary_key_t new_id) {
    auto& registry = schema_registry::instance();
    registry.resolve_declared();
    for (const auto& edge : registry.dependents_of(*schema_)) {
        query_spec spec;
        spec.table = edge.source->table_name();
        spec.filters.push_back({edge.field->column(), cmp_op::eq, old_id});
        auto moved = db_->update_matching(spec, {{edge.field->column(), new_id}});
        if (moved > 0) {
            LOG_DEBUG("object", "Moved %lld %s.%s references to id=%lld",
                      static_cast<long long>(moved), edge.source->name().c_str(),
                      edge.field->name.c_str(), static_cast<long long>(new_id));
        }
    }
}

database::values_t model_base::collect_values() const {
    database::values_t values;
    const auto& fields = schema_->fields();
    values.reserve(fields.size() + 1);

    for (size_t i = 0; i < fields.size(); ++i) {
        const auto& f = fields[i];
        const auto& s = slots_[i];

        if (std::holds_alternative<std::monostate>(s)) {
            throw validation_error(describe() + " is missing a value for '" + f.name + "'");
        }
        if (std::holds_alternative<std::nullptr_t>(s)) {
            if (!f.nullable) {
                throw validation_error(describe() + "." + f.name + " is not nullable");
            }
            values.emplace_back(f.column(), nullptr);
        } else if (auto v = std::get_if<std::any>(&s)) {
            values.emplace_back(f.column(), f.conv->to_storage(*v));
        } else if (auto unresolved = std::get_if<unresolved_ref>(&s)) {
            require_target_row(f, unresolved->id);
            values.emplace_back(f.column(), unresolved->id);
        } else {
            const auto& target = std::get<std::shared_ptr<model_base>>(s);
            if (target->is_stale()) {
                throw consistency_error(describe() + "." + f.name + " references " +
                                        target->describe());
            }
            if (!target->id()) {
                throw validation_error(describe() + "." + f.name + " references an unsaved " +
                                       target->schema().name());
            }
            if (target.get() != this) {
                require_target_row(f, *target->id());
            }
            values.emplace_back(f.column(), *target->id());
        }
    }
    return values;
}

void model_base::save() {
    require_not_stale("save");
    database::values_t values;
    try {
        values = collect_values();
    } catch (const consistency_error&) {
        // the row may have gone in the same cascade as its target
        if (state_ == object_state::persisted && !row_exists(*db_, schema_->table_name(), *db_id_)) {
            state_ = object_state::stale;
        }
        throw;
    }
    const auto& table = schema_->table_name();

    if (state_ == object_state::transient) {
        if (id_) {
            values.emplace(values.begin(), "id", *id_);
        }
        auto new_id = db_->insert(table, values);
        id_ = new_id;
        db_id_ = new_id;
        state_ = object_state::persisted;
        LOG_DEBUG("object", "Inserted %s", describe().c_str());
        return;
    }

    values.emplace(values.begin(), "id", *id_);
    if (db_->update_by_key(table, *db_id_, values) == 0) {
        state_ = object_state::stale;
        LOG_ERROR("object", "Row of %s id=%lld vanished before save", schema_->name().c_str(),
                  static_cast<long long>(*db_id_));
        throw consistency_error("Cannot save " + schema_->name() + " id=" +
                                std::to_string(*db_id_) + ": its row was deleted");
    }
    if (db_id_ != id_) {
        repoint_dependents(*db_id_, *id_);
        LOG_INFO("object", "Re-keyed %s from id=%lld", describe().c_str(),
                 static_cast<long long>(*db_id_));
    }
    db_id_ = id_;
}

void model_base::remove() {
    require_not_stale("delete");
    if (state_ != object_state::persisted) {
        throw validation_error("Cannot delete " + describe() + ": it was never saved");
    }
    cascade_delete(*db_, *schema_, *db_id_);
    state_ = object_state::stale;
}

nlohmann::json model_base::to_json() const {
    nlohmann::json j;
    j["entity"] = schema_->name();
    j["id"] = id_ ? nlohmann::json(*id_) : nlohmann::json(nullptr);
    if (state_ == object_state::stale) {
        j["fields"] = "<deleted>";
        return j;
    }

    auto fields_json = nlohmann::json::object();
    const auto& fields = schema_->fields();
    for (size_t i = 0; i < fields.size(); ++i) {
        const auto& f = fields[i];
        const auto& s = slots_[i];
        if (std::holds_alternative<std::monostate>(s)) {
            fields_json[f.name] = "<missing>";
        } else if (std::holds_alternative<std::nullptr_t>(s)) {
            fields_json[f.name] = nullptr;
        } else if (auto v = std::get_if<std::any>(&s)) {
            fields_json[f.name] = storage_to_json(f.conv->to_storage(*v));
        } else {
            auto target_id = ref_id(f.name);
            fields_json[f.name] = {
                {"ref", f.target->table_name()},
                {"id", target_id ? nlohmann::json(*target_id) : nlohmann::json(nullptr)}
            };
        }
    }
    j["fields"] = std::move(fields_json);
    return j;
}

std::string model_base::describe() const {
    switch (state_) {
        case object_state::transient:
            return schema_->name() + "(<unsaved>)";
        case object_state::stale:
            return schema_->name() + "(<deleted>)";
        case object_state::persisted:
            break;
    }
    return schema_->name() + ".get_one(id=" + std::to_string(*id_) + ")";
}

} // namespace strata
