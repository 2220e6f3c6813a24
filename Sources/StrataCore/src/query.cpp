#include "strata/query.hpp"
#include "strata/cascade.hpp"
#include "strata/log.hpp"

#include <algorithm>

namespace strata {

namespace {

cmp_op parse_op(const std::string& name, const std::string& key) {
    if (name == "eq") return cmp_op::eq;
    if (name == "lt") return cmp_op::lt;
    if (name == "lte") return cmp_op::lte;
    if (name == "gt") return cmp_op::gt;
    if (name == "gte") return cmp_op::gte;
    throw validation_error("Unknown filter operator '" + name + "' in '" + key + "'");
}

} // namespace

query_base::query_base(std::shared_ptr<database> db, const entity_schema& schema)
    : db_(std::move(db)), schema_(&schema) {
    if (!db_) {
        throw validation_error("Query over " + schema.name() + " needs a database");
    }
    spec_.table = schema.table_name();
}

column_value_t query_base::filter_storage(const std::string& field, cmp_op op,
                                          const field_value& value, std::string& column) const {
    if (value.is_null() && op != cmp_op::eq) {
        throw validation_error("Only equality filters accept null (" + field + ")");
    }

    if (field == "id") {
        column = "id";
        auto id = value.is_value() ? std::any_cast<int64_t>(&value.value()) : nullptr;
        if (!id) {
            throw validation_error(schema_->name() + ": id filters take an integer");
        }
        return *id;
    }

    const auto& f = schema_->field(field);
    column = f.column();
    if (value.is_null()) {
        return nullptr;
    }

    if (f.is_reference()) {
        if (value.is_object()) {
            const auto& target = value.object();
            if (&target->schema() != f.target) {
                throw validation_error(schema_->name() + "." + field + " references " +
                                       f.target->name() + ", not " + target->schema().name());
            }
            if (!target->id()) {
                throw validation_error("Cannot filter on unsaved " + target->schema().name());
            }
            return *target->id();
        }
        if (auto id = std::any_cast<int64_t>(&value.value())) {
            return *id;
        }
        throw validation_error(schema_->name() + "." + field + " filters take an instance or an id");
    }

    if (!value.is_value()) {
        throw validation_error(schema_->name() + "." + field + " does not take an instance");
    }
    const auto& v = value.value();
    if (std::type_index(v.type()) == f.type) {
        return f.conv->to_storage(v);
    }
    if (f.type == std::type_index(typeid(double)) && v.type() == typeid(int64_t)) {
        return static_cast<double>(std::any_cast<int64_t>(v));
    }
    throw validation_error(schema_->name() + "." + field + " expects " + f.conv->type_name);
}

query_base query_base::with_filter(const std::string& key, const field_value& value) const {
    auto split = key.rfind("__");
    if (split == std::string::npos) {
        return with_filter(key, cmp_op::eq, value);
    }
    return with_filter(key.substr(0, split), parse_op(key.substr(split + 2), key), value);
}

query_base query_base::with_filter(const std::string& field, cmp_op op, const field_value& value) const {
    std::string column;
    auto storage = filter_storage(field, op, value, column);

    for (const auto& term : spec_.filters) {
        if (term.column == column && term.op == op) {
            throw validation_error("Filter " + field + "__" + cmp_op_name(op) + " given twice");
        }
    }

    query_base next = *this;
    next.spec_.filters.push_back({column, op, std::move(storage)});
    return next;
}

query_base query_base::with_order(const std::vector<std::string>& keys) const {
    std::vector<sort_key> order;
    for (const auto& key : keys) {
        sort_key sk;
        std::string name = key;
        if (!name.empty() && (name[0] == '+' || name[0] == '-')) {
            sk.order = name[0] == '-' ? sort_order::descending : sort_order::ascending;
            name = name.substr(1);
        }
        if (name.empty()) {
            throw validation_error("Empty ordering key");
        }
        sk.column = name == "id" ? "id" : schema_->field(name).column();
        order.push_back(std::move(sk));
    }

    query_base next = *this;
    next.spec_.order = std::move(order);
    return next;
}

query_base query_base::with_slice(int64_t start, std::optional<int64_t> stop) const {
    if (sliced_) {
        throw validation_error("Query over " + schema_->name() + " is already sliced");
    }
    if (start < 0 || (stop && *stop < 0)) {
        throw validation_error("Negative slice bounds are not supported");
    }

    query_base next = *this;
    next.sliced_ = true;
    next.spec_.offset = start;
    if (stop) {
        next.spec_.limit = std::max<int64_t>(0, *stop - start);
    }
    return next;
}

std::vector<database::row_t> query_base::fetch_rows(std::optional<int64_t> max_rows) const {
    if (!max_rows) {
        return db_->select(schema_->column_names(), spec_);
    }
    auto spec = spec_;
    spec.limit = spec.limit ? std::min(*spec.limit, *max_rows) : *max_rows;
    return db_->select(schema_->column_names(), spec);
}

std::shared_ptr<model_base> query_base::materialize(const database::row_t& row) const {
    return model_base::from_row(db_, *schema_, row);
}

int64_t query_base::count() const {
    return db_->count_matching(spec_);
}

size_t query_base::remove() const {
    auto& registry = schema_registry::instance();
    registry.resolve_declared();

    if (registry.dependents_of(*schema_).empty()) {
        auto removed = db_->delete_matching(spec_);
        LOG_DEBUG("query", "Deleted %lld rows from %s", static_cast<long long>(removed),
                  schema_->table_name().c_str());
        return static_cast<size_t>(removed);
    }

    std::vector<primary_key_t> ids;
    for (const auto& row : db_->select({"id"}, spec_)) {
        ids.push_back(std::get<int64_t>(row.at("id")));
    }

    size_t removed = 0;
    for (auto id : ids) {
        // an earlier cascade in this loop may already have taken the row
        if (cascade_delete(*db_, *schema_, id).deleted > 0) {
            ++removed;
        }
    }
    LOG_DEBUG("query", "Deleted %zu of %zu matched rows from %s", removed, ids.size(),
              schema_->table_name().c_str());
    return removed;
}

} // namespace strata
