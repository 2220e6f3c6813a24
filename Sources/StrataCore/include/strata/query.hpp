#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "errors.hpp"
#include "db.hpp"
#include "schema.hpp"
#include "managed.hpp"

#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace strata {

/// Untyped part of a query: an immutable scan description over one entity table.
/// Nothing runs until a terminal operation is called.
class query_base {
public:
    query_base(std::shared_ptr<database> db, const entity_schema& schema);

    const query_spec& spec() const { return spec_; }
    const entity_schema& schema() const { return *schema_; }

    /// Rows matching the filters, ignoring the slice window.
    int64_t count() const;

    /// Deletes the filtered, ordered and windowed result set through the cascade
    /// engine, one row at a time. Returns the number of matching rows removed.
    size_t remove() const;

protected:
    // key is "field" or "field__op" with op one of eq, lt, lte, gt, gte
    query_base with_filter(const std::string& key, const field_value& value) const;
    query_base with_filter(const std::string& field, cmp_op op, const field_value& value) const;
    // "+field", "-field" or "field"; replaces the previous ordering
    query_base with_order(const std::vector<std::string>& keys) const;
    query_base with_slice(int64_t start, std::optional<int64_t> stop) const;

    std::vector<database::row_t> fetch_rows(std::optional<int64_t> max_rows = std::nullopt) const;
    std::shared_ptr<model_base> materialize(const database::row_t& row) const;

    const std::shared_ptr<database>& db() const { return db_; }

private:
    column_value_t filter_storage(const std::string& field, cmp_op op, const field_value& value,
                                  std::string& column) const;

    std::shared_ptr<database> db_;
    const entity_schema* schema_;
    query_spec spec_;
    bool sliced_ = false;
};

template<typename T>
class query : public query_base {
public:
    query(std::shared_ptr<database> db, const entity_schema& schema)
        : query_base(std::move(db), schema) {}

    // ========================================================================
    // Refinements - each returns a new query
    // ========================================================================

    /// Usage: q.where("name", "a"), q.where("count__gte", 3)
    query where(const std::string& key, const field_value& value) const {
        return query(with_filter(key, value));
    }

    query where(const std::string& field, cmp_op op, const field_value& value) const {
        return query(with_filter(field, op, value));
    }

    query where(const field_args& filters) const {
        query next = *this;
        for (const auto& [key, value] : filters) {
            next = query(next.with_filter(key, value));
        }
        return next;
    }

    /// Usage: q.order_by({"-last_activity", "id"})
    query order_by(std::initializer_list<std::string> keys) const {
        return query(with_order(std::vector<std::string>(keys)));
    }

    query order_by(const std::vector<std::string>& keys) const {
        return query(with_order(keys));
    }

    /// Python-style [start:stop] window applied after filtering and ordering.
    query slice(int64_t start, std::optional<int64_t> stop = std::nullopt) const {
        return query(with_slice(start, stop));
    }

    // ========================================================================
    // Iteration - every begin() re-issues the query
    // ========================================================================

    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = managed<T>;
        using difference_type = std::ptrdiff_t;
        using pointer = void;
        using reference = managed<T>;

        iterator() = default;

        managed<T> operator*() const {
            if (!current_) {
                current_ = managed<T>(owner_->materialize((*rows_)[index_]));
            }
            return *current_;
        }

        iterator& operator++() {
            ++index_;
            current_.reset();
            return *this;
        }

        iterator operator++(int) {
            iterator previous = *this;
            ++*this;
            return previous;
        }

        bool operator==(const iterator& other) const {
            if (at_end() || other.at_end()) {
                return at_end() == other.at_end();
            }
            return rows_ == other.rows_ && index_ == other.index_;
        }

    private:
        friend class query;

        iterator(std::shared_ptr<const query> owner,
                 std::shared_ptr<const std::vector<database::row_t>> rows)
            : owner_(std::move(owner)), rows_(std::move(rows)) {}

        bool at_end() const { return !rows_ || index_ >= rows_->size(); }

        std::shared_ptr<const query> owner_;
        std::shared_ptr<const std::vector<database::row_t>> rows_;
        size_t index_ = 0;
        mutable std::optional<managed<T>> current_;
    };

    iterator begin() const {
        auto rows = std::make_shared<const std::vector<database::row_t>>(fetch_rows());
        return iterator(std::make_shared<const query>(*this), std::move(rows));
    }

    iterator end() const { return iterator(); }

    std::vector<managed<T>> to_vector() const {
        std::vector<managed<T>> out;
        for (const auto& row : fetch_rows()) {
            out.emplace_back(materialize(row));
        }
        return out;
    }

    // ========================================================================
    // Single-row access
    // ========================================================================

    /// Exactly one match: not_found_error on none, ambiguous_result_error on several.
    managed<T> get_one() const {
        auto result = get_opt();
        if (!result) {
            throw not_found_error(schema().name() + " matching query does not exist");
        }
        return *result;
    }

    /// Empty on no match; still ambiguous_result_error on several.
    std::optional<managed<T>> get_opt() const {
        auto rows = fetch_rows(2);
        if (rows.size() > 1) {
            throw ambiguous_result_error("More than one " + schema().name() + " matches query");
        }
        if (rows.empty()) {
            return std::nullopt;
        }
        return managed<T>(materialize(rows.front()));
    }

    std::optional<managed<T>> first() const {
        auto rows = fetch_rows(1);
        if (rows.empty()) {
            return std::nullopt;
        }
        return managed<T>(materialize(rows.front()));
    }

private:
    explicit query(query_base base) : query_base(std::move(base)) {}
};

} // namespace strata

#endif // __cplusplus
