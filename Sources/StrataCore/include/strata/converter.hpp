#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "errors.hpp"

#include <any>
#include <concepts>
#include <functional>
#include <mutex>
#include <string>
#include <typeindex>
#include <unordered_map>

namespace strata {

// The four types a converter may map a domain value onto
template<typename S>
concept storage_primitive = std::same_as<S, int64_t> ||
                            std::same_as<S, double> ||
                            std::same_as<S, std::string> ||
                            std::same_as<S, bytes_t>;

// Type trait to get column_type from a storage primitive
template<typename S>
struct storage_column;

template<> struct storage_column<int64_t> {
    static constexpr column_type value = column_type::integer;
};
template<> struct storage_column<double> {
    static constexpr column_type value = column_type::real;
};
template<> struct storage_column<std::string> {
    static constexpr column_type value = column_type::text;
};
template<> struct storage_column<bytes_t> {
    static constexpr column_type value = column_type::blob;
};

// Type-erased converter between a domain type and one storage primitive
struct converter {
    std::type_index type = typeid(void);
    std::string type_name;
    column_type storage = column_type::blob;
    std::function<column_value_t(const std::any&)> to_storage;
    std::function<std::any(const column_value_t&)> from_storage;
    bool builtin = false;
};

class converter_registry {
public:
    static converter_registry& instance();

    /// Installs a converter. A type may be registered once; built-ins are pre-registered.
    /// Throws configuration_error on re-registration.
    void register_converter(converter conv);

    const converter* find(std::type_index type) const;
    bool contains(std::type_index type) const { return find(type) != nullptr; }

    template<typename V>
    const converter* find() const { return find(std::type_index(typeid(V))); }

private:
    converter_registry();
    mutable std::mutex mutex_;
    std::unordered_map<std::type_index, converter> converters_;
};

namespace detail {

// Storage values come back exactly as the engine typed them; coerce the
// REAL/INTEGER affinity mismatch and reject anything else.
template<typename S>
S storage_as(const column_value_t& v, const std::string& type_name) {
    if (auto p = std::get_if<S>(&v)) return *p;
    if constexpr (std::is_same_v<S, double>) {
        if (auto i = std::get_if<int64_t>(&v)) return static_cast<double>(*i);
    }
    if constexpr (std::is_same_v<S, int64_t>) {
        if (auto d = std::get_if<double>(&v)) return static_cast<int64_t>(*d);
    }
    throw consistency_error("Stored value has wrong storage type for " + type_name);
}

} // namespace detail

/// Register a converter for domain type V stored as primitive S.
/// Usage:
///   strata::register_converter<color, std::string>("color",
///       [](const color& c) { return c.name(); },
///       [](const std::string& s) { return color::parse(s); });
template<typename V, storage_primitive S>
void register_converter(std::string type_name,
                        std::function<S(const V&)> to_fn,
                        std::function<V(const S&)> from_fn) {
    converter conv;
    conv.type = std::type_index(typeid(V));
    conv.type_name = type_name;
    conv.storage = storage_column<S>::value;
    conv.to_storage = [to_fn](const std::any& value) -> column_value_t {
        return to_fn(std::any_cast<const V&>(value));
    };
    conv.from_storage = [from_fn, type_name](const column_value_t& value) -> std::any {
        return from_fn(detail::storage_as<S>(value, type_name));
    };
    converter_registry::instance().register_converter(std::move(conv));
}

} // namespace strata

#endif // __cplusplus
