#include "strata/converter.hpp"
#include "strata/log.hpp"

#include <cmath>

namespace strata {

namespace {

template<typename V, typename S>
converter make_builtin(const char* name,
                       std::function<S(const V&)> to_fn,
                       std::function<V(const S&)> from_fn) {
    converter conv;
    conv.type = std::type_index(typeid(V));
    conv.type_name = name;
    conv.storage = storage_column<S>::value;
    conv.builtin = true;
    std::string type_name = name;
    conv.to_storage = [to_fn](const std::any& value) -> column_value_t {
        return to_fn(std::any_cast<const V&>(value));
    };
    conv.from_storage = [from_fn, type_name](const column_value_t& value) -> std::any {
        return from_fn(detail::storage_as<S>(value, type_name));
    };
    return conv;
}

} // namespace

converter_registry& converter_registry::instance() {
    static converter_registry registry;
    return registry;
}

converter_registry::converter_registry() {
    auto add = [this](converter conv) {
        auto key = conv.type;
        converters_.emplace(key, std::move(conv));
    };

    add(make_builtin<int64_t, int64_t>("integer",
        [](const int64_t& v) { return v; },
        [](const int64_t& v) { return v; }));
    add(make_builtin<double, double>("real",
        [](const double& v) { return v; },
        [](const double& v) { return v; }));
    add(make_builtin<bool, int64_t>("boolean",
        [](const bool& v) { return static_cast<int64_t>(v ? 1 : 0); },
        [](const int64_t& v) { return v != 0; }));
    add(make_builtin<std::string, std::string>("text",
        [](const std::string& v) { return v; },
        [](const std::string& v) { return v; }));
    add(make_builtin<bytes_t, bytes_t>("bytes",
        [](const bytes_t& v) { return v; },
        [](const bytes_t& v) { return v; }));
    // Timestamp stored as double seconds since epoch; microseconds survive the trip
    add(make_builtin<timestamp_t, double>("timestamp",
        [](const timestamp_t& v) {
            return static_cast<double>(v.time_since_epoch().count()) / 1e6;
        },
        [](const double& seconds) {
            return timestamp_t(std::chrono::microseconds(std::llround(seconds * 1e6)));
        }));
}

void converter_registry::register_converter(converter conv) {
    if (!conv.to_storage || !conv.from_storage) {
        throw configuration_error("Converter for " + conv.type_name + " is missing a conversion function");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = converters_.find(conv.type);
    if (it != converters_.end()) {
        LOG_ERROR("schema", "Converter for %s already registered as %s",
                  conv.type_name.c_str(), it->second.type_name.c_str());
        if (it->second.builtin) {
            throw configuration_error("Cannot override built-in converter for " + it->second.type_name);
        }
        throw configuration_error("Converter for " + conv.type_name + " already registered");
    }

    LOG_DEBUG("schema", "Registered converter %s -> %s",
              conv.type_name.c_str(), column_type_sql(conv.storage));
    auto key = conv.type;
    converters_.emplace(key, std::move(conv));
}

const converter* converter_registry::find(std::type_index type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = converters_.find(type);
    if (it == converters_.end()) {
        return nullptr;
    }
    return &it->second;
}

} // namespace strata
