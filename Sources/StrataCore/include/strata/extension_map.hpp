#pragma once

#ifdef __cplusplus

#include <any>
#include <typeindex>
#include <unordered_map>
#include <utility>

namespace strata {

/// Auxiliary data attached to an object, keyed by the value's type.
/// At most one value per type; never persisted.
class extension_map {
public:
    template<typename T>
    void set(T value) {
        values_[std::type_index(typeid(T))] = std::move(value);
    }

    template<typename T>
    T* get() {
        auto it = values_.find(std::type_index(typeid(T)));
        return it == values_.end() ? nullptr : std::any_cast<T>(&it->second);
    }

    template<typename T>
    const T* get() const {
        auto it = values_.find(std::type_index(typeid(T)));
        return it == values_.end() ? nullptr : std::any_cast<T>(&it->second);
    }

    /// Returns the attached value, default-constructing it first if absent.
    template<typename T>
    T& get_or_create() {
        auto& slot = values_[std::type_index(typeid(T))];
        if (!slot.has_value()) {
            slot = T{};
        }
        return *std::any_cast<T>(&slot);
    }

    template<typename T>
    bool contains() const {
        return values_.count(std::type_index(typeid(T))) != 0;
    }

    template<typename T>
    bool erase() {
        return values_.erase(std::type_index(typeid(T))) != 0;
    }

    size_t size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }
    void clear() { values_.clear(); }

private:
    std::unordered_map<std::type_index, std::any> values_;
};

} // namespace strata

#endif // __cplusplus
