#include "strata/log.hpp"
#include "strata/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <set>

namespace strata {

std::atomic<log_level> g_log_level{log_level::off};
std::atomic<bool> g_has_debug_tags{false};

namespace {

const char* const k_known_tags[] = {"db", "schema", "object", "cascade", "query", "config"};

std::mutex& tags_mutex() {
    static std::mutex m;
    return m;
}

std::set<std::string>& tags_storage() {
    static std::set<std::string> tags;
    return tags;
}

std::string trim_lower(const std::string& s) {
    auto begin = s.find_first_not_of(" \t");
    if (begin == std::string::npos) return {};
    auto end = s.find_last_not_of(" \t");
    std::string out = s.substr(begin, end - begin + 1);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

void set_debug_tags(const std::vector<std::string>& tags) {
    std::lock_guard<std::mutex> lock(tags_mutex());
    auto& stored = tags_storage();
    stored.clear();
    for (const auto& tag : tags) {
        bool known = std::any_of(std::begin(k_known_tags), std::end(k_known_tags),
                                 [&](const char* k) { return tag == k; });
        if (!known) {
            LOG_WARN("config", "Unknown log tag '%s' enabled for debug", tag.c_str());
        }
        stored.insert(tag);
    }
    g_has_debug_tags.store(!stored.empty(), std::memory_order_relaxed);
}

std::vector<std::string> debug_tags() {
    std::lock_guard<std::mutex> lock(tags_mutex());
    const auto& stored = tags_storage();
    return {stored.begin(), stored.end()};
}

bool is_debug_tag(const char* tag) {
    std::lock_guard<std::mutex> lock(tags_mutex());
    return tags_storage().count(tag) != 0;
}

log_level parse_log_level(const std::string& name) {
    auto value = trim_lower(name);
    if (value == "off") return log_level::off;
    if (value == "error") return log_level::error;
    if (value == "warn" || value == "warning") return log_level::warn;
    if (value == "info") return log_level::info;
    if (value == "debug") return log_level::debug;
    throw configuration_error("Unknown log level: " + name);
}

void configure_logging(const std::string& value) {
    auto v = trim_lower(value);
    if (v == "1" || v == "true" || v == "yes" || v == "y") {
        set_log_level(log_level::debug);
        set_debug_tags({});
        return;
    }

    set_log_level(log_level::info);
    if (v.empty() || v == "0" || v == "false" || v == "no" || v == "n") {
        set_debug_tags({});
        return;
    }

    std::vector<std::string> tags;
    size_t start = 0;
    while (start <= v.size()) {
        size_t comma = v.find(',', start);
        if (comma == std::string::npos) comma = v.size();
        auto tag = trim_lower(v.substr(start, comma - start));
        if (!tag.empty()) tags.push_back(tag);
        start = comma + 1;
    }
    set_debug_tags(tags);
}

void configure_logging_from_env() {
    const char* env = std::getenv("LOG_DEBUG");
    configure_logging(env ? env : "");
}

} // namespace strata
