#pragma once

#ifdef __cplusplus

#include <stdexcept>
#include <string>

namespace strata {

/// Base of every error raised by the library. Thrown directly for storage engine failures.
class db_error : public std::runtime_error {
public:
    explicit db_error(const std::string& msg) : std::runtime_error(msg) {}
};

/// A UNIQUE or PRIMARY KEY constraint rejected an insert or update.
class already_exists_error : public db_error {
public:
    explicit already_exists_error(const std::string& msg) : db_error(msg) {}
};

/// A single-row lookup matched nothing.
class not_found_error : public db_error {
public:
    explicit not_found_error(const std::string& msg) : db_error(msg) {}
};

/// A single-row lookup matched more than one row.
class ambiguous_result_error : public db_error {
public:
    explicit ambiguous_result_error(const std::string& msg) : db_error(msg) {}
};

/// An entity declaration is malformed or names an unknown field type.
class declaration_error : public db_error {
public:
    explicit declaration_error(const std::string& msg) : db_error(msg) {}
};

/// Bad setup: converter registered twice, no database path, unreadable config file.
class configuration_error : public db_error {
public:
    explicit configuration_error(const std::string& msg) : db_error(msg) {}
};

/// Caller supplied values or query arguments that do not fit the schema.
class validation_error : public db_error {
public:
    explicit validation_error(const std::string& msg) : db_error(msg) {}
};

/// In-memory state no longer matches storage (stale instance, dangling reference).
class consistency_error : public db_error {
public:
    explicit consistency_error(const std::string& msg) : db_error(msg) {}
};

/// The storage engine or database file is unusable for this process.
class startup_error : public db_error {
public:
    explicit startup_error(const std::string& msg) : db_error(msg) {}
};

} // namespace strata

#endif // __cplusplus
