#pragma once

#include "config/instance_config.hpp"
#include <optional>
#include <string>
#include <tuple>

namespace mssql_conncheck::connection {

constexpr const char* DEFAULT_DATABASE = "master";
constexpr const char* DEFAULT_DRIVER = "SQL Server";

// Configuration keys naming the database of a connection
constexpr const char* DEFAULT_DB_KEY = "database";
constexpr const char* PROC_GUARD_DB_KEY = "proc_only_if_database";

// Everything needed to address one database of the instance.
// `database` is empty only when a DSN supplies it.
struct AccessInfo {
    std::optional<std::string> dsn;
    std::optional<std::string> host;       // "host,port"
    std::optional<std::string> username;
    std::optional<std::string> password;
    std::string database;
    std::optional<std::string> driver;
};

/**
 * @brief Merge the instance's discrete fields with defaults
 *
 * The database is `db_name` when given, otherwise the value of the option
 * named by `db_key`. Without a DSN, a missing host becomes
 * DEFAULT_HOST_WITH_PORT, a missing database DEFAULT_DATABASE and a missing
 * driver DEFAULT_DRIVER.
 */
AccessInfo resolve_access_info(const config::InstanceConfig& instance,
                               const std::optional<std::string>& db_key,
                               const std::optional<std::string>& db_name = std::nullopt);

// Cache key of a live connection. Holds the password: never log or print it.
struct ConnectionIdentity {
    std::string key_prefix;
    std::optional<std::string> dsn;
    std::optional<std::string> host;
    std::optional<std::string> username;
    std::optional<std::string> password;
    std::string database;
    std::optional<std::string> driver;

    static ConnectionIdentity from(const std::string& key_prefix, const AccessInfo& info);

    auto tie() const {
        return std::tie(key_prefix, dsn, host, username, password, database, driver);
    }

    bool operator<(const ConnectionIdentity& other) const {
        return tie() < other.tie();
    }
    bool operator==(const ConnectionIdentity& other) const {
        return tie() == other.tie();
    }
};

} // namespace mssql_conncheck::connection
