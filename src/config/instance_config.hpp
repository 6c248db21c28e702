#pragma once

#include "driver/driver.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mssql_conncheck::config {

constexpr int DEFAULT_COMMAND_TIMEOUT = 5;
// Unset server_version means "always modern"
constexpr int DEFAULT_SQLSERVER_VERSION = 1000000000;
constexpr int SQLSERVER_2014 = 2014;
constexpr const char* DEFAULT_ADOPROVIDER = "SQLOLEDB";

// ADO providers accepted for the `adoprovider` option (compared upper-cased)
const std::vector<std::string>& valid_adoproviders();

// Settings shared by every instance
struct InitConfig {
    std::optional<std::string> connector;
    std::optional<std::string> adoprovider;
};

// Settings of one monitored SQL Server instance
struct InstanceConfig {
    std::optional<std::string> host;
    std::optional<std::string> port;
    std::optional<std::string> username;
    std::optional<std::string> password;
    std::optional<std::string> database;
    std::optional<std::string> driver;
    std::optional<std::string> dsn;
    std::optional<std::string> connection_string;
    std::optional<std::string> connector;
    std::optional<std::string> adoprovider;
    int command_timeout = DEFAULT_COMMAND_TIMEOUT;
    int server_version = DEFAULT_SQLSERVER_VERSION;

    // Any other string option (e.g. "proc_only_if_database")
    std::map<std::string, std::string> extra;

    /**
     * @brief Value of a configuration option by its name
     *
     * Knows every named field above plus the extra options.
     * Returns std::nullopt when the option is not configured.
     */
    std::optional<std::string> get(std::string_view key) const;
};

struct CheckConfig {
    InitConfig init_config;
    std::vector<InstanceConfig> instances;
};

void from_json(const nlohmann::json& j, InitConfig& config);
void from_json(const nlohmann::json& j, InstanceConfig& config);

// Parse {"init_config": {...}, "instances": [{...}, ...]}. Throws core::ConfigurationError,
// including for integers out of range and a command_timeout that is not positive.
CheckConfig parse_config(const nlohmann::json& j);
CheckConfig load_config_file(const std::string& path);

// Immutable connector selection handed to the connection manager
struct ConnectorSettings {
    driver::DriverFamily connector = driver::DriverFamily::ADODBAPI;
    std::string adoprovider = DEFAULT_ADOPROVIDER;
    std::chrono::seconds command_timeout{DEFAULT_COMMAND_TIMEOUT};
    int server_version = DEFAULT_SQLSERVER_VERSION;
};

/**
 * @brief Resolve connector family and ADO provider for one instance
 *
 * @param available Families with a driver in this process; any other
 *        configured connector is rejected with a log line and replaced by
 *        the default (adodbapi).
 * @throws core::ConfigurationError when command_timeout is not positive
 */
ConnectorSettings resolve_connector_settings(const InitConfig& init_config,
                                             const InstanceConfig& instance,
                                             const std::vector<driver::DriverFamily>& available);

} // namespace mssql_conncheck::config
