#include "instance_config.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "utils/string_utils.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <limits>
#include <set>

namespace mssql_conncheck::config {

namespace {

const std::set<std::string> kNamedKeys = {
    "host", "port", "username", "password", "database", "driver", "dsn",
    "connection_string", "connector", "adoprovider", "command_timeout", "server_version",
};

// Strings are taken as-is, numbers and booleans rendered as text, null means unset
std::optional<std::string> scalar_to_string(const nlohmann::json& value) {
    if (value.is_null()) {
        return std::nullopt;
    }
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_number() || value.is_boolean()) {
        return value.dump();
    }
    return std::nullopt;
}

std::optional<std::string> optional_string(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end()) {
        return std::nullopt;
    }
    if (!it->is_null() && !it->is_primitive()) {
        throw core::ConfigurationError(std::string("Option '") + key + "' must be a string");
    }
    return scalar_to_string(*it);
}

[[noreturn]] void invalid_integer(const char* key, const nlohmann::json& value) {
    throw core::ConfigurationError(std::string("Option '") + key + "' must be an integer, got: " + value.dump());
}

int integer_option(const nlohmann::json& j, const char* key, int default_value) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return default_value;
    }

    constexpr auto kMin = std::numeric_limits<int>::min();
    constexpr auto kMax = std::numeric_limits<int>::max();

    if (it->is_number_unsigned()) {
        auto value = it->get<std::uint64_t>();
        if (value > static_cast<std::uint64_t>(kMax)) {
            invalid_integer(key, *it);
        }
        return static_cast<int>(value);
    }
    if (it->is_number_integer()) {
        auto value = it->get<std::int64_t>();
        if (value < kMin || value > kMax) {
            invalid_integer(key, *it);
        }
        return static_cast<int>(value);
    }
    if (it->is_number_float()) {
        // Fractions are truncated, out-of-range and non-finite values rejected
        double value = it->get<double>();
        if (!std::isfinite(value) || value < static_cast<double>(kMin) || value >= static_cast<double>(kMax) + 1.0) {
            invalid_integer(key, *it);
        }
        return static_cast<int>(value);
    }
    if (it->is_string()) {
        try {
            std::size_t consumed = 0;
            std::string text = it->get<std::string>();
            int value = std::stoi(text, &consumed);
            if (consumed == text.size()) {
                return value;
            }
        } catch (const std::logic_error&) {
            // invalid_argument or out_of_range, reported below
        }
    }
    invalid_integer(key, *it);
}

void check_command_timeout(int seconds) {
    if (seconds <= 0) {
        throw core::ConfigurationError("Option 'command_timeout' must be a positive number of seconds, got: " +
                                       std::to_string(seconds));
    }
}

bool is_valid_adoprovider(const std::string& provider) {
    const auto& valid = valid_adoproviders();
    return std::find(valid.begin(), valid.end(), utils::to_upper(provider)) != valid.end();
}

bool is_available(const std::vector<driver::DriverFamily>& available, driver::DriverFamily family) {
    return std::find(available.begin(), available.end(), family) != available.end();
}

} // anonymous namespace

const std::vector<std::string>& valid_adoproviders() {
    static const std::vector<std::string> providers = {"SQLOLEDB", "MSOLEDBSQL", "MSOLEDBSQL19", "SQLNCLI11"};
    return providers;
}

std::optional<std::string> InstanceConfig::get(std::string_view key) const {
    if (key == "host") return host;
    if (key == "port") return port;
    if (key == "username") return username;
    if (key == "password") return password;
    if (key == "database") return database;
    if (key == "driver") return driver;
    if (key == "dsn") return dsn;
    if (key == "connection_string") return connection_string;
    if (key == "connector") return connector;
    if (key == "adoprovider") return adoprovider;
    if (key == "command_timeout") return std::to_string(command_timeout);
    if (key == "server_version") return std::to_string(server_version);

    auto it = extra.find(std::string(key));
    if (it == extra.end()) {
        return std::nullopt;
    }
    return it->second;
}

void from_json(const nlohmann::json& j, InitConfig& config) {
    if (j.is_null()) {
        config = InitConfig{};
        return;
    }
    if (!j.is_object()) {
        throw core::ConfigurationError("init_config must be an object");
    }
    config.connector = optional_string(j, "connector");
    config.adoprovider = optional_string(j, "adoprovider");
}

void from_json(const nlohmann::json& j, InstanceConfig& config) {
    if (!j.is_object()) {
        throw core::ConfigurationError("Each instance must be an object");
    }

    config.host = optional_string(j, "host");
    config.port = optional_string(j, "port");
    config.username = optional_string(j, "username");
    config.password = optional_string(j, "password");
    config.database = optional_string(j, "database");
    config.driver = optional_string(j, "driver");
    config.dsn = optional_string(j, "dsn");
    config.connection_string = optional_string(j, "connection_string");
    config.connector = optional_string(j, "connector");
    config.adoprovider = optional_string(j, "adoprovider");
    config.command_timeout = integer_option(j, "command_timeout", DEFAULT_COMMAND_TIMEOUT);
    check_command_timeout(config.command_timeout);
    config.server_version = integer_option(j, "server_version", DEFAULT_SQLSERVER_VERSION);

    config.extra.clear();
    for (const auto& [key, value] : j.items()) {
        if (kNamedKeys.count(key) > 0) {
            continue;
        }
        if (auto text = scalar_to_string(value)) {
            config.extra[key] = *text;
        }
    }
}

CheckConfig parse_config(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw core::ConfigurationError("Configuration root must be an object");
    }

    CheckConfig config;

    auto init_it = j.find("init_config");
    if (init_it != j.end()) {
        config.init_config = init_it->get<InitConfig>();
    }

    auto instances_it = j.find("instances");
    if (instances_it == j.end() || !instances_it->is_array() || instances_it->empty()) {
        throw core::ConfigurationError("Configuration must contain a non-empty 'instances' list");
    }
    for (const auto& instance : *instances_it) {
        config.instances.push_back(instance.get<InstanceConfig>());
    }

    return config;
}

CheckConfig load_config_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw core::ConfigurationError("Could not open configuration file: " + path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw core::ConfigurationError("Invalid JSON in " + path + ": " + e.what());
    }

    LOG_DEBUG("Loaded configuration file " + path);
    return parse_config(j);
}

ConnectorSettings resolve_connector_settings(const InitConfig& init_config,
                                             const InstanceConfig& instance,
                                             const std::vector<driver::DriverFamily>& available) {
    check_command_timeout(instance.command_timeout);

    ConnectorSettings settings;
    settings.command_timeout = std::chrono::seconds(instance.command_timeout);
    settings.server_version = instance.server_version;

    // Process-wide default connector
    driver::DriverFamily default_connector = driver::DriverFamily::ADODBAPI;
    if (!init_config.connector) {
        LOG_DEBUG("`connector` config value was not set, defaulting to adodbapi");
    } else {
        auto family = driver::parse_family(*init_config.connector);
        if (family && is_available(available, *family)) {
            default_connector = *family;
        } else {
            LOG_ERROR("Invalid database connector " + *init_config.connector + ", defaulting to adodbapi");
        }
    }

    // Per-instance override
    settings.connector = default_connector;
    if (instance.connector) {
        auto family = driver::parse_family(*instance.connector);
        if (!family || !is_available(available, *family)) {
            LOG_WARN("Invalid database connector " + *instance.connector + " using default " +
                     driver::family_name(default_connector));
        } else if (*family != default_connector) {
            LOG_DEBUG("Overriding default connector for " + instance.host.value_or("") + " with " +
                      driver::family_name(*family));
            settings.connector = *family;
        }
    }

    std::string default_provider = DEFAULT_ADOPROVIDER;
    if (init_config.adoprovider) {
        if (is_valid_adoprovider(*init_config.adoprovider)) {
            default_provider = *init_config.adoprovider;
        } else {
            LOG_ERROR("Invalid ADODB provider string " + *init_config.adoprovider + ", defaulting to " +
                      DEFAULT_ADOPROVIDER);
        }
    }

    settings.adoprovider = default_provider;
    if (instance.adoprovider && *instance.adoprovider != default_provider) {
        if (!is_valid_adoprovider(*instance.adoprovider)) {
            LOG_WARN("Invalid ADO provider " + *instance.adoprovider + " using default " + default_provider);
        } else {
            LOG_DEBUG("Overriding default ADO provider for " + instance.host.value_or("") + " with " +
                      *instance.adoprovider);
            settings.adoprovider = *instance.adoprovider;
        }
    }

    return settings;
}

} // namespace mssql_conncheck::config
