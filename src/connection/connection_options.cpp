#include "connection_options.hpp"
#include "connection_string_parser.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "utils/string_utils.hpp"
#include <algorithm>
#include <set>

namespace mssql_conncheck::connection {

namespace {

bool is_truthy(const std::optional<std::string>& value, std::initializer_list<const char*> accepted) {
    if (!value) {
        return false;
    }
    std::string lowered = utils::to_lower(*value);
    return std::any_of(accepted.begin(), accepted.end(),
                       [&](const char* candidate) { return lowered == candidate; });
}

bool has_field(const std::vector<ConnectionOption>& options, const std::optional<std::string>& field) {
    return std::any_of(options.begin(), options.end(),
                       [&](const ConnectionOption& option) { return option.config_field == field; });
}

bool is_configured(const config::InstanceConfig& instance, const std::optional<std::string>& field) {
    return field && instance.get(*field).has_value();
}

} // anonymous namespace

std::vector<ConnectionOption> connection_options(driver::DriverFamily family,
                                                 const std::optional<std::string>& database_field) {
    if (family == driver::DriverFamily::ADODBAPI) {
        return {
            {"PROVIDER", std::string("adoprovider")},
            {"Data Source", std::string("host")},
            {"Initial Catalog", database_field},
            {"User ID", std::string("username")},
            {"Password", std::string("password")},
        };
    }
    return {
        {"DSN", std::string("dsn")},
        {"DRIVER", std::string("driver")},
        {"SERVER", std::string("host")},
        {"DATABASE", database_field},
        {"UID", std::string("username")},
        {"PWD", std::string("password")},
    };
}

void validate_connection_options(const config::InstanceConfig& instance,
                                 driver::DriverFamily active,
                                 const std::optional<std::string>& db_key,
                                 const std::optional<std::string>& db_name) {
    const std::optional<std::string> database_field = db_name ? db_name : db_key;
    const driver::DriverFamily other = driver::other_family(active);
    const auto active_options = connection_options(active, database_field);
    const auto other_options = connection_options(other, database_field);
    const std::string active_name = driver::family_name(active);

    std::set<std::string> ignored;
    for (const auto& option : other_options) {
        if (!has_field(active_options, option.config_field) && is_configured(instance, option.config_field)) {
            ignored.insert(*option.config_field);
        }
    }
    for (const auto& field : ignored) {
        LOG_WARN(field + " option will be ignored since " + active_name + " connection is used");
    }

    if (!instance.connection_string) {
        return;
    }

    ConnectionProperties parsed;
    try {
        parsed = parse_connection_string_properties(*instance.connection_string);
    } catch (const core::ConfigurationError& e) {
        throw core::ConfigurationError(core::Logger::instance().mask(e.what()));
    }

    const bool windows_auth = is_truthy(parsed.find("trusted_connection"), {"yes", "true"}) ||
                              is_truthy(parsed.find("integrated security"), {"sspi", "yes", "true"});
    if (windows_auth && (instance.username || instance.password)) {
        LOG_WARN("Username and password are ignored when using Windows authentication");
    }

    for (const auto& option : active_options) {
        if (parsed.contains(option.keyword) && is_configured(instance, option.config_field)) {
            throw core::ConfigurationError(
                option.keyword + " has been provided both in the connection string and as a "
                "configuration option (" + *option.config_field + "), please specify it only once");
        }
    }

    for (const auto& option : other_options) {
        if (parsed.contains(option.keyword)) {
            throw core::ConfigurationError(
                option.keyword + " has been provided in the connection string. "
                "This option is only available for " + driver::family_name(other) +
                " connections, however " + active_name + " has been selected");
        }
    }
}

} // namespace mssql_conncheck::connection
