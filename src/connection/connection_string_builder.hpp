#pragma once

#include "access_info.hpp"
#include "config/instance_config.hpp"
#include "driver/driver.hpp"
#include <optional>
#include <string>
#include <vector>

namespace mssql_conncheck::connection {

// Values a generated connection string can carry
struct ConnectionFields {
    std::optional<std::string> provider;
    std::optional<std::string> dsn;
    std::optional<std::string> driver;
    std::optional<std::string> host;
    std::optional<std::string> database;
    std::optional<std::string> username;
    std::optional<std::string> password;
};

struct FieldSpec {
    const char* keyword;
    std::optional<std::string> ConnectionFields::*field;
};

// Wire format of one family: fields in emission order, then the password
struct ConnectionStringFormat {
    std::vector<FieldSpec> fields;
    const char* password_keyword;
    // Appended when neither username nor password is set (nullptr: never)
    const char* integrated_security;
};

const ConnectionStringFormat& connection_string_format(driver::DriverFamily family);

/**
 * @brief Generate the family-specific part of the connection string
 *
 * Only present fields are emitted, each as "Keyword=value;".
 * "ConnectRetryCount=2;" is prepended for SQL Server 2014 and later.
 * The string is logged at debug level before the password is appended.
 */
std::string build_connection_string(const AccessInfo& info, const config::ConnectorSettings& settings);

} // namespace mssql_conncheck::connection
