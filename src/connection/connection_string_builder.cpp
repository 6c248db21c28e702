#include "connection_string_builder.hpp"
#include "core/logger.hpp"
#include "utils/string_utils.hpp"

namespace mssql_conncheck::connection {

namespace {

const ConnectionStringFormat kOdbcFormat = {
    {
        {"DSN", &ConnectionFields::dsn},
        {"DRIVER", &ConnectionFields::driver},
        {"Server", &ConnectionFields::host},
        {"Database", &ConnectionFields::database},
        {"UID", &ConnectionFields::username},
    },
    "PWD",
    nullptr,
};

const ConnectionStringFormat kAdoFormat = {
    {
        {"Provider", &ConnectionFields::provider},
        {"Data Source", &ConnectionFields::host},
        {"Initial Catalog", &ConnectionFields::database},
        {"User ID", &ConnectionFields::username},
    },
    "Password",
    "Integrated Security=SSPI;",
};

// Connection resiliency is available from SQL Server 2014 and on Azure SQL Database
constexpr const char* kConnectRetry = "ConnectRetryCount=2;";

void append_field(std::string& out, const char* keyword, const std::optional<std::string>& value) {
    if (!utils::is_present(value)) {
        return;
    }
    out += keyword;
    out += '=';
    out += *value;
    out += ';';
}

} // anonymous namespace

const ConnectionStringFormat& connection_string_format(driver::DriverFamily family) {
    return family == driver::DriverFamily::ADODBAPI ? kAdoFormat : kOdbcFormat;
}

std::string build_connection_string(const AccessInfo& info, const config::ConnectorSettings& settings) {
    ConnectionFields fields;
    fields.dsn = info.dsn;
    fields.driver = info.driver;
    fields.host = info.host;
    fields.username = info.username;
    fields.password = info.password;
    if (!info.database.empty()) {
        fields.database = info.database;
    }
    if (settings.connector == driver::DriverFamily::ADODBAPI) {
        fields.provider = settings.adoprovider;
    }

    const auto& format = connection_string_format(settings.connector);

    std::string conn_str;
    if (settings.server_version >= config::SQLSERVER_2014) {
        conn_str += kConnectRetry;
    }
    for (const auto& spec : format.fields) {
        append_field(conn_str, spec.keyword, fields.*spec.field);
    }

    LOG_DEBUG("Connection string (before password) " + conn_str);

    append_field(conn_str, format.password_keyword, fields.password);

    if (format.integrated_security &&
        !utils::is_present(fields.username) && !utils::is_present(fields.password)) {
        conn_str += format.integrated_security;
    }

    return conn_str;
}

} // namespace mssql_conncheck::connection
