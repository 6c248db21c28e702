#include "access_info.hpp"
#include "host_port.hpp"
#include "core/logger.hpp"
#include "utils/string_utils.hpp"

namespace mssql_conncheck::connection {

AccessInfo resolve_access_info(const config::InstanceConfig& instance,
                               const std::optional<std::string>& db_key,
                               const std::optional<std::string>& db_name) {
    AccessInfo info;
    info.dsn = instance.dsn;
    info.username = instance.username;
    info.password = instance.password;
    info.driver = instance.driver;
    info.host = resolve_host_with_port(instance.host, instance.port);

    if (db_name) {
        info.database = *db_name;
    } else if (db_key) {
        info.database = instance.get(*db_key).value_or("");
    }

    if (!utils::is_present(info.dsn)) {
        if (!utils::is_present(info.host)) {
            LOG_DEBUG(std::string("No host provided, falling back to defaults: ") + DEFAULT_HOST_WITH_PORT);
            info.host = DEFAULT_HOST_WITH_PORT;
        }
        if (info.database.empty()) {
            LOG_DEBUG(std::string("No database provided, falling back to default: ") + DEFAULT_DATABASE);
            info.database = DEFAULT_DATABASE;
        }
        if (!utils::is_present(info.driver)) {
            LOG_DEBUG(std::string("No driver provided, falling back to default: ") + DEFAULT_DRIVER);
            info.driver = DEFAULT_DRIVER;
        }
    }

    return info;
}

ConnectionIdentity ConnectionIdentity::from(const std::string& key_prefix, const AccessInfo& info) {
    ConnectionIdentity identity;
    identity.key_prefix = key_prefix;
    identity.dsn = info.dsn;
    identity.host = info.host;
    identity.username = info.username;
    identity.password = info.password;
    identity.database = info.database;
    identity.driver = info.driver;
    return identity;
}

} // namespace mssql_conncheck::connection
