#include "connection_manager.hpp"
#include "connection_options.hpp"
#include "connection_string_builder.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

namespace mssql_conncheck::connection {

ConnectionManager::ConnectionManager(config::InstanceConfig instance,
                                     config::ConnectorSettings settings,
                                     driver::Driver& driver,
                                     ReachabilityChecker& reachability,
                                     StatusCallback report)
    : instance_(std::move(instance)),
      settings_(std::move(settings)),
      driver_(driver),
      classifier_(reachability, settings_.command_timeout),
      report_(std::move(report)) {
    if (instance_.password) {
        core::Logger::instance().add_secret(*instance_.password);
    }

    if (driver_.family() != settings_.connector) {
        LOG_WARN("Driver family " + driver::family_name(driver_.family()) +
                 " does not match the configured connector " + driver::family_name(settings_.connector));
    }
    LOG_DEBUG("Connection initialized.");
}

ConnectionManager::~ConnectionManager() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [id, raw] : conns_) {
        try {
            raw->close();
        } catch (const std::exception& e) {
            LOG_WARN(std::string("Could not close db connection on shutdown\n") + e.what());
        }
    }
    conns_.clear();
}

AccessInfo ConnectionManager::get_access_info(const DbKey& db_key,
                                              const std::optional<std::string>& db_name) const {
    return resolve_access_info(instance_, db_key, db_name);
}

ConnectionIdentity ConnectionManager::identity(const DbKey& db_key, const std::optional<std::string>& db_name,
                                               const std::optional<std::string>& key_prefix) const {
    return ConnectionIdentity::from(key_prefix.value_or(""), get_access_info(db_key, db_name));
}

void ConnectionManager::open_db_connections(const DbKey& db_key, const std::optional<std::string>& db_name,
                                            bool is_default, const std::optional<std::string>& key_prefix) {
    const AccessInfo info = get_access_info(db_key, db_name);
    const ConnectionIdentity id = ConnectionIdentity::from(key_prefix.value_or(""), info);
    const std::string host = info.host.value_or("");

    std::string conn_str = instance_.connection_string.value_or("");
    if (!conn_str.empty()) {
        conn_str += ';';
    }

    validate_connection_options(instance_, settings_.connector, db_key, db_name);

    std::unique_ptr<driver::RawConnection> raw;
    try {
        conn_str += build_connection_string(info, settings_);

        driver::ConnectOptions options;
        options.timeout = settings_.command_timeout;
        options.autocommit = true;  // no implicit transaction

        raw = driver_.connect(conn_str, options);
        setup_new_connection(*raw);

        report_(ServiceCheckStatus::OK, host, info.database, "", is_default);
        install(id, std::move(raw));
    } catch (const std::exception& e) {
        // Connected but not cached (setup failed): release the native connection now
        if (raw) {
            try {
                raw->close();
            } catch (const std::exception& close_error) {
                LOG_WARN(std::string("Could not close db connection after failed setup\n") + close_error.what());
            }
            raw.reset();
        }

        std::string message = classifier_.classify(e, info, instance_.password);
        report_(ServiceCheckStatus::CRITICAL, host, info.database, message, is_default);

        // Only the default database aborts the check, other databases of a scan keep going
        LOG_IF(is_default, "Connection failure on default database, raising", "Connection failure on non-default database, continuing");
        if (is_default) {
            throw core::SQLConnectionError(message);
        }
    }
}

void ConnectionManager::setup_new_connection(driver::RawConnection& raw) {
    auto cursor = raw.cursor();
    // The monitoring reads must never block writers on the tables they read
    cursor->execute(SETUP_STATEMENT);
    close_cursor(*cursor);
}

void ConnectionManager::install(const ConnectionIdentity& id, std::unique_ptr<driver::RawConnection> raw) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = conns_.find(id);
    if (it == conns_.end()) {
        conns_.emplace(id, std::move(raw));
        return;
    }

    try {
        it->second->close();
    } catch (const std::exception& e) {
        LOG_INFO(std::string("Could not close db connection\n") + e.what());
    }
    it->second = std::move(raw);
}

void ConnectionManager::close_db_connections(const DbKey& db_key, const std::optional<std::string>& db_name,
                                             const std::optional<std::string>& key_prefix) {
    const ConnectionIdentity id = identity(db_key, db_name, key_prefix);

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = conns_.find(id);
    if (it == conns_.end()) {
        return;
    }

    // Open connections hold locks on the server (SQL Server Agent cannot stop), always drop the entry
    try {
        it->second->close();
    } catch (const std::exception& e) {
        LOG_WARN(std::string("Could not close db connection\n") + e.what());
    }
    conns_.erase(it);
}

std::unique_ptr<driver::Cursor> ConnectionManager::get_cursor(const DbKey& db_key,
                                                              const std::optional<std::string>& db_name,
                                                              const std::optional<std::string>& key_prefix) {
    const ConnectionIdentity id = identity(db_key, db_name, key_prefix);

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = conns_.find(id);
    if (it == conns_.end()) {
        // The identity embeds the credentials, only the host goes into the error
        throw core::ConnectionNotFoundError(instance_.host.value_or(""));
    }
    return it->second->cursor();
}

void ConnectionManager::close_cursor(driver::Cursor& cursor) {
    try {
        cursor.close();
    } catch (const std::exception& e) {
        LOG_WARN(std::string("Could not close cursor\n") + e.what());
    }
}

void ConnectionManager::check_database_conns(const std::string& db_name) {
    open_db_connections(std::nullopt, db_name, false);
    close_db_connections(std::nullopt, db_name);
}

bool ConnectionManager::has_connection(const DbKey& db_key, const std::optional<std::string>& db_name,
                                       const std::optional<std::string>& key_prefix) const {
    const ConnectionIdentity id = identity(db_key, db_name, key_prefix);
    std::lock_guard<std::mutex> lock(mutex_);
    return conns_.count(id) > 0;
}

std::size_t ConnectionManager::open_connection_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return conns_.size();
}

ManagedConnection::ManagedConnection(ConnectionManager& manager, DbKey db_key,
                                     std::optional<std::string> db_name,
                                     std::optional<std::string> key_prefix)
    : manager_(manager),
      db_key_(std::move(db_key)),
      db_name_(std::move(db_name)),
      key_prefix_(std::move(key_prefix)) {
    manager_.open_db_connections(db_key_, db_name_, true, key_prefix_);
}

ManagedConnection::~ManagedConnection() {
    manager_.close_db_connections(db_key_, db_name_, key_prefix_);
}

std::unique_ptr<ManagedConnection> ManagedConnection::default_connection(
    ConnectionManager& manager, std::optional<std::string> key_prefix) {
    return std::make_unique<ManagedConnection>(manager, std::string(DEFAULT_DB_KEY), std::nullopt,
                                               std::move(key_prefix));
}

std::unique_ptr<ManagedConnection> ManagedConnection::default_database(ConnectionManager& manager) {
    return std::make_unique<ManagedConnection>(manager, std::nullopt, std::string(DEFAULT_DATABASE));
}

ManagedCursor::ManagedCursor(ConnectionManager& manager, std::optional<std::string> key_prefix)
    : manager_(manager),
      cursor_(manager.get_cursor(std::string(DEFAULT_DB_KEY), std::nullopt, key_prefix)) {
}

ManagedCursor::~ManagedCursor() {
    manager_.close_cursor(*cursor_);
}

} // namespace mssql_conncheck::connection
