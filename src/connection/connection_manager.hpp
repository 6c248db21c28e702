#pragma once

#include "access_info.hpp"
#include "failure_classifier.hpp"
#include "reachability_checker.hpp"
#include "service_check.hpp"
#include "config/instance_config.hpp"
#include "driver/driver.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace mssql_conncheck::connection {

using DbKey = std::optional<std::string>;

/**
 * @brief Owns every live connection of one SQL Server instance
 *
 * Connections are cached by ConnectionIdentity (key prefix plus resolved
 * access info). Each identity is absent, then open, possibly reopened,
 * then closed. Reopening an identity closes the previous native connection
 * first.
 *
 * The driver and the reachability checker must outlive the manager. One mutex guards the
 * cache map; the blocking connect itself runs outside of it.
 */
class ConnectionManager {
public:
    static constexpr const char* SETUP_STATEMENT = "SET TRANSACTION ISOLATION LEVEL READ UNCOMMITTED";

    ConnectionManager(config::InstanceConfig instance,
                      config::ConnectorSettings settings,
                      driver::Driver& driver,
                      ReachabilityChecker& reachability,
                      StatusCallback report);
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    /**
     * @brief Open (or reopen) the connection for a database
     *
     * Validates the configured options, builds the connection string,
     * connects with the command timeout and autocommit on, runs
     * SETUP_STATEMENT and reports OK. On failure reports CRITICAL with a
     * classified, redacted message.
     *
     * @throws core::ConfigurationError on invalid options
     * @throws core::SQLConnectionError on connect failure when `is_default`
     */
    void open_db_connections(const DbKey& db_key, const std::optional<std::string>& db_name = std::nullopt,
                             bool is_default = true, const std::optional<std::string>& key_prefix = std::nullopt);

    // Close and forget the connection. No-op when none is open; failures are logged.
    void close_db_connections(const DbKey& db_key, const std::optional<std::string>& db_name = std::nullopt,
                              const std::optional<std::string>& key_prefix = std::nullopt);

    /**
     * @brief New cursor on an open connection
     *
     * The cursor must be released before the connection is closed.
     *
     * @throws core::ConnectionNotFoundError when no connection is open
     */
    std::unique_ptr<driver::Cursor> get_cursor(const DbKey& db_key,
                                               const std::optional<std::string>& db_name = std::nullopt,
                                               const std::optional<std::string>& key_prefix = std::nullopt);

    // Close a cursor, logging any failure
    void close_cursor(driver::Cursor& cursor);

    // Open `db_name` as a non-default database and close it again
    void check_database_conns(const std::string& db_name);

    AccessInfo get_access_info(const DbKey& db_key, const std::optional<std::string>& db_name = std::nullopt) const;

    bool has_connection(const DbKey& db_key, const std::optional<std::string>& db_name = std::nullopt,
                        const std::optional<std::string>& key_prefix = std::nullopt) const;
    std::size_t open_connection_count() const;

    const config::InstanceConfig& instance() const noexcept { return instance_; }
    const config::ConnectorSettings& settings() const noexcept { return settings_; }

private:
    ConnectionIdentity identity(const DbKey& db_key, const std::optional<std::string>& db_name,
                                const std::optional<std::string>& key_prefix) const;

    void setup_new_connection(driver::RawConnection& raw);
    void install(const ConnectionIdentity& id, std::unique_ptr<driver::RawConnection> raw);

    const config::InstanceConfig instance_;
    const config::ConnectorSettings settings_;
    driver::Driver& driver_;
    FailureClassifier classifier_;
    StatusCallback report_;

    std::map<ConnectionIdentity, std::unique_ptr<driver::RawConnection>> conns_;
    mutable std::mutex mutex_;
};

/**
 * @brief Connection opened for the lifetime of a scope
 *
 * Closes on every exit path, including exceptions. A failed open of a
 * default database throws from the constructor and nothing is closed.
 */
class ManagedConnection {
public:
    ManagedConnection(ConnectionManager& manager, DbKey db_key,
                      std::optional<std::string> db_name = std::nullopt,
                      std::optional<std::string> key_prefix = std::nullopt);
    ~ManagedConnection();

    ManagedConnection(const ManagedConnection&) = delete;
    ManagedConnection& operator=(const ManagedConnection&) = delete;

    // The configured database under DEFAULT_DB_KEY
    static std::unique_ptr<ManagedConnection> default_connection(
        ConnectionManager& manager, std::optional<std::string> key_prefix = std::nullopt);

    // The server's default database (master), used for catalog queries
    static std::unique_ptr<ManagedConnection> default_database(ConnectionManager& manager);

private:
    ConnectionManager& manager_;
    DbKey db_key_;
    std::optional<std::string> db_name_;
    std::optional<std::string> key_prefix_;
};

// Cursor on the DEFAULT_DB_KEY connection, closed when the scope ends
class ManagedCursor {
public:
    explicit ManagedCursor(ConnectionManager& manager, std::optional<std::string> key_prefix = std::nullopt);
    ~ManagedCursor();

    ManagedCursor(const ManagedCursor&) = delete;
    ManagedCursor& operator=(const ManagedCursor&) = delete;

    driver::Cursor& operator*() const noexcept { return *cursor_; }
    driver::Cursor* operator->() const noexcept { return cursor_.get(); }

private:
    ConnectionManager& manager_;
    std::unique_ptr<driver::Cursor> cursor_;
};

} // namespace mssql_conncheck::connection
