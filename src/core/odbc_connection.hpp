#pragma once

#include "odbc_environment.hpp"
#include <chrono>
#include <string>
#include <string_view>

namespace mssql_conncheck::core {

// RAII wrapper for ODBC Connection handle
class OdbcConnection {
public:
    explicit OdbcConnection(OdbcEnvironment& env);
    ~OdbcConnection();

    // Non-copyable, non-movable (due to reference member)
    OdbcConnection(const OdbcConnection&) = delete;
    OdbcConnection& operator=(const OdbcConnection&) = delete;
    OdbcConnection(OdbcConnection&&) = delete;
    OdbcConnection& operator=(OdbcConnection&&) = delete;

    // Login and connection timeouts must be applied before connect()
    void set_timeout(std::chrono::seconds timeout);
    void set_autocommit(bool enabled);

    void connect(std::string_view connection_string);
    void disconnect();
    bool is_connected() const noexcept { return connected_; }

    std::chrono::seconds timeout() const noexcept { return timeout_; }

    SQLHDBC get_handle() const noexcept { return handle_; }
    OdbcEnvironment& get_environment() const noexcept { return env_; }

private:
    SQLHDBC handle_ = SQL_NULL_HDBC;
    OdbcEnvironment& env_;
    std::chrono::seconds timeout_{0};
    bool connected_ = false;
};

} // namespace mssql_conncheck::core
