#pragma once

#include "odbc_connection.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace mssql_conncheck::core {

// RAII wrapper for ODBC Statement handle
class OdbcStatement {
public:
    explicit OdbcStatement(OdbcConnection& conn);
    ~OdbcStatement();

    // Non-copyable, non-movable (due to reference member)
    OdbcStatement(const OdbcStatement&) = delete;
    OdbcStatement& operator=(const OdbcStatement&) = delete;
    OdbcStatement(OdbcStatement&&) = delete;
    OdbcStatement& operator=(OdbcStatement&&) = delete;

    void set_query_timeout(std::chrono::seconds timeout);

    void execute(std::string_view sql);
    bool fetch();

    // Column value of the current row as text, std::nullopt for SQL NULL (1-based column)
    std::optional<std::string> get_string(SQLUSMALLINT column);

    void close_cursor();

    SQLHSTMT get_handle() const noexcept { return handle_; }
    OdbcConnection& get_connection() const noexcept { return conn_; }

private:
    void recycle() noexcept;

    SQLHSTMT handle_ = SQL_NULL_HSTMT;
    OdbcConnection& conn_;
};

} // namespace mssql_conncheck::core
