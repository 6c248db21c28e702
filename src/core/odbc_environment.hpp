#pragma once

#ifdef _WIN32
#include <windows.h>
#endif

#include <sql.h>
#include <sqlext.h>

namespace mssql_conncheck::core {

// RAII wrapper for the ODBC environment handle (ODBC 3.x behavior)
class OdbcEnvironment {
public:
    OdbcEnvironment();
    ~OdbcEnvironment();

    OdbcEnvironment(const OdbcEnvironment&) = delete;
    OdbcEnvironment& operator=(const OdbcEnvironment&) = delete;

    OdbcEnvironment(OdbcEnvironment&& other) noexcept;
    OdbcEnvironment& operator=(OdbcEnvironment&& other) noexcept;

    SQLHENV get_handle() const noexcept { return handle_; }

private:
    SQLHENV handle_ = SQL_NULL_HENV;
};

} // namespace mssql_conncheck::core
