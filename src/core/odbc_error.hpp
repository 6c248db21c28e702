#pragma once

#include "errors.hpp"
#include <string>
#include <vector>

#ifdef _WIN32
#include <windows.h>
#endif

#include <sql.h>
#include <sqlext.h>

namespace mssql_conncheck::core {

// Diagnostic record from SQLGetDiagRec
struct OdbcDiagnostic {
    std::string sqlstate;           // 5-character SQLSTATE code
    SQLINTEGER native_error = 0;    // Driver-specific error code
    std::string message;
    SQLSMALLINT record_number = 0;
};

// Error raised by the ODBC driver manager or driver
class OdbcError : public DriverError {
public:
    // Extract all diagnostic records from a handle
    static OdbcError from_handle(SQLSMALLINT handle_type, SQLHANDLE handle, const std::string& context = "");

    explicit OdbcError(const std::string& message);
    OdbcError(const std::string& message, std::vector<OdbcDiagnostic> diagnostics);

    const std::vector<OdbcDiagnostic>& diagnostics() const noexcept { return diagnostics_; }

    std::string format_diagnostics() const;

    // Single-line rendering of every diagnostic record
    std::string describe() const override;

private:
    std::vector<OdbcDiagnostic> diagnostics_;
};

// Check ODBC return code and throw on error
void check_odbc_result(SQLRETURN ret, SQLSMALLINT handle_type, SQLHANDLE handle, const std::string& context);

} // namespace mssql_conncheck::core
