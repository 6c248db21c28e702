#include "odbc_statement.hpp"
#include "odbc_error.hpp"

namespace mssql_conncheck::core {

OdbcStatement::OdbcStatement(OdbcConnection& conn)
    : conn_(conn) {
    SQLRETURN ret = SQLAllocHandle(SQL_HANDLE_STMT, conn_.get_handle(), &handle_);
    check_odbc_result(ret, SQL_HANDLE_DBC, conn_.get_handle(), "SQLAllocHandle(STMT)");
}

OdbcStatement::~OdbcStatement() {
    if (handle_ != SQL_NULL_HSTMT) {
        SQLFreeHandle(SQL_HANDLE_STMT, handle_);
    }
}

void OdbcStatement::recycle() noexcept {
    // SQL_CLOSE silently succeeds even when no cursor is open,
    // unlike SQLCloseCursor which returns 24000 in that case.
    SQLFreeStmt(handle_, SQL_CLOSE);
    SQLFreeStmt(handle_, SQL_RESET_PARAMS);
}

void OdbcStatement::set_query_timeout(std::chrono::seconds timeout) {
    SQLRETURN ret = SQLSetStmtAttr(handle_, SQL_ATTR_QUERY_TIMEOUT,
                                   reinterpret_cast<SQLPOINTER>(static_cast<SQLULEN>(timeout.count())),
                                   SQL_IS_UINTEGER);
    check_odbc_result(ret, SQL_HANDLE_STMT, handle_, "SQLSetStmtAttr(QUERY_TIMEOUT)");
}

void OdbcStatement::execute(std::string_view sql) {
    recycle();
    SQLRETURN ret = SQLExecDirect(handle_, (SQLCHAR*)sql.data(), static_cast<SQLINTEGER>(sql.length()));

    // A statement that produces no result set (SET ...) may legitimately return SQL_NO_DATA
    if (ret == SQL_NO_DATA) {
        return;
    }
    check_odbc_result(ret, SQL_HANDLE_STMT, handle_, "SQLExecDirect");
}

bool OdbcStatement::fetch() {
    SQLRETURN ret = SQLFetch(handle_);

    if (ret == SQL_NO_DATA) {
        return false;
    }

    // Allow SQL_SUCCESS_WITH_INFO (warnings)
    if (ret == SQL_SUCCESS || ret == SQL_SUCCESS_WITH_INFO) {
        return true;
    }

    check_odbc_result(ret, SQL_HANDLE_STMT, handle_, "SQLFetch");
    return false;
}

std::optional<std::string> OdbcStatement::get_string(SQLUSMALLINT column) {
    std::string value;
    SQLCHAR buffer[256];

    for (;;) {
        SQLLEN indicator = 0;
        SQLRETURN ret = SQLGetData(handle_, column, SQL_C_CHAR, buffer, sizeof(buffer), &indicator);

        if (ret == SQL_NO_DATA) {
            break;
        }
        check_odbc_result(ret, SQL_HANDLE_STMT, handle_, "SQLGetData");

        if (indicator == SQL_NULL_DATA) {
            return std::nullopt;
        }

        // On truncation (01004) the buffer is full minus the terminator, fetch the next chunk
        if (ret == SQL_SUCCESS_WITH_INFO &&
            (indicator == SQL_NO_TOTAL || indicator >= static_cast<SQLLEN>(sizeof(buffer)))) {
            value.append(reinterpret_cast<char*>(buffer), sizeof(buffer) - 1);
            continue;
        }

        value.append(reinterpret_cast<char*>(buffer), static_cast<std::size_t>(indicator));
        break;
    }

    return value;
}

void OdbcStatement::close_cursor() {
    SQLRETURN ret = SQLFreeStmt(handle_, SQL_CLOSE);
    check_odbc_result(ret, SQL_HANDLE_STMT, handle_, "SQLFreeStmt(CLOSE)");
}

} // namespace mssql_conncheck::core
