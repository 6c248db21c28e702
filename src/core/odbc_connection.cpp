#include "odbc_connection.hpp"
#include "odbc_error.hpp"
#include "logger.hpp"

namespace mssql_conncheck::core {

OdbcConnection::OdbcConnection(OdbcEnvironment& env)
    : env_(env) {
    SQLRETURN ret = SQLAllocHandle(SQL_HANDLE_DBC, env_.get_handle(), &handle_);
    check_odbc_result(ret, SQL_HANDLE_ENV, env_.get_handle(), "SQLAllocHandle(DBC)");
}

OdbcConnection::~OdbcConnection() {
    if (connected_) {
        SQLRETURN ret = SQLDisconnect(handle_);
        if (!SQL_SUCCEEDED(ret)) {
            LOG_WARN("SQLDisconnect failed in destructor");
        }
    }

    if (handle_ != SQL_NULL_HDBC) {
        SQLFreeHandle(SQL_HANDLE_DBC, handle_);
    }
}

void OdbcConnection::set_timeout(std::chrono::seconds timeout) {
    auto value = static_cast<SQLULEN>(timeout.count());

    SQLRETURN ret = SQLSetConnectAttr(handle_, SQL_ATTR_LOGIN_TIMEOUT,
                                      reinterpret_cast<SQLPOINTER>(value), SQL_IS_UINTEGER);
    check_odbc_result(ret, SQL_HANDLE_DBC, handle_, "SQLSetConnectAttr(LOGIN_TIMEOUT)");

    // Not every driver supports SQL_ATTR_CONNECTION_TIMEOUT (HYC00), the login timeout is what bounds connect()
    ret = SQLSetConnectAttr(handle_, SQL_ATTR_CONNECTION_TIMEOUT,
                            reinterpret_cast<SQLPOINTER>(value), SQL_IS_UINTEGER);
    if (!SQL_SUCCEEDED(ret)) {
        LOG_DEBUG("SQL_ATTR_CONNECTION_TIMEOUT not supported by driver");
    }

    timeout_ = timeout;
}

void OdbcConnection::set_autocommit(bool enabled) {
    SQLRETURN ret = SQLSetConnectAttr(
        handle_, SQL_ATTR_AUTOCOMMIT,
        reinterpret_cast<SQLPOINTER>(static_cast<SQLULEN>(enabled ? SQL_AUTOCOMMIT_ON : SQL_AUTOCOMMIT_OFF)),
        SQL_IS_UINTEGER);
    check_odbc_result(ret, SQL_HANDLE_DBC, handle_, "SQLSetConnectAttr(AUTOCOMMIT)");
}

void OdbcConnection::connect(std::string_view connection_string) {
    if (connected_) {
        throw OdbcError("Already connected");
    }

    SQLCHAR out_conn_str[1024];
    SQLSMALLINT out_conn_str_len;

    SQLRETURN ret = SQLDriverConnect(
        handle_,
        nullptr,  // No window handle
        (SQLCHAR*)connection_string.data(),
        static_cast<SQLSMALLINT>(connection_string.length()),
        out_conn_str,
        sizeof(out_conn_str),
        &out_conn_str_len,
        SQL_DRIVER_NOPROMPT
    );

    check_odbc_result(ret, SQL_HANDLE_DBC, handle_, "SQLDriverConnect");
    connected_ = true;
}

void OdbcConnection::disconnect() {
    if (!connected_) {
        return;
    }

    SQLRETURN ret = SQLDisconnect(handle_);
    check_odbc_result(ret, SQL_HANDLE_DBC, handle_, "SQLDisconnect");
    connected_ = false;
}

} // namespace mssql_conncheck::core
