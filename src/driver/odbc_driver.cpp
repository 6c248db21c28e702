#include "odbc_driver.hpp"
#include "core/odbc_connection.hpp"
#include "core/odbc_statement.hpp"
#include "core/logger.hpp"

namespace mssql_conncheck::driver {

namespace {

class OdbcCursor : public Cursor {
public:
    explicit OdbcCursor(core::OdbcConnection& conn)
        : stmt_(conn) {
        stmt_.set_query_timeout(conn.timeout());
    }

    void execute(std::string_view sql) override {
        LOG_TRACE("SQLExecDirect: " + std::string(sql));
        stmt_.execute(sql);
    }

    bool fetch() override { return stmt_.fetch(); }

    std::optional<std::string> get_string(std::size_t column) override {
        return stmt_.get_string(static_cast<SQLUSMALLINT>(column));
    }

    void close() override { stmt_.close_cursor(); }

private:
    core::OdbcStatement stmt_;
};

class OdbcRawConnection : public RawConnection {
public:
    explicit OdbcRawConnection(core::OdbcEnvironment& env)
        : conn_(env) {}

    core::OdbcConnection& handle() noexcept { return conn_; }

    std::unique_ptr<Cursor> cursor() override {
        return std::make_unique<OdbcCursor>(conn_);
    }

    void close() override { conn_.disconnect(); }

private:
    core::OdbcConnection conn_;
};

} // anonymous namespace

std::unique_ptr<RawConnection> OdbcDriver::connect(const std::string& connection_string,
                                                   const ConnectOptions& options) {
    auto raw = std::make_unique<OdbcRawConnection>(env_);

    raw->handle().set_timeout(options.timeout);
    raw->handle().set_autocommit(options.autocommit);
    raw->handle().connect(connection_string);

    LOG_DEBUG("ODBC connection established");
    return raw;
}

} // namespace mssql_conncheck::driver
