#ifdef _WIN32

#include <gtest/gtest.h>
#include "core/errors.hpp"
#include "driver/ado_driver.hpp"
#include <cstdlib>

using namespace mssql_conncheck;

TEST(AdoDriverTest, UnknownProviderRaisesProviderError) {
    driver::AdoDriver ado;
    driver::ConnectOptions options;
    options.timeout = std::chrono::seconds(1);

    try {
        ado.connect("Provider=mssql_conncheck_no_such_provider;Data Source=127.0.0.1,1;", options);
        FAIL() << "expected ProviderError";
    } catch (const core::ProviderError& e) {
        EXPECT_NE(e.hresult(), 0);
        EXPECT_EQ(e.describe().rfind("ProviderError(hresult=", 0), 0u);
    }
}

TEST(AdoDriverTest, ConnectAndReadDatabases) {
    const char* conn_str = std::getenv("MSSQL_ADO_CONNECTION");
    if (!conn_str) {
        GTEST_SKIP() << "MSSQL_ADO_CONNECTION not set";
    }

    driver::AdoDriver ado;
    auto raw = ado.connect(conn_str, driver::ConnectOptions{});
    auto cursor = raw->cursor();
    EXPECT_NO_THROW(cursor->execute("SET TRANSACTION ISOLATION LEVEL READ UNCOMMITTED"));
    EXPECT_FALSE(cursor->fetch());
    cursor->close();

    cursor->execute("select name, collation_name from sys.databases;");
    bool found_master = false;
    while (cursor->fetch()) {
        if (cursor->get_string(1).value_or("") == "master") {
            found_master = true;
        }
    }
    cursor->close();
    EXPECT_NO_THROW(cursor->close());
    cursor.reset();
    EXPECT_TRUE(found_master);
    EXPECT_NO_THROW(raw->close());
}

#endif // _WIN32
