#include <gtest/gtest.h>
#include "core/odbc_connection.hpp"
#include "core/odbc_environment.hpp"
#include "core/odbc_error.hpp"
#include "driver/driver_registry.hpp"
#include "driver/odbc_driver.hpp"
#include "log_capture.hpp"
#include "stub_driver.hpp"
#include <cstdlib>

using namespace mssql_conncheck;
using namespace mssql_conncheck::core;

TEST(OdbcEnvironmentTest, GetHandleReturnsNonNull) {
    OdbcEnvironment env;
    EXPECT_NE(env.get_handle(), static_cast<SQLHENV>(SQL_NULL_HENV));
}

TEST(OdbcEnvironmentTest, MoveConstructor) {
    OdbcEnvironment env1;
    SQLHENV handle = env1.get_handle();

    OdbcEnvironment env2(std::move(env1));

    EXPECT_EQ(env2.get_handle(), handle);
    EXPECT_EQ(env1.get_handle(), static_cast<SQLHENV>(SQL_NULL_HENV));
}

TEST(OdbcConnectionTest, InitiallyNotConnected) {
    OdbcEnvironment env;
    OdbcConnection conn(env);
    EXPECT_NE(conn.get_handle(), static_cast<SQLHDBC>(SQL_NULL_HDBC));
    EXPECT_FALSE(conn.is_connected());
}

TEST(OdbcConnectionTest, TimeoutIsKept) {
    OdbcEnvironment env;
    OdbcConnection conn(env);
    conn.set_timeout(std::chrono::seconds(7));
    EXPECT_EQ(conn.timeout(), std::chrono::seconds(7));
}

TEST(OdbcConnectionTest, CleanTeardownLogsNoBranchNoise) {
    test::LogCapture log;
    {
        OdbcEnvironment env;
        OdbcConnection conn(env);
        conn.set_timeout(std::chrono::seconds(7));
        conn.disconnect();
    }
    EXPECT_FALSE(log.contains("BRANCH"));
    EXPECT_FALSE(log.contains("SQLDisconnect failed"));
}

TEST(OdbcConnectionTest, DisconnectWhenNotConnectedIsNoOp) {
    OdbcEnvironment env;
    OdbcConnection conn(env);
    EXPECT_NO_THROW(conn.disconnect());
}

TEST(OdbcDriverTest, UnknownDsnRaisesOdbcError) {
    driver::OdbcDriver odbc;
    driver::ConnectOptions options;
    options.timeout = std::chrono::seconds(1);

    try {
        odbc.connect("DSN=mssql_conncheck_no_such_dsn;", options);
        FAIL() << "expected OdbcError";
    } catch (const OdbcError& e) {
        EXPECT_FALSE(e.diagnostics().empty());
        EXPECT_NE(e.describe().find('['), std::string::npos);
    }
}

TEST(OdbcDriverTest, ConnectAndRunSetupStatement) {
    const char* conn_str = std::getenv("MSSQL_ODBC_CONNECTION");
    if (!conn_str) {
        GTEST_SKIP() << "MSSQL_ODBC_CONNECTION not set";
    }

    driver::OdbcDriver odbc;
    auto raw = odbc.connect(conn_str, driver::ConnectOptions{});
    auto cursor = raw->cursor();
    EXPECT_NO_THROW(cursor->execute("SET TRANSACTION ISOLATION LEVEL READ UNCOMMITTED"));
    cursor->close();

    cursor->execute("select name, collation_name from sys.databases;");
    bool found_master = false;
    while (cursor->fetch()) {
        if (cursor->get_string(1).value_or("") == "master") {
            found_master = true;
        }
    }
    cursor->close();
    cursor.reset();
    EXPECT_TRUE(found_master);
    EXPECT_NO_THROW(raw->close());
}

TEST(DriverRegistryTest, PlatformDriversProvideOdbc) {
    auto registry = driver::DriverRegistry::with_platform_drivers();
    EXPECT_TRUE(registry->is_available(driver::DriverFamily::ODBC));
#ifdef _WIN32
    ASSERT_NE(registry->find(driver::DriverFamily::ADODBAPI), nullptr);
    EXPECT_EQ(registry->find(driver::DriverFamily::ADODBAPI)->family(), driver::DriverFamily::ADODBAPI);
#else
    EXPECT_FALSE(registry->is_available(driver::DriverFamily::ADODBAPI));
    EXPECT_EQ(registry->find(driver::DriverFamily::ADODBAPI), nullptr);
#endif
    ASSERT_NE(registry->find(driver::DriverFamily::ODBC), nullptr);
    EXPECT_EQ(registry->find(driver::DriverFamily::ODBC)->family(), driver::DriverFamily::ODBC);
}

TEST(DriverRegistryTest, AddReplacesSameFamily) {
    driver::DriverRegistry registry;
    registry.add(std::make_unique<test::StubDriver>(driver::DriverFamily::ADODBAPI));

    auto replacement = std::make_unique<test::StubDriver>(driver::DriverFamily::ADODBAPI);
    driver::Driver* expected = replacement.get();
    registry.add(std::move(replacement));

    EXPECT_EQ(registry.available_families(), std::vector<driver::DriverFamily>{driver::DriverFamily::ADODBAPI});
    EXPECT_EQ(registry.find(driver::DriverFamily::ADODBAPI), expected);
}

TEST(DriverFamilyTest, Names) {
    EXPECT_EQ(driver::family_name(driver::DriverFamily::ODBC), "odbc");
    EXPECT_EQ(driver::parse_family("AdoDbApi"), driver::DriverFamily::ADODBAPI);
    EXPECT_FALSE(driver::parse_family("jdbc").has_value());
    EXPECT_EQ(driver::other_family(driver::DriverFamily::ODBC), driver::DriverFamily::ADODBAPI);
}
