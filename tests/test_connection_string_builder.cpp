#include <gtest/gtest.h>
#include "connection/connection_string_builder.hpp"
#include "log_capture.hpp"

using namespace mssql_conncheck;
using namespace mssql_conncheck::connection;
using mssql_conncheck::test::LogCapture;

namespace {

config::ConnectorSettings settings_for(driver::DriverFamily family, int server_version) {
    config::ConnectorSettings settings;
    settings.connector = family;
    settings.server_version = server_version;
    return settings;
}

} // anonymous namespace

TEST(ConnectionStringBuilderTest, OdbcDefaults) {
    config::InstanceConfig instance;
    instance.host = "dbhost,1500";

    AccessInfo info = resolve_access_info(instance, std::string(DEFAULT_DB_KEY));
    auto settings = settings_for(driver::DriverFamily::ODBC, config::DEFAULT_SQLSERVER_VERSION);

    EXPECT_EQ(build_connection_string(info, settings),
              "ConnectRetryCount=2;DRIVER=SQL Server;Server=dbhost,1500;Database=master;");
}

TEST(ConnectionStringBuilderTest, OdbcCredentialsBeforeServer2014) {
    AccessInfo info;
    info.driver = "ODBC Driver 18 for SQL Server";
    info.host = "db01,1433";
    info.database = "AppDb";
    info.username = "monitor";
    info.password = "hunter2";

    EXPECT_EQ(build_connection_string(info, settings_for(driver::DriverFamily::ODBC, 2012)),
              "DRIVER=ODBC Driver 18 for SQL Server;Server=db01,1433;Database=AppDb;UID=monitor;PWD=hunter2;");
}

TEST(ConnectionStringBuilderTest, OdbcDsnOnly) {
    AccessInfo info;
    info.dsn = "sqlserver-prod";

    EXPECT_EQ(build_connection_string(info, settings_for(driver::DriverFamily::ODBC, 2014)),
              "ConnectRetryCount=2;DSN=sqlserver-prod;");
}

TEST(ConnectionStringBuilderTest, AdoIntegratedSecurityWithoutCredentials) {
    config::InstanceConfig instance;
    instance.host = "db01";
    AccessInfo info = resolve_access_info(instance, std::string(DEFAULT_DB_KEY));

    EXPECT_EQ(build_connection_string(info, settings_for(driver::DriverFamily::ADODBAPI, 2012)),
              "Provider=SQLOLEDB;Data Source=db01,1433;Initial Catalog=master;Integrated Security=SSPI;");
}

TEST(ConnectionStringBuilderTest, AdoCredentials) {
    AccessInfo info;
    info.host = "db01,1433";
    info.database = "AppDb";
    info.username = "monitor";
    info.password = "hunter2";

    auto settings = settings_for(driver::DriverFamily::ADODBAPI, 2016);
    settings.adoprovider = "MSOLEDBSQL";

    EXPECT_EQ(build_connection_string(info, settings),
              "ConnectRetryCount=2;Provider=MSOLEDBSQL;Data Source=db01,1433;Initial Catalog=AppDb;"
              "User ID=monitor;Password=hunter2;");
}

TEST(ConnectionStringBuilderTest, DebugLogStopsBeforePassword) {
    LogCapture log;

    AccessInfo info;
    info.host = "db01,1433";
    info.database = "master";
    info.username = "monitor";
    info.password = "hunter2";
    build_connection_string(info, settings_for(driver::DriverFamily::ODBC, 2012));

    EXPECT_TRUE(log.contains("Connection string (before password) Server=db01,1433;Database=master;UID=monitor;"));
    EXPECT_FALSE(log.contains("PWD="));
}
