#include <gtest/gtest.h>
#include "connection/connection_options.hpp"
#include "connection/access_info.hpp"
#include "core/errors.hpp"
#include "log_capture.hpp"

using namespace mssql_conncheck;
using namespace mssql_conncheck::connection;
using driver::DriverFamily;
using mssql_conncheck::test::LogCapture;

class ConnectionOptionsTest : public ::testing::Test {
protected:
    std::string validation_error(DriverFamily family,
                                 const std::optional<std::string>& db_name = std::nullopt) {
        try {
            validate_connection_options(instance, family, std::string(DEFAULT_DB_KEY), db_name);
        } catch (const core::ConfigurationError& e) {
            return e.what();
        }
        return "";
    }

    LogCapture log;
    config::InstanceConfig instance;
};

TEST_F(ConnectionOptionsTest, OptionTables) {
    auto odbc = connection_options(DriverFamily::ODBC, std::string("database"));
    ASSERT_EQ(odbc.size(), 6u);
    EXPECT_EQ(odbc[2].keyword, "SERVER");
    EXPECT_EQ(odbc[2].config_field.value_or(""), "host");
    EXPECT_EQ(odbc[3].config_field.value_or(""), "database");

    auto ado = connection_options(DriverFamily::ADODBAPI, std::nullopt);
    ASSERT_EQ(ado.size(), 5u);
    EXPECT_EQ(ado[0].keyword, "PROVIDER");
    EXPECT_EQ(ado[2].keyword, "Initial Catalog");
    EXPECT_FALSE(ado[2].config_field.has_value());
}

TEST_F(ConnectionOptionsTest, NoConnectionStringIsValid) {
    instance.host = "db01";
    instance.username = "monitor";
    EXPECT_EQ(validation_error(DriverFamily::ODBC), "");
}

TEST_F(ConnectionOptionsTest, DisjointConnectionStringIsValid) {
    instance.host = "db01";
    instance.connection_string = "ApplicationIntent=ReadOnly";
    EXPECT_EQ(validation_error(DriverFamily::ODBC), "");
}

TEST_F(ConnectionOptionsTest, DuplicateOptionIsRejected) {
    instance.username = "monitor";
    instance.connection_string = "uid=monitor";

    std::string error = validation_error(DriverFamily::ODBC);
    EXPECT_NE(error.find("UID has been provided both in the connection string and as a configuration "
                         "option (username), please specify it only once"),
              std::string::npos);
}

TEST_F(ConnectionOptionsTest, DuplicateDatabaseFollowsDbKey) {
    instance.database = "AppDb";
    instance.connection_string = "Database=AppDb";
    EXPECT_NE(validation_error(DriverFamily::ODBC).find("(database)"), std::string::npos);

    // An explicit db_name is not a configuration option
    EXPECT_EQ(validation_error(DriverFamily::ODBC, std::string("Other")), "");
}

TEST_F(ConnectionOptionsTest, OtherFamilyKeywordIsRejected) {
    instance.connection_string = "DSN=sqlserver-prod";

    std::string error = validation_error(DriverFamily::ADODBAPI);
    EXPECT_NE(error.find("DSN has been provided in the connection string. This option is only available "
                         "for odbc connections, however adodbapi has been selected"),
              std::string::npos);
}

TEST_F(ConnectionOptionsTest, SharedKeywordIsNotOtherFamily) {
    // "Server" is the ODBC keyword, Data Source the ADO one
    instance.connection_string = "Data Source=db01";
    EXPECT_NE(validation_error(DriverFamily::ODBC).find("only available for adodbapi"), std::string::npos);
    EXPECT_EQ(validation_error(DriverFamily::ADODBAPI), "");
}

TEST_F(ConnectionOptionsTest, IgnoredOptionsAreWarned) {
    instance.adoprovider = "MSOLEDBSQL";
    validate_connection_options(instance, DriverFamily::ODBC, std::string(DEFAULT_DB_KEY), std::nullopt);
    EXPECT_TRUE(log.contains("adoprovider option will be ignored since odbc connection is used"));

    instance.adoprovider.reset();
    instance.dsn = "sqlserver-prod";
    instance.driver = "ODBC Driver 18 for SQL Server";
    validate_connection_options(instance, DriverFamily::ADODBAPI, std::string(DEFAULT_DB_KEY), std::nullopt);
    EXPECT_TRUE(log.contains("dsn option will be ignored since adodbapi connection is used"));
    EXPECT_TRUE(log.contains("driver option will be ignored since adodbapi connection is used"));
}

TEST_F(ConnectionOptionsTest, WindowsAuthWithCredentialsIsWarned) {
    instance.username = "monitor";
    instance.connection_string = "Trusted_Connection=yes";
    EXPECT_EQ(validation_error(DriverFamily::ODBC), "");
    EXPECT_TRUE(log.contains("Username and password are ignored when using Windows authentication"));
}

TEST_F(ConnectionOptionsTest, IntegratedSecurityWithCredentialsIsWarned) {
    instance.password = "hunter2";
    instance.connection_string = "Integrated Security=SSPI";
    EXPECT_EQ(validation_error(DriverFamily::ADODBAPI), "");
    EXPECT_TRUE(log.contains("ignored when using Windows authentication"));
}

TEST_F(ConnectionOptionsTest, MalformedConnectionStringIsRejected) {
    instance.connection_string = "A==B";
    EXPECT_NE(validation_error(DriverFamily::ODBC).find("Invalid connection string"), std::string::npos);
}

TEST_F(ConnectionOptionsTest, ParseErrorDoesNotLeakRegisteredPassword) {
    core::Logger::instance().add_secret("hunter2");
    instance.connection_string = "Timeout=hunter2;Broken";

    std::string error = validation_error(DriverFamily::ODBC);
    EXPECT_FALSE(error.empty());
    EXPECT_EQ(error.find("hunter2"), std::string::npos);
    EXPECT_NE(error.find("******"), std::string::npos);
}
