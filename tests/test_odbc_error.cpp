#include <gtest/gtest.h>
#include "core/odbc_error.hpp"

using namespace mssql_conncheck::core;

TEST(OdbcErrorTest, ConstructWithMessage) {
    OdbcError error("Test error");
    EXPECT_STREQ(error.what(), "Test error");
    EXPECT_TRUE(error.diagnostics().empty());
}

TEST(OdbcErrorTest, IsADriverError) {
    try {
        throw OdbcError("SQLDriverConnect");
    } catch (const DriverError& e) {
        EXPECT_STREQ(e.what(), "SQLDriverConnect");
        return;
    }
    FAIL() << "OdbcError not caught as DriverError";
}

TEST(OdbcErrorTest, FormatDiagnostics) {
    std::vector<OdbcDiagnostic> diags;

    OdbcDiagnostic diag;
    diag.sqlstate = "08001";
    diag.native_error = 53;
    diag.message = "[Microsoft][ODBC Driver 18 for SQL Server]TCP Provider: Error code 0x2749";
    diag.record_number = 1;
    diags.push_back(diag);

    OdbcError error("SQLDriverConnect", std::move(diags));

    std::string formatted = error.format_diagnostics();
    EXPECT_NE(formatted.find("08001"), std::string::npos);
    EXPECT_NE(formatted.find("53"), std::string::npos);
    EXPECT_NE(formatted.find("TCP Provider"), std::string::npos);
}

TEST(OdbcErrorTest, DescribeIsSingleLineWithEveryRecord) {
    std::vector<OdbcDiagnostic> diags(2);
    diags[0].sqlstate = "28000";
    diags[0].native_error = 18456;
    diags[0].message = "Login failed for user 'monitor'.";
    diags[1].sqlstate = "01S00";
    diags[1].native_error = 0;
    diags[1].message = "Invalid connection string attribute";

    OdbcError error("SQLDriverConnect", std::move(diags));

    std::string described = error.describe();
    EXPECT_EQ(described.find('\n'), std::string::npos);
    EXPECT_NE(described.find("[28000] (18456) Login failed for user 'monitor'."), std::string::npos);
    EXPECT_NE(described.find("[01S00]"), std::string::npos);
}

TEST(ProviderErrorTest, CarriesNestedDetail) {
    ProviderError error("(-2147352567, 'Exception occurred.')", -2147352567,
                        ProviderErrorDetail{"Invalid connection string attribute", -2147217843});

    EXPECT_EQ(error.hresult(), -2147352567);
    ASSERT_TRUE(error.detail().has_value());
    EXPECT_EQ(error.detail()->hresult, -2147217843);
    EXPECT_NE(error.describe().find("Invalid connection string attribute"), std::string::npos);
}

TEST(ConnectionNotFoundErrorTest, NamesOnlyTheHost) {
    ConnectionNotFoundError error("db01,1433");
    EXPECT_STREQ(error.what(), "Cannot find an opened connection for host: db01,1433");

    const SQLConnectionError& base = error;
    EXPECT_STREQ(base.what(), error.what());
}
