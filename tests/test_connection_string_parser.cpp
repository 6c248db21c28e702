#include <gtest/gtest.h>
#include "connection/connection_string_parser.hpp"
#include "core/errors.hpp"

using namespace mssql_conncheck::connection;
using mssql_conncheck::core::ConfigurationError;

namespace {

// Message of the ConfigurationError thrown while parsing, empty when parsing succeeds
std::string parse_error(const std::string& cs) {
    try {
        parse_connection_string_properties(cs);
    } catch (const ConfigurationError& e) {
        return e.what();
    }
    return "";
}

} // anonymous namespace

TEST(ConnectionStringParserTest, SimplePairs) {
    auto props = parse_connection_string_properties("ApplicationIntent=ReadOnly;MultiSubnetFailover=Yes;");
    ASSERT_EQ(props.size(), 2u);
    EXPECT_EQ(props.entries()[0].first, "ApplicationIntent");
    EXPECT_EQ(props.entries()[0].second, "ReadOnly");
    EXPECT_EQ(props.entries()[1].first, "MultiSubnetFailover");
    EXPECT_EQ(props.entries()[1].second, "Yes");
}

TEST(ConnectionStringParserTest, TrailingSemicolonIsOptional) {
    auto props = parse_connection_string_properties("A=B;C=D");
    ASSERT_EQ(props.size(), 2u);
    EXPECT_EQ(props.find("C").value_or(""), "D");
}

TEST(ConnectionStringParserTest, EmptyInput) {
    EXPECT_TRUE(parse_connection_string_properties("").empty());
    EXPECT_TRUE(parse_connection_string_properties("   ").empty());
}

TEST(ConnectionStringParserTest, BracedValueKeepsReservedCharacters) {
    auto props = parse_connection_string_properties("PWD={va;l=ue}}2};Server=db01");
    EXPECT_EQ(props.find("PWD").value_or(""), "va;l=ue}2");
    EXPECT_EQ(props.find("Server").value_or(""), "db01");
}

TEST(ConnectionStringParserTest, WhitespaceBetweenPropertiesIsSkipped) {
    auto props = parse_connection_string_properties("A=B;   Data Source=db01");
    ASSERT_EQ(props.size(), 2u);
    EXPECT_EQ(props.entries()[1].first, "Data Source");
}

TEST(ConnectionStringParserTest, LookupIgnoresCase) {
    auto props = parse_connection_string_properties("Trusted_Connection=yes");
    EXPECT_TRUE(props.contains("trusted_connection"));
    EXPECT_TRUE(props.contains("TRUSTED_CONNECTION"));
    EXPECT_FALSE(props.contains("UID"));
}

TEST(ConnectionStringParserTest, RepeatedKeyReplacesValue) {
    auto props = parse_connection_string_properties("A=1;B=2;A=3");
    ASSERT_EQ(props.size(), 2u);
    EXPECT_EQ(props.entries()[0].second, "3");
}

TEST(ConnectionStringParserTest, RejectsSecondEquals) {
    std::string error = parse_error("A==B");
    EXPECT_NE(error.find("Invalid connection string"), std::string::npos);
    EXPECT_NE(error.find("index=2"), std::string::npos);
    EXPECT_NE(error.find("A==B"), std::string::npos);
}

TEST(ConnectionStringParserTest, RejectsEmptyKey) {
    EXPECT_NE(parse_error("=B").find("empty key"), std::string::npos);
}

TEST(ConnectionStringParserTest, RejectsEmptyValue) {
    EXPECT_NE(parse_error("A=;B=C").find("empty value"), std::string::npos);
    EXPECT_NE(parse_error("A=").find("empty value"), std::string::npos);
}

TEST(ConnectionStringParserTest, RejectsUnterminatedBrace) {
    EXPECT_NE(parse_error("A={abc").find("closing brace"), std::string::npos);
}

TEST(ConnectionStringParserTest, RejectsUnescapedReservedCharacter) {
    EXPECT_NE(parse_error("A=B}").find("invalid character '}'"), std::string::npos);
}

TEST(ConnectionStringParserTest, RejectsKeyWithoutValue) {
    EXPECT_NE(parse_error("A;B=C").find("missing '='"), std::string::npos);
    EXPECT_NE(parse_error("A=B;C").find("missing '='"), std::string::npos);
}

TEST(ConnectionPropertiesTest, SerializeEscapesReservedValues) {
    ConnectionProperties props;
    props.set("Server", "db01");
    props.set("PWD", "a;b}c");
    EXPECT_EQ(props.to_string(), "Server=db01;PWD={a;b}}c};");
}

TEST(ConnectionPropertiesTest, SerializedFormParsesBack) {
    using Entries = std::vector<ConnectionProperties::Entry>;
    const std::vector<Entries> cases = {
        {{"Server", "db01"}},
        {{"Data Source", "db01,1433"}, {"Initial Catalog", "App Db"}},
        {{"PWD", " leading space"}},
        {{"PWD", "trailing space "}},
        {{"PWD", "}"}},
        {{"PWD", "}}}"}},
        {{"PWD", "{abc}"}},
        {{"PWD", "va;l=ue}2"}, {"UID", "monitor"}, {"APP", "mssql-conncheck"}},
        {{"we=ird", "key"}, {"semi;colon", "=;{}"}},
    };

    for (const auto& entries : cases) {
        ConnectionProperties props;
        for (const auto& [key, value] : entries) {
            props.set(key, value);
        }

        const std::string serialized = props.to_string();
        ConnectionProperties reparsed;
        ASSERT_NO_THROW(reparsed = parse_connection_string_properties(serialized)) << serialized;
        EXPECT_EQ(reparsed.entries(), entries) << serialized;
    }
}
