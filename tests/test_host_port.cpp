#include <gtest/gtest.h>
#include "connection/host_port.hpp"
#include "log_capture.hpp"

using namespace mssql_conncheck::connection;
using mssql_conncheck::test::LogCapture;

TEST(HostPortTest, HostWithoutPort) {
    auto [host, port] = split_sqlserver_host_port("db01");
    EXPECT_EQ(host, "db01");
    EXPECT_FALSE(port.has_value());
}

TEST(HostPortTest, HostWithPortIsTrimmed) {
    auto [host, port] = split_sqlserver_host_port(" db01 , 5000 ");
    EXPECT_EQ(host, "db01");
    ASSERT_TRUE(port.has_value());
    EXPECT_EQ(*port, "5000");
}

TEST(HostPortTest, ExtraFieldsAreDroppedWithWarning) {
    LogCapture log;

    auto [host, port] = split_sqlserver_host_port("a,5000,extra");
    EXPECT_EQ(host, "a");
    EXPECT_EQ(port.value_or(""), "5000");
    EXPECT_TRUE(log.contains("more than one comma"));
}

TEST(HostPortTest, ValidPorts) {
    EXPECT_TRUE(is_valid_port("1433"));
    EXPECT_TRUE(is_valid_port(" 1433 "));
    EXPECT_FALSE(is_valid_port(""));
    EXPECT_FALSE(is_valid_port("notanumber"));
    EXPECT_FALSE(is_valid_port("14x3"));
    EXPECT_FALSE(is_valid_port("-"));
}

TEST(ResolveHostTest, AbsentHost) {
    EXPECT_FALSE(resolve_host_with_port(std::nullopt, std::string("1433")).has_value());
    EXPECT_FALSE(resolve_host_with_port(std::string(""), std::nullopt).has_value());
}

TEST(ResolveHostTest, DefaultPort) {
    EXPECT_EQ(resolve_host_with_port(std::string("a"), std::nullopt).value_or(""), "a,1433");
}

TEST(ResolveHostTest, PortInHostWins) {
    EXPECT_EQ(resolve_host_with_port(std::string("a,5000"), std::string("6000")).value_or(""), "a,5000");
}

TEST(ResolveHostTest, SeparatePortOption) {
    EXPECT_EQ(resolve_host_with_port(std::string("a"), std::string("6000")).value_or(""), "a,6000");
}

TEST(ResolveHostTest, ExtraFieldsIgnored) {
    LogCapture log;
    EXPECT_EQ(resolve_host_with_port(std::string("a,5000,extra"), std::nullopt).value_or(""), "a,5000");
}

TEST(ResolveHostTest, InvalidPortFallsBackToDefault) {
    LogCapture log;

    EXPECT_EQ(resolve_host_with_port(std::string("a,notanumber"), std::nullopt).value_or(""), "a,1433");
    EXPECT_TRUE(log.contains("Invalid port notanumber"));
}
