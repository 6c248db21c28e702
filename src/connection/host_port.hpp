#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace mssql_conncheck::connection {

constexpr int DEFAULT_CONN_PORT = 1433;
constexpr const char* DEFAULT_HOST_WITH_PORT = "127.0.0.1,1433";

/**
 * @brief Split a SQL Server "host[,port]" string
 *
 * Each part is whitespace-trimmed. More than one comma logs a warning and
 * only the first two fields are kept.
 *
 * @return (host, port) where port is std::nullopt when no comma is present
 */
std::pair<std::string, std::optional<std::string>> split_sqlserver_host_port(std::string_view host);

/**
 * @brief Render the configured host as "host,port"
 *
 * The port comes from the host string if present, otherwise from the separate
 * `port` option, otherwise DEFAULT_CONN_PORT. A port that is not an integer
 * is replaced by DEFAULT_CONN_PORT with a warning.
 *
 * @return std::nullopt when no host is configured
 */
std::optional<std::string> resolve_host_with_port(const std::optional<std::string>& host,
                                                  const std::optional<std::string>& config_port);

// True when the whole string parses as a decimal integer
bool is_valid_port(std::string_view port);

} // namespace mssql_conncheck::connection
