#include "host_port.hpp"
#include "core/logger.hpp"
#include "utils/string_utils.hpp"
#include <cctype>

namespace mssql_conncheck::connection {

std::pair<std::string, std::optional<std::string>> split_sqlserver_host_port(std::string_view host) {
    auto parts = utils::split(host, ',');
    for (auto& part : parts) {
        part = utils::trim(part);
    }

    if (parts.size() == 1) {
        return {parts[0], std::nullopt};
    }

    if (parts.size() > 2) {
        LOG_WARN("invalid sqlserver host string has more than one comma: " + std::string(host) +
                 ". using only 1st two items: host:" + parts[0] + ", port:" + parts[1]);
    }
    return {parts[0], parts[1]};
}

bool is_valid_port(std::string_view port) {
    std::string trimmed = utils::trim(port);
    if (trimmed.empty()) {
        return false;
    }

    std::size_t start = (trimmed[0] == '+' || trimmed[0] == '-') ? 1 : 0;
    if (start == trimmed.size()) {
        return false;
    }
    for (std::size_t i = start; i < trimmed.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(trimmed[i]))) {
            return false;
        }
    }
    return true;
}

std::optional<std::string> resolve_host_with_port(const std::optional<std::string>& host,
                                                  const std::optional<std::string>& config_port) {
    if (!utils::is_present(host)) {
        return std::nullopt;
    }

    auto [split_host, split_port] = split_sqlserver_host_port(*host);

    std::string port = std::to_string(DEFAULT_CONN_PORT);
    if (split_port) {
        port = *split_port;
    } else if (config_port) {
        port = *config_port;
    }

    if (!is_valid_port(port)) {
        LOG_WARN("Invalid port " + port + "; falling back to default " + std::to_string(DEFAULT_CONN_PORT));
        port = std::to_string(DEFAULT_CONN_PORT);
    }

    return split_host + "," + port;
}

} // namespace mssql_conncheck::connection
