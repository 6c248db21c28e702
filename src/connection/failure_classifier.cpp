#include "failure_classifier.hpp"
#include "host_port.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "utils/string_utils.hpp"
#include <sstream>

namespace mssql_conncheck::connection {

const std::map<std::int32_t, std::string>& known_hresult_codes() {
    // A failed TCP connection can also produce -2147467259, the TCP status is reported separately
    static const std::map<std::int32_t, std::string> codes = {
        {-2147352567, "unable to connect"},
        {-2147217843, "login failed for user"},
        {-2147467259, "could not open database requested by login"},
    };
    return codes;
}

std::string format_connection_exception(const std::exception& error) {
    if (const auto* provider_error = dynamic_cast<const core::ProviderError*>(&error)) {
        const auto& detail = provider_error->detail();
        if (detail && detail->message == MISLEADING_PROVIDER_MESSAGE) {
            const auto& codes = known_hresult_codes();
            auto base = codes.find(provider_error->hresult());
            auto sub = codes.find(detail->hresult);
            if (base != codes.end() && sub != codes.end()) {
                return base->second + ": " + sub->second;
            }
        }
    }

    if (const auto* driver_error = dynamic_cast<const core::DriverError*>(&error)) {
        return driver_error->describe();
    }
    return std::string("Exception('") + error.what() + "')";
}

std::string FailureClassifier::tcp_connection_status(const AccessInfo& info) const {
    if (!utils::is_present(info.host)) {
        return "ERROR: no host configured";
    }

    auto [host, port] = split_sqlserver_host_port(*info.host);
    auto error = reachability_.check(host, port.value_or(std::to_string(DEFAULT_CONN_PORT)), timeout_);
    return error ? *error : "OK";
}

std::string FailureClassifier::classify(const std::exception& error, const AccessInfo& info,
                                        const std::optional<std::string>& password) const {
    std::ostringstream oss;
    oss << "Unable to connect to SQL Server (host=" << info.host.value_or("")
        << " database=" << info.database << "). "
        << "TCP-connection(" << tcp_connection_status(info) << "). "
        << "Exception: " << format_connection_exception(error);

    std::string message = oss.str();
    if (utils::is_present(password)) {
        message = utils::replace_all(message, *password, PASSWORD_MASK);
    }
    return message;
}

} // namespace mssql_conncheck::connection
