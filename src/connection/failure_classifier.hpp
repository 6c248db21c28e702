#pragma once

#include "access_info.hpp"
#include "reachability_checker.hpp"
#include <chrono>
#include <cstdint>
#include <exception>
#include <map>
#include <string>

namespace mssql_conncheck::connection {

constexpr const char* PASSWORD_MASK = "******";

// Provider message that hides the real cause behind the HRESULT codes
constexpr const char* MISLEADING_PROVIDER_MESSAGE = "Invalid connection string attribute";

// HRESULT -> description for the codes seen when an ADO login fails
const std::map<std::int32_t, std::string>& known_hresult_codes();

/**
 * @brief Describe a connect failure
 *
 * A core::ProviderError whose nested message is MISLEADING_PROVIDER_MESSAGE
 * and whose outer and nested HRESULTs are both known is rendered as
 * "<outer phrase>: <nested phrase>". Anything else uses the error's default
 * textual form.
 */
std::string format_connection_exception(const std::exception& error);

// Turns a connect failure into the redacted CRITICAL report message
class FailureClassifier {
public:
    FailureClassifier(ReachabilityChecker& reachability, std::chrono::seconds timeout)
        : reachability_(reachability), timeout_(timeout) {}

    /**
     * @brief Check TCP reachability and compose the diagnostic
     *
     * "Unable to connect to SQL Server (host=H database=D).
     *  TCP-connection(R). Exception: X" with every occurrence of `password`
     * replaced by PASSWORD_MASK when it is non-empty.
     */
    std::string classify(const std::exception& error, const AccessInfo& info,
                         const std::optional<std::string>& password) const;

    // TCP status of the resolved "host,port": "OK" or the reachability error text
    std::string tcp_connection_status(const AccessInfo& info) const;

private:
    ReachabilityChecker& reachability_;
    std::chrono::seconds timeout_;
};

} // namespace mssql_conncheck::connection
