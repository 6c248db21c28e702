#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace mssql_conncheck::connection {

// Tests whether the server port accepts TCP connections
class ReachabilityChecker {
public:
    virtual ~ReachabilityChecker() = default;

    /**
     * @brief Attempt a TCP connection
     *
     * Blocks for at most `timeout`.
     *
     * @return std::nullopt when the connection succeeded, otherwise a
     *         "ERROR: ..." description of the failure
     */
    virtual std::optional<std::string> check(const std::string& host, const std::string& port,
                                             std::chrono::seconds timeout) = 0;
};

// Plain socket connect through getaddrinfo(), first address that answers wins.
// A non-positive timeout is reported as an error without connecting.
class TcpReachabilityChecker : public ReachabilityChecker {
public:
    // Starts Winsock on Windows, no-op elsewhere
    TcpReachabilityChecker();
    ~TcpReachabilityChecker() override;

    TcpReachabilityChecker(const TcpReachabilityChecker&) = delete;
    TcpReachabilityChecker& operator=(const TcpReachabilityChecker&) = delete;

    std::optional<std::string> check(const std::string& host, const std::string& port,
                                     std::chrono::seconds timeout) override;

private:
    int startup_error_ = 0;
};

} // namespace mssql_conncheck::connection
