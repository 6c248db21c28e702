#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace mssql_conncheck::core {

// Malformed connection string, or an option supplied twice / for the wrong connector.
// Never retried.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message);
};

// Failure to open a connection. The message is already classified and redacted.
class SQLConnectionError : public std::runtime_error {
public:
    explicit SQLConnectionError(const std::string& message);
};

// No cached connection for the requested database. The message names the host only.
class ConnectionNotFoundError : public SQLConnectionError {
public:
    explicit ConnectionNotFoundError(const std::string& host);
};

// Base class for errors raised by a driver capability provider
class DriverError : public std::runtime_error {
public:
    explicit DriverError(const std::string& message);

    // Default textual form used in connection failure reports
    virtual std::string describe() const;
};

// Nested details of a provider error: the provider's own message and sub code
struct ProviderErrorDetail {
    std::string message;
    std::int32_t hresult = 0;
};

// Error raised through an ADO / OLE DB provider (COM HRESULT based)
class ProviderError : public DriverError {
public:
    ProviderError(const std::string& message, std::int32_t hresult,
                  std::optional<ProviderErrorDetail> detail = std::nullopt);

    std::int32_t hresult() const noexcept { return hresult_; }
    const std::optional<ProviderErrorDetail>& detail() const noexcept { return detail_; }

    std::string describe() const override;

private:
    std::int32_t hresult_;
    std::optional<ProviderErrorDetail> detail_;
};

} // namespace mssql_conncheck::core
