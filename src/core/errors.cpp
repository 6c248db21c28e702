#include "errors.hpp"
#include <sstream>

namespace mssql_conncheck::core {

ConfigurationError::ConfigurationError(const std::string& message)
    : std::runtime_error(message) {
}

SQLConnectionError::SQLConnectionError(const std::string& message)
    : std::runtime_error(message) {
}

ConnectionNotFoundError::ConnectionNotFoundError(const std::string& host)
    : SQLConnectionError("Cannot find an opened connection for host: " + host) {
}

DriverError::DriverError(const std::string& message)
    : std::runtime_error(message) {
}

std::string DriverError::describe() const {
    return std::string("DriverError('") + what() + "')";
}

ProviderError::ProviderError(const std::string& message, std::int32_t hresult,
                             std::optional<ProviderErrorDetail> detail)
    : DriverError(message), hresult_(hresult), detail_(std::move(detail)) {
}

std::string ProviderError::describe() const {
    std::ostringstream oss;
    oss << "ProviderError(hresult=" << hresult_ << ", '" << what() << "'";
    if (detail_) {
        oss << ", ('" << detail_->message << "', " << detail_->hresult << ")";
    }
    oss << ")";
    return oss.str();
}

} // namespace mssql_conncheck::core
