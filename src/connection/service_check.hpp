#pragma once

#include <functional>
#include <string>

namespace mssql_conncheck::connection {

enum class ServiceCheckStatus {
    OK,
    CRITICAL
};

inline const char* status_to_string(ServiceCheckStatus status) {
    switch (status) {
        case ServiceCheckStatus::OK:       return "OK";
        case ServiceCheckStatus::CRITICAL: return "CRITICAL";
    }
    return "UNKNOWN";
}

// Receives the outcome of every open attempt. `message` is empty on OK.
using StatusCallback = std::function<void(ServiceCheckStatus status,
                                          const std::string& host,
                                          const std::string& database,
                                          const std::string& message,
                                          bool is_default)>;

} // namespace mssql_conncheck::connection
