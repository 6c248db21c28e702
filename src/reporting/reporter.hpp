#pragma once

#include "connection/service_check.hpp"
#include <chrono>
#include <string>

namespace mssql_conncheck::reporting {

// One call of the status callback
struct StatusReport {
    connection::ServiceCheckStatus status = connection::ServiceCheckStatus::OK;
    std::string host;
    std::string database;
    std::string message;
    bool is_default = true;
};

// Reporter interface
class Reporter {
public:
    virtual ~Reporter() = default;

    virtual void report_start(const std::string& host, const std::string& connector) = 0;

    virtual void report_status(const StatusReport& report) = 0;

    virtual void report_database_check(bool exists, const std::string& context) = 0;

    virtual void report_summary(size_t total_reports, size_t ok, size_t critical,
                                std::chrono::microseconds total_duration) = 0;

    virtual void report_end() = 0;
};

} // namespace mssql_conncheck::reporting
