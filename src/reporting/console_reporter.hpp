#pragma once

#include "reporter.hpp"
#include <iostream>

namespace mssql_conncheck::reporting {

// Console reporter with formatted output
class ConsoleReporter : public Reporter {
public:
    explicit ConsoleReporter(std::ostream& out = std::cout, bool verbose = false)
        : out_(out), verbose_(verbose) {}

    void report_start(const std::string& host, const std::string& connector) override;
    void report_status(const StatusReport& report) override;
    void report_database_check(bool exists, const std::string& context) override;
    void report_summary(size_t total_reports, size_t ok, size_t critical,
                        std::chrono::microseconds total_duration) override;
    void report_end() override;

private:
    std::ostream& out_;
    bool verbose_;

    std::string status_icon(connection::ServiceCheckStatus status) const;
    std::string format_duration(std::chrono::microseconds duration) const;
};

} // namespace mssql_conncheck::reporting
