#pragma once

#include "reporter.hpp"
#include <nlohmann/json.hpp>

namespace mssql_conncheck::reporting {

// JSON reporter for structured output
class JsonReporter : public Reporter {
public:
    explicit JsonReporter(const std::string& output_file = "")
        : output_file_(output_file) {}

    void report_start(const std::string& host, const std::string& connector) override;
    void report_status(const StatusReport& report) override;
    void report_database_check(bool exists, const std::string& context) override;
    void report_summary(size_t total_reports, size_t ok, size_t critical,
                        std::chrono::microseconds total_duration) override;
    void report_end() override;

    const nlohmann::json& document() const noexcept { return root_; }

private:
    std::string output_file_;
    nlohmann::json root_;
    nlohmann::json service_checks_;
};

} // namespace mssql_conncheck::reporting
