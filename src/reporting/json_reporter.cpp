#include "json_reporter.hpp"
#include "mssql_conncheck/version.hpp"
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>

namespace mssql_conncheck::reporting {

void JsonReporter::report_start(const std::string& host, const std::string& connector) {
    root_ = nlohmann::json::object();
    root_["version"] = MSSQL_CONNCHECK_VERSION;
    root_["host"] = host;
    root_["connector"] = connector;
    root_["timestamp"] = std::time(nullptr);
    service_checks_ = nlohmann::json::array();
}

void JsonReporter::report_status(const StatusReport& report) {
    nlohmann::json check;
    check["status"] = connection::status_to_string(report.status);
    check["host"] = report.host;
    check["database"] = report.database;
    check["is_default"] = report.is_default;
    if (!report.message.empty()) {
        check["message"] = report.message;
    }
    service_checks_.push_back(check);
}

void JsonReporter::report_database_check(bool exists, const std::string& context) {
    nlohmann::json database_check;
    database_check["exists"] = exists;
    database_check["context"] = context;
    root_["database_check"] = database_check;
}

void JsonReporter::report_summary(size_t total_reports, size_t ok, size_t critical,
                                  std::chrono::microseconds total_duration) {
    nlohmann::json summary;
    summary["total"] = total_reports;
    summary["ok"] = ok;
    summary["critical"] = critical;
    summary["total_duration_us"] = total_duration.count();

    root_["summary"] = summary;
    root_["service_checks"] = service_checks_;
}

void JsonReporter::report_end() {
    if (output_file_.empty()) {
        std::cout << std::setw(2) << root_ << std::endl;
    } else {
        std::ofstream file(output_file_);
        if (file.is_open()) {
            file << std::setw(2) << root_ << std::endl;
            std::cout << "JSON report written to: " << output_file_ << std::endl;
        } else {
            std::cerr << "Error: Could not write to " << output_file_ << std::endl;
        }
    }
}

} // namespace mssql_conncheck::reporting
