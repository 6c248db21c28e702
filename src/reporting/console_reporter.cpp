#include "console_reporter.hpp"
#include "mssql_conncheck/version.hpp"
#include <iomanip>
#include <sstream>

namespace mssql_conncheck::reporting {

void ConsoleReporter::report_start(const std::string& host, const std::string& connector) {
    out_ << "mssql-conncheck v" << MSSQL_CONNCHECK_VERSION << " - SQL Server connection check\n";
    out_ << "  Host:      " << (host.empty() ? "(default)" : host) << "\n";
    out_ << "  Connector: " << connector << "\n\n";
}

void ConsoleReporter::report_status(const StatusReport& report) {
    out_ << "  " << status_icon(report.status) << " " << report.host << " / " << report.database;
    if (!report.is_default) {
        out_ << " [secondary]";
    }
    out_ << "\n";

    if (!report.message.empty() &&
        (verbose_ || report.status == connection::ServiceCheckStatus::CRITICAL)) {
        out_ << "      Message:     " << report.message << "\n";
    }
}

void ConsoleReporter::report_database_check(bool exists, const std::string& context) {
    out_ << "  " << (exists ? "[ OK ]" : "[MISS]") << " database " << context
         << (exists ? " exists" : " does not exist") << "\n";
}

void ConsoleReporter::report_summary(size_t total_reports, size_t ok, size_t critical,
                                     std::chrono::microseconds total_duration) {
    out_ << "\nSUMMARY:\n";
    out_ << "  Connections:  " << total_reports << "\n";
    out_ << "  OK:           " << ok << "\n";
    if (critical > 0) {
        out_ << "  Critical:     " << critical << "\n";
    }
    out_ << "  Total Time:   " << format_duration(total_duration) << "\n";
}

void ConsoleReporter::report_end() {
    out_ << std::flush;
}

std::string ConsoleReporter::status_icon(connection::ServiceCheckStatus status) const {
    switch (status) {
        case connection::ServiceCheckStatus::OK:       return "[ OK ]";
        case connection::ServiceCheckStatus::CRITICAL: return "[CRIT]";
        default: return "[????]";
    }
}

std::string ConsoleReporter::format_duration(std::chrono::microseconds duration) const {
    auto us = duration.count();

    std::ostringstream oss;
    if (us < 1000) {
        oss << us << " us";
    } else if (us < 1000000) {
        oss << std::fixed << std::setprecision(2) << (us / 1000.0) << " ms";
    } else {
        oss << std::fixed << std::setprecision(2) << (us / 1000000.0) << " s";
    }
    return oss.str();
}

} // namespace mssql_conncheck::reporting
