#include <chrono>
#include <iostream>
#include <memory>
#include <CLI/CLI.hpp>
#include "mssql_conncheck/version.hpp"
#include "config/instance_config.hpp"
#include "connection/connection_manager.hpp"
#include "connection/database_checker.hpp"
#include "connection/reachability_checker.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "driver/driver_registry.hpp"
#include "reporting/console_reporter.hpp"
#include "reporting/json_reporter.hpp"

using namespace mssql_conncheck;

namespace {

// Discrete options given on the command line override the configuration file
struct Overrides {
    std::string host, port, username, password, database, driver, dsn;
    std::string connection_string, connector, adoprovider;
    int command_timeout = 0;
    int server_version = 0;
};

void apply_overrides(const CLI::App& app, const Overrides& o, config::InstanceConfig& instance) {
    auto set = [&](const char* flag, const std::string& value, std::optional<std::string>& target) {
        if (app.count(flag) > 0) {
            target = value;
        }
    };
    set("--host", o.host, instance.host);
    set("--port", o.port, instance.port);
    set("--username", o.username, instance.username);
    set("--password", o.password, instance.password);
    set("--database", o.database, instance.database);
    set("--driver", o.driver, instance.driver);
    set("--dsn", o.dsn, instance.dsn);
    set("--connection-string", o.connection_string, instance.connection_string);
    set("--connector", o.connector, instance.connector);
    set("--adoprovider", o.adoprovider, instance.adoprovider);

    if (app.count("--command-timeout") > 0) {
        instance.command_timeout = o.command_timeout;
    }
    if (app.count("--server-version") > 0) {
        instance.server_version = o.server_version;
    }
}

} // anonymous namespace

int main(int argc, char** argv) {
    CLI::App app{
        "mssql-conncheck - SQL Server connection check\n"
        "\n"
        "  Opens the monitoring connections of a SQL Server instance the way the\n"
        "  monitoring client does, checks that the configured database exists and\n"
        "  reports a classified diagnostic for every failed connection.\n"
        "\n"
        "Examples:\n"
        "  mssql-conncheck --connector odbc --host db01,1433 --username monitor --password ...\n"
        "  mssql-conncheck -c sqlserver.json --check-databases AppDb,Reporting -o json\n",
        "mssql-conncheck"
    };

    app.set_version_flag("--version,-V", MSSQL_CONNCHECK_VERSION);

    std::string config_file;
    app.add_option("-c,--config", config_file,
                   "JSON configuration: {\"init_config\": {...}, \"instances\": [{...}]}")
        ->check(CLI::ExistingFile);

    size_t instance_index = 0;
    app.add_option("--instance", instance_index, "Index of the instance to check in the configuration file");

    Overrides o;
    app.add_option("--host", o.host, "Server host, optionally \"host,port\"");
    app.add_option("--port", o.port, "Server port when not part of --host");
    app.add_option("--username", o.username, "SQL Server login");
    app.add_option("--password", o.password, "SQL Server password");
    app.add_option("--database", o.database, "Database to connect to (default: master)");
    app.add_option("--driver", o.driver, "ODBC driver name");
    app.add_option("--dsn", o.dsn, "ODBC data source name");
    app.add_option("--connection-string", o.connection_string,
                   "Extra connection string properties (key=value;...)");
    app.add_option("--connector", o.connector, "Connector: 'adodbapi' or 'odbc'");
    app.add_option("--adoprovider", o.adoprovider, "ADO provider for the adodbapi connector");
    app.add_option("--command-timeout", o.command_timeout, "Connect and query timeout in seconds")
        ->check(CLI::PositiveNumber);
    app.add_option("--server-version", o.server_version, "SQL Server release year, e.g. 2012");

    std::vector<std::string> check_databases;
    app.add_option("--check-databases", check_databases,
                   "Additional databases to open as secondary connections")
        ->delimiter(',');

    bool skip_database_check = false;
    app.add_flag("--no-database-check", skip_database_check,
                 "Do not check that the configured database exists");

    bool verbose = false;
    app.add_flag("-v,--verbose", verbose, "Debug logging and full messages for every report");

    std::string log_file;
    app.add_option("--log-file", log_file, "Also write the log to FILE");

    std::string output_format = "console";
    app.add_option("-o,--output", output_format,
                   "Output format: 'console' (default) or 'json'")
        ->check(CLI::IsMember({"console", "json"}));

    std::string json_file;
    app.add_option("-f,--file", json_file,
                   "Write JSON output to FILE instead of stdout");

    CLI11_PARSE(app, argc, argv);

    core::Logger::instance().set_level(verbose ? core::LogLevel::DEBUG : core::LogLevel::WARN);
    if (!log_file.empty()) {
        core::Logger::instance().set_output(log_file);
    }

    try {
        config::CheckConfig cfg;
        if (!config_file.empty()) {
            cfg = config::load_config_file(config_file);
        } else {
            cfg.instances.emplace_back();
        }
        if (instance_index >= cfg.instances.size()) {
            throw core::ConfigurationError("Instance index " + std::to_string(instance_index) +
                                           " out of range, configuration has " +
                                           std::to_string(cfg.instances.size()) + " instance(s)");
        }

        config::InstanceConfig instance = cfg.instances[instance_index];
        apply_overrides(app, o, instance);

        auto registry = driver::DriverRegistry::with_platform_drivers();
        auto settings = config::resolve_connector_settings(cfg.init_config, instance,
                                                           registry->available_families());

        driver::Driver* drv = registry->find(settings.connector);
        if (!drv) {
            throw core::ConfigurationError("Connector " + driver::family_name(settings.connector) +
                                           " is not available in this build");
        }

        std::unique_ptr<reporting::Reporter> reporter;
        if (output_format == "json") {
            reporter = std::make_unique<reporting::JsonReporter>(json_file);
        } else {
            reporter = std::make_unique<reporting::ConsoleReporter>(std::cout, verbose);
        }

        size_t total = 0, ok = 0, critical = 0;
        auto report = [&](connection::ServiceCheckStatus status, const std::string& host,
                          const std::string& database, const std::string& message, bool is_default) {
            total++;
            if (status == connection::ServiceCheckStatus::OK) {
                ok++;
            } else {
                critical++;
            }
            reporter->report_status({status, host, database, message, is_default});
        };

        auto start = std::chrono::steady_clock::now();
        reporter->report_start(instance.host.value_or(""), driver::family_name(settings.connector));

        connection::TcpReachabilityChecker reachability;
        connection::ConnectionManager manager(instance, settings, *drv, reachability, report);

        bool database_missing = false;
        try {
            {
                auto scope = connection::ManagedConnection::default_connection(manager);
            }

            if (!skip_database_check) {
                connection::DatabaseExistenceChecker checker(manager);
                auto [exists, context] = checker.check_database();
                reporter->report_database_check(exists, context);
                database_missing = !exists;
            }

            for (const auto& db_name : check_databases) {
                manager.check_database_conns(db_name);
            }
        } catch (const core::SQLConnectionError& e) {
            // Already reported as CRITICAL through the callback
            LOG_ERROR(e.what());
        }

        auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - start);
        reporter->report_summary(total, ok, critical, elapsed);
        reporter->report_end();

        return (critical > 0 || database_missing) ? 2 : 0;
    } catch (const core::ConfigurationError& e) {
        std::cerr << "Configuration error: " << core::Logger::instance().mask(e.what()) << std::endl;
        return 1;
    } catch (const core::DriverError& e) {
        std::cerr << "Driver error: " << core::Logger::instance().mask(e.describe()) << std::endl;
        return 1;
    }
}
