#pragma once

#include "config/instance_config.hpp"
#include "driver/driver.hpp"
#include <optional>
#include <string>
#include <vector>

namespace mssql_conncheck::connection {

// A connection string keyword and the discrete configuration option it duplicates
struct ConnectionOption {
    std::string keyword;
    std::optional<std::string> config_field;
};

/**
 * @brief Keywords a family understands in `connection_string`
 *
 * @param database_field Option naming the database of this connection
 *        (the db_name when given, otherwise the db_key)
 */
std::vector<ConnectionOption> connection_options(driver::DriverFamily family,
                                                 const std::optional<std::string>& database_field);

/**
 * @brief Check that every setting is given exactly once, through one channel
 *
 * Warns about discrete options that only the inactive family uses and about
 * credentials configured alongside Windows authentication.
 *
 * @throws core::ConfigurationError when `connection_string` does not parse,
 *         repeats a discrete option, or uses a keyword of the inactive family
 */
void validate_connection_options(const config::InstanceConfig& instance,
                                 driver::DriverFamily active,
                                 const std::optional<std::string>& db_key,
                                 const std::optional<std::string>& db_name);

} // namespace mssql_conncheck::connection
