#include "driver.hpp"
#include "utils/string_utils.hpp"

namespace mssql_conncheck::driver {

std::string family_name(DriverFamily family) {
    switch (family) {
        case DriverFamily::ADODBAPI: return "adodbapi";
        case DriverFamily::ODBC:     return "odbc";
    }
    return "unknown";
}

std::optional<DriverFamily> parse_family(std::string_view name) {
    std::string lowered = utils::to_lower(name);
    if (lowered == "adodbapi") {
        return DriverFamily::ADODBAPI;
    }
    if (lowered == "odbc") {
        return DriverFamily::ODBC;
    }
    return std::nullopt;
}

DriverFamily other_family(DriverFamily family) noexcept {
    return family == DriverFamily::ADODBAPI ? DriverFamily::ODBC : DriverFamily::ADODBAPI;
}

} // namespace mssql_conncheck::driver
