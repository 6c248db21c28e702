#pragma once

#include "driver.hpp"
#include <map>
#include <memory>
#include <vector>

namespace mssql_conncheck::driver {

// Drivers available in this process, one per family.
// The registered families are the valid values of the `connector` option.
class DriverRegistry {
public:
    DriverRegistry() = default;

    DriverRegistry(const DriverRegistry&) = delete;
    DriverRegistry& operator=(const DriverRegistry&) = delete;

    // Registers the drivers this build ships: ODBC everywhere, ADO on Windows
    static std::unique_ptr<DriverRegistry> with_platform_drivers();

    // Replaces any driver already registered for the same family
    void add(std::unique_ptr<Driver> driver);

    bool is_available(DriverFamily family) const;
    std::vector<DriverFamily> available_families() const;

    // nullptr when the family has no registered driver
    Driver* find(DriverFamily family) const;

private:
    std::map<DriverFamily, std::unique_ptr<Driver>> drivers_;
};

} // namespace mssql_conncheck::driver
