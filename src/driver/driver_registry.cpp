#include "driver_registry.hpp"
#include "odbc_driver.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

#ifdef _WIN32
#include "ado_driver.hpp"
#endif

namespace mssql_conncheck::driver {

std::unique_ptr<DriverRegistry> DriverRegistry::with_platform_drivers() {
    auto registry = std::make_unique<DriverRegistry>();
    registry->add(std::make_unique<OdbcDriver>());

#ifdef _WIN32
    try {
        registry->add(std::make_unique<AdoDriver>());
    } catch (const core::DriverError& e) {
        LOG_WARN("ADO connector unavailable: " + e.describe());
    }
#endif

    return registry;
}

void DriverRegistry::add(std::unique_ptr<Driver> driver) {
    DriverFamily family = driver->family();
    LOG_DEBUG("Registering driver for connector " + family_name(family));
    drivers_[family] = std::move(driver);
}

bool DriverRegistry::is_available(DriverFamily family) const {
    return drivers_.count(family) > 0;
}

std::vector<DriverFamily> DriverRegistry::available_families() const {
    std::vector<DriverFamily> families;
    for (const auto& [family, driver] : drivers_) {
        families.push_back(family);
    }
    return families;
}

Driver* DriverRegistry::find(DriverFamily family) const {
    auto it = drivers_.find(family);
    return it == drivers_.end() ? nullptr : it->second.get();
}

} // namespace mssql_conncheck::driver
