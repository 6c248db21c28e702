#pragma once

#include "driver.hpp"
#include "core/odbc_environment.hpp"

namespace mssql_conncheck::driver {

// ODBC family provider backed by the platform driver manager.
// Owns the environment handle: must outlive every connection it returns.
class OdbcDriver : public Driver {
public:
    OdbcDriver() = default;

    DriverFamily family() const noexcept override { return DriverFamily::ODBC; }

    std::unique_ptr<RawConnection> connect(const std::string& connection_string,
                                           const ConnectOptions& options) override;

private:
    core::OdbcEnvironment env_;
};

} // namespace mssql_conncheck::driver
