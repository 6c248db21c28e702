#pragma once

#ifdef _WIN32

#include "driver.hpp"

namespace mssql_conncheck::driver {

// ADODBAPI family provider: ADO Connection objects over an OLE DB provider.
// Initializes COM for the constructing thread and must be used from that thread.
//
// Failures surface as core::ProviderError shaped like an automation call error:
// hresult DISP_E_EXCEPTION, detail holding the provider description and the
// HRESULT of the failing ADO call.
class AdoDriver : public Driver {
public:
    // @throws core::ProviderError when COM cannot be initialized
    AdoDriver();
    ~AdoDriver() override;

    AdoDriver(const AdoDriver&) = delete;
    AdoDriver& operator=(const AdoDriver&) = delete;

    DriverFamily family() const noexcept override { return DriverFamily::ADODBAPI; }

    std::unique_ptr<RawConnection> connect(const std::string& connection_string,
                                           const ConnectOptions& options) override;

private:
    bool com_initialized_ = false;
};

} // namespace mssql_conncheck::driver

#endif // _WIN32
