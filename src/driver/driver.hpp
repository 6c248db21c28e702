#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace mssql_conncheck::driver {

// Connection string dialect and native provider stack
enum class DriverFamily {
    ADODBAPI,   // ADO / OLE DB provider (Provider=...;Data Source=...)
    ODBC        // ODBC driver manager (DRIVER=...;Server=...)
};

// Configuration name of a family: "adodbapi" or "odbc"
std::string family_name(DriverFamily family);

// Case-insensitive lookup of a configuration name
std::optional<DriverFamily> parse_family(std::string_view name);

DriverFamily other_family(DriverFamily family) noexcept;

struct ConnectOptions {
    std::chrono::seconds timeout{5};
    bool autocommit = true;
};

// Statement handle borrowed from a RawConnection. Must not outlive it.
class Cursor {
public:
    virtual ~Cursor() = default;

    virtual void execute(std::string_view sql) = 0;

    // Advance to the next row, false when the result set is exhausted
    virtual bool fetch() = 0;

    // Column value of the current row (1-based), std::nullopt for NULL
    virtual std::optional<std::string> get_string(std::size_t column) = 0;

    // Closing an already closed cursor is not an error
    virtual void close() = 0;
};

// Live native connection
class RawConnection {
public:
    virtual ~RawConnection() = default;

    virtual std::unique_ptr<Cursor> cursor() = 0;
    virtual void close() = 0;
};

// Capability provider for one driver family
class Driver {
public:
    virtual ~Driver() = default;

    virtual DriverFamily family() const noexcept = 0;

    // Throws a core::DriverError (or subclass) on failure
    virtual std::unique_ptr<RawConnection> connect(const std::string& connection_string,
                                                   const ConnectOptions& options) = 0;
};

} // namespace mssql_conncheck::driver
