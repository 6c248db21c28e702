#pragma once

#include "connection_manager.hpp"
#include <map>
#include <optional>
#include <string>
#include <utility>

namespace mssql_conncheck::connection {

constexpr const char* DATABASE_EXISTS_QUERY = "select name, collation_name from sys.databases;";

// Substring of a collation name marking it case-insensitive
constexpr const char* CASE_INSENSITIVE_COLLATION_MARKER = "CI";

struct ExistingDatabase {
    bool case_insensitive = true;
    std::string name;   // as stored on the server
};

// Lower-cased database name -> stored entry
using ExistingDatabasesIndex = std::map<std::string, ExistingDatabase>;

/**
 * @brief Answers whether the configured database exists on the server
 *
 * The catalog is read once, through the default database connection, and
 * kept until invalidate(). A database with a NULL collation (offline) is
 * treated as case-insensitive.
 */
class DatabaseExistenceChecker {
public:
    explicit DatabaseExistenceChecker(ConnectionManager& manager)
        : manager_(manager) {}

    /**
     * @brief Check the database configured under DEFAULT_DB_KEY
     *
     * Opens the default database for the duration of the call.
     *
     * @return (exists, "host - database"). A failed catalog query yields false.
     * @throws core::SQLConnectionError when the default database cannot be opened
     */
    std::pair<bool, std::string> check_database();

    // Lookup in the cached index, false when the index is not built
    bool database_exists(const std::string& database) const;

    void invalidate() { index_.reset(); }

    const std::optional<ExistingDatabasesIndex>& index() const noexcept { return index_; }

private:
    bool build_index(const std::string& database);

    ConnectionManager& manager_;
    std::optional<ExistingDatabasesIndex> index_;
};

} // namespace mssql_conncheck::connection
