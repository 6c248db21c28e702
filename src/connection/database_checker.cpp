#include "database_checker.hpp"
#include "core/logger.hpp"
#include "utils/string_utils.hpp"

namespace mssql_conncheck::connection {

std::pair<bool, std::string> DatabaseExistenceChecker::check_database() {
    const AccessInfo info = manager_.get_access_info(std::string(DEFAULT_DB_KEY));
    const std::string context = info.host.value_or("") + " - " + info.database;

    auto scope = ManagedConnection::default_database(manager_);

    if (!index_ && !build_index(info.database)) {
        return {false, context};
    }
    return {database_exists(info.database), context};
}

bool DatabaseExistenceChecker::build_index(const std::string& database) {
    std::unique_ptr<driver::Cursor> cursor;
    ExistingDatabasesIndex index;

    try {
        cursor = manager_.get_cursor(std::nullopt, std::string(DEFAULT_DATABASE));
        cursor->execute(DATABASE_EXISTS_QUERY);

        while (cursor->fetch()) {
            auto name = cursor->get_string(1);
            auto collation = cursor->get_string(2);
            if (!name) {
                continue;
            }

            ExistingDatabase entry;
            entry.case_insensitive = !utils::is_present(collation) ||
                                     collation->find(CASE_INSENSITIVE_COLLATION_MARKER) != std::string::npos;
            entry.name = *name;
            index[utils::to_lower(*name)] = std::move(entry);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to check if database " + database + " exists: " + e.what());
        if (cursor) {
            manager_.close_cursor(*cursor);
        }
        return false;
    }

    manager_.close_cursor(*cursor);
    index_ = std::move(index);
    return true;
}

bool DatabaseExistenceChecker::database_exists(const std::string& database) const {
    if (!index_) {
        return false;
    }

    auto it = index_->find(utils::to_lower(database));
    if (it == index_->end()) {
        return false;
    }
    return it->second.case_insensitive || it->second.name == database;
}

} // namespace mssql_conncheck::connection
