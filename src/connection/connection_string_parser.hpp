#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mssql_conncheck::connection {

/**
 * @brief Ordered key/value properties of a connection string
 *
 * Keys keep the case they were written with. Assigning an existing key
 * (exact match) replaces its value in place. Lookups through find() ignore
 * case.
 */
class ConnectionProperties {
public:
    using Entry = std::pair<std::string, std::string>;

    void set(std::string key, std::string value);

    // Case-insensitive lookup
    std::optional<std::string> find(std::string_view key) const;
    bool contains(std::string_view key) const { return find(key).has_value(); }

    const std::vector<Entry>& entries() const noexcept { return entries_; }
    std::size_t size() const noexcept { return entries_.size(); }
    bool empty() const noexcept { return entries_.empty(); }

    /**
     * @brief Serialize as "key=value;" pairs
     *
     * Values containing a reserved character or a leading space are wrapped
     * in braces, with '}' doubled inside.
     */
    std::string to_string() const;

private:
    std::vector<Entry> entries_;
};

/**
 * @brief Parse the properties portion of a SQL Server connection string
 *
 * Input is "key1=value1;key2={va;l=ue}}2};..." without any subprotocol,
 * server, instance or port prefix. The string is scanned character by
 * character: '{' starts an escaped run where everything is literal except
 * "}}" (a literal '}') and a single '}' (end of escape). Outside escapes,
 * '=', ';', '{' and '}' are reserved. The trailing ';' is optional.
 *
 * @throws core::ConfigurationError on empty keys or values, a key without
 *         '=', a second '=' in a value, an unescaped reserved character or
 *         an unterminated '{'. The message carries the index and the string.
 */
ConnectionProperties parse_connection_string_properties(std::string_view connection_string);

} // namespace mssql_conncheck::connection
