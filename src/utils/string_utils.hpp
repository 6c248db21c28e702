#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mssql_conncheck::utils {

std::string to_lower(std::string_view s);
std::string to_upper(std::string_view s);

// Strip leading/trailing whitespace (" \t\r\n")
std::string trim(std::string_view s);

bool iequals(std::string_view a, std::string_view b);

// Split on every occurrence of a delimiter, keeping empty fields
std::vector<std::string> split(std::string_view s, char delimiter);

// True when the optional holds a non-empty string
inline bool is_present(const std::optional<std::string>& value) {
    return value.has_value() && !value->empty();
}

// Replace every occurrence of `needle` in `text`
std::string replace_all(std::string_view text, std::string_view needle, std::string_view replacement);

} // namespace mssql_conncheck::utils
