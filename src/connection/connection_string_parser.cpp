#include "connection_string_parser.hpp"
#include "core/errors.hpp"
#include "utils/string_utils.hpp"

namespace mssql_conncheck::connection {

namespace {

// Only the characters needed to split the string; the driver validates the rest
bool is_reserved(char c) {
    return c == '=' || c == ';' || c == '{' || c == '}';
}

enum class ParseState {
    OUTSIDE,
    ESCAPING
};

[[noreturn]] void fail(const std::string& reason, std::string_view cs) {
    throw core::ConfigurationError("Invalid connection string: " + reason + ": " + std::string(cs));
}

[[noreturn]] void fail_at(const std::string& reason, std::size_t index, std::string_view cs) {
    fail(reason + " at index=" + std::to_string(index), cs);
}

void append_token(std::string& out, const std::string& token) {
    bool needs_escape = token.empty() || token.front() == ' ';
    for (char c : token) {
        if (is_reserved(c)) {
            needs_escape = true;
            break;
        }
    }

    if (!needs_escape) {
        out += token;
        return;
    }

    out += '{';
    for (char c : token) {
        out += c;
        if (c == '}') {
            out += '}';
        }
    }
    out += '}';
}

} // anonymous namespace

void ConnectionProperties::set(std::string key, std::string value) {
    for (auto& entry : entries_) {
        if (entry.first == key) {
            entry.second = std::move(value);
            return;
        }
    }
    entries_.emplace_back(std::move(key), std::move(value));
}

std::optional<std::string> ConnectionProperties::find(std::string_view key) const {
    for (const auto& entry : entries_) {
        if (utils::iequals(entry.first, key)) {
            return entry.second;
        }
    }
    return std::nullopt;
}

std::string ConnectionProperties::to_string() const {
    std::string out;
    for (const auto& [key, value] : entries_) {
        append_token(out, key);
        out += '=';
        append_token(out, value);
        out += ';';
    }
    return out;
}

ConnectionProperties parse_connection_string_properties(std::string_view connection_string) {
    const std::string cs = utils::trim(connection_string);

    ConnectionProperties params;
    ParseState state = ParseState::OUTSIDE;
    std::string key;
    std::string parsed;
    bool key_done = false;

    std::size_t i = 0;
    while (i < cs.size()) {
        const char c = cs[i];

        if (state == ParseState::ESCAPING) {
            if (c == '}' && i + 1 < cs.size() && cs[i + 1] == '}') {
                parsed += '}';
                i += 2;
                continue;
            }
            if (c == '}') {
                state = ParseState::OUTSIDE;
            } else {
                parsed += c;
            }
            ++i;
            continue;
        }

        if (c == '{') {
            state = ParseState::ESCAPING;
            ++i;
            continue;
        }

        // Whitespace between two properties, i.e. "A=B;  C=D"
        if (!key_done && parsed.empty() && c == ' ') {
            ++i;
            continue;
        }

        if (c == '=') {
            if (key_done) {
                fail_at("unexpected '=' while parsing value", i, cs);
            }
            if (parsed.empty()) {
                fail_at("empty key", i, cs);
            }
            key = std::move(parsed);
            parsed.clear();
            key_done = true;
            ++i;
            continue;
        }

        if (c == ';') {
            if (!key_done) {
                fail_at("missing '=' after key '" + parsed + "'", i, cs);
            }
            if (parsed.empty()) {
                fail_at("empty value", i, cs);
            }
            params.set(std::move(key), std::move(parsed));
            key.clear();
            parsed.clear();
            key_done = false;
            ++i;
            continue;
        }

        if (is_reserved(c)) {
            fail_at(std::string("invalid character '") + c + "'", i, cs);
        }

        parsed += c;
        ++i;
    }

    // The last ';' can be omitted, commit a final pending property
    if (state == ParseState::ESCAPING) {
        fail("did not find expected matching closing brace '}'", cs);
    }
    if (key_done) {
        if (parsed.empty()) {
            fail("empty value at the end of the connection string", cs);
        }
        params.set(std::move(key), std::move(parsed));
    } else if (!parsed.empty()) {
        fail("missing '=' after key '" + parsed + "' at the end of the connection string", cs);
    }

    return params;
}

} // namespace mssql_conncheck::connection
