#include "db/connection_params.hpp"
#include <format>

namespace pgquery {

namespace {

// libpq conninfo value: single-quoted, with ' and \ escaped by a backslash
std::string quote_conninfo_value(const std::string& value) {
    std::string out;
    out.reserve(value.size() + 2);
    out += '\'';
    for (const char c : value) {
        if (c == '\'' || c == '\\') {
            out += '\\';
        }
        out += c;
    }
    out += '\'';
    return out;
}

void append_keyword(std::string& conninfo, const char* keyword, const std::string& value) {
    if (!conninfo.empty()) {
        conninfo += ' ';
    }
    conninfo += keyword;
    conninfo += '=';
    conninfo += quote_conninfo_value(value);
}

} // anonymous namespace

std::string ConnectionParams::to_conninfo() const {
    std::string conninfo;
    conninfo.reserve(160);

    append_keyword(conninfo, "host", host);
    append_keyword(conninfo, "port", std::to_string(port));
    append_keyword(conninfo, "dbname", database);
    if (!user.empty()) {
        append_keyword(conninfo, "user", user);
    }
    if (!password.empty()) {
        append_keyword(conninfo, "password", password);
    }
    if (!sslmode.empty()) {
        append_keyword(conninfo, "sslmode", sslmode);
    }
    if (!application_name.empty()) {
        append_keyword(conninfo, "application_name", application_name);
    }
    if (connect_timeout.count() > 0) {
        append_keyword(conninfo, "connect_timeout", std::format("{}", connect_timeout.count()));
    }
    return conninfo;
}

} // namespace pgquery
