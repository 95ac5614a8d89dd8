#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace pgquery {

/**
 * @brief Physical connection parameters for one target database
 */
struct ConnectionParams {
    std::string host = "localhost";
    uint16_t port = 5432;
    std::string database;
    std::string user;
    std::string password;
    std::string sslmode = "prefer";
    std::string application_name = "pgquery";
    std::chrono::seconds connect_timeout{5};

    /**
     * @brief Render as a libpq keyword/value conninfo string
     *
     * Every value is single-quoted with backslash escaping. Empty optional
     * keywords (user, password) are omitted.
     */
    [[nodiscard]] std::string to_conninfo() const;
};

} // namespace pgquery
