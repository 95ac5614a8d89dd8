#pragma once

#include "core/error.hpp"
#include "db/idb_connection.hpp"

#include <string_view>

namespace pgquery {

/**
 * @brief Turns a driver error into the QueryError handed to callers
 *
 * Copies the diagnostic fields and repairs line coordinates that do not fit
 * the statement text: when the reported line exceeds ten times the number of
 * lines actually sent, the line is recomputed from the 1-based position, or
 * set to 1 for a syntax error whose position is out of range too.
 */
class ErrorNormalizer {
public:
    static constexpr const char* kUnknownError = "Unknown database error";
    static constexpr int kInflationFactor = 10;

    [[nodiscard]] static QueryError normalize(const DbError& raw, std::string_view sql_sent);

    /**
     * @brief The line correction on its own
     * @return Corrected line, or `line` unchanged when it is plausible
     */
    [[nodiscard]] static int correct_line(int line, int position, std::string_view message,
                                          std::string_view sql_sent);
};

} // namespace pgquery
