#pragma once

#include "core/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace pgquery {

/**
 * @brief Side-effect-free checks and cosmetics on statement text
 *
 * Regex based, no parsing: destructive shapes are flagged, never blocked.
 */
class SqlValidator {
public:
    static constexpr const char* kEmptyMessage = "SQL query cannot be empty";
    static constexpr const char* kDestructiveMessage =
        "Potentially dangerous operation detected. Please be careful with destructive queries.";

    /**
     * @brief Check for empty input and destructive statements
     *
     * DROP DATABASE / SCHEMA / TABLE, TRUNCATE TABLE and DELETE FROM without
     * a WHERE clause add a single kDestructiveMessage entry.
     */
    [[nodiscard]] static SqlValidation validate(std::string_view sql);

    /**
     * @brief Reflow a statement: one clause per line, one select item per line
     */
    [[nodiscard]] static std::string format(std::string_view sql);

    /**
     * @brief Split a script on top-level semicolons
     *
     * Semicolons inside quoted strings, quoted identifiers, dollar-quoted
     * bodies and comments do not split. Segments holding only whitespace or
     * comments are dropped; the rest are returned trimmed.
     */
    [[nodiscard]] static std::vector<std::string> split_statements(std::string_view sql);

    /**
     * @brief True for a single statement EXPLAIN accepts without running it
     *
     * SELECT, INSERT, UPDATE, DELETE, MERGE, VALUES, TABLE and WITH. Scripts,
     * transaction control, COPY, DDL and utility statements are not.
     */
    [[nodiscard]] static bool is_explainable(std::string_view sql);

private:
    [[nodiscard]] static bool has_unguarded_delete(const std::string& sql);
};

} // namespace pgquery
