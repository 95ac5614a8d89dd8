#pragma once

#include "core/types.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pgquery {

/**
 * @brief Error fields as reported by the driver
 *
 * Raw input to ErrorNormalizer. `line` is the server-reported source line,
 * `position` the 1-based character offset into the statement text.
 */
struct DbError {
    std::string message;
    std::optional<std::string> detail;
    std::optional<std::string> hint;
    std::optional<std::string> where;
    std::optional<std::string> code;      // SQLSTATE
    std::optional<int> line;
    std::optional<int> position;
    bool connection_lost = false;         // socket is unusable after this error
};

struct DbField {
    std::string name;
    uint32_t type_oid = 0;
};

/**
 * @brief Result set from a statement execution
 *
 * Owns the result data (copied from native result handles).
 */
struct DbResultSet {
    bool success = false;
    DbError error;

    // For statements returning tuples
    std::vector<DbField> fields;
    std::vector<std::vector<CellValue>> rows;

    // From the command tag (INSERT/UPDATE/DELETE/SELECT/MOVE/FETCH/COPY)
    std::optional<uint64_t> affected_rows;

    // SELECT vs DML/DDL
    bool has_rows = false;

    static DbResultSet failure(DbError err) {
        DbResultSet r;
        r.success = false;
        r.error = std::move(err);
        return r;
    }
};

/**
 * @brief Abstract database connection
 *
 * Wraps a single native connection handle. Implementations are not
 * thread-safe; a connection is owned by one ManagedConnection at a time.
 */
class IDbConnection {
public:
    virtual ~IDbConnection() = default;

    /**
     * @brief Execute a SQL statement
     * @param sql SQL text, sent unchanged
     * @param params Positional parameters; empty selects the simple protocol
     *        (multiple statements allowed, last result returned)
     */
    [[nodiscard]] virtual DbResultSet execute(
        const std::string& sql, const std::vector<SqlParam>& params = {}) = 0;

    /**
     * @brief Run a health check statement
     * @return true if the connection is usable
     */
    [[nodiscard]] virtual bool is_healthy(const std::string& health_check_query) = 0;

    /**
     * @brief Check if connection is in a valid state (connected)
     */
    [[nodiscard]] virtual bool is_connected() const = 0;

    /**
     * @brief True while a transaction block is open or aborted on the session
     */
    [[nodiscard]] virtual bool in_transaction() const = 0;

    /**
     * @brief Database this connection was opened against
     */
    [[nodiscard]] virtual const std::string& database() const = 0;

    /**
     * @brief Close the connection and release resources
     */
    virtual void close() = 0;
};

} // namespace pgquery
