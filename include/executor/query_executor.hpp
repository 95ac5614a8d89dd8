#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "db/iconnection_pool.hpp"
#include "db/managed_connection.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pgquery {

/**
 * @brief Query execution façade
 *
 * Acquires a ManagedConnection per call from IConnectionPool, runs the
 * statement, times each phase and, after a successful statement, runs a
 * best-effort EXPLAIN on the same connection to classify the plan. Server
 * errors come back normalized through ErrorNormalizer. The connection is
 * released on every exit path.
 *
 * Thread-safe: all shared state lives in the pool.
 */
class QueryExecutor {
public:
    struct Config {
        bool collect_performance_stats = true;   // side EXPLAIN after success
    };

    static constexpr const char* kStatsExplainPrefix = "EXPLAIN (ANALYZE false, BUFFERS false, FORMAT JSON) ";
    static constexpr const char* kExplainPrefix = "EXPLAIN (ANALYZE, BUFFERS, FORMAT JSON) ";

    QueryExecutor(std::shared_ptr<IConnectionPool> pool, const Config& config);

    explicit QueryExecutor(std::shared_ptr<IConnectionPool> pool)
        : QueryExecutor(std::move(pool), Config{}) {}

    /**
     * @brief Execute a canonical request
     * @return QueryResult, or VALIDATION_ERROR (empty SQL, pool untouched),
     *         CONNECTION_ERROR, QUERY_ERROR
     */
    [[nodiscard]] Result<QueryResult> execute_query(const QueryRequest& request);

    [[nodiscard]] Result<QueryResult> execute_query(
        const std::string& sql,
        const std::optional<std::string>& database = std::nullopt);

    [[nodiscard]] Result<QueryResult> execute_query(
        const std::string& sql,
        std::vector<SqlParam> params,
        const std::optional<std::string>& database = std::nullopt);

    /**
     * @brief Run EXPLAIN (ANALYZE, BUFFERS, FORMAT JSON) and return its output
     *
     * The statement is really executed by ANALYZE.
     */
    [[nodiscard]] Result<QueryResult> explain_query(
        const std::string& sql,
        const std::optional<std::string>& database = std::nullopt);

    [[nodiscard]] SqlValidation validate_sql(std::string_view sql) const;

    [[nodiscard]] std::string format_sql(std::string_view sql) const;

    /**
     * @brief First rows of a table (identifiers are quoted)
     */
    [[nodiscard]] Result<QueryResult> get_table_preview(
        const std::string& schema,
        const std::string& table,
        int64_t limit = 100,
        const std::optional<std::string>& database = std::nullopt);

    /**
     * @brief Columns, indexes and constraints of a table, read on one connection
     */
    [[nodiscard]] Result<TableInfo> get_table_info(
        const std::string& schema,
        const std::string& table,
        const std::optional<std::string>& database = std::nullopt);

    /**
     * @brief SELECT 1 round trip
     * @return true if the database answered with one row holding 1
     */
    [[nodiscard]] bool test_connection(const std::optional<std::string>& database = std::nullopt);

    [[nodiscard]] std::map<std::string, bool> health_check();

    /**
     * @brief Drain and close the pool (process shutdown; safe to repeat)
     */
    void cleanup();

    /**
     * @brief Approximate wire size of a result set
     *
     * Per row `columns × 4`; per value NULL 4, boolean 1, numeric types 8,
     * anything else twice its text length.
     */
    [[nodiscard]] static uint64_t estimate_bytes_received(const DbResultSet& result_set);

private:
    /**
     * @brief Best-effort plan classification; every failure is logged and dropped
     *
     * Only single statements SqlValidator::is_explainable accepts are explained.
     */
    void collect_plan_stats(
        ManagedConnection& conn,
        const std::string& sql,
        const std::vector<SqlParam>& params,
        PerformanceStats& stats);

    /**
     * @brief Run one statement on a leased connection, normalizing failures
     */
    [[nodiscard]] Result<DbResultSet> run(
        ManagedConnection& conn,
        const std::string& sql,
        const std::vector<SqlParam>& params);

    [[nodiscard]] static QueryResult build_result(DbResultSet& result_set);

    std::shared_ptr<IConnectionPool> pool_;
    Config config_;
};

} // namespace pgquery
