#include "executor/query_executor.hpp"
#include "analyzer/plan_analyzer.hpp"
#include "analyzer/sql_validator.hpp"
#include "core/utils.hpp"
#include "executor/error_normalizer.hpp"

#include <format>
#include <unordered_map>

namespace pgquery {

namespace {

// pg_type OIDs that arrive as fixed-size values
constexpr uint32_t kBoolOid = 16;

[[nodiscard]] bool is_numeric_oid(uint32_t oid) {
    switch (oid) {
        case 20:    // int8
        case 21:    // int2
        case 23:    // int4
        case 26:    // oid
        case 700:   // float4
        case 701:   // float8
        case 1700:  // numeric
            return true;
        default:
            return false;
    }
}

std::string quote_identifier(const std::string& name) {
    std::string out;
    out.reserve(name.size() + 2);
    out += '"';
    for (const char c : name) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

constexpr const char* kTableColumnsSql =
    "SELECT column_name, data_type, is_nullable, column_default, "
    "character_maximum_length, numeric_precision, numeric_scale "
    "FROM information_schema.columns "
    "WHERE table_schema = $1 AND table_name = $2 "
    "ORDER BY ordinal_position";

constexpr const char* kTableIndexesSql =
    "SELECT indexname AS name, indexdef AS definition "
    "FROM pg_indexes "
    "WHERE schemaname = $1 AND tablename = $2 "
    "ORDER BY indexname";

constexpr const char* kTableConstraintsSql =
    "SELECT constraint_name, constraint_type "
    "FROM information_schema.table_constraints "
    "WHERE table_schema = $1 AND table_name = $2 "
    "ORDER BY constraint_name";

} // anonymous namespace

QueryExecutor::QueryExecutor(std::shared_ptr<IConnectionPool> pool, const Config& config)
    : pool_(std::move(pool)),
      config_(config) {}

Result<QueryResult> QueryExecutor::execute_query(
    const std::string& sql, const std::optional<std::string>& database) {
    return execute_query(QueryRequest{.sql = sql, .params = {}, .database = database});
}

Result<QueryResult> QueryExecutor::execute_query(
    const std::string& sql, std::vector<SqlParam> params, const std::optional<std::string>& database) {
    return execute_query(QueryRequest{.sql = sql, .params = std::move(params), .database = database});
}

Result<QueryResult> QueryExecutor::execute_query(const QueryRequest& request) {
    const std::string sql = utils::trim(request.sql);
    if (sql.empty()) {
        return Result<QueryResult>::error(ErrorCategory::VALIDATION_ERROR, SqlValidator::kEmptyMessage);
    }

    utils::Timer total_timer;

    auto acquired = pool_->acquire(request.database);
    const auto connection_time = total_timer.elapsed_us();
    if (acquired.is_error()) {
        utils::log::warn(std::format("Connection acquire failed: {}", acquired.error_message()));
        return Result<QueryResult>::error(acquired.error());
    }
    ManagedConnection conn = acquired.take();

    utils::log::debug(std::format("Executing on '{}' ({} params): {}",
        conn.database(), request.params.size(), sql));

    utils::Timer query_timer;
    auto executed = run(conn, sql, request.params);
    const auto query_execution_time = query_timer.elapsed_us();
    if (executed.is_error()) {
        return Result<QueryResult>::error(executed.error());
    }

    DbResultSet& db_result = executed.value();
    QueryResult result = build_result(db_result);
    result.execution_time = total_timer.elapsed_us();

    PerformanceStats stats;
    stats.execution_time = result.execution_time;
    stats.connection_time = connection_time;
    stats.query_execution_time = query_execution_time;
    stats.rows_returned = result.row_count;
    stats.rows_affected = result.affected_rows;
    stats.bytes_received = estimate_bytes_received(db_result);

    if (request.collect_stats && config_.collect_performance_stats) {
        collect_plan_stats(conn, sql, request.params, stats);
    }
    result.performance_stats = std::move(stats);

    utils::log::debug(std::format("Query executed successfully in {:.3f}ms, {} rows returned",
        utils::to_millis(result.execution_time), result.row_count));

    return Result<QueryResult>::ok(std::move(result));
}

Result<DbResultSet> QueryExecutor::run(
    ManagedConnection& conn, const std::string& sql, const std::vector<SqlParam>& params) {

    DbResultSet db_result;
    try {
        db_result = conn->execute(sql, params);
    } catch (const std::exception& e) {
        conn.mark_unhealthy();
        return Result<DbResultSet>::error(ErrorCategory::INTERNAL_ERROR,
            std::format("Database error: {}", e.what()));
    }

    if (!db_result.success) {
        if (db_result.error.connection_lost) {
            conn.mark_unhealthy();
        }
        auto error = ErrorNormalizer::normalize(db_result.error, sql);
        utils::log::debug(std::format("Query failed on '{}': {}", conn.database(), error.message));
        return Result<DbResultSet>::error(std::move(error));
    }
    return Result<DbResultSet>::ok(std::move(db_result));
}

void QueryExecutor::collect_plan_stats(
    ManagedConnection& conn,
    const std::string& sql,
    const std::vector<SqlParam>& params,
    PerformanceStats& stats) {

    const char* category = error_category_to_string(ErrorCategory::PLAN_ANALYSIS_ERROR);

    // The EXPLAIN text goes out as-is: a script would re-run every statement after the first
    if (!SqlValidator::is_explainable(sql)) {
        utils::log::debug(std::format("{}: skipped, not a single explainable statement", category));
        return;
    }

    try {
        auto explain = conn->execute(kStatsExplainPrefix + sql, params);
        if (!explain.success) {
            if (explain.error.connection_lost) {
                conn.mark_unhealthy();
            }
            utils::log::debug(std::format("{}: EXPLAIN failed: {}", category, explain.error.message));
            return;
        }
        if (explain.rows.empty() || explain.rows.front().empty() || !explain.rows.front().front()) {
            utils::log::debug(std::format("{}: EXPLAIN returned no plan", category));
            return;
        }

        auto analysis = PlanAnalyzer::analyze_explain_output(*explain.rows.front().front());
        if (!analysis) {
            utils::log::debug(std::format("{}: unreadable plan output", category));
            return;
        }

        stats.query_planning_time_ms = analysis->planning_time_ms;
        stats.query_complexity = analysis->complexity;
        stats.indexes_used = std::move(analysis->indexes_used);
        stats.tables_scan_status = std::move(analysis->tables_scan_status);
    } catch (const std::exception& e) {
        utils::log::debug(std::format("{}: {}", category, e.what()));
    }
}

QueryResult QueryExecutor::build_result(DbResultSet& result_set) {
    QueryResult result;

    // Duplicate names keep their first position; the row holds the last value
    std::unordered_map<std::string, size_t> seen;
    result.columns.reserve(result_set.fields.size());
    for (const auto& field : result_set.fields) {
        if (seen.emplace(field.name, result.columns.size()).second) {
            result.columns.push_back(field.name);
            result.column_type_oids.push_back(field.type_oid);
        }
    }

    result.rows.reserve(result_set.rows.size());
    for (auto& values : result_set.rows) {
        Row row;
        row.reserve(result.columns.size());
        for (size_t i = 0; i < values.size() && i < result_set.fields.size(); ++i) {
            row[result_set.fields[i].name] = values[i];
        }
        result.rows.push_back(std::move(row));
    }

    result.row_count = result.rows.size();
    result.affected_rows = result_set.affected_rows;
    return result;
}

uint64_t QueryExecutor::estimate_bytes_received(const DbResultSet& result_set) {
    const uint64_t per_row_overhead = result_set.fields.size() * 4;
    uint64_t total = 0;

    for (const auto& row : result_set.rows) {
        total += per_row_overhead;
        for (size_t i = 0; i < row.size(); ++i) {
            const auto& cell = row[i];
            if (!cell) {
                total += 4;
                continue;
            }
            const uint32_t oid = i < result_set.fields.size() ? result_set.fields[i].type_oid : 0;
            if (oid == kBoolOid) {
                total += 1;
            } else if (is_numeric_oid(oid)) {
                total += 8;
            } else {
                total += cell->size() * 2;
            }
        }
    }
    return total;
}

Result<QueryResult> QueryExecutor::explain_query(
    const std::string& sql, const std::optional<std::string>& database) {

    const std::string trimmed = utils::trim(sql);
    if (trimmed.empty()) {
        return Result<QueryResult>::error(ErrorCategory::VALIDATION_ERROR, SqlValidator::kEmptyMessage);
    }
    return execute_query(QueryRequest{
        .sql = kExplainPrefix + trimmed,
        .params = {},
        .database = database,
        .collect_stats = false,
    });
}

SqlValidation QueryExecutor::validate_sql(std::string_view sql) const {
    return SqlValidator::validate(sql);
}

std::string QueryExecutor::format_sql(std::string_view sql) const {
    return SqlValidator::format(sql);
}

Result<QueryResult> QueryExecutor::get_table_preview(
    const std::string& schema,
    const std::string& table,
    int64_t limit,
    const std::optional<std::string>& database) {

    if (schema.empty() || table.empty()) {
        return Result<QueryResult>::error(ErrorCategory::VALIDATION_ERROR,
            "Schema and table name must not be empty");
    }
    if (limit < 0) {
        return Result<QueryResult>::error(ErrorCategory::VALIDATION_ERROR,
            std::format("Preview limit must be >= 0, got {}", limit));
    }

    return execute_query(std::format("SELECT * FROM {}.{} LIMIT {}",
        quote_identifier(schema), quote_identifier(table), limit), database);
}

Result<TableInfo> QueryExecutor::get_table_info(
    const std::string& schema,
    const std::string& table,
    const std::optional<std::string>& database) {

    if (schema.empty() || table.empty()) {
        return Result<TableInfo>::error(ErrorCategory::VALIDATION_ERROR,
            "Schema and table name must not be empty");
    }

    auto acquired = pool_->acquire(database);
    if (acquired.is_error()) {
        return Result<TableInfo>::error(acquired.error());
    }
    ManagedConnection conn = acquired.take();

    const std::vector<SqlParam> params = {schema, table};
    TableInfo info;

    const std::pair<const char*, QueryResult*> queries[] = {
        {kTableColumnsSql, &info.columns},
        {kTableIndexesSql, &info.indexes},
        {kTableConstraintsSql, &info.constraints},
    };
    for (const auto& [sql, target] : queries) {
        utils::Timer timer;
        auto executed = run(conn, sql, params);
        if (executed.is_error()) {
            utils::log::warn(std::format("Reading table info for {}.{} failed: {}",
                schema, table, executed.error_message()));
            return Result<TableInfo>::error(executed.error());
        }
        *target = build_result(executed.value());
        target->execution_time = timer.elapsed_us();
    }

    return Result<TableInfo>::ok(std::move(info));
}

bool QueryExecutor::test_connection(const std::optional<std::string>& database) {
    auto result = execute_query(QueryRequest{
        .sql = "SELECT 1 AS test",
        .params = {},
        .database = database,
        .collect_stats = false,
    });
    if (result.is_error()) {
        utils::log::warn(std::format("Connection test failed: {}", result.error_message()));
        return false;
    }

    const auto& rows = result.value().rows;
    if (rows.size() != 1) {
        return false;
    }
    const auto it = rows.front().find("test");
    return it != rows.front().end() && it->second && *it->second == "1";
}

std::map<std::string, bool> QueryExecutor::health_check() {
    return pool_->health_check();
}

void QueryExecutor::cleanup() {
    pool_->close_all();
}

} // namespace pgquery
