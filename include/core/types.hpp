#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace pgquery {

// ============================================================================
// Parameters
// ============================================================================

/**
 * @brief Positional statement parameter ($1, $2, ...)
 *
 * Sent to the server in text format; std::nullptr_t becomes SQL NULL.
 */
using SqlParam = std::variant<std::nullptr_t, bool, int64_t, double, std::string>;

/**
 * @brief Render a parameter the way the server expects it in text format
 * @return nullopt for NULL
 */
[[nodiscard]] std::optional<std::string> param_to_text(const SqlParam& param);

// ============================================================================
// Request
// ============================================================================

/**
 * @brief Canonical execution request
 *
 * Replaces the (sql, paramsOrDatabase, database) overload: both call shapes
 * end up here before any work is done.
 */
struct QueryRequest {
    std::string sql;
    std::vector<SqlParam> params;
    std::optional<std::string> database;   // nullopt = provider default
    bool collect_stats = true;             // run the side EXPLAIN on success
};

// ============================================================================
// Plan classification
// ============================================================================

enum class QueryComplexity {
    SIMPLE,
    MODERATE,
    COMPLEX
};

enum class ScanType {
    SEQ_SCAN,
    INDEX_SCAN,
    BITMAP_SCAN
};

[[nodiscard]] inline constexpr const char* complexity_to_string(QueryComplexity c) {
    switch (c) {
        case QueryComplexity::SIMPLE:   return "Simple";
        case QueryComplexity::MODERATE: return "Moderate";
        case QueryComplexity::COMPLEX:  return "Complex";
    }
    return "Simple";
}

[[nodiscard]] inline constexpr const char* scan_type_to_string(ScanType s) {
    switch (s) {
        case ScanType::SEQ_SCAN:    return "seq_scan";
        case ScanType::INDEX_SCAN:  return "index_scan";
        case ScanType::BITMAP_SCAN: return "bitmap_scan";
    }
    return "seq_scan";
}

// ============================================================================
// Result
// ============================================================================

struct PerformanceStats {
    std::chrono::microseconds execution_time{0};
    std::chrono::microseconds connection_time{0};
    std::optional<double> query_planning_time_ms;               // from EXPLAIN "Planning Time"
    std::optional<std::chrono::microseconds> query_execution_time;
    uint64_t bytes_received = 0;                                // estimate, see QueryExecutor
    uint64_t rows_returned = 0;
    std::optional<uint64_t> rows_affected;
    std::optional<QueryComplexity> query_complexity;
    std::set<std::string> indexes_used;
    std::map<std::string, ScanType> tables_scan_status;
};

// A cell in text format; nullopt is SQL NULL
using CellValue = std::optional<std::string>;
using Row = std::unordered_map<std::string, CellValue>;

struct QueryResult {
    std::vector<std::string> columns;          // unique, server field order
    std::vector<uint32_t> column_type_oids;    // parallel to columns
    std::vector<Row> rows;
    uint64_t row_count = 0;                    // == rows.size()
    std::optional<uint64_t> affected_rows;
    std::chrono::microseconds execution_time{0};
    std::optional<PerformanceStats> performance_stats;
};

// ============================================================================
// Validation
// ============================================================================

struct SqlValidation {
    bool is_valid = true;
    std::vector<std::string> errors;
    bool destructive = false;
};

// ============================================================================
// Table introspection
// ============================================================================

struct TableInfo {
    QueryResult columns;
    QueryResult indexes;
    QueryResult constraints;
};

} // namespace pgquery
