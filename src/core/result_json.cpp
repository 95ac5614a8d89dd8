#include "core/result_json.hpp"
#include "core/utils.hpp"

#include <charconv>
#include <cmath>

namespace pgquery {

using ojson = nlohmann::ordered_json;

namespace {

template<typename T>
void put_optional(ojson& j, const char* key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    }
}

std::optional<double> try_parse_double(const std::string& text) {
    double value = 0.0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

} // anonymous namespace

ojson cell_to_json(const CellValue& cell, uint32_t type_oid) {
    if (!cell) {
        return nullptr;
    }
    const std::string& text = *cell;

    switch (type_oid) {
        case 16:  // bool
            return text == "t" || text == "true";
        case 20:  // int8
        case 21:  // int2
        case 23:  // int4
        case 26:  // oid
            if (const auto v = utils::try_parse_int<int64_t>(text)) {
                return *v;
            }
            break;
        case 700:  // float4
        case 701:  // float8
            if (const auto v = try_parse_double(text)) {
                return *v;
            }
            break;
        default:
            break;
    }
    return text;
}

void to_json(ojson& j, const PerformanceStats& stats) {
    j = ojson::object();
    j["executionTime"] = utils::to_millis(stats.execution_time);
    j["connectionTime"] = utils::to_millis(stats.connection_time);
    put_optional(j, "queryPlanningTime", stats.query_planning_time_ms);
    if (stats.query_execution_time) {
        j["queryExecutionTime"] = utils::to_millis(*stats.query_execution_time);
    }
    j["bytesReceived"] = stats.bytes_received;
    j["rowsReturned"] = stats.rows_returned;
    put_optional(j, "rowsAffected", stats.rows_affected);
    if (stats.query_complexity) {
        j["queryComplexity"] = complexity_to_string(*stats.query_complexity);
    }
    j["indexesUsed"] = stats.indexes_used;

    ojson scans = ojson::object();
    for (const auto& [table, scan] : stats.tables_scan_status) {
        scans[table] = scan_type_to_string(scan);
    }
    j["tablesScanStatus"] = std::move(scans);
}

void to_json(ojson& j, const QueryResult& result) {
    j = ojson::object();
    j["columns"] = result.columns;

    ojson rows = ojson::array();
    for (const auto& row : result.rows) {
        ojson obj = ojson::object();
        for (size_t i = 0; i < result.columns.size(); ++i) {
            const auto& name = result.columns[i];
            const auto it = row.find(name);
            const uint32_t oid = i < result.column_type_oids.size() ? result.column_type_oids[i] : 0;
            obj[name] = it != row.end() ? cell_to_json(it->second, oid) : ojson(nullptr);
        }
        rows.push_back(std::move(obj));
    }
    j["rows"] = std::move(rows);
    j["rowCount"] = result.row_count;
    put_optional(j, "affectedRows", result.affected_rows);
    j["executionTime"] = utils::to_millis(result.execution_time);
    if (result.performance_stats) {
        j["performanceStats"] = *result.performance_stats;
    }
}

void to_json(ojson& j, const QueryError& error) {
    j = ojson::object();
    j["category"] = error_category_to_string(error.category);
    j["message"] = error.message;
    put_optional(j, "line", error.line);
    put_optional(j, "position", error.position);
    put_optional(j, "detail", error.detail);
    put_optional(j, "where", error.where);
    put_optional(j, "code", error.code);
    put_optional(j, "hint", error.hint);
}

void to_json(ojson& j, const SqlValidation& validation) {
    j = ojson::object();
    j["isValid"] = validation.is_valid;
    j["errors"] = validation.errors;
    j["destructive"] = validation.destructive;
}

void to_json(ojson& j, const TableInfo& info) {
    j = ojson::object();
    j["columns"] = ojson(info.columns)["rows"];
    j["indexes"] = ojson(info.indexes)["rows"];
    j["constraints"] = ojson(info.constraints)["rows"];
}

} // namespace pgquery
