#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <nlohmann/json.hpp>

namespace pgquery {

// JSON rendering for collaborators (CLI, UI bridges). ordered_json keeps
// result columns in server field order. Durations are fractional milliseconds.

void to_json(nlohmann::ordered_json& j, const PerformanceStats& stats);
void to_json(nlohmann::ordered_json& j, const QueryResult& result);
void to_json(nlohmann::ordered_json& j, const QueryError& error);
void to_json(nlohmann::ordered_json& j, const SqlValidation& validation);
void to_json(nlohmann::ordered_json& j, const TableInfo& info);

/**
 * @brief Typed JSON value for a text-format cell
 *
 * bool and integer/float columns become JSON booleans and numbers; numeric
 * stays a string to keep its precision; NULL is null.
 */
[[nodiscard]] nlohmann::ordered_json cell_to_json(const CellValue& cell, uint32_t type_oid);

} // namespace pgquery
