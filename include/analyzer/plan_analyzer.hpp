#pragma once

#include "core/types.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace pgquery {

/**
 * @brief What a plan tree says about how a statement runs
 */
struct PlanAnalysis {
    QueryComplexity complexity = QueryComplexity::SIMPLE;
    std::set<std::string> indexes_used;
    std::map<std::string, ScanType> tables_scan_status;
    std::optional<double> planning_time_ms;
};

/**
 * @brief Classifies an EXPLAIN (FORMAT JSON) plan tree
 *
 * Pure and stateless; no I/O.
 */
class PlanAnalyzer {
public:
    /**
     * @brief Analyze one plan
     *
     * Accepts either an EXPLAIN entry (`{"Plan": {...}, "Planning Time": ...}`)
     * or a bare plan node. Nodes are visited pre-order through their "Plans"
     * children; complexity only ever escalates.
     */
    [[nodiscard]] static PlanAnalysis analyze(const nlohmann::json& plan_root);

    /**
     * @brief Analyze the text of the "QUERY PLAN" column
     * @return nullopt if the text is not a JSON plan
     */
    [[nodiscard]] static std::optional<PlanAnalysis> analyze_explain_output(std::string_view query_plan);

private:
    static void visit(const nlohmann::json& node, PlanAnalysis& analysis);
};

} // namespace pgquery
