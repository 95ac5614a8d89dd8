#include "analyzer/plan_analyzer.hpp"

#include <algorithm>

namespace pgquery {

using json = nlohmann::json;

namespace {

// Safely get a string value from a JSON node, returning empty string on failure
[[nodiscard]] std::string get_string(const json& node, const char* key) {
    const auto it = node.find(key);
    if (it != node.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return {};
}

[[nodiscard]] QueryComplexity at_least(QueryComplexity current, QueryComplexity floor) {
    return std::max(current, floor);
}

[[nodiscard]] bool contains(const std::string& haystack, std::string_view needle) {
    return haystack.find(needle) != std::string::npos;
}

} // anonymous namespace

PlanAnalysis PlanAnalyzer::analyze(const json& plan_root) {
    PlanAnalysis analysis;
    if (!plan_root.is_object()) {
        return analysis;
    }

    const auto plan = plan_root.find("Plan");
    if (plan != plan_root.end()) {
        visit(*plan, analysis);
        const auto planning = plan_root.find("Planning Time");
        if (planning != plan_root.end() && planning->is_number()) {
            analysis.planning_time_ms = planning->get<double>();
        }
    } else {
        visit(plan_root, analysis);
    }
    return analysis;
}

std::optional<PlanAnalysis> PlanAnalyzer::analyze_explain_output(std::string_view query_plan) {
    // allow_exceptions = false: malformed input yields a discarded value
    const json parsed = json::parse(query_plan, nullptr, false);
    if (parsed.is_discarded()) {
        return std::nullopt;
    }

    // Shape: [ { "Plan": {...}, "Planning Time": ... } ]
    const json* entry = &parsed;
    if (parsed.is_array()) {
        if (parsed.empty()) {
            return std::nullopt;
        }
        entry = &parsed.front();
    }
    if (!entry->is_object() || !entry->contains("Plan")) {
        return std::nullopt;
    }
    return analyze(*entry);
}

void PlanAnalyzer::visit(const json& node, PlanAnalysis& analysis) {
    if (!node.is_object()) {
        return;
    }

    const std::string node_type = get_string(node, "Node Type");

    if (contains(node_type, "Join") || contains(node_type, "Aggregate") || contains(node_type, "Sort")) {
        analysis.complexity = at_least(analysis.complexity, QueryComplexity::MODERATE);
    }

    if (node_type == "Nested Loop" || node_type == "Hash Join" || node_type == "Merge Join") {
        analysis.complexity = QueryComplexity::COMPLEX;
    }

    if (node_type == "Index Scan" || node_type == "Index Only Scan") {
        if (auto index = get_string(node, "Index Name"); !index.empty()) {
            analysis.indexes_used.insert(std::move(index));
        }
        if (auto relation = get_string(node, "Relation Name"); !relation.empty()) {
            analysis.tables_scan_status[std::move(relation)] = ScanType::INDEX_SCAN;
        }
    } else if (node_type == "Bitmap Index Scan") {
        if (auto index = get_string(node, "Index Name"); !index.empty()) {
            analysis.indexes_used.insert(std::move(index));
        }
        analysis.complexity = at_least(analysis.complexity, QueryComplexity::MODERATE);
    } else if (node_type == "Bitmap Heap Scan") {
        if (auto relation = get_string(node, "Relation Name"); !relation.empty()) {
            analysis.tables_scan_status[std::move(relation)] = ScanType::BITMAP_SCAN;
        }
    } else if (node_type == "Seq Scan") {
        if (auto relation = get_string(node, "Relation Name"); !relation.empty()) {
            analysis.tables_scan_status[std::move(relation)] = ScanType::SEQ_SCAN;
        }
        analysis.complexity = at_least(analysis.complexity, QueryComplexity::MODERATE);
    }

    const auto children = node.find("Plans");
    if (children != node.end() && children->is_array()) {
        for (const auto& child : *children) {
            visit(child, analysis);
        }
    }
}

} // namespace pgquery
