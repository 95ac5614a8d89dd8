#include "analyzer/sql_validator.hpp"
#include "core/utils.hpp"

#include <array>
#include <cctype>
#include <regex>

namespace pgquery {

namespace {

const std::array<std::regex, 4>& destructive_patterns() {
    static const std::array<std::regex, 4> patterns = {
        std::regex(R"(\bdrop\s+database\b)", std::regex::icase),
        std::regex(R"(\bdrop\s+schema\b)", std::regex::icase),
        std::regex(R"(\bdrop\s+table\b)", std::regex::icase),
        std::regex(R"(\btruncate\s+table\b)", std::regex::icase),
    };
    return patterns;
}

// Clause keywords that start a new line; a join qualifier stays with its JOIN
const std::array<std::regex, 6>& clause_breaks() {
    static const std::array<std::regex, 6> breaks = {
        std::regex(R"(\s*\b((left|right|inner|full|cross)\s+)?(outer\s+)?join\b)", std::regex::icase),
        std::regex(R"(\s*\bfrom\b)", std::regex::icase),
        std::regex(R"(\s*\bwhere\b)", std::regex::icase),
        std::regex(R"(\s*\border\s+by\b)", std::regex::icase),
        std::regex(R"(\s*\bgroup\s+by\b)", std::regex::icase),
        std::regex(R"(\s*\bhaving\b)", std::regex::icase),
    };
    return breaks;
}

// $tag$ opener at `pos`; returns the delimiter or an empty view
std::string_view dollar_tag_at(std::string_view sql, size_t pos) {
    size_t end = pos + 1;
    while (end < sql.size()) {
        const unsigned char c = static_cast<unsigned char>(sql[end]);
        if (c == '$') {
            return sql.substr(pos, end - pos + 1);
        }
        const bool ident = std::isalnum(c) || c == '_' || c >= 0x80;
        if (!ident || (end == pos + 1 && std::isdigit(c))) {
            return {};
        }
        ++end;
    }
    return {};
}

// First word of a statement, lowercased, after leading comments and parentheses
std::string leading_keyword(std::string_view sql) {
    size_t i = 0;
    while (i < sql.size()) {
        const char c = sql[i];
        if (std::isspace(static_cast<unsigned char>(c)) || c == '(') {
            ++i;
        } else if (sql.compare(i, 2, "--") == 0) {
            const size_t nl = sql.find('\n', i);
            i = nl == std::string_view::npos ? sql.size() : nl + 1;
        } else if (sql.compare(i, 2, "/*") == 0) {
            const size_t close = sql.find("*/", i + 2);
            i = close == std::string_view::npos ? sql.size() : close + 2;
        } else {
            break;
        }
    }
    size_t end = i;
    while (end < sql.size() && (std::isalpha(static_cast<unsigned char>(sql[end])) || sql[end] == '_')) {
        ++end;
    }
    return utils::to_lower(sql.substr(i, end - i));
}

} // anonymous namespace

SqlValidation SqlValidator::validate(std::string_view sql) {
    SqlValidation result;
    const std::string trimmed = utils::trim(sql);

    if (trimmed.empty()) {
        result.is_valid = false;
        result.errors.emplace_back(kEmptyMessage);
        return result;
    }

    bool destructive = false;
    for (const auto& pattern : destructive_patterns()) {
        if (std::regex_search(trimmed, pattern)) {
            destructive = true;
            break;
        }
    }
    if (!destructive) {
        destructive = has_unguarded_delete(trimmed);
    }

    if (destructive) {
        result.destructive = true;
        result.errors.emplace_back(kDestructiveMessage);
    }
    result.is_valid = result.errors.empty();
    return result;
}

bool SqlValidator::has_unguarded_delete(const std::string& sql) {
    static const std::regex delete_re(R"(\bdelete\s+from\b)", std::regex::icase);
    static const std::regex where_re(R"(\bwhere\b)", std::regex::icase);

    // A WHERE in a later statement does not guard an earlier DELETE
    for (const auto& statement : split_statements(sql)) {
        if (std::regex_search(statement, delete_re) && !std::regex_search(statement, where_re)) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> SqlValidator::split_statements(std::string_view sql) {
    std::vector<std::string> statements;
    size_t start = 0;
    bool has_content = false;

    const auto flush = [&](size_t end) {
        if (has_content) {
            statements.push_back(utils::trim(sql.substr(start, end - start)));
        }
        start = end + 1;
        has_content = false;
    };

    size_t i = 0;
    while (i < sql.size()) {
        const char c = sql[i];

        if (c == '\'' || c == '"') {
            // '' and "" escapes just close and reopen the literal
            const size_t close = sql.find(c, i + 1);
            i = close == std::string_view::npos ? sql.size() : close + 1;
            has_content = true;
        } else if (sql.compare(i, 2, "--") == 0) {
            const size_t nl = sql.find('\n', i);
            i = nl == std::string_view::npos ? sql.size() : nl + 1;
        } else if (sql.compare(i, 2, "/*") == 0) {
            // Block comments nest in PostgreSQL
            int depth = 1;
            i += 2;
            while (i < sql.size() && depth > 0) {
                if (sql.compare(i, 2, "/*") == 0) {
                    ++depth;
                    i += 2;
                } else if (sql.compare(i, 2, "*/") == 0) {
                    --depth;
                    i += 2;
                } else {
                    ++i;
                }
            }
        } else if (c == '$' && !dollar_tag_at(sql, i).empty()) {
            const auto tag = dollar_tag_at(sql, i);
            const size_t close = sql.find(tag, i + tag.size());
            i = close == std::string_view::npos ? sql.size() : close + tag.size();
            has_content = true;
        } else if (c == ';') {
            flush(i);
            ++i;
        } else {
            if (!std::isspace(static_cast<unsigned char>(c))) {
                has_content = true;
            }
            ++i;
        }
    }
    flush(sql.size());
    return statements;
}

bool SqlValidator::is_explainable(std::string_view sql) {
    const auto statements = split_statements(sql);
    if (statements.size() != 1) {
        return false;
    }

    const std::string keyword = leading_keyword(statements.front());
    return keyword == "select" || keyword == "insert" || keyword == "update" ||
           keyword == "delete" || keyword == "merge" || keyword == "values" ||
           keyword == "table" || keyword == "with";
}

std::string SqlValidator::format(std::string_view sql) {
    static const std::regex whitespace_re(R"(\s+)");
    static const std::regex comma_re(R"(\s*,\s*)");
    static const std::regex select_re(R"(\bselect\b)", std::regex::icase);

    std::string out = std::regex_replace(utils::trim(sql), whitespace_re, " ");
    out = std::regex_replace(out, comma_re, ",\n    ");
    out = std::regex_replace(out, select_re, "SELECT");

    for (const auto& pattern : clause_breaks()) {
        std::string rebuilt;
        size_t last = 0;
        for (auto it = std::sregex_iterator(out.begin(), out.end(), pattern);
             it != std::sregex_iterator(); ++it) {
            const auto& m = *it;
            rebuilt.append(out, last, static_cast<size_t>(m.position()) - last);
            rebuilt += '\n';
            rebuilt += utils::to_upper(utils::trim(m.str()));
            last = static_cast<size_t>(m.position() + m.length());
        }
        rebuilt.append(out, last, std::string::npos);
        out = std::move(rebuilt);
    }

    return utils::trim(out);
}

} // namespace pgquery
