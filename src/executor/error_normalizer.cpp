#include "executor/error_normalizer.hpp"
#include "core/utils.hpp"

#include <format>
#include <optional>

namespace pgquery {

namespace {

// Byte length of the first `chars` UTF-8 characters, nullopt if the text is shorter
std::optional<size_t> utf8_prefix_bytes(std::string_view text, size_t chars) {
    size_t seen = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        const auto c = static_cast<unsigned char>(text[i]);
        if ((c & 0xC0) == 0x80) {
            continue;  // continuation byte
        }
        if (seen == chars) {
            return i;
        }
        ++seen;
    }
    if (seen == chars) {
        return text.size();
    }
    return std::nullopt;
}

} // anonymous namespace

QueryError ErrorNormalizer::normalize(const DbError& raw, std::string_view sql_sent) {
    QueryError error = QueryError::make(
        ErrorCategory::QUERY_ERROR,
        raw.message.empty() ? std::string(kUnknownError) : raw.message);

    error.detail = raw.detail;
    error.where = raw.where;
    error.code = raw.code;
    error.hint = raw.hint;
    error.line = raw.line;
    error.position = raw.position;

    if (raw.line && raw.position) {
        const int corrected = correct_line(*raw.line, *raw.position, error.message, sql_sent);
        if (corrected != *raw.line) {
            utils::log::debug(std::format("Corrected error line {} -> {} (position {})",
                *raw.line, corrected, *raw.position));
            error.line = corrected;
        }
    }
    return error;
}

int ErrorNormalizer::correct_line(int line, int position, std::string_view message,
                                  std::string_view sql_sent) {
    const auto actual_lines = utils::count_lines(sql_sent);
    if (line <= 0 || static_cast<size_t>(line) <= actual_lines * kInflationFactor) {
        return line;
    }

    // The server reports the position in characters, not bytes
    if (position >= 0) {
        if (const auto bytes = utf8_prefix_bytes(sql_sent, static_cast<size_t>(position))) {
            return static_cast<int>(utils::count_lines(sql_sent.substr(0, *bytes)));
        }
    }
    if (message.find("at or near") != std::string_view::npos) {
        return 1;
    }
    return line;
}

} // namespace pgquery
