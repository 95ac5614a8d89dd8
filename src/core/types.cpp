#include "core/types.hpp"

#include <format>
#include <type_traits>

namespace pgquery {

std::optional<std::string> param_to_text(const SqlParam& param) {
    return std::visit([](const auto& v) -> std::optional<std::string> {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return std::nullopt;
        } else if constexpr (std::is_same_v<T, bool>) {
            return std::string(v ? "true" : "false");
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else {
            return std::format("{}", v);
        }
    }, param);
}

} // namespace pgquery
