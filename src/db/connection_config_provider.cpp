#include "db/connection_config_provider.hpp"
#include "core/utils.hpp"

namespace pgquery {

StaticConnectionConfigProvider::StaticConnectionConfigProvider(
    ConnectionParams base, std::string default_database)
    : base_(std::move(base)),
      default_database_(utils::trim(default_database)) {}

Result<ConnectionParams> StaticConnectionConfigProvider::resolve(
    const std::optional<std::string>& database) const {

    std::string name = database ? utils::trim(*database) : default_database_;
    if (name.empty()) {
        name = default_database_;
    }
    if (name.empty()) {
        return Result<ConnectionParams>::error(ErrorCategory::CONNECTION_ERROR,
            "No target database given and no default database configured");
    }

    ConnectionParams params = base_;
    params.database = std::move(name);
    return Result<ConnectionParams>::ok(std::move(params));
}

} // namespace pgquery
