#pragma once

#include "core/error.hpp"
#include "db/connection_params.hpp"
#include <optional>
#include <string>

namespace pgquery {

/**
 * @brief Source of physical connection parameters
 *
 * Consulted on every acquire; credentials are the provider's concern.
 */
class IConnectionConfigProvider {
public:
    virtual ~IConnectionConfigProvider() = default;

    /**
     * @brief Resolve the parameters for a target database
     * @param database Requested database; nullopt selects the default
     * @return Parameters with `database` filled in, or CONNECTION_ERROR
     */
    [[nodiscard]] virtual Result<ConnectionParams> resolve(
        const std::optional<std::string>& database) const = 0;
};

/**
 * @brief Provider over a fixed server endpoint and default database
 */
class StaticConnectionConfigProvider : public IConnectionConfigProvider {
public:
    StaticConnectionConfigProvider(ConnectionParams base, std::string default_database);

    [[nodiscard]] Result<ConnectionParams> resolve(
        const std::optional<std::string>& database) const override;

    const std::string& default_database() const { return default_database_; }

private:
    ConnectionParams base_;
    std::string default_database_;
};

} // namespace pgquery
