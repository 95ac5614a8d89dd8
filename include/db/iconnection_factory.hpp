#pragma once

#include "core/error.hpp"
#include "db/connection_params.hpp"
#include "db/idb_connection.hpp"
#include <memory>

namespace pgquery {

/**
 * @brief Abstract factory for creating database connections
 *
 * One attempt per call; retry policy belongs to the pool.
 */
class IConnectionFactory {
public:
    virtual ~IConnectionFactory() = default;

    /**
     * @brief Open a new physical connection
     * @return Connection, or CONNECTION_ERROR carrying the driver message
     */
    [[nodiscard]] virtual Result<std::unique_ptr<IDbConnection>> create(
        const ConnectionParams& params) = 0;
};

} // namespace pgquery
