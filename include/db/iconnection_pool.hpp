#pragma once

#include "core/error.hpp"
#include "db/managed_connection.hpp"
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace pgquery {

/**
 * @brief Sub-pool configuration (applies to every target database)
 */
struct PoolConfig {
    size_t max_connections = 5;
    int connect_retries = 3;                              // attempts per physical connect
    std::chrono::milliseconds retry_backoff{500};         // doubled per attempt
    std::chrono::milliseconds max_retry_backoff{2000};
    std::chrono::milliseconds acquire_timeout{0};         // 0 = wait indefinitely
    std::chrono::seconds idle_timeout{60};                // health-check idle connections older than this
    std::string health_check_query{"SELECT 1"};
};

/**
 * @brief Per-database pool statistics
 */
struct PoolStats {
    std::string database;
    size_t max_connections = 0;
    size_t active_connections = 0;      // checked out or being opened
    size_t idle_connections = 0;
    size_t waiting = 0;                 // callers queued for a connection
    uint64_t total_acquires = 0;        // successful acquires
    uint64_t total_releases = 0;
    uint64_t failed_acquires = 0;
    uint64_t connections_opened = 0;
    uint64_t connections_discarded = 0; // unhealthy or stale
};

/**
 * @brief Abstract connection pool interface
 *
 * One logical sub-pool per target database; a connection opened for one
 * database is never handed out for another.
 */
class IConnectionPool {
public:
    virtual ~IConnectionPool() = default;

    /**
     * @brief Lease a connection for a database (blocks while the sub-pool is saturated)
     * @param database Target database; nullopt selects the provider default
     * @return Managed connection or CONNECTION_ERROR
     */
    [[nodiscard]] virtual Result<ManagedConnection> acquire(
        const std::optional<std::string>& database) = 0;

    /**
     * @brief Return a leased connection (idempotent)
     */
    virtual void release(ManagedConnection& conn) = 0;

    /**
     * @brief Close every sub-pool (teardown only)
     */
    virtual void close_all() = 0;

    /**
     * @brief Close one sub-pool; the next demand creates a fresh one
     */
    virtual void close_pool(const std::string& database) = 0;

    /**
     * @brief Run the health check query through every known sub-pool
     */
    [[nodiscard]] virtual std::map<std::string, bool> health_check() = 0;

    /**
     * @brief Statistics of one sub-pool (nullopt if it was never created)
     */
    [[nodiscard]] virtual std::optional<PoolStats> get_stats(const std::string& database) const = 0;

    /**
     * @brief Statistics of all live sub-pools
     */
    [[nodiscard]] virtual std::vector<PoolStats> get_all_stats() const = 0;
};

} // namespace pgquery
