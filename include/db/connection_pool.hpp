#pragma once

#include "db/connection_config_provider.hpp"
#include "db/database_pool.hpp"
#include "db/iconnection_factory.hpp"
#include "db/iconnection_pool.hpp"
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace pgquery {

/**
 * @brief Registry of per-database sub-pools
 *
 * Sub-pools are created on first demand (double-checked under a shared
 * mutex) and are fully independent: a connection never crosses from one
 * database's pool to another's.
 */
class ConnectionPool : public IConnectionPool {
public:
    ConnectionPool(
        std::shared_ptr<IConnectionConfigProvider> provider,
        std::shared_ptr<IConnectionFactory> factory,
        PoolConfig config = {});

    ~ConnectionPool() override;

    /**
     * @brief Override max_connections for one database (applies to sub-pools created afterwards)
     */
    void set_max_connections(const std::string& database, size_t max_connections);

    [[nodiscard]] Result<ManagedConnection> acquire(
        const std::optional<std::string>& database) override;

    void release(ManagedConnection& conn) override;

    void close_all() override;

    void close_pool(const std::string& database) override;

    [[nodiscard]] std::map<std::string, bool> health_check() override;

    [[nodiscard]] std::optional<PoolStats> get_stats(const std::string& database) const override;

    [[nodiscard]] std::vector<PoolStats> get_all_stats() const override;

    const PoolConfig& config() const { return config_; }

private:
    std::shared_ptr<DatabasePool> get_pool(const ConnectionParams& params);

    std::shared_ptr<IConnectionConfigProvider> provider_;
    std::shared_ptr<IConnectionFactory> factory_;
    PoolConfig config_;

    std::unordered_map<std::string, std::shared_ptr<DatabasePool>> pools_;
    std::unordered_map<std::string, size_t> max_connections_;    // per-database overrides
    mutable std::shared_mutex mutex_;
};

} // namespace pgquery
