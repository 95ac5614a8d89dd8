#include "db/connection_pool.hpp"
#include "core/utils.hpp"
#include <format>
#include <mutex>

namespace pgquery {

ConnectionPool::ConnectionPool(
    std::shared_ptr<IConnectionConfigProvider> provider,
    std::shared_ptr<IConnectionFactory> factory,
    PoolConfig config)
    : provider_(std::move(provider)),
      factory_(std::move(factory)),
      config_(std::move(config)) {}

ConnectionPool::~ConnectionPool() {
    close_all();
}

void ConnectionPool::set_max_connections(const std::string& database, size_t max_connections) {
    std::unique_lock lock(mutex_);
    max_connections_[database] = max_connections;
}

std::shared_ptr<DatabasePool> ConnectionPool::get_pool(const ConnectionParams& params) {
    // Fast path: shared lock (read-only)
    {
        std::shared_lock lock(mutex_);
        const auto it = pools_.find(params.database);
        if (it != pools_.end()) {
            return it->second;
        }
    }

    // Slow path: unique lock with double-checked locking
    std::unique_lock lock(mutex_);
    auto [it, inserted] = pools_.try_emplace(params.database, nullptr);
    if (!inserted) {
        return it->second;
    }

    PoolConfig pool_config = config_;
    const auto override_it = max_connections_.find(params.database);
    if (override_it != max_connections_.end()) {
        pool_config.max_connections = override_it->second;
    }

    it->second = std::make_shared<DatabasePool>(params, pool_config, factory_);
    return it->second;
}

Result<ManagedConnection> ConnectionPool::acquire(const std::optional<std::string>& database) {
    auto params = provider_->resolve(database);
    if (params.is_error()) {
        return Result<ManagedConnection>::error(params.error());
    }
    return get_pool(params.value())->acquire();
}

void ConnectionPool::release(ManagedConnection& conn) {
    conn.release();
}

void ConnectionPool::close_all() {
    std::unordered_map<std::string, std::shared_ptr<DatabasePool>> pools;
    {
        std::unique_lock lock(mutex_);
        pools.swap(pools_);
    }

    for (auto& [name, pool] : pools) {
        pool->close();
    }
    if (!pools.empty()) {
        utils::log::info(std::format("Connection pool drained ({} databases)", pools.size()));
    }
}

void ConnectionPool::close_pool(const std::string& database) {
    std::shared_ptr<DatabasePool> pool;
    {
        std::unique_lock lock(mutex_);
        const auto it = pools_.find(database);
        if (it == pools_.end()) {
            return;
        }
        pool = std::move(it->second);
        pools_.erase(it);
    }
    pool->close();
}

std::map<std::string, bool> ConnectionPool::health_check() {
    std::vector<std::shared_ptr<DatabasePool>> pools;
    {
        std::shared_lock lock(mutex_);
        pools.reserve(pools_.size());
        for (const auto& [name, pool] : pools_) {
            pools.push_back(pool);
        }
    }

    std::map<std::string, bool> results;
    for (const auto& pool : pools) {
        auto conn = pool->acquire();
        if (conn.is_error()) {
            utils::log::warn(std::format("Health check for database '{}' failed: {}",
                pool->name(), conn.error_message()));
            results[pool->name()] = false;
            continue;
        }

        auto& managed = conn.value();
        const bool healthy = managed->is_healthy(config_.health_check_query);
        if (!healthy) {
            managed.mark_unhealthy();
            utils::log::warn(std::format("Health check for database '{}' failed", pool->name()));
        }
        managed.release();
        results[pool->name()] = healthy;
    }
    return results;
}

std::optional<PoolStats> ConnectionPool::get_stats(const std::string& database) const {
    std::shared_lock lock(mutex_);
    const auto it = pools_.find(database);
    if (it == pools_.end()) {
        return std::nullopt;
    }
    return it->second->get_stats();
}

std::vector<PoolStats> ConnectionPool::get_all_stats() const {
    std::shared_lock lock(mutex_);
    std::vector<PoolStats> stats;
    stats.reserve(pools_.size());
    for (const auto& [name, pool] : pools_) {
        stats.push_back(pool->get_stats());
    }
    return stats;
}

} // namespace pgquery
