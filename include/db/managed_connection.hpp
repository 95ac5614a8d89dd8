#pragma once

#include "db/idb_connection.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace pgquery {

/**
 * @brief Leased handle to a pooled connection bound to one database
 *
 * Returns the connection to its sub-pool on release() or destruction,
 * whichever comes first; release() is idempotent. Move-only: the moved-from
 * handle counts as released.
 */
class ManagedConnection {
public:
    /**
     * @brief Callback handing the connection back to its pool
     *
     * `healthy == false` asks the pool to discard the connection.
     */
    using ReturnFunc = std::function<void(std::unique_ptr<IDbConnection>, bool healthy)>;

    ManagedConnection() = default;

    ManagedConnection(std::unique_ptr<IDbConnection> conn, std::string database, ReturnFunc return_fn);

    ~ManagedConnection();

    ManagedConnection(ManagedConnection&& other) noexcept;
    ManagedConnection& operator=(ManagedConnection&& other) noexcept;

    ManagedConnection(const ManagedConnection&) = delete;
    ManagedConnection& operator=(const ManagedConnection&) = delete;

    IDbConnection* get() const { return conn_.get(); }
    IDbConnection* operator->() const { return conn_.get(); }

    const std::string& database() const { return database_; }
    std::chrono::steady_clock::time_point acquired_at() const { return acquired_at_; }

    bool is_released() const { return released_; }
    bool is_healthy() const { return healthy_; }
    bool is_valid() const { return !released_ && conn_ != nullptr; }

    /**
     * @brief Flag the connection as broken; it is discarded on release
     */
    void mark_unhealthy() { healthy_ = false; }

    /**
     * @brief Hand the connection back to the pool (no-op after the first call)
     */
    void release();

private:
    std::unique_ptr<IDbConnection> conn_;
    std::string database_;
    ReturnFunc return_fn_;
    std::chrono::steady_clock::time_point acquired_at_{};
    bool released_ = true;
    bool healthy_ = true;
};

} // namespace pgquery
