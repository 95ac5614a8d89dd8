#pragma once

#include "db/iconnection_pool.hpp"
#include "db/iconnection_factory.hpp"
#include "db/managed_connection.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>

namespace pgquery {

/**
 * @brief Bounded connection pool for a single database
 *
 * Design:
 * - Bounded: active + idle never exceeds max_connections
 * - Lazy: physical connections are opened on demand, outside the lock,
 *   against a slot reserved under the lock
 * - FIFO: saturated callers queue and are served strictly in arrival order;
 *   a released connection goes straight to the head of the queue
 * - Unhealthy connections are discarded on release and their slot passed on;
 *   a session left inside a transaction is rolled back, or discarded if that fails
 * - Thread-safe: one mutex guards idle list, counters and waiter queue
 *
 * Always owned through std::shared_ptr: leased connections keep their pool
 * alive until they are released.
 */
class DatabasePool : public std::enable_shared_from_this<DatabasePool> {
public:
    DatabasePool(
        ConnectionParams params,
        const PoolConfig& config,
        std::shared_ptr<IConnectionFactory> factory);

    ~DatabasePool();

    DatabasePool(const DatabasePool&) = delete;
    DatabasePool& operator=(const DatabasePool&) = delete;

    /**
     * @brief Lease a connection, waiting in FIFO order when saturated
     * @return Managed connection or CONNECTION_ERROR (connect failure after
     *         retries, acquire timeout, pool closed)
     */
    [[nodiscard]] Result<ManagedConnection> acquire();

    /**
     * @brief Close idle connections, fail queued waiters, and make leased
     *        connections close on their release
     */
    void close();

    [[nodiscard]] bool is_closed() const;

    [[nodiscard]] PoolStats get_stats() const;

    const std::string& name() const { return params_.database; }

private:
    struct IdleEntry {
        std::unique_ptr<IDbConnection> conn;
        std::chrono::steady_clock::time_point last_used;
    };

    /**
     * @brief A queued acquire; satisfied by a handed-over connection or by a
     *        freed slot it may open a connection into
     */
    struct Waiter {
        std::condition_variable cv;
        std::unique_ptr<IDbConnection> handoff;
        bool slot_granted = false;
        bool cancelled = false;

        bool done() const { return handoff != nullptr || slot_granted || cancelled; }
    };

    /**
     * @brief Open a physical connection with bounded retries and backoff
     */
    Result<std::unique_ptr<IDbConnection>> open_connection();

    /**
     * @brief Replace an idle connection that went stale while pooled
     * @return true if the connection can be handed out as is
     */
    bool validate_idle(IDbConnection& conn, std::chrono::steady_clock::time_point last_used);

    /**
     * @brief Give a freed slot to the longest waiter (mutex_ must be held)
     * @return true if a waiter took the slot
     */
    bool grant_slot_locked();

    /**
     * @brief Return connection to pool (called by ManagedConnection::release)
     */
    void return_connection(std::unique_ptr<IDbConnection> conn, bool healthy);

    /**
     * @brief Roll back an open transaction before the connection is pooled again
     * @return true if the session is back to idle
     */
    bool reset_session(IDbConnection& conn);

    Result<ManagedConnection> closed_error(bool while_waiting) const;

    ManagedConnection wrap(std::unique_ptr<IDbConnection> conn);

    ConnectionParams params_;
    PoolConfig config_;
    std::shared_ptr<IConnectionFactory> factory_;

    mutable std::mutex mutex_;
    std::deque<IdleEntry> idle_;
    std::deque<std::shared_ptr<Waiter>> waiters_;
    size_t active_ = 0;
    bool closed_ = false;

    // Statistics (guarded by mutex_)
    uint64_t total_acquires_ = 0;
    uint64_t total_releases_ = 0;
    uint64_t failed_acquires_ = 0;
    uint64_t connections_opened_ = 0;
    uint64_t connections_discarded_ = 0;
};

} // namespace pgquery
