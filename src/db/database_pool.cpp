#include "db/database_pool.hpp"
#include "core/utils.hpp"
#include <algorithm>
#include <format>
#include <thread>

namespace pgquery {

DatabasePool::DatabasePool(
    ConnectionParams params,
    const PoolConfig& config,
    std::shared_ptr<IConnectionFactory> factory)
    : params_(std::move(params)),
      config_(config),
      factory_(std::move(factory)) {

    utils::log::info(std::format("Pool created for database '{}' (max={})",
        params_.database, config_.max_connections));
}

DatabasePool::~DatabasePool() {
    close();
}

Result<ManagedConnection> DatabasePool::acquire() {
    std::unique_ptr<IDbConnection> conn;
    std::chrono::steady_clock::time_point last_used{};
    bool from_idle = false;

    {
        std::unique_lock lock(mutex_);
        if (closed_) {
            ++failed_acquires_;
            return closed_error(false);
        }

        // Queued callers go first; a newcomer never overtakes them
        if (waiters_.empty() && !idle_.empty()) {
            conn = std::move(idle_.back().conn);
            last_used = idle_.back().last_used;
            idle_.pop_back();
            ++active_;
            from_idle = true;
        } else if (waiters_.empty() && active_ + idle_.size() < config_.max_connections) {
            ++active_;  // reserve a slot, open outside the lock
        } else {
            auto waiter = std::make_shared<Waiter>();
            waiters_.push_back(waiter);

            const auto ready = [&waiter] { return waiter->done(); };
            if (config_.acquire_timeout.count() > 0) {
                if (!waiter->cv.wait_for(lock, config_.acquire_timeout, ready)) {
                    std::erase(waiters_, waiter);
                    ++failed_acquires_;
                    return Result<ManagedConnection>::error(ErrorCategory::CONNECTION_ERROR,
                        std::format("Timed out after {}ms waiting for a connection to database '{}'",
                            config_.acquire_timeout.count(), params_.database));
                }
            } else {
                waiter->cv.wait(lock, ready);
            }

            if (waiter->cancelled) {
                ++failed_acquires_;
                return closed_error(true);
            }
            // Handoff and granted slot both arrive with active_ already counted
            conn = std::move(waiter->handoff);

            // Served before close() but woken after it
            if (closed_) {
                --active_;
                ++failed_acquires_;
                lock.unlock();
                if (conn) {
                    conn->close();
                }
                return closed_error(true);
            }
        }
    }

    if (conn && from_idle && !validate_idle(*conn, last_used)) {
        conn->close();
        conn.reset();
        std::lock_guard lock(mutex_);
        ++connections_discarded_;
    }

    if (!conn) {
        auto opened = open_connection();
        if (opened.is_error()) {
            std::lock_guard lock(mutex_);
            --active_;
            ++failed_acquires_;
            grant_slot_locked();
            return Result<ManagedConnection>::error(opened.error());
        }
        conn = opened.take();
    }

    {
        std::unique_lock lock(mutex_);
        if (closed_) {
            // close() ran while the connection was being opened or validated
            --active_;
            ++failed_acquires_;
            lock.unlock();
            conn->close();
            return closed_error(true);
        }
        ++total_acquires_;
    }
    return Result<ManagedConnection>::ok(wrap(std::move(conn)));
}

Result<ManagedConnection> DatabasePool::closed_error(bool while_waiting) const {
    return Result<ManagedConnection>::error(ErrorCategory::CONNECTION_ERROR, while_waiting
        ? std::format("Connection pool for database '{}' was closed while waiting", params_.database)
        : std::format("Connection pool for database '{}' is closed", params_.database));
}

Result<std::unique_ptr<IDbConnection>> DatabasePool::open_connection() {
    const int attempts = std::max(1, config_.connect_retries);
    std::string last_error;

    for (int attempt = 0; attempt < attempts; ++attempt) {
        auto result = factory_->create(params_);
        if (result.is_ok()) {
            std::lock_guard lock(mutex_);
            ++connections_opened_;
            utils::log::debug(std::format("Opened connection to database '{}' ({} total opened)",
                params_.database, connections_opened_));
            return result;
        }

        last_error = result.error_message();
        utils::log::warn(std::format("Connection attempt {}/{} to database '{}' failed: {}",
            attempt + 1, attempts, params_.database, last_error));

        if (attempt + 1 < attempts) {
            const std::chrono::milliseconds backoff = config_.retry_backoff * (1 << std::min(attempt, 20));
            const auto delay = std::min(backoff, config_.max_retry_backoff);
            if (delay.count() > 0) {
                std::this_thread::sleep_for(delay);
            }
        }
    }

    return Result<std::unique_ptr<IDbConnection>>::error(ErrorCategory::CONNECTION_ERROR,
        std::format("Failed to connect to database '{}' after {} attempts: {}",
            params_.database, attempts, last_error));
}

bool DatabasePool::validate_idle(
    IDbConnection& conn, std::chrono::steady_clock::time_point last_used) {

    if (!conn.is_connected()) {
        return false;
    }

    // Only health-check connections idle longer than idle_timeout
    const auto idle_duration = std::chrono::steady_clock::now() - last_used;
    if (idle_duration > config_.idle_timeout) {
        if (!conn.is_healthy(config_.health_check_query)) {
            utils::log::warn(std::format("Discarding stale idle connection to database '{}'",
                params_.database));
            return false;
        }
    }
    return true;
}

bool DatabasePool::grant_slot_locked() {
    if (waiters_.empty()) {
        return false;
    }
    auto waiter = std::move(waiters_.front());
    waiters_.pop_front();
    ++active_;
    waiter->slot_granted = true;
    waiter->cv.notify_one();
    return true;
}

bool DatabasePool::reset_session(IDbConnection& conn) {
    utils::log::warn(std::format("Connection to database '{}' released inside a transaction, rolling back",
        params_.database));
    try {
        const auto result = conn.execute("ROLLBACK");
        if (result.success && !conn.in_transaction()) {
            return true;
        }
        utils::log::warn(std::format("ROLLBACK on database '{}' failed: {}",
            params_.database, result.success ? "transaction still open" : result.error.message));
    } catch (const std::exception& e) {
        utils::log::warn(std::format("ROLLBACK on database '{}' failed: {}", params_.database, e.what()));
    }
    return false;
}

void DatabasePool::return_connection(std::unique_ptr<IDbConnection> conn, bool healthy) {
    std::unique_ptr<IDbConnection> to_close;

    // Never pool a session with an open or aborted transaction
    if (conn && healthy && conn->is_connected() && conn->in_transaction()) {
        healthy = reset_session(*conn);
    }

    {
        std::lock_guard lock(mutex_);
        ++total_releases_;

        if (!conn || closed_ || !healthy || !conn->is_connected()) {
            if (conn && !closed_) {
                ++connections_discarded_;
            }
            to_close = std::move(conn);
            --active_;
            grant_slot_locked();
        } else if (!waiters_.empty()) {
            // Direct handoff: the slot stays counted in active_
            auto waiter = std::move(waiters_.front());
            waiters_.pop_front();
            waiter->handoff = std::move(conn);
            waiter->cv.notify_one();
        } else {
            --active_;
            idle_.push_back(IdleEntry{std::move(conn), std::chrono::steady_clock::now()});
        }
    }

    if (to_close) {
        to_close->close();
    }
}

ManagedConnection DatabasePool::wrap(std::unique_ptr<IDbConnection> conn) {
    auto self = shared_from_this();
    auto return_fn = [self](std::unique_ptr<IDbConnection> c, bool healthy) {
        self->return_connection(std::move(c), healthy);
    };
    return ManagedConnection(std::move(conn), params_.database, std::move(return_fn));
}

void DatabasePool::close() {
    std::deque<IdleEntry> idle;
    size_t cancelled = 0;

    {
        std::lock_guard lock(mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
        idle.swap(idle_);
        for (auto& waiter : waiters_) {
            waiter->cancelled = true;
            waiter->cv.notify_one();
        }
        cancelled = waiters_.size();
        waiters_.clear();
    }

    for (auto& entry : idle) {
        if (entry.conn) {
            entry.conn->close();
        }
    }

    utils::log::info(std::format("Pool for database '{}' closed ({} idle connections closed, {} waiters cancelled)",
        params_.database, idle.size(), cancelled));
}

bool DatabasePool::is_closed() const {
    std::lock_guard lock(mutex_);
    return closed_;
}

PoolStats DatabasePool::get_stats() const {
    std::lock_guard lock(mutex_);

    PoolStats stats;
    stats.database = params_.database;
    stats.max_connections = config_.max_connections;
    stats.active_connections = active_;
    stats.idle_connections = idle_.size();
    stats.waiting = waiters_.size();
    stats.total_acquires = total_acquires_;
    stats.total_releases = total_releases_;
    stats.failed_acquires = failed_acquires_;
    stats.connections_opened = connections_opened_;
    stats.connections_discarded = connections_discarded_;
    return stats;
}

} // namespace pgquery
