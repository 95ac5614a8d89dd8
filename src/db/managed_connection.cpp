#include "db/managed_connection.hpp"

namespace pgquery {

ManagedConnection::ManagedConnection(
    std::unique_ptr<IDbConnection> conn, std::string database, ReturnFunc return_fn)
    : conn_(std::move(conn)),
      database_(std::move(database)),
      return_fn_(std::move(return_fn)),
      acquired_at_(std::chrono::steady_clock::now()),
      released_(false) {}

ManagedConnection::~ManagedConnection() {
    release();
}

ManagedConnection::ManagedConnection(ManagedConnection&& other) noexcept
    : conn_(std::move(other.conn_)),
      database_(std::move(other.database_)),
      return_fn_(std::move(other.return_fn_)),
      acquired_at_(other.acquired_at_),
      released_(other.released_),
      healthy_(other.healthy_) {
    other.released_ = true;
}

ManagedConnection& ManagedConnection::operator=(ManagedConnection&& other) noexcept {
    if (this != &other) {
        // Return current connection before taking new one
        release();
        conn_ = std::move(other.conn_);
        database_ = std::move(other.database_);
        return_fn_ = std::move(other.return_fn_);
        acquired_at_ = other.acquired_at_;
        released_ = other.released_;
        healthy_ = other.healthy_;
        other.released_ = true;
    }
    return *this;
}

void ManagedConnection::release() {
    if (released_) {
        return;
    }
    released_ = true;

    if (return_fn_) {
        return_fn_(std::move(conn_), healthy_);
    } else if (conn_) {
        conn_->close();
        conn_.reset();
    }
}

} // namespace pgquery
