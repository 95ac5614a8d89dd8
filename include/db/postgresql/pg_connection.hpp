#pragma once

#include "db/idb_connection.hpp"
#include "db/iconnection_factory.hpp"
#include <libpq-fe.h>
#include <string>

namespace pgquery {

/**
 * @brief PostgreSQL connection implementing IDbConnection
 *
 * Wraps PGconn* and provides database-agnostic interface.
 * All libpq calls are encapsulated here.
 */
class PgConnection : public IDbConnection {
public:
    /**
     * @brief Construct from existing PGconn* (takes ownership)
     */
    PgConnection(PGconn* conn, std::string database);

    ~PgConnection() override;

    PgConnection(const PgConnection&) = delete;
    PgConnection& operator=(const PgConnection&) = delete;

    DbResultSet execute(const std::string& sql, const std::vector<SqlParam>& params) override;
    bool is_healthy(const std::string& health_check_query) override;
    bool is_connected() const override;
    bool in_transaction() const override;
    const std::string& database() const override { return database_; }
    void close() override;

private:
    /**
     * @brief Process a SELECT result (PGRES_TUPLES_OK)
     */
    static DbResultSet process_tuples_result(PGresult* res);

    /**
     * @brief Process a command result (PGRES_COMMAND_OK)
     */
    static DbResultSet process_command_result(PGresult* res);

    /**
     * @brief Collect diagnostic fields of a failed result (res may be null)
     */
    DbError extract_error(PGresult* res) const;

    /**
     * @brief Take the session out of COPY mode without transferring data
     *
     * COPY OUT data is read and dropped, COPY IN is ended with an error,
     * then every pending result is consumed.
     * @return false if the connection could not be brought back to idle
     */
    bool abandon_copy(ExecStatusType status);

    PGconn* conn_;
    std::string database_;
};

/**
 * @brief PostgreSQL connection factory
 *
 * Creates PgConnection instances using PQconnectdb.
 */
class PgConnectionFactory : public IConnectionFactory {
public:
    Result<std::unique_ptr<IDbConnection>> create(const ConnectionParams& params) override;
};

} // namespace pgquery
