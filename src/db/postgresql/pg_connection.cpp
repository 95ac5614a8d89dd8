#include "db/postgresql/pg_connection.hpp"
#include "core/utils.hpp"
#include <format>

namespace pgquery {

namespace {

std::optional<std::string> error_field(const PGresult* res, int field) {
    if (!res) return std::nullopt;
    const char* value = PQresultErrorField(res, field);
    if (!value || !*value) return std::nullopt;
    return std::string(value);
}

bool is_copy_status(ExecStatusType status) {
    return status == PGRES_COPY_IN || status == PGRES_COPY_OUT || status == PGRES_COPY_BOTH;
}

} // anonymous namespace

// ============================================================================
// PgConnection
// ============================================================================

PgConnection::PgConnection(PGconn* conn, std::string database)
    : conn_(conn), database_(std::move(database)) {}

PgConnection::~PgConnection() {
    close();
}

DbResultSet PgConnection::execute(const std::string& sql, const std::vector<SqlParam>& params) {
    if (!conn_) {
        DbError err;
        err.message = "Connection is closed";
        err.connection_lost = true;
        return DbResultSet::failure(std::move(err));
    }

    PGresult* res = nullptr;

    if (params.empty()) {
        // Simple protocol: accepts multi-statement scripts, returns the last result
        res = PQexec(conn_, sql.c_str());
    } else {
        std::vector<std::optional<std::string>> texts;
        texts.reserve(params.size());
        for (const auto& p : params) {
            texts.push_back(param_to_text(p));
        }

        std::vector<const char*> values;
        values.reserve(texts.size());
        for (const auto& t : texts) {
            values.push_back(t ? t->c_str() : nullptr);
        }

        res = PQexecParams(
            conn_,
            sql.c_str(),
            static_cast<int>(values.size()),
            nullptr,        // let the server infer parameter types
            values.data(),
            nullptr,        // text format
            nullptr,        // text format
            0);             // text results
    }

    if (!res) {
        return DbResultSet::failure(extract_error(nullptr));
    }

    const ExecStatusType status = PQresultStatus(res);

    if (status == PGRES_TUPLES_OK) {
        auto result = process_tuples_result(res);
        PQclear(res);
        return result;
    }

    if (status == PGRES_COMMAND_OK || status == PGRES_EMPTY_QUERY) {
        auto result = process_command_result(res);
        PQclear(res);
        return result;
    }

    if (is_copy_status(status)) {
        PQclear(res);
        const bool drained = abandon_copy(status);
        DbError err;
        err.message = "COPY statements are not supported";
        err.connection_lost = !drained || !is_connected();
        return DbResultSet::failure(std::move(err));
    }

    // Error case
    auto err = extract_error(res);
    PQclear(res);
    return DbResultSet::failure(std::move(err));
}

bool PgConnection::is_healthy(const std::string& health_check_query) {
    if (!is_connected()) {
        return false;
    }

    PGresult* res = PQexec(conn_, health_check_query.c_str());
    if (!res) {
        return false;
    }

    const ExecStatusType status = PQresultStatus(res);
    PQclear(res);

    return (status == PGRES_TUPLES_OK || status == PGRES_COMMAND_OK);
}

bool PgConnection::is_connected() const {
    return conn_ != nullptr && PQstatus(conn_) == CONNECTION_OK;
}

bool PgConnection::in_transaction() const {
    if (!conn_) {
        return false;
    }
    const PGTransactionStatusType status = PQtransactionStatus(conn_);
    return status == PQTRANS_INTRANS || status == PQTRANS_INERROR || status == PQTRANS_ACTIVE;
}

bool PgConnection::abandon_copy(ExecStatusType status) {
    // A script may hold several COPYs; leave each one until the command queue is empty
    for (;;) {
        if (status == PGRES_COPY_OUT) {
            char* buffer = nullptr;
            int n = 0;
            while ((n = PQgetCopyData(conn_, &buffer, 0)) > 0) {
                PQfreemem(buffer);
                buffer = nullptr;
            }
            if (n == -2) {
                utils::log::warn(std::format("Draining COPY output on database '{}' failed: {}",
                    database_, PQerrorMessage(conn_)));
                return false;
            }
        } else if (status == PGRES_COPY_IN || status == PGRES_COPY_BOTH) {
            if (PQputCopyEnd(conn_, "COPY is not supported by this client") < 0) {
                utils::log::warn(std::format("Ending COPY on database '{}' failed: {}",
                    database_, PQerrorMessage(conn_)));
                return false;
            }
        }

        PGresult* next = PQgetResult(conn_);
        if (!next) {
            return true;
        }
        status = PQresultStatus(next);
        PQclear(next);
    }
}

void PgConnection::close() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

DbResultSet PgConnection::process_tuples_result(PGresult* res) {
    DbResultSet result;
    result.success = true;
    result.has_rows = true;

    const int ncols = PQnfields(res);
    result.fields.reserve(static_cast<size_t>(ncols));
    for (int i = 0; i < ncols; i++) {
        result.fields.push_back({PQfname(res, i), static_cast<uint32_t>(PQftype(res, i))});
    }

    const int nrows = PQntuples(res);
    result.rows.reserve(static_cast<size_t>(nrows));

    for (int i = 0; i < nrows; i++) {
        std::vector<CellValue> row;
        row.reserve(static_cast<size_t>(ncols));
        for (int j = 0; j < ncols; j++) {
            if (PQgetisnull(res, i, j)) {
                row.emplace_back(std::nullopt);
            } else {
                row.emplace_back(std::string(PQgetvalue(res, i, j),
                                             static_cast<size_t>(PQgetlength(res, i, j))));
            }
        }
        result.rows.push_back(std::move(row));
    }

    result.affected_rows = utils::try_parse_int<uint64_t>(PQcmdTuples(res));
    return result;
}

DbResultSet PgConnection::process_command_result(PGresult* res) {
    DbResultSet result;
    result.success = true;
    result.has_rows = false;
    result.affected_rows = utils::try_parse_int<uint64_t>(PQcmdTuples(res));
    return result;
}

DbError PgConnection::extract_error(PGresult* res) const {
    DbError err;

    if (auto primary = error_field(res, PG_DIAG_MESSAGE_PRIMARY)) {
        err.message = std::move(*primary);
    } else if (conn_) {
        err.message = utils::trim(PQerrorMessage(conn_));
    }

    err.detail = error_field(res, PG_DIAG_MESSAGE_DETAIL);
    err.hint = error_field(res, PG_DIAG_MESSAGE_HINT);
    err.where = error_field(res, PG_DIAG_CONTEXT);
    err.code = error_field(res, PG_DIAG_SQLSTATE);
    if (res) {
        err.line = utils::try_parse_int<int>(PQresultErrorField(res, PG_DIAG_SOURCE_LINE));
        err.position = utils::try_parse_int<int>(PQresultErrorField(res, PG_DIAG_STATEMENT_POSITION));
    }
    err.connection_lost = !is_connected();
    return err;
}

// ============================================================================
// PgConnectionFactory
// ============================================================================

Result<std::unique_ptr<IDbConnection>> PgConnectionFactory::create(
    const ConnectionParams& params) {

    PGconn* conn = PQconnectdb(params.to_conninfo().c_str());

    if (!conn) {
        return Result<std::unique_ptr<IDbConnection>>::error(
            ErrorCategory::CONNECTION_ERROR, "Failed to allocate PGconn");
    }

    if (PQstatus(conn) != CONNECTION_OK) {
        std::string message = utils::trim(PQerrorMessage(conn));
        PQfinish(conn);
        return Result<std::unique_ptr<IDbConnection>>::error(
            ErrorCategory::CONNECTION_ERROR,
            std::format("Unable to connect to database '{}': {}", params.database, message));
    }

    return Result<std::unique_ptr<IDbConnection>>::ok(
        std::make_unique<PgConnection>(conn, params.database));
}

} // namespace pgquery
