#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "analyzer/sql_validator.hpp"
#include "db/connection_config_provider.hpp"
#include "db/connection_pool.hpp"
#include "executor/query_executor.hpp"
#include "mocks/mock_db_connection.hpp"

#include <atomic>
#include <chrono>
#include <random>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace pgquery;
using namespace pgquery::testing;
using namespace std::chrono_literals;

namespace {

constexpr const char* kIndexPlan = R"([{
    "Plan": {
        "Node Type": "Index Scan",
        "Relation Name": "users",
        "Index Name": "users_pkey"
    },
    "Planning Time": 0.123
}])";

bool starts_with(const std::string& s, std::string_view prefix) {
    return s.rfind(prefix, 0) == 0;
}

struct Fixture {
    std::shared_ptr<MockFactory> factory = std::make_shared<MockFactory>();
    std::shared_ptr<ConnectionPool> pool;

    explicit Fixture(size_t max_connections = 2) {
        PoolConfig cfg;
        cfg.max_connections = max_connections;
        cfg.retry_backoff = 0ms;
        cfg.max_retry_backoff = 0ms;
        auto provider = std::make_shared<StaticConnectionConfigProvider>(ConnectionParams{}, "app");
        pool = std::make_shared<ConnectionPool>(provider, factory, cfg);
    }

    PoolStats stats() const {
        const auto s = pool->get_stats("app");
        return s ? *s : PoolStats{};
    }
};

DbResultSet users_row() {
    return make_rows({{"id", 23}, {"name", 25}}, {{"7", "alice"}});
}

} // namespace

// ============================================================================
// Input validation
// ============================================================================

TEST_CASE("QueryExecutor: empty SQL fails before touching the pool", "[executor]") {
    Fixture fx;
    auto counting = std::make_shared<CountingPool>(fx.pool);
    QueryExecutor executor(counting);

    for (const std::string sql : {"", "   ", " \n\t "}) {
        auto result = executor.execute_query(sql);
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::VALIDATION_ERROR);
        CHECK(result.error_message() == SqlValidator::kEmptyMessage);
    }

    auto explained = executor.explain_query("  ");
    CHECK(explained.is_error());
    CHECK(explained.error_category() == ErrorCategory::VALIDATION_ERROR);

    CHECK(counting->acquire_calls() == 0);
    CHECK(fx.factory->created() == 0);
}

// ============================================================================
// Execution and statistics
// ============================================================================

TEST_CASE("QueryExecutor: successful SELECT with plan statistics", "[executor]") {
    Fixture fx;
    fx.factory->handler = [](MockConnection&, const std::string& sql, const std::vector<SqlParam>&) {
        if (starts_with(sql, QueryExecutor::kStatsExplainPrefix)) {
            return make_explain(kIndexPlan);
        }
        return users_row();
    };
    QueryExecutor executor(fx.pool);

    const std::string sql = "SELECT id, name FROM users WHERE id = $1";
    auto result = executor.execute_query(sql, {SqlParam{int64_t{7}}});
    REQUIRE(result.is_ok());

    const auto& qr = result.value();
    CHECK(qr.columns == std::vector<std::string>{"id", "name"});
    REQUIRE(qr.row_count == 1);
    CHECK(qr.rows.size() == 1);
    CHECK(qr.rows[0].at("name") == "alice");

    REQUIRE(qr.performance_stats.has_value());
    const auto& stats = *qr.performance_stats;
    CHECK(stats.rows_returned == 1);
    CHECK(stats.query_complexity == QueryComplexity::SIMPLE);
    CHECK(stats.indexes_used.count("users_pkey") == 1);
    CHECK(stats.tables_scan_status.at("users") == ScanType::INDEX_SCAN);
    REQUIRE(stats.query_planning_time_ms.has_value());
    CHECK_THAT(*stats.query_planning_time_ms, Catch::Matchers::WithinAbs(0.123, 1e-9));
    CHECK(stats.query_execution_time.has_value());
    CHECK(stats.execution_time >= stats.connection_time);

    // The side EXPLAIN runs on the same connection with the same parameters
    auto* conn = fx.factory->connection(0);
    REQUIRE(conn != nullptr);
    const auto statements = conn->statements();
    REQUIRE(statements.size() == 2);
    CHECK(statements[0] == sql);
    CHECK(statements[1] == QueryExecutor::kStatsExplainPrefix + sql);
    const auto params = conn->last_params();
    REQUIRE(params.size() == 1);
    CHECK(std::get<int64_t>(params[0]) == 7);

    CHECK(fx.factory->created() == 1);
    CHECK(fx.stats().active_connections == 0);
}

TEST_CASE("QueryExecutor: statistics phase can be turned off", "[executor]") {
    Fixture fx;
    fx.factory->handler = [](MockConnection&, const std::string&, const std::vector<SqlParam>&) {
        return users_row();
    };

    SECTION("per request") {
        QueryExecutor executor(fx.pool);
        auto result = executor.execute_query(QueryRequest{
            .sql = "SELECT id, name FROM users",
            .params = {},
            .database = std::nullopt,
            .collect_stats = false,
        });
        REQUIRE(result.is_ok());
        REQUIRE(result.value().performance_stats.has_value());
        CHECK_FALSE(result.value().performance_stats->query_complexity.has_value());
        CHECK(fx.factory->connection(0)->statements().size() == 1);
    }

    SECTION("by configuration") {
        QueryExecutor executor(fx.pool, QueryExecutor::Config{.collect_performance_stats = false});
        auto result = executor.execute_query("SELECT id, name FROM users");
        REQUIRE(result.is_ok());
        CHECK_FALSE(result.value().performance_stats->query_complexity.has_value());
        CHECK(fx.factory->connection(0)->statements().size() == 1);
    }
}

TEST_CASE("QueryExecutor: plan analysis failures never fail the query", "[executor]") {
    Fixture fx;
    QueryExecutor executor(fx.pool);

    SECTION("EXPLAIN is rejected by the server") {
        fx.factory->handler = [](MockConnection&, const std::string& sql, const std::vector<SqlParam>&) {
            if (starts_with(sql, "EXPLAIN")) {
                return make_error("EXPLAIN not allowed");
            }
            return users_row();
        };
    }

    SECTION("EXPLAIN output is not a plan") {
        fx.factory->handler = [](MockConnection&, const std::string& sql, const std::vector<SqlParam>&) {
            if (starts_with(sql, "EXPLAIN")) {
                return make_explain("this is not json");
            }
            return users_row();
        };
    }

    SECTION("EXPLAIN throws") {
        fx.factory->handler = [](MockConnection&, const std::string& sql, const std::vector<SqlParam>&) {
            if (starts_with(sql, "EXPLAIN")) {
                throw std::runtime_error("driver exploded");
            }
            return users_row();
        };
    }

    auto result = executor.execute_query("SELECT id, name FROM users");
    REQUIRE(result.is_ok());
    CHECK(result.value().row_count == 1);
    REQUIRE(result.value().performance_stats.has_value());
    CHECK_FALSE(result.value().performance_stats->query_complexity.has_value());
    CHECK(result.value().performance_stats->indexes_used.empty());
    CHECK(fx.stats().active_connections == 0);
}

TEST_CASE("QueryExecutor: DML reports affected rows", "[executor]") {
    Fixture fx;
    fx.factory->handler = [](MockConnection&, const std::string& sql, const std::vector<SqlParam>&) {
        if (starts_with(sql, "EXPLAIN")) {
            return make_explain(R"([{"Plan": {"Node Type": "ModifyTable", "Plans": [
                {"Node Type": "Seq Scan", "Relation Name": "accounts"}]}}])");
        }
        return make_command(3);
    };
    QueryExecutor executor(fx.pool);

    auto result = executor.execute_query("UPDATE accounts SET active = false");
    REQUIRE(result.is_ok());
    CHECK(result.value().columns.empty());
    CHECK(result.value().row_count == 0);
    CHECK(result.value().affected_rows == 3u);
    CHECK(result.value().performance_stats->rows_affected == 3u);
    CHECK(result.value().performance_stats->tables_scan_status.at("accounts") == ScanType::SEQ_SCAN);
}

TEST_CASE("QueryExecutor: multi-statement script is sent exactly once", "[executor][statements]") {
    Fixture fx;
    fx.factory->handler = [](MockConnection&, const std::string& sql, const std::vector<SqlParam>&) {
        if (starts_with(sql, "EXPLAIN")) {
            return make_explain(kIndexPlan);
        }
        return make_command(1);
    };
    QueryExecutor executor(fx.pool);

    const std::string script = "SELECT 1; INSERT INTO audit VALUES (1)";
    auto result = executor.execute_query(script);
    REQUIRE(result.is_ok());
    CHECK(result.value().affected_rows == 1u);
    // Timing is still reported, plan fields are not
    REQUIRE(result.value().performance_stats.has_value());
    CHECK_FALSE(result.value().performance_stats->query_complexity.has_value());

    auto* conn = fx.factory->connection(0);
    REQUIRE(conn != nullptr);
    CHECK(conn->statements() == std::vector<std::string>{script});
}

TEST_CASE("QueryExecutor: transaction control is not explained and never leaks", "[executor][statements]") {
    Fixture fx(1);
    fx.factory->handler = [](MockConnection& conn, const std::string& sql, const std::vector<SqlParam>&) {
        if (sql == "BEGIN") {
            conn.in_transaction_ = true;
        }
        return make_command(0);
    };
    QueryExecutor executor(fx.pool);

    auto begun = executor.execute_query("BEGIN");
    REQUIRE(begun.is_ok());

    auto* conn = fx.factory->connection(0);
    REQUIRE(conn != nullptr);
    // No EXPLAIN inside the open block; the pool rolls it back on release
    CHECK(conn->statements() == std::vector<std::string>{"BEGIN", "ROLLBACK"});
    CHECK_FALSE(conn->in_transaction());

    auto next = executor.execute_query("SELECT 1");
    REQUIRE(next.is_ok());
    CHECK(fx.factory->created() == 1);
    CHECK(fx.stats().connections_discarded == 0);
    CHECK(fx.stats().active_connections == 0);
}

TEST_CASE("QueryExecutor: COPY is refused without a side EXPLAIN", "[executor][statements]") {
    Fixture fx(1);
    fx.factory->handler = [](MockConnection&, const std::string& sql, const std::vector<SqlParam>&) {
        if (starts_with(sql, "COPY")) {
            return make_error("COPY statements are not supported");
        }
        return make_command(0);
    };
    QueryExecutor executor(fx.pool);

    auto result = executor.execute_query("COPY users TO STDOUT");
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::QUERY_ERROR);
    CHECK(result.error_message() == "COPY statements are not supported");

    auto* conn = fx.factory->connection(0);
    REQUIRE(conn != nullptr);
    CHECK(conn->statements() == std::vector<std::string>{"COPY users TO STDOUT"});

    // The session survives and serves the next caller
    auto next = executor.execute_query("SELECT 1");
    REQUIRE(next.is_ok());
    CHECK(fx.factory->created() == 1);
}

TEST_CASE("QueryExecutor: duplicate column names collapse", "[executor]") {
    Fixture fx;
    fx.factory->handler = [](MockConnection&, const std::string&, const std::vector<SqlParam>&) {
        return make_rows({{"id", 23}, {"label", 25}, {"id", 23}}, {{"1", "a", "2"}});
    };
    QueryExecutor executor(fx.pool, QueryExecutor::Config{.collect_performance_stats = false});

    auto result = executor.execute_query("SELECT a.id, a.label, b.id FROM a JOIN b ON true");
    REQUIRE(result.is_ok());
    CHECK(result.value().columns == std::vector<std::string>{"id", "label"});
    CHECK(result.value().rows[0].size() == 2);
    CHECK(result.value().rows[0].at("id") == "2");
}

// ============================================================================
// Errors
// ============================================================================

TEST_CASE("QueryExecutor: server error is normalized", "[executor][errors]") {
    Fixture fx;
    const std::string sql = "SELECT id,\n       name\nFROM userz WHERE id = 1";
    const int position = static_cast<int>(sql.find("userz")) + 1;

    fx.factory->handler = [position](MockConnection&, const std::string&, const std::vector<SqlParam>&) {
        DbError err;
        err.message = "relation \"userz\" does not exist";
        err.code = "42P01";
        err.line = 5000;
        err.position = position;
        err.hint = "Check the table name.";
        return DbResultSet::failure(err);
    };
    QueryExecutor executor(fx.pool);

    auto result = executor.execute_query(sql);
    REQUIRE(result.is_error());
    const auto& err = result.error();
    CHECK(err.category == ErrorCategory::QUERY_ERROR);
    CHECK(err.message == "relation \"userz\" does not exist");
    CHECK(err.code == "42P01");
    CHECK(err.line == 3);
    CHECK(err.position == position);
    CHECK(err.hint == "Check the table name.");

    // Connection survives a plain query error and goes back to the idle list
    const auto stats = fx.stats();
    CHECK(stats.active_connections == 0);
    CHECK(stats.idle_connections == 1);
    CHECK(stats.connections_discarded == 0);
    CHECK(fx.factory->connection(0)->statements().size() == 1);
}

TEST_CASE("QueryExecutor: lost connection is discarded", "[executor][errors]") {
    Fixture fx;
    std::atomic<bool> lose{true};
    fx.factory->handler = [&lose](MockConnection&, const std::string&, const std::vector<SqlParam>&) {
        if (lose.exchange(false)) {
            return make_error("server closed the connection unexpectedly", true);
        }
        return users_row();
    };
    QueryExecutor executor(fx.pool, QueryExecutor::Config{.collect_performance_stats = false});

    auto failed = executor.execute_query("SELECT id, name FROM users");
    REQUIRE(failed.is_error());
    CHECK(failed.error_category() == ErrorCategory::QUERY_ERROR);
    CHECK(fx.stats().connections_discarded == 1);
    CHECK(fx.factory->closed() == 1);

    auto ok = executor.execute_query("SELECT id, name FROM users");
    REQUIRE(ok.is_ok());
    CHECK(fx.factory->created() == 2);
}

TEST_CASE("QueryExecutor: driver exception becomes an internal error", "[executor][errors]") {
    Fixture fx;
    fx.factory->handler = [](MockConnection&, const std::string&, const std::vector<SqlParam>&) -> DbResultSet {
        throw std::runtime_error("boom");
    };
    QueryExecutor executor(fx.pool);

    auto result = executor.execute_query("SELECT 1");
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::INTERNAL_ERROR);
    CHECK(result.error_message().find("boom") != std::string::npos);
    CHECK(fx.stats().active_connections == 0);
    CHECK(fx.stats().connections_discarded == 1);
}

TEST_CASE("QueryExecutor: connect failure is a connection error", "[executor][errors]") {
    Fixture fx;
    fx.factory->set_always_fail(true);
    QueryExecutor executor(fx.pool);

    auto result = executor.execute_query("SELECT 1");
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::CONNECTION_ERROR);
    CHECK(result.error_message().find("'app'") != std::string::npos);
    CHECK(fx.stats().active_connections == 0);
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_CASE("QueryExecutor: saturated pool makes callers wait", "[executor][concurrency]") {
    Fixture fx(1);
    fx.factory->handler = [](MockConnection&, const std::string& sql, const std::vector<SqlParam>&) {
        if (sql == "SELECT slow") {
            std::this_thread::sleep_for(150ms);
        }
        return make_rows({{"x", 23}}, {{"1"}});
    };
    QueryExecutor executor(fx.pool, QueryExecutor::Config{.collect_performance_stats = false});

    std::atomic<bool> first_ok{false};
    std::thread first([&] {
        first_ok = executor.execute_query("SELECT slow").is_ok();
    });

    // The slow query holds the only connection; wait until it is leased
    const auto deadline = std::chrono::steady_clock::now() + 2s;
    while (fx.stats().active_connections == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(1ms);
    }
    REQUIRE(fx.stats().active_connections == 1);

    auto second = executor.execute_query("SELECT fast");
    first.join();

    CHECK(first_ok.load());
    REQUIRE(second.is_ok());
    CHECK(second.value().performance_stats->connection_time >= 50ms);
    CHECK(fx.factory->created() == 1);
}

TEST_CASE("QueryExecutor: no connection leaks under mixed outcomes", "[executor][concurrency]") {
    Fixture fx(3);
    fx.factory->handler = [](MockConnection&, const std::string& sql, const std::vector<SqlParam>&) {
        if (starts_with(sql, "EXPLAIN")) {
            return make_explain(kIndexPlan);
        }
        if (sql == "SELECT fail") {
            return make_error("syntax error at or near \"fail\"");
        }
        if (sql == "SELECT lost") {
            return make_error("terminating connection", true);
        }
        if (sql == "SELECT throw") {
            throw std::runtime_error("driver failure");
        }
        return users_row();
    };
    QueryExecutor executor(fx.pool);

    constexpr int kThreads = 8;
    constexpr int kIterations = 250;
    std::atomic<int> ok{0};
    std::atomic<int> failed{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            std::mt19937 rng(static_cast<unsigned>(t) * 7919u + 1u);
            std::uniform_int_distribution<int> pick(0, 3);
            const char* statements[] = {"SELECT ok", "SELECT fail", "SELECT lost", "SELECT throw"};
            for (int i = 0; i < kIterations; ++i) {
                if (executor.execute_query(statements[pick(rng)]).is_ok()) {
                    ++ok;
                } else {
                    ++failed;
                }
            }
        });
    }
    for (auto& th : threads) th.join();

    CHECK(ok.load() + failed.load() == kThreads * kIterations);

    const auto stats = fx.stats();
    CHECK(stats.active_connections == 0);
    CHECK(stats.total_acquires == stats.total_releases);
    CHECK(stats.idle_connections <= 3);
    CHECK(stats.waiting == 0);
}

// ============================================================================
// Explain, preview, introspection
// ============================================================================

TEST_CASE("QueryExecutor: explain_query runs ANALYZE without a second EXPLAIN", "[executor]") {
    Fixture fx;
    fx.factory->handler = [](MockConnection&, const std::string&, const std::vector<SqlParam>&) {
        return make_explain(kIndexPlan);
    };
    QueryExecutor executor(fx.pool);

    auto result = executor.explain_query("  SELECT * FROM users WHERE id = 1  ");
    REQUIRE(result.is_ok());
    CHECK(result.value().columns == std::vector<std::string>{"QUERY PLAN"});
    CHECK(result.value().row_count == 1);

    const auto statements = fx.factory->connection(0)->statements();
    REQUIRE(statements.size() == 1);
    CHECK(statements[0] == std::string(QueryExecutor::kExplainPrefix) + "SELECT * FROM users WHERE id = 1");
}

TEST_CASE("QueryExecutor: table preview quotes identifiers", "[executor]") {
    Fixture fx;
    auto counting = std::make_shared<CountingPool>(fx.pool);
    QueryExecutor executor(counting, QueryExecutor::Config{.collect_performance_stats = false});

    auto result = executor.get_table_preview("public", "odd\"name", 5);
    REQUIRE(result.is_ok());
    const auto statements = fx.factory->connection(0)->statements();
    REQUIRE(statements.size() == 1);
    CHECK(statements[0] == R"(SELECT * FROM "public"."odd""name" LIMIT 5)");

    auto negative = executor.get_table_preview("public", "users", -1);
    CHECK(negative.error_category() == ErrorCategory::VALIDATION_ERROR);
    auto unnamed = executor.get_table_preview("", "users");
    CHECK(unnamed.error_category() == ErrorCategory::VALIDATION_ERROR);
    CHECK(counting->acquire_calls() == 1);
}

TEST_CASE("QueryExecutor: table info reads three catalogs on one connection", "[executor]") {
    Fixture fx;
    fx.factory->handler = [](MockConnection&, const std::string& sql, const std::vector<SqlParam>&) {
        if (sql.find("information_schema.columns") != std::string::npos) {
            return make_rows({{"column_name", 19}, {"data_type", 25}},
                             {{"id", "integer"}, {"email", "text"}});
        }
        if (sql.find("pg_indexes") != std::string::npos) {
            return make_rows({{"name", 19}, {"definition", 25}},
                             {{"users_pkey", "CREATE UNIQUE INDEX users_pkey ON public.users USING btree (id)"}});
        }
        return make_rows({{"constraint_name", 19}, {"constraint_type", 25}},
                         {{"users_pkey", "PRIMARY KEY"}});
    };
    QueryExecutor executor(fx.pool);

    auto info = executor.get_table_info("public", "users");
    REQUIRE(info.is_ok());
    CHECK(info.value().columns.row_count == 2);
    CHECK(info.value().indexes.rows[0].at("name") == "users_pkey");
    CHECK(info.value().constraints.rows[0].at("constraint_type") == "PRIMARY KEY");

    CHECK(fx.factory->created() == 1);
    auto* conn = fx.factory->connection(0);
    CHECK(conn->statements().size() == 3);
    const auto params = conn->last_params();
    REQUIRE(params.size() == 2);
    CHECK(std::get<std::string>(params[0]) == "public");
    CHECK(std::get<std::string>(params[1]) == "users");
    CHECK(fx.stats().active_connections == 0);
}

TEST_CASE("QueryExecutor: table info stops at the first failing catalog query", "[executor]") {
    Fixture fx;
    fx.factory->handler = [](MockConnection&, const std::string& sql, const std::vector<SqlParam>&) {
        if (sql.find("pg_indexes") != std::string::npos) {
            return make_error("permission denied for view pg_indexes");
        }
        return make_rows({{"column_name", 19}}, {{"id"}});
    };
    QueryExecutor executor(fx.pool);

    auto info = executor.get_table_info("public", "users");
    REQUIRE(info.is_error());
    CHECK(info.error_category() == ErrorCategory::QUERY_ERROR);
    CHECK(fx.factory->connection(0)->statements().size() == 2);
    CHECK(fx.stats().active_connections == 0);
}

TEST_CASE("QueryExecutor: test_connection", "[executor]") {
    Fixture fx;

    SECTION("answers 1") {
        fx.factory->handler = [](MockConnection&, const std::string&, const std::vector<SqlParam>&) {
            return make_rows({{"test", 23}}, {{"1"}});
        };
        QueryExecutor executor(fx.pool);
        CHECK(executor.test_connection());
        CHECK(fx.factory->connection(0)->statements() == std::vector<std::string>{"SELECT 1 AS test"});
    }

    SECTION("wrong answer") {
        fx.factory->handler = [](MockConnection&, const std::string&, const std::vector<SqlParam>&) {
            return make_rows({{"test", 23}}, {{"2"}});
        };
        QueryExecutor executor(fx.pool);
        CHECK_FALSE(executor.test_connection());
    }

    SECTION("unreachable") {
        fx.factory->set_always_fail(true);
        QueryExecutor executor(fx.pool);
        CHECK_FALSE(executor.test_connection("other"));
    }
}

TEST_CASE("QueryExecutor: health_check and cleanup", "[executor]") {
    Fixture fx;
    QueryExecutor executor(fx.pool, QueryExecutor::Config{.collect_performance_stats = false});

    REQUIRE(executor.execute_query("SELECT 1").is_ok());
    const auto health = executor.health_check();
    REQUIRE(health.size() == 1);
    CHECK(health.at("app"));

    executor.cleanup();
    CHECK(fx.factory->closed() == 1);
    CHECK(fx.pool->get_all_stats().empty());

    executor.cleanup();
    CHECK(fx.factory->closed() == 1);
}

// ============================================================================
// Byte estimate
// ============================================================================

TEST_CASE("QueryExecutor: estimate_bytes_received", "[executor]") {
    const auto rs = make_rows(
        {{"id", 23}, {"flag", 16}, {"name", 25}},
        {{"1", "t", "abc"}, {"2", std::nullopt, std::nullopt}});

    // Row 1: 3*4 + 8 + 1 + 2*3 = 27; row 2: 3*4 + 8 + 4 + 4 = 28
    CHECK(QueryExecutor::estimate_bytes_received(rs) == 55);
    CHECK(QueryExecutor::estimate_bytes_received(make_command(4)) == 0);
}
