#include "analyzer/sql_validator.hpp"
#include "config/config_loader.hpp"
#include "core/result_json.hpp"
#include "core/utils.hpp"
#include "db/connection_config_provider.hpp"
#include "db/connection_pool.hpp"
#include "db/postgresql/pg_connection.hpp"
#include "executor/query_executor.hpp"

#include <cstdlib>
#include <format>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace pgquery;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

enum class Mode { EXECUTE, EXPLAIN, VALIDATE, FORMAT, TEST };

struct CliOptions {
    std::optional<std::string> config_file;
    std::optional<std::string> database;
    std::vector<SqlParam> params;
    Mode mode = Mode::EXECUTE;
    bool collect_stats = true;
    std::string sql;
};

void print_usage(const char* prog) {
    std::cerr << std::format(
        "Usage: {} [options] <sql | ->\n"
        "\n"
        "Options:\n"
        "  -c, --config FILE     TOML configuration file\n"
        "  -d, --database NAME   target database (default from config)\n"
        "  -p, --param VALUE     positional parameter $1, $2, ... (repeatable)\n"
        "      --null-param      positional parameter bound to NULL\n"
        "      --explain         run EXPLAIN (ANALYZE, BUFFERS, FORMAT JSON)\n"
        "      --validate        check the statement without connecting\n"
        "      --format          print the reformatted statement\n"
        "      --test            test the connection (SELECT 1)\n"
        "      --no-stats        skip the plan analysis after execution\n"
        "  -h, --help            show this help\n"
        "\n"
        "A SQL argument of '-' reads the statement from stdin.\n", prog);
}

// Returns nullopt after printing a message on a usage error
std::optional<CliOptions> parse_args(int argc, char* argv[]) {
    CliOptions opts;
    std::vector<std::string> sql_parts;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const auto next_value = [&](const char* name) -> std::optional<std::string> {
            if (i + 1 >= argc) {
                std::cerr << std::format("Option {} requires a value\n", name);
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            std::exit(kExitOk);
        } else if (arg == "-c" || arg == "--config") {
            auto value = next_value("--config");
            if (!value) return std::nullopt;
            opts.config_file = std::move(*value);
        } else if (arg == "-d" || arg == "--database") {
            auto value = next_value("--database");
            if (!value) return std::nullopt;
            opts.database = std::move(*value);
        } else if (arg == "-p" || arg == "--param") {
            auto value = next_value("--param");
            if (!value) return std::nullopt;
            opts.params.emplace_back(std::move(*value));
        } else if (arg == "--null-param") {
            opts.params.emplace_back(nullptr);
        } else if (arg == "--explain") {
            opts.mode = Mode::EXPLAIN;
        } else if (arg == "--validate") {
            opts.mode = Mode::VALIDATE;
        } else if (arg == "--format") {
            opts.mode = Mode::FORMAT;
        } else if (arg == "--test") {
            opts.mode = Mode::TEST;
        } else if (arg == "--no-stats") {
            opts.collect_stats = false;
        } else if (arg.size() > 1 && arg[0] == '-' && sql_parts.empty()) {
            std::cerr << std::format("Unknown option: {}\n", arg);
            return std::nullopt;
        } else {
            sql_parts.push_back(arg);
        }
    }

    if (sql_parts.size() == 1 && sql_parts.front() == "-") {
        opts.sql.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    } else {
        for (const auto& part : sql_parts) {
            if (!opts.sql.empty()) opts.sql += ' ';
            opts.sql += part;
        }
    }

    if (opts.mode != Mode::TEST && opts.sql.empty()) {
        std::cerr << "No SQL statement given\n";
        return std::nullopt;
    }
    return opts;
}

void print_json(const nlohmann::ordered_json& j) {
    std::cout << j.dump(2) << '\n';
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    auto parsed = parse_args(argc, argv);
    if (!parsed) {
        print_usage(argv[0]);
        return kExitUsage;
    }
    const CliOptions& opts = *parsed;

    // Offline modes: no configuration, no connection
    if (opts.mode == Mode::VALIDATE) {
        const auto validation = SqlValidator::validate(opts.sql);
        print_json(validation);
        return validation.is_valid ? kExitOk : kExitUsage;
    }
    if (opts.mode == Mode::FORMAT) {
        std::cout << SqlValidator::format(opts.sql) << '\n';
        return kExitOk;
    }

    AppConfig config;
    if (opts.config_file) {
        auto loaded = ConfigLoader::load_from_file(*opts.config_file);
        if (!loaded.success) {
            std::cerr << loaded.error_message << '\n';
            return kExitUsage;
        }
        config = std::move(loaded.config);
    }
    if (const auto level = utils::log::parse_level(config.logging.level)) {
        utils::log::set_level(*level);
    }

    auto provider = std::make_shared<StaticConnectionConfigProvider>(
        config.connection.to_params(), config.connection.default_database);
    auto pool = std::make_shared<ConnectionPool>(
        provider, std::make_shared<PgConnectionFactory>(), config.pool);
    for (const auto& db : config.databases) {
        pool->set_max_connections(db.name, static_cast<size_t>(db.max_connections));
    }

    QueryExecutor executor(pool, QueryExecutor::Config{
        .collect_performance_stats = config.executor.collect_performance_stats,
    });

    int exit_code = kExitOk;
    if (opts.mode == Mode::TEST) {
        const bool connected = executor.test_connection(opts.database);
        print_json(nlohmann::ordered_json{{"connected", connected}});
        exit_code = connected ? kExitOk : kExitFailure;
    } else {
        auto result = opts.mode == Mode::EXPLAIN
            ? executor.explain_query(opts.sql, opts.database)
            : executor.execute_query(QueryRequest{
                  .sql = opts.sql,
                  .params = opts.params,
                  .database = opts.database,
                  .collect_stats = opts.collect_stats,
              });

        if (result.is_ok()) {
            print_json(result.value());
        } else {
            print_json(result.error());
            exit_code = result.error_category() == ErrorCategory::VALIDATION_ERROR
                ? kExitUsage
                : kExitFailure;
        }
    }

    executor.cleanup();
    return exit_code;
}
