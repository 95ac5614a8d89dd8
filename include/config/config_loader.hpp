#pragma once

#include "db/connection_params.hpp"
#include "db/iconnection_pool.hpp"

#include <toml++/toml.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace pgquery {

// ============================================================================
// Config sections (mirror the TOML hierarchy)
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

struct ConnectionConfig {
    std::string host = "localhost";
    int64_t port = 5432;
    std::string user;
    std::string password;
    std::string sslmode = "prefer";
    std::string application_name = "pgquery";
    int64_t connect_timeout_seconds = 5;
    std::string default_database = "postgres";

    // Endpoint without a database; the provider fills that in per call
    [[nodiscard]] ConnectionParams to_params() const;
};

struct ExecutorConfig {
    bool collect_performance_stats = true;
};

// Per-database pool override
struct DatabaseConfig {
    std::string name;
    int64_t max_connections = 0;
};

struct AppConfig {
    LoggingConfig logging;
    ConnectionConfig connection;
    PoolConfig pool;
    ExecutorConfig executor;
    std::vector<DatabaseConfig> databases;
};

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

class ConfigLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        AppConfig config;

        static LoadResult ok(AppConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to pgquery.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Check a parsed config
     * @return One message per violation, naming the offending key
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const AppConfig& config);

private:
    static AppConfig extract_all_sections(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);
    static ConnectionConfig extract_connection(const toml::table& root);
    static PoolConfig extract_pool(const toml::table& root);
    static ExecutorConfig extract_executor(const toml::table& root);
    static std::vector<DatabaseConfig> extract_databases(const toml::table& root);

    static LoadResult validate_and_return(AppConfig config);
};

} // namespace pgquery
