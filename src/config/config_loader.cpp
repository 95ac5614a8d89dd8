#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <format>
#include <stdexcept>

using namespace std::string_literals;

namespace pgquery {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 *
 * Unset variables expand to the empty string.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        } else if (elem.is_string()) {
            auto& s = *elem.as_string();
            s = expand_env_vars(s.get());
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

// Negative TOML integers would wrap in size_t; map them to 0 so validation rejects them
size_t to_size(int64_t value) {
    return value < 0 ? 0 : static_cast<size_t>(value);
}

} // anonymous namespace

// ============================================================================
// ConnectionConfig
// ============================================================================

ConnectionParams ConnectionConfig::to_params() const {
    ConnectionParams params;
    params.host = host;
    params.port = static_cast<uint16_t>(port);
    params.user = user;
    params.password = password;
    params.sslmode = sslmode;
    params.application_name = application_name;
    params.connect_timeout = std::chrono::seconds(connect_timeout_seconds);
    return params;
}

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

// ---- Section extractors ----------------------------------------------------

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or(cfg.level);
    return cfg;
}

ConnectionConfig ConfigLoader::extract_connection(const toml::table& root) {
    ConnectionConfig cfg;
    const auto* connection = root["connection"].as_table();
    if (!connection) return cfg;
    const auto& c = *connection;

    cfg.host = c["host"].value_or(cfg.host);
    cfg.port = c["port"].value_or(cfg.port);
    cfg.user = c["user"].value_or(""s);
    cfg.password = c["password"].value_or(""s);
    cfg.sslmode = c["sslmode"].value_or(cfg.sslmode);
    cfg.application_name = c["application_name"].value_or(cfg.application_name);
    cfg.connect_timeout_seconds = c["connect_timeout_seconds"].value_or(cfg.connect_timeout_seconds);
    cfg.default_database = c["default_database"].value_or(cfg.default_database);
    return cfg;
}

PoolConfig ConfigLoader::extract_pool(const toml::table& root) {
    PoolConfig cfg;
    const auto* pool = root["pool"].as_table();
    if (!pool) return cfg;
    const auto& p = *pool;

    cfg.max_connections = to_size(p["max_connections"].value_or(int64_t{5}));
    cfg.connect_retries = static_cast<int>(p["connect_retries"].value_or(int64_t{3}));
    cfg.retry_backoff = std::chrono::milliseconds(p["retry_backoff_ms"].value_or(int64_t{500}));
    cfg.max_retry_backoff = std::chrono::milliseconds(p["max_retry_backoff_ms"].value_or(int64_t{2000}));
    cfg.acquire_timeout = std::chrono::milliseconds(p["acquire_timeout_ms"].value_or(int64_t{0}));
    cfg.idle_timeout = std::chrono::seconds(p["idle_timeout_seconds"].value_or(int64_t{60}));
    cfg.health_check_query = p["health_check_query"].value_or("SELECT 1"s);
    return cfg;
}

ExecutorConfig ConfigLoader::extract_executor(const toml::table& root) {
    ExecutorConfig cfg;
    const auto* executor = root["executor"].as_table();
    if (!executor) return cfg;

    cfg.collect_performance_stats =
        (*executor)["collect_performance_stats"].value_or(cfg.collect_performance_stats);
    return cfg;
}

std::vector<DatabaseConfig> ConfigLoader::extract_databases(const toml::table& root) {
    std::vector<DatabaseConfig> result;
    const auto* dbs = root["databases"].as_array();
    if (!dbs) return result;

    result.reserve(dbs->size());
    for (const auto& elem : *dbs) {
        const auto* db = elem.as_table();
        if (!db) continue;

        DatabaseConfig cfg;
        cfg.name = (*db)["name"].value_or(""s);
        cfg.max_connections = (*db)["max_connections"].value_or(int64_t{0});
        result.emplace_back(std::move(cfg));
    }
    return result;
}

AppConfig ConfigLoader::extract_all_sections(const toml::table& root) {
    AppConfig config;
    config.logging = extract_logging(root);
    config.connection = extract_connection(root);
    config.pool = extract_pool(root);
    config.executor = extract_executor(root);
    config.databases = extract_databases(root);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(AppConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return LoadResult::error(std::move(combined));
    }
    return LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const AppConfig& config) {
    std::vector<std::string> errors;

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format("logging.level must be debug, info, warn or error, got '{}'",
            config.logging.level));
    }

    if (utils::trim(config.connection.host).empty()) {
        errors.push_back("connection.host must not be empty");
    }
    if (config.connection.port < 1 || config.connection.port > 65535) {
        errors.push_back(std::format("connection.port must be 1-65535, got {}", config.connection.port));
    }
    if (config.connection.connect_timeout_seconds < 0) {
        errors.push_back("connection.connect_timeout_seconds must be >= 0");
    }

    if (config.pool.max_connections < 1) {
        errors.push_back("pool.max_connections must be >= 1");
    }
    if (config.pool.connect_retries < 1) {
        errors.push_back(std::format("pool.connect_retries must be >= 1, got {}", config.pool.connect_retries));
    }
    if (config.pool.retry_backoff.count() < 0 || config.pool.max_retry_backoff.count() < 0) {
        errors.push_back("pool.retry_backoff_ms and pool.max_retry_backoff_ms must be >= 0");
    }
    if (config.pool.acquire_timeout.count() < 0) {
        errors.push_back("pool.acquire_timeout_ms must be >= 0");
    }
    if (utils::trim(config.pool.health_check_query).empty()) {
        errors.push_back("pool.health_check_query must not be empty");
    }

    for (size_t i = 0; i < config.databases.size(); ++i) {
        const auto& db = config.databases[i];
        if (utils::trim(db.name).empty()) {
            errors.push_back(std::format("databases[{}].name must not be empty", i));
        }
        if (db.max_connections < 1) {
            errors.push_back(std::format("databases[{}].max_connections must be >= 1, got {}",
                i, db.max_connections));
        }
    }

    return errors;
}

} // namespace pgquery
