#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <format>
#include <stdexcept>
#include <unordered_set>

using namespace std::string_literals;

namespace dbaccess {

// ============================================================================
// TOML parsing helpers
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns with environment variables (unset -> "")
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
            if (const char* env_val = std::getenv(var_name.c_str())) {
                result += env_val;
            }
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_node(toml::node& node);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto&& [key, val] : tbl) {
        expand_node(val);
    }
}

void expand_node(toml::node& node) {
    if (auto* s = node.as_string()) {
        *s = expand_env_vars(s->get());
    } else if (auto* tbl = node.as_table()) {
        expand_env_vars_recursive(*tbl);
    } else if (auto* arr = node.as_array()) {
        for (auto& elem : *arr) {
            expand_node(elem);
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

std::optional<std::chrono::milliseconds> optional_ms(const toml::table& tbl, std::string_view key) {
    if (const auto v = tbl[key].value<int64_t>()) {
        return std::chrono::milliseconds(*v);
    }
    return std::nullopt;
}

} // anonymous namespace

// ============================================================================
// Config types
// ============================================================================

ConnectionSpec ConnectionConfig::to_spec() const {
    ConnectionSpec spec;
    spec.type = parse_database_type(type);
    spec.name = name;

    if (!connection_string.empty()) {
        spec.connection_string = connection_string;
    } else {
        ConnectionParams params;
        params.name = name;
        params.type = spec.type;
        params.host = host;
        if (port) params.port = static_cast<uint16_t>(*port);
        params.user = user;
        params.password = password;
        params.database = database;
        spec.connection_string = params.connection_url();
    }

    if (pool_size) spec.pool_size = static_cast<uint32_t>(*pool_size);
    spec.connect_timeout = connect_timeout;
    spec.query_timeout = query_timeout;
    return spec;
}

const ConnectionConfig* AccessConfig::find_connection(std::string_view name) const {
    for (const auto& conn : connections) {
        if (conn.name == name) return &conn;
    }
    return nullptr;
}

// ============================================================================
// Section extractors
// ============================================================================

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

BridgeConfig ConfigLoader::extract_bridge(const toml::table& root) {
    BridgeConfig cfg;
    const auto* bridge = root["bridge"].as_table();
    if (!bridge) return cfg;
    const auto& b = *bridge;

    cfg.blocking_threads = b["blocking_threads"].value_or(int64_t{4});
    cfg.operation_timeout = std::chrono::milliseconds(b["operation_timeout_ms"].value_or(int64_t{30000}));
    cfg.connect_timeout = std::chrono::milliseconds(b["connect_timeout_ms"].value_or(int64_t{10000}));
    return cfg;
}

LimitsConfig ConfigLoader::extract_limits(const toml::table& root) {
    LimitsConfig cfg;
    const auto* limits = root["limits"].as_table();
    if (!limits) return cfg;

    cfg.max_result_rows = (*limits)["max_result_rows"].value_or(int64_t{10000});
    cfg.structure_sample_size = (*limits)["structure_sample_size"].value_or(int64_t{100});
    return cfg;
}

std::vector<ConnectionConfig> ConfigLoader::extract_connections(const toml::table& root) {
    std::vector<ConnectionConfig> result;
    const auto* arr = root["connections"].as_array();
    if (!arr) return result;
    result.reserve(arr->size());

    for (const auto& elem : *arr) {
        const auto* c = elem.as_table();
        if (!c) continue;

        ConnectionConfig cfg;
        cfg.name = (*c)["name"].value_or(""s);
        cfg.type = (*c)["type"].value_or("postgresql"s);
        cfg.connection_string = (*c)["connection_string"].value_or(""s);
        cfg.host = (*c)["host"].value_or(""s);
        cfg.port = (*c)["port"].value<int64_t>();
        cfg.user = (*c)["user"].value_or(""s);
        cfg.password = (*c)["password"].value_or(""s);
        cfg.database = (*c)["database"].value_or(""s);
        cfg.pool_size = (*c)["pool_size"].value<int64_t>();
        cfg.connect_timeout = optional_ms(*c, "connect_timeout_ms");
        cfg.query_timeout = optional_ms(*c, "query_timeout_ms");

        result.emplace_back(std::move(cfg));
    }
    return result;
}

AccessConfig ConfigLoader::extract_all_sections(const toml::table& root) {
    AccessConfig config;
    config.logging = extract_logging(root);
    config.bridge = extract_bridge(root);
    config.limits = extract_limits(root);
    config.connections = extract_connections(root);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(AccessConfig config) {
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

std::vector<std::string> ConfigLoader::validate_config(const AccessConfig& config) {
    std::vector<std::string> errors;

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format("logging.level must be debug|info|warn|error, got '{}'",
            config.logging.level));
    }

    if (config.bridge.blocking_threads < 1) {
        errors.push_back(std::format("bridge.blocking_threads must be >= 1, got {}",
            config.bridge.blocking_threads));
    }
    if (config.bridge.operation_timeout.count() <= 0) {
        errors.push_back("bridge.operation_timeout_ms must be > 0");
    }
    if (config.bridge.connect_timeout.count() <= 0) {
        errors.push_back("bridge.connect_timeout_ms must be > 0");
    }

    if (config.limits.max_result_rows < 1) {
        errors.push_back(std::format("limits.max_result_rows must be >= 1, got {}",
            config.limits.max_result_rows));
    }
    if (config.limits.structure_sample_size < 1) {
        errors.push_back(std::format("limits.structure_sample_size must be >= 1, got {}",
            config.limits.structure_sample_size));
    }

    std::unordered_set<std::string> names;
    for (size_t i = 0; i < config.connections.size(); ++i) {
        const auto& conn = config.connections[i];
        if (conn.name.empty()) {
            errors.push_back(std::format("connections[{}].name must not be empty", i));
        } else if (!names.insert(conn.name).second) {
            errors.push_back(std::format("connections[{}].name '{}' is not unique", i, conn.name));
        }

        try {
            (void)parse_database_type(conn.type);
        } catch (const InvalidArgumentError&) {
            errors.push_back(std::format("connections[{}].type '{}' is not a known backend", i, conn.type));
        }

        if (conn.connection_string.empty() && conn.host.empty()) {
            errors.push_back(std::format("connections[{}] needs connection_string or host", i));
        }
        if (conn.port && (*conn.port < 1 || *conn.port > 65535)) {
            errors.push_back(std::format("connections[{}].port must be 1-65535, got {}", i, *conn.port));
        }
        if (conn.pool_size && *conn.pool_size < 1) {
            errors.push_back(std::format("connections[{}].pool_size must be >= 1", i));
        }
        if (conn.connect_timeout && conn.connect_timeout->count() <= 0) {
            errors.push_back(std::format("connections[{}].connect_timeout_ms must be > 0", i));
        }
        if (conn.query_timeout && conn.query_timeout->count() <= 0) {
            errors.push_back(std::format("connections[{}].query_timeout_ms must be > 0", i));
        }
    }

    return errors;
}

} // namespace dbaccess
