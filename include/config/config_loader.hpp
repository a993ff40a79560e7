#pragma once

#include "db/connection_spec.hpp"

#include <toml++/toml.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace dbaccess {

// ============================================================================
// Section configs (mirror the TOML layout)
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

struct BridgeConfig {
    int64_t blocking_threads = 4;
    std::chrono::milliseconds operation_timeout{30000};
    std::chrono::milliseconds connect_timeout{10000};
};

struct LimitsConfig {
    int64_t max_result_rows = 10000;
    int64_t structure_sample_size = 100;
};

/**
 * @brief One [[connections]] entry
 *
 * Either connection_string or the discrete host/port/user/password/database
 * fields describe the target; connection_string wins when both are set.
 */
struct ConnectionConfig {
    std::string name;
    std::string type = "postgresql";
    std::string connection_string;

    std::string host;
    std::optional<int64_t> port;
    std::string user;
    std::string password;
    std::string database;

    std::optional<int64_t> pool_size;
    std::optional<std::chrono::milliseconds> connect_timeout;
    std::optional<std::chrono::milliseconds> query_timeout;

    /**
     * @brief Build the ConnectionSpec handed to the connection manager
     * @throws InvalidArgumentError for an unknown backend type
     */
    [[nodiscard]] ConnectionSpec to_spec() const;
};

struct AccessConfig {
    LoggingConfig logging;
    BridgeConfig bridge;
    LimitsConfig limits;
    std::vector<ConnectionConfig> connections;

    /// nullptr when no connection has that name
    [[nodiscard]] const ConnectionConfig* find_connection(std::string_view name) const;
};

// ============================================================================
// ConfigLoader - typed config from TOML
// ============================================================================

class ConfigLoader {
public:
    static constexpr const char* kDefaultPath = "config/dbaccess.toml";

    struct LoadResult {
        bool success = false;
        std::string error_message;
        AccessConfig config;

        static LoadResult ok(AccessConfig cfg) {
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
     * @brief Load and validate a TOML file; ${VAR} in strings is expanded
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /// Every problem found, one message each; empty when valid
    [[nodiscard]] static std::vector<std::string> validate_config(const AccessConfig& config);

private:
    static AccessConfig extract_all_sections(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);
    static BridgeConfig extract_bridge(const toml::table& root);
    static LimitsConfig extract_limits(const toml::table& root);
    static std::vector<ConnectionConfig> extract_connections(const toml::table& root);

    static LoadResult validate_and_return(AccessConfig config);
};

} // namespace dbaccess
