#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "db/connection_manager.hpp"
#include "db/connection_spec.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace dbaccess {

/**
 * @brief Id of a freshly opened connection plus its initial schema
 */
struct ConnectResult {
    std::string connection_id;
    DbSchema schema;
};

/**
 * @brief Dispatcher-facing facade over the connection manager
 *
 * Every call blocks the calling thread for one database operation and never
 * throws: failures come back as Result errors carrying the ErrorCode of the
 * typed exception raised below. A ConnectionError observed on an open
 * connection evicts it from the manager.
 *
 * Thread-safe. Operations on different connection ids proceed independently;
 * operations on the same id take turns through that connection's gate.
 */
class DatabaseService {
public:
    struct Config {
        std::chrono::milliseconds operation_timeout{30000};
    };

    explicit DatabaseService(ConnectionManager& manager);
    DatabaseService(ConnectionManager& manager, Config config);

    [[nodiscard]] Result<std::string> open(const ConnectionSpec& spec,
                                           const std::string& requested_id = "");

    /// Open, then fetch the schema; the connection is closed again if that fails
    [[nodiscard]] Result<ConnectResult> connect(const ConnectionSpec& spec,
                                                const std::string& requested_id = "");

    [[nodiscard]] Result<DbSchema> get_schema(const std::string& connection_id);

    [[nodiscard]] Result<DbQueryResult> get_table_data(const std::string& connection_id,
                                                       const std::string& table,
                                                       int64_t offset,
                                                       int64_t limit);

    [[nodiscard]] Result<DbTableStructure> get_table_structure(const std::string& connection_id,
                                                               const std::string& table);

    [[nodiscard]] Result<DbQueryResult> execute_query(const std::string& connection_id,
                                                      const std::string& query);

    [[nodiscard]] Result<bool> test_connection(const std::string& connection_id);

    /**
     * @brief Connect a throwaway engine for spec and ping it; registers nothing
     * @return ok(false) when unreachable, an error only for a malformed spec
     */
    [[nodiscard]] Result<bool> test_spec(const ConnectionSpec& spec);

    /// Idempotent; an unknown id is not an error
    Result<Unit> disconnect(const std::string& connection_id);

    [[nodiscard]] std::vector<ConnectionInfo> list_connections() const;

    /// Close every connection; returns how many were open
    size_t shutdown();

    [[nodiscard]] const Config& config() const noexcept { return config_; }

private:
    template <typename T, typename MakeOperation>
    Result<T> dispatch(const std::string& connection_id, std::string_view operation,
                       MakeOperation make_operation);

    ConnectionManager& manager_;
    Config config_;
};

} // namespace dbaccess
