#pragma once

#include "core/database_type.hpp"
#include "core/types.hpp"

#include <boost/asio/awaitable.hpp>

#include <cstdint>
#include <string>

namespace dbaccess {

class ExecutionBridge;

/**
 * @brief Result-size limits applied by every engine
 */
struct EngineLimits {
    size_t max_result_rows = 10000;      // cap for execute_query
    size_t structure_sample_size = 100;  // documents sampled per structure call
};

/**
 * @brief Process-wide collaborators handed to each engine at construction
 *
 * The bridge outlives every engine created with it.
 */
struct EngineContext {
    ExecutionBridge& bridge;
    EngineLimits limits;
};

/**
 * @brief Abstract database engine, one instance per open connection
 *
 * Each backend kind (PostgreSQL, MongoDB) provides a concrete implementation
 * owning exactly one native connection or pool. Operations are coroutines run
 * on the bridge's shared execution context; arguments are taken by value so
 * they live in the coroutine frame.
 *
 * Implementations are not safe for concurrent use. Callers serialize access
 * per instance through an OperationGate.
 *
 * Usage:
 *   auto engine = BackendRegistry::instance().create(spec, context);
 *   bridge.run_to_completion(engine->connect());
 *   auto schema = bridge.run_to_completion(engine->get_schema());
 */
class IDbEngine {
public:
    virtual ~IDbEngine() = default;

    [[nodiscard]] virtual DatabaseType type() const = 0;

    /**
     * @brief Establish the native connection and verify it with one round-trip
     * @throws InvalidArgumentError for a malformed connection string
     * @throws ConnectionError when the backend is unreachable
     */
    virtual boost::asio::awaitable<void> connect() = 0;

    /**
     * @brief List tables, views and collections
     * @throws ConnectionError, DriverError
     */
    virtual boost::asio::awaitable<DbSchema> get_schema() = 0;

    /**
     * @brief Fetch one page of rows, 0-based
     *
     * An offset past the end yields zero rows.
     * @throws InvalidArgumentError on a negative offset or limit
     * @throws NotFoundError when the table does not exist
     */
    virtual boost::asio::awaitable<DbQueryResult> get_table_data(
        std::string table, int64_t offset, int64_t limit) = 0;

    /** @throws NotFoundError when the table does not exist */
    virtual boost::asio::awaitable<DbTableStructure> get_table_structure(std::string table) = 0;

    /**
     * @brief Run backend-native query text
     *
     * Statements without rows produce zero columns and zero rows.
     * @throws QuerySyntaxError, DriverError
     */
    virtual boost::asio::awaitable<DbQueryResult> execute_query(std::string query) = 0;

    /**
     * @brief Cheapest possible round-trip
     * @return false for any reachable-but-faulty or unreachable server
     * @throws InvalidArgumentError for a malformed connection spec only
     */
    virtual boost::asio::awaitable<bool> test_connection() = 0;

    /**
     * @brief Release native resources (idempotent)
     *
     * Must not run while another operation on this instance is in flight.
     */
    virtual void disconnect() = 0;
};

} // namespace dbaccess
