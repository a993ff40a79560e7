#include "db/database_service.hpp"
#include "db/operation_gate.hpp"
#include "executor/execution_bridge.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <optional>

namespace dbaccess {

namespace {

using Clock = std::chrono::steady_clock;

template <typename T>
Result<T> internal_error(std::string_view operation, const std::exception& e) {
    utils::log::error(std::format("Unexpected failure in {}: {}", operation, e.what()));
    return Result<T>::error(ErrorCode::INTERNAL_ERROR, e.what());
}

} // namespace

DatabaseService::DatabaseService(ConnectionManager& manager)
    : DatabaseService(manager, Config{}) {}

DatabaseService::DatabaseService(ConnectionManager& manager, Config config)
    : manager_(manager), config_(config) {}

template <typename T, typename MakeOperation>
Result<T> DatabaseService::dispatch(const std::string& connection_id,
                                    std::string_view operation,
                                    MakeOperation make_operation) {
    std::optional<ConnectionManager::Handle> handle;
    try {
        handle = manager_.get(connection_id);
        const utils::Timer timer;

        // Waiting for the gate counts against the same deadline as the work
        const auto deadline = Clock::now() + config_.operation_timeout;
        auto ticket = handle->gate->enter(deadline);
        const auto remaining = std::max(
            std::chrono::milliseconds{1},
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()));

        T value = manager_.bridge().run_to_completion(
            guarded(handle->engine, std::move(ticket), make_operation(*handle->engine)),
            remaining);

        utils::log::debug(std::format("{} on {} took {} ms", operation, connection_id,
            timer.elapsed_ms().count()));
        return Result<T>::ok(std::move(value));
    } catch (const ConnectionError& e) {
        if (handle && manager_.evict(*handle)) {
            utils::log::warn(std::format("Evicted connection {} after {} failed: {}",
                connection_id, operation, e.what()));
        }
        return Result<T>::error(e.code(), e.what());
    } catch (const DbError& e) {
        utils::log::debug(std::format("{} on {} failed ({}): {}", operation, connection_id,
            error_code_to_string(e.code()), e.what()));
        return Result<T>::error(e.code(), e.what());
    } catch (const std::exception& e) {
        return internal_error<T>(operation, e);
    }
}

Result<std::string> DatabaseService::open(const ConnectionSpec& spec,
                                          const std::string& requested_id) {
    try {
        return Result<std::string>::ok(manager_.open(spec, requested_id));
    } catch (const DbError& e) {
        return Result<std::string>::error(e.code(), e.what());
    } catch (const std::exception& e) {
        return internal_error<std::string>("open", e);
    }
}

Result<ConnectResult> DatabaseService::connect(const ConnectionSpec& spec,
                                               const std::string& requested_id) {
    auto opened = open(spec, requested_id);
    if (opened.is_error()) {
        return Result<ConnectResult>::error(opened.error_code(), opened.error_message());
    }

    const std::string& id = opened.value();
    auto schema = get_schema(id);
    if (schema.is_error()) {
        manager_.close(id);
        return Result<ConnectResult>::error(schema.error_code(), schema.error_message());
    }
    return Result<ConnectResult>::ok(ConnectResult{id, std::move(schema.value())});
}

Result<DbSchema> DatabaseService::get_schema(const std::string& connection_id) {
    return dispatch<DbSchema>(connection_id, "get_schema",
        [](IDbEngine& engine) { return engine.get_schema(); });
}

Result<DbQueryResult> DatabaseService::get_table_data(const std::string& connection_id,
                                                      const std::string& table,
                                                      int64_t offset,
                                                      int64_t limit) {
    return dispatch<DbQueryResult>(connection_id, "get_table_data",
        [&](IDbEngine& engine) { return engine.get_table_data(table, offset, limit); });
}

Result<DbTableStructure> DatabaseService::get_table_structure(const std::string& connection_id,
                                                              const std::string& table) {
    return dispatch<DbTableStructure>(connection_id, "get_table_structure",
        [&](IDbEngine& engine) { return engine.get_table_structure(table); });
}

Result<DbQueryResult> DatabaseService::execute_query(const std::string& connection_id,
                                                     const std::string& query) {
    return dispatch<DbQueryResult>(connection_id, "execute_query",
        [&](IDbEngine& engine) { return engine.execute_query(query); });
}

Result<bool> DatabaseService::test_connection(const std::string& connection_id) {
    return dispatch<bool>(connection_id, "test_connection",
        [](IDbEngine& engine) { return engine.test_connection(); });
}

Result<bool> DatabaseService::test_spec(const ConnectionSpec& spec) {
    try {
        return Result<bool>::ok(manager_.probe(spec));
    } catch (const DbError& e) {
        return Result<bool>::error(e.code(), e.what());
    } catch (const std::exception& e) {
        return internal_error<bool>("test_spec", e);
    }
}

Result<Unit> DatabaseService::disconnect(const std::string& connection_id) {
    try {
        manager_.close(connection_id);
        return Result<Unit>::ok(Unit{});
    } catch (const DbError& e) {
        return Result<Unit>::error(e.code(), e.what());
    } catch (const std::exception& e) {
        return internal_error<Unit>("disconnect", e);
    }
}

std::vector<ConnectionInfo> DatabaseService::list_connections() const {
    return manager_.list();
}

size_t DatabaseService::shutdown() {
    return manager_.close_all();
}

} // namespace dbaccess
