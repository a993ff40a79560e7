#pragma once

#include "db/connection_spec.hpp"
#include "db/idb_engine.hpp"
#include "db/operation_gate.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace dbaccess {

class ExecutionBridge;

/**
 * @brief Summary of one open connection
 */
struct ConnectionInfo {
    std::string id;
    DatabaseType type = DatabaseType::POSTGRESQL;
    std::string name;
};

/**
 * @brief Owns every live engine, keyed by connection id
 *
 * Lookups take a shared lock and may run alongside each other; inserts and
 * removals take the unique lock. Driver work (connect, disconnect) never runs
 * under the lock, so a slow backend cannot stall unrelated connections.
 *
 * Ids handed out by open() come from a process-wide counter ("conn-1",
 * "conn-2", ...) that is never reset, so an id is never reused while the
 * process lives. Eviction is explicit only: close(), close_all(), or evict() on a
 * failure reported by the service layer.
 */
class ConnectionManager {
public:
    using EngineFactory = std::function<std::shared_ptr<IDbEngine>(
        const ConnectionSpec& spec, const EngineContext& context)>;

    struct Config {
        std::chrono::milliseconds connect_timeout{10000};
        EngineLimits limits;
    };

    /// What get() hands out: the engine plus the gate that serializes it
    struct Handle {
        std::string id;
        std::shared_ptr<IDbEngine> engine;
        std::shared_ptr<OperationGate> gate;
    };

    explicit ConnectionManager(ExecutionBridge& bridge);

    /**
     * @param factory Engine factory; defaults to BackendRegistry
     */
    ConnectionManager(ExecutionBridge& bridge, Config config, EngineFactory factory = {});

    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    /**
     * @brief Create the engine for spec.type, connect, verify, register
     * @param requested_id Caller-chosen id; empty to allocate one
     * @return The registered id
     * @throws ConnectionError when the backend cannot be reached (nothing registered)
     * @throws InvalidArgumentError for a malformed spec or an id already in use
     */
    std::string open(const ConnectionSpec& spec, const std::string& requested_id = "");

    /**
     * @throws NotFoundError for an unknown or closed id
     */
    [[nodiscard]] Handle get(const std::string& id) const;

    /**
     * @brief Disconnect and forget a connection (no-op for unknown ids)
     *
     * Waits for the connection's in-flight operation; operations arriving
     * meanwhile are rejected with ConnectionError.
     */
    void close(const std::string& id);

    /**
     * @brief Close handle.id only while it still refers to handle.engine
     *
     * A failure seen through an old handle never takes down a connection
     * reopened under the same id.
     * @return true when the entry was removed
     */
    bool evict(const Handle& handle);

    /**
     * @brief Close every connection
     * @return Number of connections closed
     */
    size_t close_all();

    /**
     * @brief Connect a throwaway engine, ping it, tear it down
     * @return false when the backend is unreachable or unhealthy
     * @throws InvalidArgumentError for a malformed spec
     */
    bool probe(const ConnectionSpec& spec);

    [[nodiscard]] std::vector<ConnectionInfo> list() const;
    [[nodiscard]] size_t size() const;
    [[nodiscard]] bool contains(const std::string& id) const;

    [[nodiscard]] ExecutionBridge& bridge() noexcept { return bridge_; }
    [[nodiscard]] const Config& config() const noexcept { return config_; }

private:
    struct Entry {
        std::shared_ptr<IDbEngine> engine;
        std::shared_ptr<OperationGate> gate;
        DatabaseType type;
        std::string name;
    };

    /// Apply manager defaults to the caller's hints
    [[nodiscard]] ConnectionSpec effective_spec(const ConnectionSpec& spec) const;

    /// Create and connect an engine; nothing is registered
    [[nodiscard]] std::pair<std::shared_ptr<IDbEngine>, std::shared_ptr<OperationGate>>
    connect_engine(const ConnectionSpec& spec, bool verify);

    static void release(const std::string& id, Entry& entry);
    static std::string allocate_id();

    ExecutionBridge& bridge_;
    Config config_;
    EngineFactory factory_;

    std::unordered_map<std::string, Entry> connections_;
    mutable std::shared_mutex mutex_;

    static std::atomic<uint64_t> next_id_;
};

} // namespace dbaccess
