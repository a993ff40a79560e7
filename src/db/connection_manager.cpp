#include "db/connection_manager.hpp"
#include "db/backend_registry.hpp"
#include "executor/execution_bridge.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <mutex>
#include <optional>
#include <tuple>

namespace dbaccess {

namespace {

// Lets the engine's own connect deadline fire before the bridge gives up
constexpr std::chrono::milliseconds kConnectGrace{2000};

boost::asio::awaitable<void> connect_and_verify(IDbEngine* engine, bool verify) {
    co_await engine->connect();
    if (!verify) {
        co_return;
    }
    // Awaited as its own statement; GCC 10-12 miscompile co_await inside && operands
    const bool reachable = co_await engine->test_connection();
    if (!reachable) {
        throw ConnectionError("Initial connectivity check failed");
    }
}

} // namespace

std::atomic<uint64_t> ConnectionManager::next_id_{0};

ConnectionManager::ConnectionManager(ExecutionBridge& bridge)
    : ConnectionManager(bridge, Config{}) {}

ConnectionManager::ConnectionManager(ExecutionBridge& bridge, Config config, EngineFactory factory)
    : bridge_(bridge),
      config_(std::move(config)),
      factory_(std::move(factory)) {
    if (!factory_) {
        factory_ = [](const ConnectionSpec& spec, const EngineContext& context) {
            return BackendRegistry::instance().create(spec, context);
        };
    }
}

ConnectionManager::~ConnectionManager() {
    close_all();
}

std::string ConnectionManager::open(const ConnectionSpec& spec, const std::string& requested_id) {
    if (!requested_id.empty() && contains(requested_id)) {
        throw InvalidArgumentError(std::format("Connection id already in use: {}", requested_id));
    }

    const ConnectionSpec effective = effective_spec(spec);
    const auto display = database_type_display_name(effective.type);

    std::shared_ptr<IDbEngine> engine;
    std::shared_ptr<OperationGate> gate;
    try {
        std::tie(engine, gate) = connect_engine(effective, /*verify=*/true);
    } catch (const InvalidArgumentError& e) {
        utils::log::warn(std::format("Rejected {} connection spec: {}", display, e.what()));
        throw;
    } catch (const DbError& e) {
        utils::log::warn(std::format("Failed to open {} connection to {}: {}", display,
            utils::redact_connection_string(effective.connection_string), e.what()));
        throw ConnectionError(std::format("Failed to connect to {}: {}", display, e.what()));
    }

    std::string id;
    {
        std::unique_lock lock(mutex_);
        if (!requested_id.empty()) {
            // Another caller may have claimed the id while we were connecting
            if (connections_.count(requested_id) > 0) {
                lock.unlock();
                engine->disconnect();
                throw InvalidArgumentError(std::format("Connection id already in use: {}", requested_id));
            }
            id = requested_id;
        } else {
            do {
                id = allocate_id();
            } while (connections_.count(id) > 0);
        }
        connections_.emplace(id, Entry{engine, gate, effective.type, effective.name});
    }

    utils::log::info(std::format("Connection opened: {} ({}{})", id, display,
        effective.name.empty() ? "" : ", " + effective.name));
    return id;
}

ConnectionManager::Handle ConnectionManager::get(const std::string& id) const {
    std::shared_lock lock(mutex_);
    const auto it = connections_.find(id);
    if (it == connections_.end()) {
        throw NotFoundError(std::format("Unknown connection id: {}", id));
    }
    return Handle{id, it->second.engine, it->second.gate};
}

void ConnectionManager::close(const std::string& id) {
    std::optional<Entry> entry;
    {
        std::unique_lock lock(mutex_);
        auto it = connections_.find(id);
        if (it == connections_.end()) {
            return;
        }
        entry = std::move(it->second);
        connections_.erase(it);
    }
    release(id, *entry);
}

bool ConnectionManager::evict(const Handle& handle) {
    std::optional<Entry> entry;
    {
        std::unique_lock lock(mutex_);
        auto it = connections_.find(handle.id);
        if (it == connections_.end() || it->second.engine != handle.engine) {
            return false;
        }
        entry = std::move(it->second);
        connections_.erase(it);
    }
    release(handle.id, *entry);
    return true;
}

size_t ConnectionManager::close_all() {
    std::unordered_map<std::string, Entry> drained;
    {
        std::unique_lock lock(mutex_);
        drained.swap(connections_);
    }

    for (auto& [id, entry] : drained) {
        release(id, entry);
    }
    if (!drained.empty()) {
        utils::log::info(std::format("Closed {} connection(s)", drained.size()));
    }
    return drained.size();
}

bool ConnectionManager::probe(const ConnectionSpec& spec) {
    const ConnectionSpec effective = effective_spec(spec);

    bool reachable = false;
    try {
        auto [engine, gate] = connect_engine(effective, /*verify=*/true);
        gate->close();
        engine->disconnect();
        reachable = true;
    } catch (const InvalidArgumentError&) {
        throw;
    } catch (const DbError& e) {
        utils::log::debug(std::format("Connection test failed for {}: {}",
            utils::redact_connection_string(effective.connection_string), e.what()));
    }
    return reachable;
}

std::vector<ConnectionInfo> ConnectionManager::list() const {
    std::vector<ConnectionInfo> infos;
    {
        std::shared_lock lock(mutex_);
        infos.reserve(connections_.size());
        for (const auto& [id, entry] : connections_) {
            infos.push_back(ConnectionInfo{id, entry.type, entry.name});
        }
    }
    std::sort(infos.begin(), infos.end(),
        [](const ConnectionInfo& a, const ConnectionInfo& b) { return a.id < b.id; });
    return infos;
}

size_t ConnectionManager::size() const {
    std::shared_lock lock(mutex_);
    return connections_.size();
}

bool ConnectionManager::contains(const std::string& id) const {
    std::shared_lock lock(mutex_);
    return connections_.count(id) > 0;
}

ConnectionSpec ConnectionManager::effective_spec(const ConnectionSpec& spec) const {
    ConnectionSpec effective = spec;
    if (!effective.connect_timeout) {
        effective.connect_timeout = config_.connect_timeout;
    }
    return effective;
}

std::pair<std::shared_ptr<IDbEngine>, std::shared_ptr<OperationGate>>
ConnectionManager::connect_engine(const ConnectionSpec& spec, bool verify) {
    auto engine = factory_(spec, EngineContext{bridge_, config_.limits});
    if (!engine) {
        throw InvalidArgumentError(std::format("No engine available for {}",
            database_type_display_name(spec.type)));
    }
    auto gate = std::make_shared<OperationGate>();

    const auto timeout = std::chrono::duration_cast<std::chrono::milliseconds>(
        spec.connect_timeout.value_or(config_.connect_timeout) + kConnectGrace);
    try {
        auto ticket = gate->enter(std::chrono::steady_clock::now() + timeout);
        bridge_.run_to_completion(
            guarded(engine, std::move(ticket), connect_and_verify(engine.get(), verify)),
            timeout);
    } catch (const std::exception&) {
        // A connect abandoned on timeout still owns the engine and cleans up when it ends
        if (!gate->is_busy()) {
            engine->disconnect();
        }
        throw;
    }
    return {std::move(engine), std::move(gate)};
}

void ConnectionManager::release(const std::string& id, Entry& entry) {
    entry.gate->close();
    entry.engine->disconnect();
    utils::log::info(std::format("Connection closed: {} ({})", id,
        database_type_display_name(entry.type)));
}

std::string ConnectionManager::allocate_id() {
    return std::format("conn-{}", next_id_.fetch_add(1, std::memory_order_relaxed) + 1);
}

} // namespace dbaccess
