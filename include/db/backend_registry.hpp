#pragma once

#include "db/idb_engine.hpp"
#include "db/connection_spec.hpp"
#include "core/database_type.hpp"
#include "core/error.hpp"

#include <format>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace dbaccess {

/**
 * @brief Registry of engine factories, keyed by backend kind
 *
 * Backends are registered explicitly at startup through
 * register_builtin_backends(); the connection manager asks the registry for
 * an engine matching a spec's kind tag.
 *
 * Usage:
 *   register_builtin_backends();
 *   auto engine = BackendRegistry::instance().create(spec, context);
 */
class BackendRegistry {
public:
    using Factory = std::function<std::shared_ptr<IDbEngine>(
        const ConnectionSpec& spec, const EngineContext& context)>;

    static BackendRegistry& instance() {
        static BackendRegistry registry;
        return registry;
    }

    void register_backend(DatabaseType type, Factory factory) {
        std::lock_guard lock(mutex_);
        factories_[type] = std::move(factory);
    }

    /**
     * @throws InvalidArgumentError when no backend handles spec.type
     */
    [[nodiscard]] std::shared_ptr<IDbEngine> create(
        const ConnectionSpec& spec, const EngineContext& context) const {
        Factory factory;
        {
            std::lock_guard lock(mutex_);
            const auto it = factories_.find(spec.type);
            if (it == factories_.end()) {
                throw InvalidArgumentError(std::format(
                    "No backend registered for database type: {}",
                    database_type_to_string(spec.type)));
            }
            factory = it->second;
        }
        return factory(spec, context);
    }

    [[nodiscard]] bool has_backend(DatabaseType type) const {
        std::lock_guard lock(mutex_);
        return factories_.count(type) > 0;
    }

private:
    BackendRegistry() = default;

    struct DatabaseTypeHash {
        size_t operator()(DatabaseType t) const {
            return std::hash<int>()(static_cast<int>(t));
        }
    };

    mutable std::mutex mutex_;
    std::unordered_map<DatabaseType, Factory, DatabaseTypeHash> factories_;
};

/**
 * @brief Register the PostgreSQL and MongoDB engines (idempotent)
 *
 * Defined in src/db/builtin_backends.cpp.
 */
void register_builtin_backends();

} // namespace dbaccess
