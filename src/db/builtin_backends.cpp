#include "db/backend_registry.hpp"
#include "db/postgresql/pg_engine.hpp"
#include "db/mongodb/mongo_engine.hpp"

#include <mutex>

namespace dbaccess {

void register_builtin_backends() {
    static std::once_flag once;
    std::call_once(once, [] {
        auto& registry = BackendRegistry::instance();

        registry.register_backend(DatabaseType::POSTGRESQL,
            [](const ConnectionSpec& spec, const EngineContext& context) -> std::shared_ptr<IDbEngine> {
                return std::make_shared<PgEngine>(spec, context);
            });

        registry.register_backend(DatabaseType::MONGODB,
            [](const ConnectionSpec& spec, const EngineContext& context) -> std::shared_ptr<IDbEngine> {
                return std::make_shared<MongoEngine>(spec, context);
            });
    });
}

} // namespace dbaccess
