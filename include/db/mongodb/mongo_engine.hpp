#pragma once

#include "db/idb_engine.hpp"
#include "db/connection_spec.hpp"
#include "db/mongodb/bson_convert.hpp"
#include "db/mongodb/mongo_query.hpp"
#include "core/error.hpp"

#include <mongoc/mongoc.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace dbaccess {

/**
 * @brief Error kind for a libmongoc error (API version 2 domains)
 */
[[nodiscard]] ErrorCode classify_mongo_error(uint32_t domain, uint32_t code);

/**
 * @brief Throw the typed error for a libmongoc error
 */
[[noreturn]] void throw_mongo_error(const bson_error_t& error);

/**
 * @brief MongoDB engine over one libmongoc client pool
 *
 * libmongoc has no asynchronous API, so every driver call runs on the
 * bridge's offload pool while the calling coroutine stays suspended. The
 * database is the one named in the connection URI.
 */
class MongoEngine : public IDbEngine {
public:
    static constexpr std::chrono::milliseconds kDefaultConnectTimeout{10000};

    MongoEngine(ConnectionSpec spec, const EngineContext& context);
    ~MongoEngine() override;

    [[nodiscard]] DatabaseType type() const override { return DatabaseType::MONGODB; }

    boost::asio::awaitable<void> connect() override;
    boost::asio::awaitable<DbSchema> get_schema() override;
    boost::asio::awaitable<DbQueryResult> get_table_data(
        std::string table, int64_t offset, int64_t limit) override;
    boost::asio::awaitable<DbTableStructure> get_table_structure(std::string table) override;
    boost::asio::awaitable<DbQueryResult> execute_query(std::string query) override;
    boost::asio::awaitable<bool> test_connection() override;
    void disconnect() override;

    [[nodiscard]] const std::string& database_name() const { return database_; }

private:
    struct PoolDeleter {
        void operator()(mongoc_client_pool_t* pool) const noexcept {
            if (pool) {
                mongoc_client_pool_destroy(pool);
            }
        }
    };
    using PoolPtr = std::unique_ptr<mongoc_client_pool_t, PoolDeleter>;

    /**
     * @brief Client popped from the pool, pushed back on destruction
     */
    class PooledClient {
    public:
        PooledClient(mongoc_client_pool_t* pool, mongoc_client_t* client)
            : pool_(pool), client_(client) {}
        ~PooledClient() {
            if (client_) {
                mongoc_client_pool_push(pool_, client_);
            }
        }

        PooledClient(const PooledClient&) = delete;
        PooledClient& operator=(const PooledClient&) = delete;

        [[nodiscard]] mongoc_client_t* get() const { return client_; }

    private:
        mongoc_client_pool_t* pool_;
        mongoc_client_t* client_;
    };

    // Blocking helpers; only called on the offload pool
    [[nodiscard]] PooledClient acquire() const;
    void ping() const;
    void ensure_collection(mongoc_client_t* client, const std::string& name) const;
    [[nodiscard]] std::vector<BsonPtr> find_documents(mongoc_client_t* client,
                                                      const std::string& collection,
                                                      const bson_t* filter,
                                                      const bson_t* opts,
                                                      size_t max_docs,
                                                      bool& truncated) const;
    [[nodiscard]] DbQueryResult run_find(const MongoFindQuery& query) const;
    [[nodiscard]] DbQueryResult run_command(const MongoCommand& command) const;

    ConnectionSpec spec_;
    ExecutionBridge& bridge_;
    EngineLimits limits_;
    std::string database_;
    PoolPtr pool_;
};

} // namespace dbaccess
