#pragma once

#include "db/idb_engine.hpp"
#include "db/connection_spec.hpp"
#include "db/postgresql/pg_connection.hpp"

#include <chrono>
#include <string>
#include <string_view>
#include <utility>

namespace dbaccess {

/**
 * @brief Quote a PostgreSQL identifier ("a""b" for a"b)
 */
[[nodiscard]] std::string pg_quote_identifier(std::string_view ident);

/**
 * @brief PostgreSQL engine over one asynchronous libpq connection
 *
 * The connection string is anything libpq accepts: a postgres:// URI or
 * keyword/value pairs. Table names may be qualified as "schema.table";
 * unqualified names resolve through the search path first.
 */
class PgEngine : public IDbEngine {
public:
    static constexpr std::chrono::milliseconds kDefaultConnectTimeout{10000};

    PgEngine(ConnectionSpec spec, const EngineContext& context);
    ~PgEngine() override;

    [[nodiscard]] DatabaseType type() const override { return DatabaseType::POSTGRESQL; }

    boost::asio::awaitable<void> connect() override;
    boost::asio::awaitable<DbSchema> get_schema() override;
    boost::asio::awaitable<DbQueryResult> get_table_data(
        std::string table, int64_t offset, int64_t limit) override;
    boost::asio::awaitable<DbTableStructure> get_table_structure(std::string table) override;
    boost::asio::awaitable<DbQueryResult> execute_query(std::string query) override;
    boost::asio::awaitable<bool> test_connection() override;
    void disconnect() override;

private:
    /// (schema, relation) of an existing table, view or materialized view
    boost::asio::awaitable<std::pair<std::string, std::string>> resolve_table(std::string table);

    /**
     * @brief Convert a tuples result, keeping at most max_rows rows
     */
    static DbQueryResult to_query_result(const PGresult* res, size_t max_rows);

    ConnectionSpec spec_;
    EngineLimits limits_;
    PgConnection conn_;
};

} // namespace dbaccess
