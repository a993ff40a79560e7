#include "db/postgresql/pg_engine.hpp"
#include "db/postgresql/pg_type_map.hpp"
#include "executor/execution_bridge.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <format>

namespace dbaccess {

namespace asio = boost::asio;

namespace {

// Socket waits outlive the server-side statement_timeout by this much
constexpr std::chrono::milliseconds kIoGrace{5000};

constexpr const char* SCHEMA_QUERY =
    "SELECT t.table_schema, t.table_name, t.table_type, "
    "       c.reltuples::bigint, c.relkind "
    "FROM information_schema.tables t "
    "LEFT JOIN pg_catalog.pg_namespace n ON n.nspname = t.table_schema "
    "LEFT JOIN pg_catalog.pg_class c ON c.relnamespace = n.oid AND c.relname = t.table_name "
    "WHERE t.table_schema <> 'information_schema' "
    "  AND t.table_schema NOT LIKE 'pg\\_%' "
    "UNION ALL "
    "SELECT m.schemaname, m.matviewname, 'MATERIALIZED VIEW', "
    "       c.reltuples::bigint, c.relkind "
    "FROM pg_catalog.pg_matviews m "
    "JOIN pg_catalog.pg_namespace n ON n.nspname = m.schemaname "
    "JOIN pg_catalog.pg_class c ON c.relnamespace = n.oid AND c.relname = m.matviewname "
    "WHERE m.schemaname <> 'information_schema' "
    "  AND m.schemaname NOT LIKE 'pg\\_%' "
    "ORDER BY 1, 2";

constexpr const char* RESOLVE_QUERY =
    "SELECT n.nspname, c.relname "
    "FROM pg_catalog.pg_class c "
    "JOIN pg_catalog.pg_namespace n ON n.oid = c.relnamespace "
    "WHERE c.relname = $1 "
    "  AND c.relkind IN ('r', 'p', 'v', 'm', 'f') "
    "  AND ($2::text = '' OR n.nspname = $2::text) "
    "  AND n.nspname <> 'information_schema' "
    "  AND n.nspname NOT LIKE 'pg\\_%' "
    "ORDER BY (n.nspname = ANY (pg_catalog.current_schemas(false))) DESC, n.nspname "
    "LIMIT 1";

constexpr const char* STRUCTURE_QUERY =
    "SELECT a.attname, "
    "       pg_catalog.format_type(a.atttypid, a.atttypmod), "
    "       NOT a.attnotnull, "
    "       pg_catalog.pg_get_expr(d.adbin, d.adrelid), "
    "       EXISTS (SELECT 1 FROM pg_catalog.pg_index i "
    "               WHERE i.indrelid = c.oid AND i.indisprimary "
    "                 AND a.attnum = ANY (i.indkey)) "
    "FROM pg_catalog.pg_attribute a "
    "JOIN pg_catalog.pg_class c ON c.oid = a.attrelid "
    "JOIN pg_catalog.pg_namespace n ON n.oid = c.relnamespace "
    "LEFT JOIN pg_catalog.pg_attrdef d ON d.adrelid = a.attrelid AND d.adnum = a.attnum "
    "WHERE n.nspname = $1 AND c.relname = $2 "
    "  AND a.attnum > 0 AND NOT a.attisdropped "
    "ORDER BY a.attnum";

TableKind table_kind_from(std::string_view table_type) {
    if (table_type == "VIEW") return TableKind::VIEW;
    if (table_type == "MATERIALIZED VIEW") return TableKind::MATERIALIZED_VIEW;
    if (table_type == "FOREIGN") return TableKind::FOREIGN_TABLE;
    return TableKind::TABLE;
}

std::string text_at(const PGresult* res, int row, int col) {
    return std::string(PQgetvalue(res, row, col), PQgetlength(res, row, col));
}

uint64_t parse_count(const char* text) {
    return text ? std::strtoull(text, nullptr, 10) : 0;
}

} // namespace

std::string pg_quote_identifier(std::string_view ident) {
    std::string quoted;
    quoted.reserve(ident.size() + 2);
    quoted += '"';
    for (const char c : ident) {
        if (c == '"') {
            quoted += '"';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

PgEngine::PgEngine(ConnectionSpec spec, const EngineContext& context)
    : spec_(std::move(spec)),
      limits_(context.limits) {
    const auto query_timeout = spec_.query_timeout.value_or(context.bridge.config().default_timeout);
    conn_.set_io_timeout(query_timeout + kIoGrace);
}

PgEngine::~PgEngine() {
    disconnect();
}

asio::awaitable<void> PgEngine::connect() {
    const auto timeout = spec_.connect_timeout.value_or(kDefaultConnectTimeout);
    co_await conn_.connect(spec_.connection_string, timeout);

    if (spec_.query_timeout) {
        auto results = co_await conn_.exec(std::format(
            "SET statement_timeout = {}", spec_.query_timeout->count()));
        for (const auto& res : results) {
            conn_.check_result(res.get());
        }
    }

    utils::log::info(std::format("PostgreSQL connected: {}",
        utils::redact_connection_string(spec_.connection_string)));
}

asio::awaitable<DbSchema> PgEngine::get_schema() {
    auto results = co_await conn_.exec(SCHEMA_QUERY);

    DbSchema schema;
    for (const auto& res : results) {
        conn_.check_result(res.get());

        const int nrows = PQntuples(res.get());
        schema.tables.reserve(schema.tables.size() + static_cast<size_t>(nrows));
        for (int row = 0; row < nrows; ++row) {
            DbTableInfo info;
            info.schema = text_at(res.get(), row, 0);
            info.name = text_at(res.get(), row, 1);
            info.kind = table_kind_from(PQgetvalue(res.get(), row, 2));

            // Estimates exist only for storage-backed relations that were analyzed
            if (!PQgetisnull(res.get(), row, 3) && !PQgetisnull(res.get(), row, 4)) {
                const long long estimate = std::strtoll(PQgetvalue(res.get(), row, 3), nullptr, 10);
                const char relkind = PQgetvalue(res.get(), row, 4)[0];
                if (estimate >= 0 && (relkind == 'r' || relkind == 'p' || relkind == 'm')) {
                    info.row_count = static_cast<uint64_t>(estimate);
                }
            }
            schema.tables.push_back(std::move(info));
        }
    }
    co_return schema;
}

asio::awaitable<DbQueryResult> PgEngine::get_table_data(std::string table,
                                                        int64_t offset, int64_t limit) {
    validate_page(offset, limit);
    utils::Timer timer;

    const auto [schema, relation] = co_await resolve_table(std::move(table));
    const std::string qualified = std::format("{}.{}",
        pg_quote_identifier(schema), pg_quote_identifier(relation));

    // Both statements travel in one round-trip
    auto results = co_await conn_.exec(std::format(
        "SELECT COUNT(*) FROM {0}; SELECT * FROM {0} LIMIT {1} OFFSET {2}",
        qualified, limit, offset));

    for (const auto& res : results) {
        conn_.check_result(res.get());
    }
    if (results.size() != 2) {
        throw DriverError(std::format("Expected 2 results for a table page, got {}", results.size()));
    }

    const uint64_t total = parse_count(PQgetvalue(results[0].get(), 0, 0));
    DbQueryResult page = to_query_result(results[1].get(), static_cast<size_t>(limit));
    page.total_count = total;
    page.has_more = static_cast<uint64_t>(offset) + page.rows.size() < total;
    page.execution_time_ms = static_cast<uint64_t>(timer.elapsed_ms().count());
    co_return page;
}

asio::awaitable<DbTableStructure> PgEngine::get_table_structure(std::string table) {
    const auto [schema, relation] = co_await resolve_table(std::move(table));

    auto res = co_await conn_.exec_params(STRUCTURE_QUERY, {schema, relation});
    conn_.check_result(res.get());

    DbTableStructure structure;
    structure.table_name = relation;
    structure.schema = schema;

    const int nrows = PQntuples(res.get());
    structure.columns.reserve(static_cast<size_t>(nrows));
    for (int row = 0; row < nrows; ++row) {
        DbColumnInfo column;
        column.name = text_at(res.get(), row, 0);
        column.data_type = text_at(res.get(), row, 1);
        column.nullable = std::strcmp(PQgetvalue(res.get(), row, 2), "t") == 0;
        if (!PQgetisnull(res.get(), row, 3)) {
            column.default_value = text_at(res.get(), row, 3);
        }
        column.is_primary_key = std::strcmp(PQgetvalue(res.get(), row, 4), "t") == 0;
        structure.columns.push_back(std::move(column));
    }
    co_return structure;
}

asio::awaitable<DbQueryResult> PgEngine::execute_query(std::string query) {
    utils::Timer timer;
    auto results = co_await conn_.exec(std::move(query));

    for (const auto& res : results) {
        conn_.check_result(res.get());
    }

    DbQueryResult result;
    if (!results.empty()) {
        // Multi-statement text reports its last statement
        const PGresult* last = results.back().get();
        if (PQresultStatus(last) == PGRES_TUPLES_OK) {
            result = to_query_result(last, limits_.max_result_rows);
        } else {
            const char* affected = PQcmdTuples(const_cast<PGresult*>(last));
            if (affected && affected[0] != '\0') {
                result.affected_rows = parse_count(affected);
            }
        }
    }
    result.execution_time_ms = static_cast<uint64_t>(timer.elapsed_ms().count());
    co_return result;
}

asio::awaitable<bool> PgEngine::test_connection() {
    if (!conn_.is_connected()) {
        co_return false;
    }

    bool healthy = false;
    try {
        auto results = co_await conn_.exec("SELECT 1");
        for (const auto& res : results) {
            conn_.check_result(res.get());
        }
        healthy = true;
    } catch (const InvalidArgumentError&) {
        throw;
    } catch (const DbError& e) {
        utils::log::debug(std::format("PostgreSQL ping failed: {}", e.what()));
    }
    co_return healthy;
}

void PgEngine::disconnect() {
    if (conn_.is_connected()) {
        utils::log::info(std::format("PostgreSQL disconnected: {}",
            utils::redact_connection_string(spec_.connection_string)));
    }
    conn_.close();
}

asio::awaitable<std::pair<std::string, std::string>> PgEngine::resolve_table(std::string table) {
    if (table.empty()) {
        throw InvalidArgumentError("Table name must not be empty");
    }

    // A literal name containing a dot wins over the schema-qualified reading
    auto res = co_await conn_.exec_params(RESOLVE_QUERY, {table, ""});
    conn_.check_result(res.get());
    if (PQntuples(res.get()) > 0) {
        co_return std::make_pair(text_at(res.get(), 0, 0), text_at(res.get(), 0, 1));
    }

    if (const auto dot = table.find('.'); dot != std::string::npos) {
        auto qualified = co_await conn_.exec_params(RESOLVE_QUERY,
            {table.substr(dot + 1), table.substr(0, dot)});
        conn_.check_result(qualified.get());
        if (PQntuples(qualified.get()) > 0) {
            co_return std::make_pair(text_at(qualified.get(), 0, 0), text_at(qualified.get(), 0, 1));
        }
    }

    throw NotFoundError(std::format("Table not found: {}", table));
}

DbQueryResult PgEngine::to_query_result(const PGresult* res, size_t max_rows) {
    DbQueryResult result;

    const int ncols = PQnfields(res);
    std::vector<GenericColumnType> generic;
    generic.reserve(static_cast<size_t>(ncols));
    result.columns.reserve(static_cast<size_t>(ncols));

    for (int col = 0; col < ncols; ++col) {
        const auto oid = static_cast<uint32_t>(PQftype(res, col));
        DbColumnInfo column;
        column.name = PQfname(res, col);
        column.data_type = PgTypeMap::oid_to_type_name(oid);
        result.columns.push_back(std::move(column));
        generic.push_back(PgTypeMap::oid_to_generic_type(oid));
    }

    const auto nrows = static_cast<size_t>(PQntuples(res));
    const size_t kept = std::min(nrows, max_rows);
    result.has_more = nrows > kept;
    result.rows.reserve(kept);

    for (size_t row = 0; row < kept; ++row) {
        const int r = static_cast<int>(row);
        std::vector<DbValue> values;
        values.reserve(static_cast<size_t>(ncols));
        for (int col = 0; col < ncols; ++col) {
            if (PQgetisnull(res, r, col)) {
                values.push_back(null_value());
            } else {
                values.push_back(PgTypeMap::to_value(generic[static_cast<size_t>(col)],
                    std::string_view(PQgetvalue(res, r, col),
                                     static_cast<size_t>(PQgetlength(res, r, col)))));
            }
        }
        result.rows.push_back(std::move(values));
    }

    check_row_alignment(result);
    return result;
}

} // namespace dbaccess
