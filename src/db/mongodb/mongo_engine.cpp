#include "db/mongodb/mongo_engine.hpp"
#include "executor/execution_bridge.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cstdlib>
#include <format>
#include <mutex>
#include <type_traits>
#include <variant>

namespace dbaccess {

namespace asio = boost::asio;

namespace {

// Server error codes with a dedicated error kind
constexpr uint32_t kBadValue = 2;
constexpr uint32_t kHostUnreachable = 6;
constexpr uint32_t kHostNotFound = 7;
constexpr uint32_t kFailedToParse = 9;
constexpr uint32_t kTypeMismatch = 14;
constexpr uint32_t kAuthenticationFailed = 18;
constexpr uint32_t kNamespaceNotFound = 26;
constexpr uint32_t kMaxTimeMSExpired = 50;
constexpr uint32_t kCommandNotFound = 59;
constexpr uint32_t kNetworkTimeout = 89;
constexpr uint32_t kShutdownInProgress = 91;
constexpr uint32_t kPrimarySteppedDown = 189;
constexpr uint32_t kInterruptedAtShutdown = 11600;

struct UriDeleter {
    void operator()(mongoc_uri_t* uri) const noexcept {
        if (uri) {
            mongoc_uri_destroy(uri);
        }
    }
};
using UriPtr = std::unique_ptr<mongoc_uri_t, UriDeleter>;

struct DatabaseDeleter {
    void operator()(mongoc_database_t* db) const noexcept {
        if (db) {
            mongoc_database_destroy(db);
        }
    }
};
using DatabasePtr = std::unique_ptr<mongoc_database_t, DatabaseDeleter>;

struct CollectionDeleter {
    void operator()(mongoc_collection_t* coll) const noexcept {
        if (coll) {
            mongoc_collection_destroy(coll);
        }
    }
};
using CollectionPtr = std::unique_ptr<mongoc_collection_t, CollectionDeleter>;

struct CursorDeleter {
    void operator()(mongoc_cursor_t* cursor) const noexcept {
        if (cursor) {
            mongoc_cursor_destroy(cursor);
        }
    }
};
using CursorPtr = std::unique_ptr<mongoc_cursor_t, CursorDeleter>;

/**
 * @brief Command reply slot
 *
 * libmongoc initializes the reply on success and failure alike, so a Reply
 * must be handed to a command call right after construction.
 */
struct Reply {
    bson_t doc;
    Reply() = default;
    ~Reply() { bson_destroy(&doc); }
    Reply(const Reply&) = delete;
    Reply& operator=(const Reply&) = delete;
};

void ensure_driver_initialized() {
    static std::once_flag once;
    std::call_once(once, [] {
        mongoc_init();
        std::atexit(mongoc_cleanup);
    });
}

void set_uri_option(mongoc_uri_t* uri, const char* option, int32_t value) {
    if (!mongoc_uri_set_option_as_int32(uri, option, value)) {
        throw InvalidArgumentError(std::format("Invalid MongoDB option {}={}", option, value));
    }
}

std::optional<std::string> utf8_field(const bson_t* doc, const char* key) {
    bson_iter_t iter;
    if (bson_iter_init_find(&iter, doc, key) && BSON_ITER_HOLDS_UTF8(&iter)) {
        uint32_t len = 0;
        const char* s = bson_iter_utf8(&iter, &len);
        return std::string(s, len);
    }
    return std::nullopt;
}

std::optional<int64_t> estimated_count(mongoc_client_t* client, const std::string& database,
                                       const std::string& collection) {
    CollectionPtr coll(mongoc_client_get_collection(client, database.c_str(), collection.c_str()));
    bson_error_t error;
    const int64_t n = mongoc_collection_estimated_document_count(
        coll.get(), nullptr, nullptr, nullptr, &error);
    if (n < 0) {
        utils::log::debug(std::format("Count estimate for {} failed: {}", collection, error.message));
        return std::nullopt;
    }
    return n;
}

} // namespace

// ============================================================================
// Error translation
// ============================================================================

ErrorCode classify_mongo_error(uint32_t domain, uint32_t code) {
    switch (domain) {
        case MONGOC_ERROR_CLIENT:
        case MONGOC_ERROR_STREAM:
        case MONGOC_ERROR_PROTOCOL:
        case MONGOC_ERROR_SERVER_SELECTION:
            return ErrorCode::CONNECTION_ERROR;

        case MONGOC_ERROR_BSON:
        case MONGOC_ERROR_MATCHER:
        case MONGOC_ERROR_NAMESPACE:
            return ErrorCode::QUERY_SYNTAX_ERROR;

        case MONGOC_ERROR_COMMAND:
            return code == MONGOC_ERROR_COMMAND_INVALID_ARG
                ? ErrorCode::QUERY_SYNTAX_ERROR : ErrorCode::DRIVER_ERROR;

        case MONGOC_ERROR_SERVER:
        case MONGOC_ERROR_QUERY:
        case MONGOC_ERROR_WRITE_CONCERN:
            switch (code) {
                case kBadValue:
                case kFailedToParse:
                case kTypeMismatch:
                case kCommandNotFound:
                    return ErrorCode::QUERY_SYNTAX_ERROR;
                case kNamespaceNotFound:
                    return ErrorCode::NOT_FOUND;
                case kMaxTimeMSExpired:
                    return ErrorCode::TIMEOUT;
                case kHostUnreachable:
                case kHostNotFound:
                case kAuthenticationFailed:
                case kNetworkTimeout:
                case kShutdownInProgress:
                case kPrimarySteppedDown:
                case kInterruptedAtShutdown:
                    return ErrorCode::CONNECTION_ERROR;
                default:
                    return ErrorCode::DRIVER_ERROR;
            }

        default:
            return ErrorCode::DRIVER_ERROR;
    }
}

void throw_mongo_error(const bson_error_t& error) {
    utils::log::debug(std::format("MongoDB error [domain {}, code {}]: {}",
        error.domain, error.code, error.message));

    const std::string message = error.message;
    switch (classify_mongo_error(error.domain, error.code)) {
        case ErrorCode::CONNECTION_ERROR: throw ConnectionError(message);
        case ErrorCode::QUERY_SYNTAX_ERROR: throw QuerySyntaxError(message);
        case ErrorCode::NOT_FOUND: throw NotFoundError(message);
        case ErrorCode::TIMEOUT: throw TimeoutError(message);
        default: throw DriverError(message);
    }
}

// ============================================================================
// MongoEngine
// ============================================================================

MongoEngine::MongoEngine(ConnectionSpec spec, const EngineContext& context)
    : spec_(std::move(spec)),
      bridge_(context.bridge),
      limits_(context.limits) {
    ensure_driver_initialized();
}

MongoEngine::~MongoEngine() {
    disconnect();
}

asio::awaitable<void> MongoEngine::connect() {
    bson_error_t error;
    UriPtr uri(mongoc_uri_new_with_error(spec_.connection_string.c_str(), &error));
    if (!uri) {
        throw InvalidArgumentError(std::format("Invalid MongoDB connection string: {}", error.message));
    }

    const char* database = mongoc_uri_get_database(uri.get());
    if (!database || database[0] == '\0') {
        throw InvalidArgumentError("MongoDB connection string must name a database");
    }
    database_ = database;

    // Hints override the URI; otherwise the URI's own settings stand
    const auto connect_timeout = static_cast<int32_t>(
        spec_.connect_timeout.value_or(kDefaultConnectTimeout).count());
    if (spec_.connect_timeout ||
        mongoc_uri_get_option_as_int32(uri.get(), MONGOC_URI_SERVERSELECTIONTIMEOUTMS, -1) < 0) {
        set_uri_option(uri.get(), MONGOC_URI_SERVERSELECTIONTIMEOUTMS, connect_timeout);
        set_uri_option(uri.get(), MONGOC_URI_CONNECTTIMEOUTMS, connect_timeout);
    }
    if (spec_.query_timeout) {
        set_uri_option(uri.get(), MONGOC_URI_SOCKETTIMEOUTMS,
            static_cast<int32_t>(spec_.query_timeout->count()));
    }
    if (spec_.pool_size) {
        set_uri_option(uri.get(), MONGOC_URI_MAXPOOLSIZE,
            static_cast<int32_t>(*spec_.pool_size));
    }

    PoolPtr pool(mongoc_client_pool_new(uri.get()));
    if (!pool) {
        throw InvalidArgumentError("MongoDB connection string was rejected by the driver");
    }
    if (!mongoc_client_pool_set_error_api(pool.get(), MONGOC_ERROR_API_VERSION_2)) {
        throw DriverError("Failed to select the MongoDB error API");
    }
    pool_ = std::move(pool);

    try {
        co_await bridge_.offload([this] {
            ping();
            return true;
        });
    } catch (const DbError&) {
        pool_.reset();
        throw;
    }

    utils::log::info(std::format("MongoDB connected: {}",
        utils::redact_connection_string(spec_.connection_string)));
}

asio::awaitable<DbSchema> MongoEngine::get_schema() {
    co_return co_await bridge_.offload([this] {
        auto client = acquire();
        DatabasePtr db(mongoc_client_get_database(client.get(), database_.c_str()));
        CursorPtr cursor(mongoc_database_find_collections_with_opts(db.get(), nullptr));

        DbSchema schema;
        const bson_t* doc = nullptr;
        while (mongoc_cursor_next(cursor.get(), &doc)) {
            auto name = utf8_field(doc, "name");
            if (!name || name->starts_with("system.")) {
                continue;
            }

            DbTableInfo info;
            info.name = *name;
            const auto kind = utf8_field(doc, "type");
            if (kind && *kind == "view") {
                info.kind = TableKind::VIEW;
            } else {
                info.kind = TableKind::COLLECTION;
                if (auto n = estimated_count(client.get(), database_, *name); n) {
                    info.row_count = static_cast<uint64_t>(*n);
                }
            }
            schema.tables.push_back(std::move(info));
        }

        bson_error_t error;
        if (mongoc_cursor_error(cursor.get(), &error)) {
            throw_mongo_error(error);
        }

        std::sort(schema.tables.begin(), schema.tables.end(),
            [](const DbTableInfo& a, const DbTableInfo& b) { return a.name < b.name; });
        return schema;
    });
}

asio::awaitable<DbQueryResult> MongoEngine::get_table_data(std::string table,
                                                           int64_t offset, int64_t limit) {
    validate_page(offset, limit);

    co_return co_await bridge_.offload([this, table = std::move(table), offset, limit] {
        utils::Timer timer;
        auto client = acquire();
        ensure_collection(client.get(), table);

        const auto total = estimated_count(client.get(), database_, table);

        DbQueryResult page;
        // A zero limit means "no limit" to the server
        if (limit > 0) {
            BsonPtr filter(bson_new());
            BsonPtr opts(BCON_NEW("skip", BCON_INT64(offset), "limit", BCON_INT64(limit)));
            bool truncated = false;
            auto docs = find_documents(client.get(), table, filter.get(), opts.get(),
                                       static_cast<size_t>(limit), truncated);
            page = documents_to_result(docs);
        }

        if (total) {
            page.total_count = static_cast<uint64_t>(*total);
            page.has_more = static_cast<uint64_t>(offset) + page.rows.size() <
                            static_cast<uint64_t>(*total);
        }
        page.execution_time_ms = static_cast<uint64_t>(timer.elapsed_ms().count());
        return page;
    });
}

asio::awaitable<DbTableStructure> MongoEngine::get_table_structure(std::string table) {
    co_return co_await bridge_.offload([this, table = std::move(table)] {
        auto client = acquire();
        ensure_collection(client.get(), table);

        const auto sample = static_cast<int64_t>(std::max<size_t>(limits_.structure_sample_size, 1));
        BsonPtr filter(bson_new());
        BsonPtr opts(BCON_NEW("limit", BCON_INT64(sample)));
        bool truncated = false;
        auto docs = find_documents(client.get(), table, filter.get(), opts.get(),
                                   static_cast<size_t>(sample), truncated);
        return infer_collection_structure(table, docs);
    });
}

asio::awaitable<DbQueryResult> MongoEngine::execute_query(std::string query) {
    // Parse errors surface before any driver work
    MongoQuery parsed = parse_mongo_query(query);

    co_return co_await bridge_.offload([this, parsed = std::move(parsed)] {
        utils::Timer timer;
        DbQueryResult result = std::visit([this](const auto& q) {
            using Q = std::decay_t<decltype(q)>;
            if constexpr (std::is_same_v<Q, MongoFindQuery>) {
                return run_find(q);
            } else {
                return run_command(q);
            }
        }, parsed);
        result.execution_time_ms = static_cast<uint64_t>(timer.elapsed_ms().count());
        return result;
    });
}

asio::awaitable<bool> MongoEngine::test_connection() {
    if (!pool_) {
        co_return false;
    }

    bool healthy = false;
    try {
        healthy = co_await bridge_.offload([this] {
            ping();
            return true;
        });
    } catch (const InvalidArgumentError&) {
        throw;
    } catch (const DbError& e) {
        utils::log::debug(std::format("MongoDB ping failed: {}", e.what()));
    }
    co_return healthy;
}

void MongoEngine::disconnect() {
    if (pool_) {
        pool_.reset();
        utils::log::info(std::format("MongoDB disconnected: {}",
            utils::redact_connection_string(spec_.connection_string)));
    }
}

MongoEngine::PooledClient MongoEngine::acquire() const {
    if (!pool_) {
        throw ConnectionError("MongoDB connection is not open");
    }
    return PooledClient(pool_.get(), mongoc_client_pool_pop(pool_.get()));
}

void MongoEngine::ping() const {
    auto client = acquire();
    BsonPtr command(BCON_NEW("ping", BCON_INT32(1)));
    bson_error_t error;
    Reply reply;
    if (!mongoc_client_command_simple(client.get(), "admin", command.get(), nullptr,
                                      &reply.doc, &error)) {
        throw_mongo_error(error);
    }
}

void MongoEngine::ensure_collection(mongoc_client_t* client, const std::string& name) const {
    if (name.empty()) {
        throw InvalidArgumentError("Collection name must not be empty");
    }

    DatabasePtr db(mongoc_client_get_database(client, database_.c_str()));
    bson_error_t error{};
    if (mongoc_database_has_collection(db.get(), name.c_str(), &error)) {
        return;
    }
    if (error.code != 0) {
        throw_mongo_error(error);
    }
    throw NotFoundError(std::format("Collection not found: {}", name));
}

std::vector<BsonPtr> MongoEngine::find_documents(mongoc_client_t* client,
                                                 const std::string& collection,
                                                 const bson_t* filter,
                                                 const bson_t* opts,
                                                 size_t max_docs,
                                                 bool& truncated) const {
    CollectionPtr coll(mongoc_client_get_collection(client, database_.c_str(), collection.c_str()));
    CursorPtr cursor(mongoc_collection_find_with_opts(coll.get(), filter, opts, nullptr));

    std::vector<BsonPtr> docs;
    truncated = false;
    const bson_t* doc = nullptr;
    while (mongoc_cursor_next(cursor.get(), &doc)) {
        if (docs.size() == max_docs) {
            truncated = true;
            break;
        }
        docs.emplace_back(bson_copy(doc));
    }

    bson_error_t error;
    if (!truncated && mongoc_cursor_error(cursor.get(), &error)) {
        throw_mongo_error(error);
    }
    return docs;
}

DbQueryResult MongoEngine::run_find(const MongoFindQuery& query) const {
    auto client = acquire();

    BsonPtr filter = bson_from_json(query.filter.dump());

    // One extra document tells whether the cap cut the result
    const auto cap = static_cast<int64_t>(limits_.max_result_rows);
    int64_t limit = cap + 1;
    if (query.limit && *query.limit > 0 && *query.limit <= cap) {
        limit = *query.limit;
    }

    nlohmann::ordered_json options = nlohmann::ordered_json::object();
    if (query.projection) options["projection"] = *query.projection;
    if (query.sort) options["sort"] = *query.sort;
    if (query.skip > 0) options["skip"] = query.skip;
    options["limit"] = limit;
    BsonPtr opts = bson_from_json(options.dump());

    bool truncated = false;
    auto docs = find_documents(client.get(), query.collection, filter.get(), opts.get(),
                               limits_.max_result_rows, truncated);

    DbQueryResult result = documents_to_result(docs);
    result.has_more = truncated;
    return result;
}

DbQueryResult MongoEngine::run_command(const MongoCommand& command) const {
    auto client = acquire();
    BsonPtr cmd = bson_from_json(command.document.dump());

    DatabasePtr db(mongoc_client_get_database(client.get(), database_.c_str()));
    bson_error_t error;
    Reply reply;
    if (!mongoc_database_command_simple(db.get(), cmd.get(), nullptr, &reply.doc, &error)) {
        throw_mongo_error(error);
    }

    std::vector<BsonPtr> docs;
    bool has_more = false;

    bson_iter_t iter;
    bson_iter_t batch;
    if (bson_iter_init(&iter, &reply.doc) &&
        bson_iter_find_descendant(&iter, "cursor.firstBatch", &batch) &&
        BSON_ITER_HOLDS_ARRAY(&batch)) {
        bson_iter_t element;
        if (bson_iter_recurse(&batch, &element)) {
            while (bson_iter_next(&element)) {
                if (!BSON_ITER_HOLDS_DOCUMENT(&element)) {
                    continue;
                }
                if (docs.size() == limits_.max_result_rows) {
                    has_more = true;
                    break;
                }
                uint32_t len = 0;
                const uint8_t* data = nullptr;
                bson_iter_document(&element, &len, &data);
                docs.emplace_back(bson_new_from_data(data, len));
            }
        }

        bson_iter_t cursor_id;
        if (bson_iter_init(&iter, &reply.doc) &&
            bson_iter_find_descendant(&iter, "cursor.id", &cursor_id) &&
            bson_iter_as_int64(&cursor_id) != 0) {
            has_more = true;
        }
    } else {
        docs.emplace_back(bson_copy(&reply.doc));
    }

    DbQueryResult result = documents_to_result(docs);
    result.has_more = has_more;

    if (bson_iter_init_find(&iter, &reply.doc, "n") &&
        (BSON_ITER_HOLDS_INT32(&iter) || BSON_ITER_HOLDS_INT64(&iter) || BSON_ITER_HOLDS_DOUBLE(&iter))) {
        const int64_t n = bson_iter_as_int64(&iter);
        if (n >= 0) {
            result.affected_rows = static_cast<uint64_t>(n);
        }
    }
    return result;
}

} // namespace dbaccess
