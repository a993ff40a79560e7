#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace dbaccess {

/**
 * @brief find() on one collection
 *
 * {"collection": "users", "filter": {...}, "projection": {...},
 *  "sort": {...}, "skip": 0, "limit": 10}
 */
struct MongoFindQuery {
    std::string collection;
    nlohmann::ordered_json filter = nlohmann::ordered_json::object();
    std::optional<nlohmann::ordered_json> projection;
    std::optional<nlohmann::ordered_json> sort;
    int64_t skip = 0;
    std::optional<int64_t> limit;
};

/**
 * @brief Any database command; the first key names the command
 */
struct MongoCommand {
    std::string name;
    nlohmann::ordered_json document;
};

using MongoQuery = std::variant<MongoFindQuery, MongoCommand>;

/**
 * @brief Parse query text typed by the user
 *
 * A document with a "collection" key is a find; any other document is run
 * as a database command. Key order is preserved because the server reads the
 * command name from the first key.
 *
 * @throws QuerySyntaxError for malformed JSON or option types
 */
[[nodiscard]] MongoQuery parse_mongo_query(std::string_view text);

} // namespace dbaccess
