#pragma once

#include "core/types.hpp"

#include <bson/bson.h>
#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <vector>

namespace dbaccess {

struct BsonDeleter {
    void operator()(bson_t* doc) const noexcept {
        if (doc) {
            bson_destroy(doc);
        }
    }
};
using BsonPtr = std::unique_ptr<bson_t, BsonDeleter>;

/**
 * @brief Normalize the BSON value under an iterator
 *
 * ObjectId → 24-char hex, DateTime → ISO-8601 UTC with milliseconds,
 * Decimal128 → string, Binary → "<binary N bytes>", Regex → "/pattern/options",
 * Timestamp → "Timestamp(t, i)", documents and arrays → OpaqueJson.
 */
[[nodiscard]] DbValue bson_to_value(const bson_iter_t& iter);

/**
 * @brief Same mapping as bson_to_value, producing plain JSON
 */
[[nodiscard]] nlohmann::json bson_to_json(const bson_iter_t& iter);

/**
 * @brief Convert a whole document to a JSON object
 */
[[nodiscard]] nlohmann::json bson_document_to_json(const bson_t* doc);

/**
 * @brief Display name of a BSON type ("int32", "ObjectId", "Document", ...)
 */
[[nodiscard]] const char* bson_type_name(bson_type_t type);

/**
 * @brief Format milliseconds since the Unix epoch as 2024-01-31T12:00:00.000Z
 */
[[nodiscard]] std::string format_bson_datetime(int64_t millis);

/**
 * @brief Build a BSON document from JSON text (extended JSON accepted)
 * @throws QuerySyntaxError with the parser's message
 */
[[nodiscard]] BsonPtr bson_from_json(const std::string& json);

/**
 * @brief Turn documents into rows
 *
 * Columns are the union of top-level keys: "_id" first, then the rest in
 * first-seen order. A key missing from a document is null in that row.
 * data_type joins the observed BSON type names with " | ".
 */
[[nodiscard]] DbQueryResult documents_to_result(const std::vector<BsonPtr>& docs);

/**
 * @brief Infer a collection's fields from sampled documents
 *
 * A field is nullable when some sampled document lacks it or holds null;
 * "_id" is the primary key.
 */
[[nodiscard]] DbTableStructure infer_collection_structure(const std::string& collection,
                                                          const std::vector<BsonPtr>& docs);

} // namespace dbaccess
