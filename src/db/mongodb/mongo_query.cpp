#include "db/mongodb/mongo_query.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>

namespace dbaccess {

namespace {

int64_t non_negative_integer(const nlohmann::ordered_json& value, std::string_view key) {
    if (!value.is_number_integer()) {
        throw QuerySyntaxError(std::format("\"{}\" must be an integer", key));
    }
    const auto n = value.get<int64_t>();
    if (n < 0) {
        throw QuerySyntaxError(std::format("\"{}\" must not be negative", key));
    }
    return n;
}

const nlohmann::ordered_json& object_option(const nlohmann::ordered_json& value,
                                            std::string_view key) {
    if (!value.is_object()) {
        throw QuerySyntaxError(std::format("\"{}\" must be a document", key));
    }
    return value;
}

MongoFindQuery parse_find(const nlohmann::ordered_json& doc) {
    MongoFindQuery find;

    for (const auto& item : doc.items()) {
        const std::string& key = item.key();
        const auto& value = item.value();
        if (key == "collection") {
            if (!value.is_string() || value.get<std::string>().empty()) {
                throw QuerySyntaxError("\"collection\" must be a non-empty string");
            }
            find.collection = value.get<std::string>();
        } else if (key == "filter") {
            find.filter = object_option(value, key);
        } else if (key == "projection") {
            find.projection = object_option(value, key);
        } else if (key == "sort") {
            find.sort = object_option(value, key);
        } else if (key == "skip") {
            find.skip = non_negative_integer(value, key);
        } else if (key == "limit") {
            find.limit = non_negative_integer(value, key);
        } else {
            throw QuerySyntaxError(std::format("Unknown find option \"{}\"", key));
        }
    }
    return find;
}

} // namespace

MongoQuery parse_mongo_query(std::string_view text) {
    const std::string trimmed = utils::trim(text);
    if (trimmed.empty()) {
        throw QuerySyntaxError("Query text is empty");
    }

    nlohmann::ordered_json doc;
    try {
        doc = nlohmann::ordered_json::parse(trimmed);
    } catch (const nlohmann::json::parse_error& e) {
        throw QuerySyntaxError(std::format("Malformed query document: {}", e.what()));
    }

    if (!doc.is_object()) {
        throw QuerySyntaxError("Query must be a JSON document");
    }
    if (doc.empty()) {
        throw QuerySyntaxError("Query document is empty");
    }

    if (doc.contains("collection")) {
        return parse_find(doc);
    }

    MongoCommand command;
    command.name = doc.begin().key();
    command.document = std::move(doc);
    return command;
}

} // namespace dbaccess
