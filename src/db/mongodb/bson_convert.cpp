#include "db/mongodb/bson_convert.hpp"
#include "core/error.hpp"

#include <algorithm>
#include <ctime>
#include <format>
#include <set>
#include <unordered_map>

namespace dbaccess {

std::string format_bson_datetime(int64_t millis) {
    int64_t seconds = millis / 1000;
    int64_t fraction = millis % 1000;
    if (fraction < 0) {
        fraction += 1000;
        --seconds;
    }

    const auto t = static_cast<std::time_t>(seconds);
    std::tm tm{};
    if (!gmtime_r(&t, &tm)) {
        return std::to_string(millis);
    }
    return std::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
        tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
        tm.tm_hour, tm.tm_min, tm.tm_sec, fraction);
}

const char* bson_type_name(bson_type_t type) {
    switch (type) {
        case BSON_TYPE_NULL: return "null";
        case BSON_TYPE_BOOL: return "bool";
        case BSON_TYPE_INT32: return "int32";
        case BSON_TYPE_INT64: return "int64";
        case BSON_TYPE_DOUBLE: return "double";
        case BSON_TYPE_UTF8: return "string";
        case BSON_TYPE_OID: return "ObjectId";
        case BSON_TYPE_DATE_TIME: return "DateTime";
        case BSON_TYPE_ARRAY: return "Array";
        case BSON_TYPE_DOCUMENT: return "Document";
        case BSON_TYPE_BINARY: return "Binary";
        case BSON_TYPE_REGEX: return "Regex";
        case BSON_TYPE_TIMESTAMP: return "Timestamp";
        case BSON_TYPE_DECIMAL128: return "Decimal128";
        default: return "unknown";
    }
}

nlohmann::json bson_to_json(const bson_iter_t& iter) {
    const bson_iter_t* it = &iter;

    switch (bson_iter_type(it)) {
        case BSON_TYPE_DOUBLE:
            return bson_iter_double(it);

        case BSON_TYPE_UTF8: {
            uint32_t len = 0;
            const char* s = bson_iter_utf8(it, &len);
            return std::string(s, len);
        }

        case BSON_TYPE_DOCUMENT: {
            auto object = nlohmann::json::object();
            bson_iter_t child;
            if (bson_iter_recurse(it, &child)) {
                while (bson_iter_next(&child)) {
                    object[bson_iter_key(&child)] = bson_to_json(child);
                }
            }
            return object;
        }

        case BSON_TYPE_ARRAY: {
            auto array = nlohmann::json::array();
            bson_iter_t child;
            if (bson_iter_recurse(it, &child)) {
                while (bson_iter_next(&child)) {
                    array.push_back(bson_to_json(child));
                }
            }
            return array;
        }

        case BSON_TYPE_BINARY: {
            bson_subtype_t subtype;
            uint32_t len = 0;
            const uint8_t* data = nullptr;
            bson_iter_binary(it, &subtype, &len, &data);
            return std::format("<binary {} bytes>", len);
        }

        case BSON_TYPE_OID: {
            char hex[25];
            bson_oid_to_string(bson_iter_oid(it), hex);
            return std::string(hex);
        }

        case BSON_TYPE_BOOL:
            return bson_iter_bool(it);

        case BSON_TYPE_DATE_TIME:
            return format_bson_datetime(bson_iter_date_time(it));

        case BSON_TYPE_NULL:
        case BSON_TYPE_UNDEFINED:
            return nullptr;

        case BSON_TYPE_REGEX: {
            const char* options = nullptr;
            const char* pattern = bson_iter_regex(it, &options);
            return std::format("/{}/{}", pattern ? pattern : "", options ? options : "");
        }

        case BSON_TYPE_INT32:
            return bson_iter_int32(it);

        case BSON_TYPE_INT64:
            return bson_iter_int64(it);

        case BSON_TYPE_TIMESTAMP: {
            uint32_t timestamp = 0;
            uint32_t increment = 0;
            bson_iter_timestamp(it, &timestamp, &increment);
            return std::format("Timestamp({}, {})", timestamp, increment);
        }

        case BSON_TYPE_DECIMAL128: {
            bson_decimal128_t dec;
            char text[BSON_DECIMAL128_STRING];
            if (!bson_iter_decimal128(it, &dec)) {
                return nullptr;
            }
            bson_decimal128_to_string(&dec, text);
            return std::string(text);
        }

        case BSON_TYPE_SYMBOL: {
            uint32_t len = 0;
            const char* s = bson_iter_symbol(it, &len);
            return std::string(s, len);
        }

        case BSON_TYPE_CODE: {
            uint32_t len = 0;
            const char* s = bson_iter_code(it, &len);
            return std::string(s, len);
        }

        case BSON_TYPE_MINKEY: return "MinKey";
        case BSON_TYPE_MAXKEY: return "MaxKey";

        default:
            return bson_type_name(bson_iter_type(it));
    }
}

DbValue bson_to_value(const bson_iter_t& iter) {
    const bson_iter_t* it = &iter;

    switch (bson_iter_type(it)) {
        case BSON_TYPE_NULL:
        case BSON_TYPE_UNDEFINED:
            return null_value();
        case BSON_TYPE_BOOL:
            return bson_iter_bool(it);
        case BSON_TYPE_INT32:
            return static_cast<int64_t>(bson_iter_int32(it));
        case BSON_TYPE_INT64:
            return static_cast<int64_t>(bson_iter_int64(it));
        case BSON_TYPE_DOUBLE:
            return bson_iter_double(it);
        case BSON_TYPE_DOCUMENT:
        case BSON_TYPE_ARRAY:
            return OpaqueJson{bson_to_json(iter)};
        default: {
            // Every remaining type renders as text
            auto rendered = bson_to_json(iter);
            if (rendered.is_string()) {
                return rendered.get<std::string>();
            }
            return null_value();
        }
    }
}

nlohmann::json bson_document_to_json(const bson_t* doc) {
    auto object = nlohmann::json::object();
    bson_iter_t iter;
    if (doc && bson_iter_init(&iter, doc)) {
        while (bson_iter_next(&iter)) {
            object[bson_iter_key(&iter)] = bson_to_json(iter);
        }
    }
    return object;
}

namespace {

struct FieldStats {
    std::string name;
    std::set<std::string> types;
    size_t present = 0;
    bool saw_null = false;
};

/// Top-level fields across documents, "_id" first then first-seen order
std::vector<FieldStats> collect_fields(const std::vector<BsonPtr>& docs) {
    std::vector<FieldStats> fields;
    std::unordered_map<std::string, size_t> index;

    auto slot = [&](const std::string& key) -> FieldStats& {
        auto it = index.find(key);
        if (it == index.end()) {
            it = index.emplace(key, fields.size()).first;
            fields.push_back(FieldStats{key, {}, 0, false});
        }
        return fields[it->second];
    };

    for (const auto& doc : docs) {
        bson_iter_t iter;
        if (!bson_iter_init(&iter, doc.get())) {
            continue;
        }
        while (bson_iter_next(&iter)) {
            FieldStats& field = slot(bson_iter_key(&iter));
            const bson_type_t type = bson_iter_type(&iter);
            field.types.insert(bson_type_name(type));
            ++field.present;
            if (type == BSON_TYPE_NULL || type == BSON_TYPE_UNDEFINED) {
                field.saw_null = true;
            }
        }
    }

    const auto id = std::find_if(fields.begin(), fields.end(),
        [](const FieldStats& f) { return f.name == "_id"; });
    if (id != fields.end() && id != fields.begin()) {
        std::rotate(fields.begin(), id, id + 1);
    }
    return fields;
}

std::string join_types(const std::set<std::string>& types) {
    std::string joined;
    for (const auto& t : types) {
        if (!joined.empty()) {
            joined += " | ";
        }
        joined += t;
    }
    return joined;
}

} // namespace

DbQueryResult documents_to_result(const std::vector<BsonPtr>& docs) {
    DbQueryResult result;
    const auto fields = collect_fields(docs);

    std::unordered_map<std::string, size_t> position;
    result.columns.reserve(fields.size());
    for (const auto& field : fields) {
        position.emplace(field.name, result.columns.size());
        DbColumnInfo column;
        column.name = field.name;
        column.data_type = join_types(field.types);
        column.nullable = field.present < docs.size() || field.saw_null;
        column.is_primary_key = field.name == "_id";
        result.columns.push_back(std::move(column));
    }

    result.rows.reserve(docs.size());
    for (const auto& doc : docs) {
        std::vector<DbValue> row(result.columns.size(), null_value());
        bson_iter_t iter;
        if (bson_iter_init(&iter, doc.get())) {
            while (bson_iter_next(&iter)) {
                row[position.at(bson_iter_key(&iter))] = bson_to_value(iter);
            }
        }
        result.rows.push_back(std::move(row));
    }

    check_row_alignment(result);
    return result;
}

DbTableStructure infer_collection_structure(const std::string& collection,
                                            const std::vector<BsonPtr>& docs) {
    DbTableStructure structure;
    structure.table_name = collection;

    for (const auto& field : collect_fields(docs)) {
        DbColumnInfo column;
        column.name = field.name;
        column.data_type = join_types(field.types);
        column.nullable = field.present < docs.size() || field.saw_null;
        column.is_primary_key = field.name == "_id";
        structure.columns.push_back(std::move(column));
    }
    return structure;
}

BsonPtr bson_from_json(const std::string& json) {
    bson_error_t error;
    bson_t* doc = bson_new_from_json(reinterpret_cast<const uint8_t*>(json.data()),
                                     static_cast<ssize_t>(json.size()), &error);
    if (!doc) {
        throw QuerySyntaxError(std::format("Invalid JSON document: {}", error.message));
    }
    return BsonPtr(doc);
}

} // namespace dbaccess
