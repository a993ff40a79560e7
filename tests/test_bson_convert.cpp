#include <catch2/catch_test_macros.hpp>
#include "db/mongodb/bson_convert.hpp"
#include "core/error.hpp"

using namespace dbaccess;

namespace {

DbValue value_of(const BsonPtr& doc, const char* key) {
    bson_iter_t iter;
    REQUIRE(bson_iter_init_find(&iter, doc.get(), key));
    return bson_to_value(iter);
}

std::vector<BsonPtr> docs_from(std::initializer_list<const char*> texts) {
    std::vector<BsonPtr> docs;
    for (const char* text : texts) {
        docs.push_back(bson_from_json(text));
    }
    return docs;
}

} // namespace

TEST_CASE("bson_to_value maps scalars to native values", "[bson]") {
    auto doc = bson_from_json(R"({
        "name": "ada",
        "age": 36,
        "big": {"$numberLong": "9007199254740993"},
        "score": 9.5,
        "active": true,
        "nothing": null
    })");

    CHECK(std::get<std::string>(value_of(doc, "name")) == "ada");
    CHECK(std::get<int64_t>(value_of(doc, "age")) == 36);
    CHECK(std::get<int64_t>(value_of(doc, "big")) == 9007199254740993LL);
    CHECK(std::get<double>(value_of(doc, "score")) == 9.5);
    CHECK(std::get<bool>(value_of(doc, "active")));
    CHECK(is_null(value_of(doc, "nothing")));
}

TEST_CASE("bson_to_value renders special types as text", "[bson]") {
    auto doc = bson_from_json(R"({
        "_id": {"$oid": "65a1b2c3d4e5f6a7b8c9d0e1"},
        "when": {"$date": {"$numberLong": "1706702400000"}},
        "price": {"$numberDecimal": "12.50"},
        "blob": {"$binary": "AQID", "$type": "00"},
        "pattern": {"$regex": "^a", "$options": "i"},
        "ts": {"$timestamp": {"t": 1700000000, "i": 3}}
    })");

    CHECK(std::get<std::string>(value_of(doc, "_id")) == "65a1b2c3d4e5f6a7b8c9d0e1");
    CHECK(std::get<std::string>(value_of(doc, "when")) == "2024-01-31T12:00:00.000Z");
    CHECK(std::get<std::string>(value_of(doc, "price")) == "12.50");
    CHECK(std::get<std::string>(value_of(doc, "blob")) == "<binary 3 bytes>");
    CHECK(std::get<std::string>(value_of(doc, "pattern")) == "/^a/i");
    CHECK(std::get<std::string>(value_of(doc, "ts")) == "Timestamp(1700000000, 3)");
}

TEST_CASE("bson_to_value keeps documents and arrays as opaque JSON", "[bson]") {
    auto doc = bson_from_json(R"({
        "address": {"city": "London", "zip": {"$oid": "65a1b2c3d4e5f6a7b8c9d0e1"}},
        "tags": ["a", 2, true]
    })");

    const auto address = std::get<OpaqueJson>(value_of(doc, "address"));
    CHECK(address.value["city"] == "London");
    CHECK(address.value["zip"] == "65a1b2c3d4e5f6a7b8c9d0e1");

    const auto tags = std::get<OpaqueJson>(value_of(doc, "tags"));
    REQUIRE(tags.value.is_array());
    CHECK(tags.value.size() == 3);
    CHECK(tags.value[1] == 2);
    CHECK(tags.value[2] == true);
}

TEST_CASE("bson_document_to_json converts a whole document", "[bson]") {
    auto doc = bson_from_json(R"({"a": 1, "b": {"c": [1, 2]}, "d": null})");
    const auto j = bson_document_to_json(doc.get());

    CHECK(j["a"] == 1);
    CHECK(j["b"]["c"] == nlohmann::json::array({1, 2}));
    CHECK(j["d"].is_null());
    CHECK(bson_document_to_json(nullptr) == nlohmann::json::object());
}

TEST_CASE("format_bson_datetime handles the epoch and earlier instants", "[bson]") {
    CHECK(format_bson_datetime(0) == "1970-01-01T00:00:00.000Z");
    CHECK(format_bson_datetime(1500) == "1970-01-01T00:00:01.500Z");
    CHECK(format_bson_datetime(-1) == "1969-12-31T23:59:59.999Z");
}

TEST_CASE("bson_type_name spells BSON types", "[bson]") {
    CHECK(std::string(bson_type_name(BSON_TYPE_INT32)) == "int32");
    CHECK(std::string(bson_type_name(BSON_TYPE_UTF8)) == "string");
    CHECK(std::string(bson_type_name(BSON_TYPE_OID)) == "ObjectId");
    CHECK(std::string(bson_type_name(BSON_TYPE_DOCUMENT)) == "Document");
    CHECK(std::string(bson_type_name(BSON_TYPE_MINKEY)) == "unknown");
}

TEST_CASE("bson_from_json rejects malformed text", "[bson]") {
    CHECK_THROWS_AS(bson_from_json("{\"a\": "), QuerySyntaxError);
    CHECK_THROWS_AS(bson_from_json("not json"), QuerySyntaxError);
}

TEST_CASE("documents_to_result aligns heterogeneous documents", "[bson]") {
    const auto docs = docs_from({
        R"({"name": "ada", "_id": 1, "age": 36})",
        R"({"_id": 2, "name": "grace", "email": "g@example.com", "age": null})",
    });

    const auto result = documents_to_result(docs);
    REQUIRE(result.columns.size() == 4);
    CHECK(result.column_names() == std::vector<std::string>{"_id", "name", "age", "email"});

    CHECK(result.columns[0].is_primary_key);
    CHECK(result.columns[0].nullable == false);
    CHECK(result.columns[1].data_type == "string");
    CHECK(result.columns[2].data_type == "int32 | null");
    CHECK(result.columns[2].nullable == true);
    CHECK(result.columns[3].nullable == true);

    REQUIRE(result.rows.size() == 2);
    for (const auto& row : result.rows) {
        CHECK(row.size() == result.columns.size());
    }
    CHECK(std::get<int64_t>(result.rows[0][0]) == 1);
    CHECK(std::get<std::string>(result.rows[0][1]) == "ada");
    CHECK(is_null(result.rows[0][3]));
    CHECK(is_null(result.rows[1][2]));
    CHECK(std::get<std::string>(result.rows[1][3]) == "g@example.com");
}

TEST_CASE("documents_to_result with no documents is empty but well-formed", "[bson]") {
    const auto result = documents_to_result({});
    CHECK(result.columns.empty());
    CHECK(result.rows.empty());
}

TEST_CASE("infer_collection_structure unions sampled fields", "[bson]") {
    const auto docs = docs_from({
        R"({"_id": 1, "qty": 5})",
        R"({"_id": 2, "qty": "five", "note": "typo"})",
        R"({"_id": 3, "qty": {"$numberLong": "7"}})",
    });

    const auto structure = infer_collection_structure("orders", docs);
    CHECK(structure.table_name == "orders");
    CHECK_FALSE(structure.schema.has_value());
    REQUIRE(structure.columns.size() == 3);

    CHECK(structure.columns[0].name == "_id");
    CHECK(structure.columns[0].is_primary_key);
    CHECK(structure.columns[1].name == "qty");
    CHECK(structure.columns[1].data_type == "int32 | int64 | string");
    CHECK(structure.columns[1].nullable == false);
    CHECK(structure.columns[2].name == "note");
    CHECK(structure.columns[2].nullable == true);
}
