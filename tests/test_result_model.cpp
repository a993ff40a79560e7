#include <catch2/catch_test_macros.hpp>
#include "core/types.hpp"
#include "core/result_json.hpp"
#include "core/database_type.hpp"
#include "core/error.hpp"

using namespace dbaccess;

TEST_CASE("validate_page rejects negative values only", "[model]") {
    CHECK_NOTHROW(validate_page(0, 0));
    CHECK_NOTHROW(validate_page(100, 50));
    CHECK_THROWS_AS(validate_page(-1, 10), InvalidArgumentError);
    CHECK_THROWS_AS(validate_page(0, -1), InvalidArgumentError);
}

TEST_CASE("check_row_alignment flags short rows", "[model]") {
    DbQueryResult result;
    result.columns = {{"a", "integer"}, {"b", "text"}};
    result.rows.push_back({int64_t{1}, std::string("x")});
    CHECK_NOTHROW(check_row_alignment(result));

    result.rows.push_back({int64_t{2}});
    CHECK_THROWS_AS(check_row_alignment(result), DriverError);
}

TEST_CASE("value_kind follows the variant alternative", "[model]") {
    CHECK(value_kind(null_value()) == ValueKind::NULL_VALUE);
    CHECK(value_kind(DbValue{true}) == ValueKind::BOOLEAN);
    CHECK(value_kind(DbValue{int64_t{7}}) == ValueKind::INTEGER);
    CHECK(value_kind(DbValue{1.5}) == ValueKind::FLOAT);
    CHECK(value_kind(DbValue{std::string("s")}) == ValueKind::STRING);
    CHECK(value_kind(DbValue{OpaqueJson{nlohmann::json::object()}}) == ValueKind::JSON);
    CHECK(is_null(DbValue{}));
}

TEST_CASE("Result carries either a value or an error", "[model]") {
    auto ok = Result<int>::ok(42);
    CHECK(ok.is_ok());
    CHECK(ok.value() == 42);

    auto failed = Result<int>::error(ErrorCode::NOT_FOUND, "Unknown connection id: x");
    CHECK(failed.is_error());
    CHECK(failed.error_code() == ErrorCode::NOT_FOUND);
    CHECK(failed.error_message() == "Unknown connection id: x");
}

TEST_CASE("error codes and table kinds have stable names", "[model]") {
    CHECK(error_code_to_string(ErrorCode::QUERY_SYNTAX_ERROR) == "query_syntax_error");
    CHECK(error_code_to_string(ErrorCode::TIMEOUT) == "timeout");
    CHECK(std::string(table_kind_to_string(TableKind::MATERIALIZED_VIEW)) == "materialized_view");
    CHECK(std::string(table_kind_to_string(TableKind::COLLECTION)) == "collection");
}

TEST_CASE("parse_database_type accepts aliases in any case", "[model]") {
    CHECK(parse_database_type("postgresql") == DatabaseType::POSTGRESQL);
    CHECK(parse_database_type("pg") == DatabaseType::POSTGRESQL);
    CHECK(parse_database_type("Postgres") == DatabaseType::POSTGRESQL);
    CHECK(parse_database_type("MONGO") == DatabaseType::MONGODB);
    CHECK_THROWS_AS(parse_database_type("mysql"), InvalidArgumentError);

    CHECK(default_port(DatabaseType::POSTGRESQL) == 5432);
    CHECK(default_port(DatabaseType::MONGODB) == 27017);
}

TEST_CASE("result_json renders a query result", "[model][json]") {
    DbQueryResult result;
    result.columns = {{"id", "integer", false, true}, {"doc", "jsonb"}};
    result.rows.push_back({int64_t{1}, OpaqueJson{nlohmann::json{{"k", "v"}}}});
    result.rows.push_back({int64_t{2}, null_value()});
    result.total_count = 2;

    nlohmann::json j = result;
    CHECK(j["columns"][0]["name"] == "id");
    CHECK(j["columns"][0]["is_primary_key"] == true);
    CHECK(j["columns"][0]["nullable"] == false);
    CHECK(j["columns"][1]["nullable"].is_null());
    CHECK(j["rows"][0][1]["k"] == "v");
    CHECK(j["rows"][1][1].is_null());
    CHECK(j["total_count"] == 2);
    CHECK(j["affected_rows"].is_null());
    CHECK(j["has_more"] == false);
}

TEST_CASE("result_json renders a schema", "[model][json]") {
    DbSchema schema;
    schema.tables.push_back({"users", std::string("public"), TableKind::TABLE, 12});
    schema.tables.push_back({"events", std::nullopt, TableKind::COLLECTION, std::nullopt});

    nlohmann::json j = schema;
    REQUIRE(j["tables"].size() == 2);
    CHECK(j["tables"][0]["schema"] == "public");
    CHECK(j["tables"][0]["row_count"] == 12);
    CHECK(j["tables"][1]["table_type"] == "collection");
    CHECK(j["tables"][1]["schema"].is_null());
}
