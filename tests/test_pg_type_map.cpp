#include <catch2/catch_test_macros.hpp>
#include "db/postgresql/pg_type_map.hpp"
#include "db/postgresql/pg_connection.hpp"

using namespace dbaccess;

TEST_CASE("PgTypeMap: OID names match information_schema spelling", "[pg][types]") {
    CHECK(PgTypeMap::oid_to_type_name(23) == "integer");
    CHECK(PgTypeMap::oid_to_type_name(25) == "text");
    CHECK(PgTypeMap::oid_to_type_name(1184) == "timestamp with time zone");
    CHECK(PgTypeMap::oid_to_type_name(999999) == "unknown");
}

TEST_CASE("PgTypeMap: OIDs classify into generic types", "[pg][types]") {
    CHECK(PgTypeMap::oid_to_generic_type(20) == GenericColumnType::BIGINT);
    CHECK(PgTypeMap::oid_to_generic_type(1700) == GenericColumnType::NUMERIC);
    CHECK(PgTypeMap::oid_to_generic_type(1007) == GenericColumnType::ARRAY);
    CHECK(PgTypeMap::oid_to_generic_type(999999) == GenericColumnType::UNKNOWN);
}

TEST_CASE("PgTypeMap: to_value normalizes text cells", "[pg][types]") {
    CHECK(std::get<bool>(PgTypeMap::to_value(GenericColumnType::BOOLEAN, "t")));
    CHECK_FALSE(std::get<bool>(PgTypeMap::to_value(GenericColumnType::BOOLEAN, "f")));
    CHECK(std::get<int64_t>(PgTypeMap::to_value(GenericColumnType::BIGINT, "-9000000000"))
          == -9000000000LL);
    CHECK(std::get<double>(PgTypeMap::to_value(GenericColumnType::DOUBLE_PRECISION, "2.5")) == 2.5);

    // Fixed point stays exact
    CHECK(std::get<std::string>(PgTypeMap::to_value(GenericColumnType::NUMERIC, "12.500"))
          == "12.500");

    const auto doc = PgTypeMap::to_value(GenericColumnType::JSONB, R"({"a": [1, 2]})");
    REQUIRE(std::holds_alternative<OpaqueJson>(doc));
    CHECK(std::get<OpaqueJson>(doc).value["a"][1] == 2);

    CHECK(std::get<std::string>(PgTypeMap::to_value(GenericColumnType::TIMESTAMP_TZ,
        "2024-01-31 12:00:00+00")) == "2024-01-31 12:00:00+00");
}

TEST_CASE("PgTypeMap: unparsable text falls back to a string", "[pg][types]") {
    CHECK(std::get<std::string>(PgTypeMap::to_value(GenericColumnType::INTEGER, "12abc")) == "12abc");
    CHECK(std::get<std::string>(PgTypeMap::to_value(GenericColumnType::REAL, "NaNish")) == "NaNish");
    CHECK(std::get<std::string>(PgTypeMap::to_value(GenericColumnType::BOOLEAN, "yes")) == "yes");
    CHECK(std::get<std::string>(PgTypeMap::to_value(GenericColumnType::JSON, "{broken")) == "{broken");
}

TEST_CASE("classify_sqlstate maps SQLSTATE classes", "[pg][errors]") {
    CHECK(classify_sqlstate("42601") == ErrorCode::QUERY_SYNTAX_ERROR);
    CHECK(classify_sqlstate("42P01") == ErrorCode::QUERY_SYNTAX_ERROR);
    CHECK(classify_sqlstate("08006") == ErrorCode::CONNECTION_ERROR);
    CHECK(classify_sqlstate("57014") == ErrorCode::TIMEOUT);
    CHECK(classify_sqlstate("57P01") == ErrorCode::CONNECTION_ERROR);
    CHECK(classify_sqlstate("23505") == ErrorCode::DRIVER_ERROR);
    CHECK(classify_sqlstate("abc") == ErrorCode::DRIVER_ERROR);
    CHECK(classify_sqlstate("") == ErrorCode::DRIVER_ERROR);
}
