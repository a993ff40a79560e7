#include <catch2/catch_test_macros.hpp>
#include "db/mongodb/mongo_query.hpp"
#include "db/mongodb/mongo_engine.hpp"
#include "core/error.hpp"

using namespace dbaccess;

TEST_CASE("parse_mongo_query: find document", "[mongo][query]") {
    const auto query = parse_mongo_query(R"({
        "collection": "users",
        "filter": {"age": {"$gt": 30}},
        "projection": {"name": 1},
        "sort": {"name": -1},
        "skip": 5,
        "limit": 10
    })");

    REQUIRE(std::holds_alternative<MongoFindQuery>(query));
    const auto& find = std::get<MongoFindQuery>(query);
    CHECK(find.collection == "users");
    CHECK(find.filter["age"]["$gt"] == 30);
    REQUIRE(find.projection.has_value());
    CHECK((*find.projection)["name"] == 1);
    REQUIRE(find.sort.has_value());
    CHECK((*find.sort)["name"] == -1);
    CHECK(find.skip == 5);
    REQUIRE(find.limit.has_value());
    CHECK(*find.limit == 10);
}

TEST_CASE("parse_mongo_query: find defaults", "[mongo][query]") {
    const auto query = parse_mongo_query(R"(  {"collection": "users"}  )");
    const auto& find = std::get<MongoFindQuery>(query);
    CHECK(find.filter.empty());
    CHECK_FALSE(find.projection.has_value());
    CHECK_FALSE(find.sort.has_value());
    CHECK(find.skip == 0);
    CHECK_FALSE(find.limit.has_value());
}

TEST_CASE("parse_mongo_query: command keeps key order", "[mongo][query]") {
    const auto query = parse_mongo_query(R"({"count": "users", "query": {"active": true}})");

    REQUIRE(std::holds_alternative<MongoCommand>(query));
    const auto& command = std::get<MongoCommand>(query);
    CHECK(command.name == "count");
    CHECK(command.document.begin().key() == "count");
    CHECK(command.document.dump() == R"({"count":"users","query":{"active":true}})");
}

TEST_CASE("parse_mongo_query: malformed text is a syntax error", "[mongo][query]") {
    CHECK_THROWS_AS(parse_mongo_query(""), QuerySyntaxError);
    CHECK_THROWS_AS(parse_mongo_query("   "), QuerySyntaxError);
    CHECK_THROWS_AS(parse_mongo_query(R"({"collection": "users", "filter": {)"), QuerySyntaxError);
    CHECK_THROWS_AS(parse_mongo_query("db.users.find()"), QuerySyntaxError);
    CHECK_THROWS_AS(parse_mongo_query("[1, 2]"), QuerySyntaxError);
    CHECK_THROWS_AS(parse_mongo_query("{}"), QuerySyntaxError);
}

TEST_CASE("parse_mongo_query: bad find options are syntax errors", "[mongo][query]") {
    CHECK_THROWS_AS(parse_mongo_query(R"({"collection": ""})"), QuerySyntaxError);
    CHECK_THROWS_AS(parse_mongo_query(R"({"collection": 5})"), QuerySyntaxError);
    CHECK_THROWS_AS(parse_mongo_query(R"({"collection": "u", "filter": [1]})"), QuerySyntaxError);
    CHECK_THROWS_AS(parse_mongo_query(R"({"collection": "u", "skip": -1})"), QuerySyntaxError);
    CHECK_THROWS_AS(parse_mongo_query(R"({"collection": "u", "limit": "ten"})"), QuerySyntaxError);
    CHECK_THROWS_AS(parse_mongo_query(R"({"collection": "u", "hint": {}})"), QuerySyntaxError);
}

TEST_CASE("classify_mongo_error: connectivity domains", "[mongo][errors]") {
    CHECK(classify_mongo_error(MONGOC_ERROR_SERVER_SELECTION, MONGOC_ERROR_SERVER_SELECTION_FAILURE)
          == ErrorCode::CONNECTION_ERROR);
    CHECK(classify_mongo_error(MONGOC_ERROR_STREAM, MONGOC_ERROR_STREAM_SOCKET)
          == ErrorCode::CONNECTION_ERROR);
    CHECK(classify_mongo_error(MONGOC_ERROR_CLIENT, MONGOC_ERROR_CLIENT_AUTHENTICATE)
          == ErrorCode::CONNECTION_ERROR);
}

TEST_CASE("classify_mongo_error: server codes", "[mongo][errors]") {
    CHECK(classify_mongo_error(MONGOC_ERROR_SERVER, 2) == ErrorCode::QUERY_SYNTAX_ERROR);
    CHECK(classify_mongo_error(MONGOC_ERROR_SERVER, 9) == ErrorCode::QUERY_SYNTAX_ERROR);
    CHECK(classify_mongo_error(MONGOC_ERROR_SERVER, 59) == ErrorCode::QUERY_SYNTAX_ERROR);
    CHECK(classify_mongo_error(MONGOC_ERROR_SERVER, 26) == ErrorCode::NOT_FOUND);
    CHECK(classify_mongo_error(MONGOC_ERROR_SERVER, 50) == ErrorCode::TIMEOUT);
    CHECK(classify_mongo_error(MONGOC_ERROR_SERVER, 18) == ErrorCode::CONNECTION_ERROR);
    CHECK(classify_mongo_error(MONGOC_ERROR_SERVER, 11000) == ErrorCode::DRIVER_ERROR);
}

TEST_CASE("classify_mongo_error: parse and argument errors", "[mongo][errors]") {
    CHECK(classify_mongo_error(MONGOC_ERROR_BSON, MONGOC_ERROR_BSON_INVALID)
          == ErrorCode::QUERY_SYNTAX_ERROR);
    CHECK(classify_mongo_error(MONGOC_ERROR_COMMAND, MONGOC_ERROR_COMMAND_INVALID_ARG)
          == ErrorCode::QUERY_SYNTAX_ERROR);
    CHECK(classify_mongo_error(MONGOC_ERROR_COMMAND, 0)
          == ErrorCode::DRIVER_ERROR);
}
