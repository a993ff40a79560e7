#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace dbaccess {

// ============================================================================
// Normalized scalar values
// ============================================================================

/**
 * @brief Nested or document value carried through as JSON
 *
 * Wrapped so that DbValue construction from strings is never ambiguous.
 */
struct OpaqueJson {
    nlohmann::json value;

    bool operator==(const OpaqueJson& other) const { return value == other.value; }
};

/**
 * @brief One cell of a DbQueryResult row
 *
 * null | boolean | integer | float | string | opaque JSON.
 * Fixed-point numbers are carried as strings to avoid precision loss.
 */
using DbValue = std::variant<std::monostate, bool, int64_t, double, std::string, OpaqueJson>;

enum class ValueKind : uint8_t {
    NULL_VALUE,
    BOOLEAN,
    INTEGER,
    FLOAT,
    STRING,
    JSON,
};

[[nodiscard]] inline ValueKind value_kind(const DbValue& v) {
    return static_cast<ValueKind>(v.index());
}

[[nodiscard]] inline bool is_null(const DbValue& v) {
    return std::holds_alternative<std::monostate>(v);
}

[[nodiscard]] inline DbValue null_value() { return DbValue{std::monostate{}}; }

// ============================================================================
// Schema / structure / query result
// ============================================================================

enum class TableKind : uint8_t {
    TABLE,
    VIEW,
    MATERIALIZED_VIEW,
    FOREIGN_TABLE,
    COLLECTION,
};

[[nodiscard]] inline const char* table_kind_to_string(TableKind kind) {
    switch (kind) {
        case TableKind::TABLE: return "table";
        case TableKind::VIEW: return "view";
        case TableKind::MATERIALIZED_VIEW: return "materialized_view";
        case TableKind::FOREIGN_TABLE: return "foreign_table";
        case TableKind::COLLECTION: return "collection";
        default: return "table";
    }
}

/**
 * @brief A table or collection in a DbSchema
 */
struct DbTableInfo {
    std::string name;
    std::optional<std::string> schema;   // owning schema (Postgres), absent for Mongo
    TableKind kind = TableKind::TABLE;
    std::optional<uint64_t> row_count;   // estimate; absent when not known
};

struct DbSchema {
    std::vector<DbTableInfo> tables;
};

/**
 * @brief Column or document field descriptor
 *
 * data_type is a normalized string ("integer", "text", "int32 | string").
 */
struct DbColumnInfo {
    std::string name;
    std::string data_type;
    std::optional<bool> nullable;        // absent when the backend doesn't say
    bool is_primary_key = false;
    std::optional<std::string> default_value;
};

struct DbTableStructure {
    std::string table_name;
    std::optional<std::string> schema;
    std::vector<DbColumnInfo> columns;
};

/**
 * @brief Normalized rows returned by table-data and ad-hoc query operations
 *
 * Every row holds exactly columns.size() values, aligned by position.
 * Statements that return no rows produce zero columns and zero rows.
 */
struct DbQueryResult {
    std::vector<DbColumnInfo> columns;
    std::vector<std::vector<DbValue>> rows;

    std::optional<uint64_t> affected_rows;  // write statements
    std::optional<uint64_t> total_count;    // only when cheaply available
    uint64_t execution_time_ms = 0;
    bool has_more = false;

    [[nodiscard]] std::vector<std::string> column_names() const {
        std::vector<std::string> names;
        names.reserve(columns.size());
        for (const auto& c : columns) {
            names.push_back(c.name);
        }
        return names;
    }
};

/**
 * @brief Reject negative pagination parameters
 * @throws InvalidArgumentError
 */
void validate_page(int64_t offset, int64_t limit);

/**
 * @brief Verify that every row has one value per column
 * @throws DriverError naming the first misaligned row
 */
void check_row_alignment(const DbQueryResult& result);

} // namespace dbaccess
