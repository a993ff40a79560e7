#include "core/result_json.hpp"

#include <type_traits>

namespace dbaccess {

void to_json(nlohmann::json& j, const DbValue& value) {
    std::visit([&j](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            j = nullptr;
        } else if constexpr (std::is_same_v<T, OpaqueJson>) {
            j = v.value;
        } else {
            j = v;
        }
    }, value);
}

void to_json(nlohmann::json& j, const DbTableInfo& table) {
    j = nlohmann::json{
        {"name", table.name},
        {"table_type", table_kind_to_string(table.kind)},
    };
    j["schema"] = table.schema ? nlohmann::json(*table.schema) : nlohmann::json(nullptr);
    j["row_count"] = table.row_count ? nlohmann::json(*table.row_count) : nlohmann::json(nullptr);
}

void to_json(nlohmann::json& j, const DbSchema& schema) {
    j = nlohmann::json{{"tables", schema.tables}};
}

void to_json(nlohmann::json& j, const DbColumnInfo& column) {
    j = nlohmann::json{
        {"name", column.name},
        {"data_type", column.data_type},
        {"is_primary_key", column.is_primary_key},
    };
    j["nullable"] = column.nullable ? nlohmann::json(*column.nullable) : nlohmann::json(nullptr);
    j["default_value"] = column.default_value
        ? nlohmann::json(*column.default_value) : nlohmann::json(nullptr);
}

void to_json(nlohmann::json& j, const DbTableStructure& structure) {
    j = nlohmann::json{
        {"table_name", structure.table_name},
        {"columns", structure.columns},
    };
    j["schema"] = structure.schema ? nlohmann::json(*structure.schema) : nlohmann::json(nullptr);
}

void to_json(nlohmann::json& j, const DbQueryResult& result) {
    nlohmann::json rows = nlohmann::json::array();
    for (const auto& row : result.rows) {
        nlohmann::json cells = nlohmann::json::array();
        for (const auto& cell : row) {
            nlohmann::json value;
            to_json(value, cell);
            cells.push_back(std::move(value));
        }
        rows.push_back(std::move(cells));
    }

    j = nlohmann::json{
        {"columns", result.columns},
        {"rows", std::move(rows)},
        {"execution_time_ms", result.execution_time_ms},
        {"has_more", result.has_more},
    };
    j["affected_rows"] = result.affected_rows
        ? nlohmann::json(*result.affected_rows) : nlohmann::json(nullptr);
    j["total_count"] = result.total_count
        ? nlohmann::json(*result.total_count) : nlohmann::json(nullptr);
}

} // namespace dbaccess
