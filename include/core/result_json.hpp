#pragma once

#include "core/types.hpp"

#include <nlohmann/json.hpp>

namespace dbaccess {

// nlohmann ADL serializers for the result model (used by the CLI)

void to_json(nlohmann::json& j, const DbValue& value);
void to_json(nlohmann::json& j, const DbTableInfo& table);
void to_json(nlohmann::json& j, const DbSchema& schema);
void to_json(nlohmann::json& j, const DbColumnInfo& column);
void to_json(nlohmann::json& j, const DbTableStructure& structure);
void to_json(nlohmann::json& j, const DbQueryResult& result);

} // namespace dbaccess
