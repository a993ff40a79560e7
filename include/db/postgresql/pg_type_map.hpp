#pragma once

#include "core/column_type.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace dbaccess {

/**
 * @brief PostgreSQL type mapping utilities
 *
 * Maps result-column OIDs to display names and GenericColumnType, and
 * normalizes text cells into DbValue. The mapping is deterministic: the same
 * OID and text always produce the same value.
 */
class PgTypeMap {
public:
    /**
     * @brief Map PostgreSQL OID to GenericColumnType
     * @param oid PostgreSQL type OID
     * @return Generic column type
     */
    [[nodiscard]] static GenericColumnType oid_to_generic_type(uint32_t oid);

    /**
     * @brief Display name for a result column's OID
     *
     * Uses the same spelling information_schema reports ("integer", "text",
     * "timestamp with time zone"); "unknown" for unmapped OIDs.
     */
    [[nodiscard]] static std::string oid_to_type_name(uint32_t oid);

    /**
     * @brief Normalize one text-format cell
     *
     * Integers and booleans become native values, floats become double,
     * fixed-point stays text, json/jsonb becomes OpaqueJson. Text that fails
     * to parse for its declared type is kept as a string.
     */
    [[nodiscard]] static DbValue to_value(GenericColumnType type, std::string_view text);
};

} // namespace dbaccess
