#pragma once

#include <cstdint>

namespace dbaccess {

/**
 * @brief Database-agnostic column type classification
 *
 * Maps from vendor-specific types (PG OIDs). Drives how raw cell text is
 * normalized into a DbValue.
 */
enum class GenericColumnType : uint16_t {
    UNKNOWN = 0,

    // Integer family
    SMALLINT,
    INTEGER,
    BIGINT,

    // Floating point
    REAL,
    DOUBLE_PRECISION,

    // Fixed point (kept as text)
    NUMERIC,
    MONEY,

    // String family
    TEXT,
    VARCHAR,
    CHAR,

    BOOLEAN,

    // Date/Time
    DATE,
    TIME,
    TIMESTAMP,
    TIMESTAMP_TZ,
    INTERVAL,

    BLOB,

    JSON,
    JSONB,

    UUID,

    // Network
    INET,
    MACADDR,

    XML,

    ARRAY,

    // Vendor-specific fallback
    VENDOR_SPECIFIC,
};

} // namespace dbaccess
