#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <format>
#include <string>
#include <string_view>
#include <unordered_map>

#include "core/error.hpp"

namespace dbaccess {

namespace keys {
    inline constexpr std::string_view POSTGRES = "postgres";
    inline constexpr std::string_view POSTGRESQL = "postgresql";
    inline constexpr std::string_view PG = "pg";
    inline constexpr std::string_view MONGODB = "mongodb";
    inline constexpr std::string_view MONGO = "mongo";
}

/**
 * @brief Backend kind tag of a ConnectionSpec
 */
enum class DatabaseType {
    POSTGRESQL,
    MONGODB,
};

[[nodiscard]] inline std::string_view database_type_to_string(DatabaseType type) {
    switch (type) {
        case DatabaseType::POSTGRESQL: return keys::POSTGRESQL;
        case DatabaseType::MONGODB: return keys::MONGODB;
        default: return "unknown";
    }
}

/// Human-readable backend name for display ("PostgreSQL", "MongoDB")
[[nodiscard]] inline std::string_view database_type_display_name(DatabaseType type) {
    switch (type) {
        case DatabaseType::POSTGRESQL: return "PostgreSQL";
        case DatabaseType::MONGODB: return "MongoDB";
        default: return "Unknown";
    }
}

/// Default server port for a backend kind
[[nodiscard]] inline uint16_t default_port(DatabaseType type) {
    switch (type) {
        case DatabaseType::POSTGRESQL: return 5432;
        case DatabaseType::MONGODB: return 27017;
        default: return 0;
    }
}

/**
 * @brief Parse a backend kind tag ("postgresql", "pg", "mongo", ...)
 * @throws InvalidArgumentError for an unknown tag
 */
[[nodiscard]] inline DatabaseType parse_database_type(std::string_view type_str) {
    static const std::unordered_map<std::string_view, DatabaseType> lookup = {
        {keys::POSTGRESQL, DatabaseType::POSTGRESQL},
        {keys::POSTGRES,   DatabaseType::POSTGRESQL},
        {keys::PG,         DatabaseType::POSTGRESQL},
        {keys::MONGODB,    DatabaseType::MONGODB},
        {keys::MONGO,      DatabaseType::MONGODB},
    };

    if (const auto it = lookup.find(type_str); it != lookup.end()) {
        return it->second;
    }

    // Case-insensitive fallback, only when the direct lookup misses
    for (const auto& [key, value] : lookup) {
        if (key.size() == type_str.size()) {
            const bool match = std::equal(key.begin(), key.end(), type_str.begin(),
                [](char a, char b) {
                    return std::tolower(static_cast<unsigned char>(a)) ==
                           std::tolower(static_cast<unsigned char>(b));
                });
            if (match) return value;
        }
    }

    throw InvalidArgumentError(std::format("Unknown database type: {}", type_str));
}

} // namespace dbaccess
