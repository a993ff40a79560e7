#include "db/postgresql/pg_type_map.hpp"

#include <charconv>
#include <unordered_map>

namespace dbaccess {

namespace {

struct OidInfo {
    GenericColumnType generic;
    const char* name;
};

const std::unordered_map<uint32_t, OidInfo>& oid_table() {
    static const std::unordered_map<uint32_t, OidInfo> OIDS = {
        {16,   {GenericColumnType::BOOLEAN, "boolean"}},
        {17,   {GenericColumnType::BLOB, "bytea"}},
        {18,   {GenericColumnType::CHAR, "\"char\""}},
        {19,   {GenericColumnType::TEXT, "name"}},
        {20,   {GenericColumnType::BIGINT, "bigint"}},
        {21,   {GenericColumnType::SMALLINT, "smallint"}},
        {23,   {GenericColumnType::INTEGER, "integer"}},
        {25,   {GenericColumnType::TEXT, "text"}},
        {26,   {GenericColumnType::BIGINT, "oid"}},
        {114,  {GenericColumnType::JSON, "json"}},
        {142,  {GenericColumnType::XML, "xml"}},
        {600,  {GenericColumnType::VENDOR_SPECIFIC, "point"}},
        {601,  {GenericColumnType::VENDOR_SPECIFIC, "lseg"}},
        {602,  {GenericColumnType::VENDOR_SPECIFIC, "path"}},
        {603,  {GenericColumnType::VENDOR_SPECIFIC, "box"}},
        {604,  {GenericColumnType::VENDOR_SPECIFIC, "polygon"}},
        {628,  {GenericColumnType::VENDOR_SPECIFIC, "line"}},
        {650,  {GenericColumnType::INET, "cidr"}},
        {700,  {GenericColumnType::REAL, "real"}},
        {701,  {GenericColumnType::DOUBLE_PRECISION, "double precision"}},
        {718,  {GenericColumnType::VENDOR_SPECIFIC, "circle"}},
        {790,  {GenericColumnType::MONEY, "money"}},
        {829,  {GenericColumnType::MACADDR, "macaddr"}},
        {869,  {GenericColumnType::INET, "inet"}},
        {1042, {GenericColumnType::CHAR, "character"}},
        {1043, {GenericColumnType::VARCHAR, "character varying"}},
        {1082, {GenericColumnType::DATE, "date"}},
        {1083, {GenericColumnType::TIME, "time without time zone"}},
        {1114, {GenericColumnType::TIMESTAMP, "timestamp without time zone"}},
        {1184, {GenericColumnType::TIMESTAMP_TZ, "timestamp with time zone"}},
        {1186, {GenericColumnType::INTERVAL, "interval"}},
        {1266, {GenericColumnType::TIME, "time with time zone"}},
        {1700, {GenericColumnType::NUMERIC, "numeric"}},
        {2950, {GenericColumnType::UUID, "uuid"}},
        {3614, {GenericColumnType::VENDOR_SPECIFIC, "tsvector"}},
        {3615, {GenericColumnType::VENDOR_SPECIFIC, "tsquery"}},
        {3802, {GenericColumnType::JSONB, "jsonb"}},
        // Common array types
        {1000, {GenericColumnType::ARRAY, "boolean[]"}},
        {1005, {GenericColumnType::ARRAY, "smallint[]"}},
        {1007, {GenericColumnType::ARRAY, "integer[]"}},
        {1009, {GenericColumnType::ARRAY, "text[]"}},
        {1015, {GenericColumnType::ARRAY, "character varying[]"}},
        {1016, {GenericColumnType::ARRAY, "bigint[]"}},
        {1021, {GenericColumnType::ARRAY, "real[]"}},
        {1022, {GenericColumnType::ARRAY, "double precision[]"}},
        {1231, {GenericColumnType::ARRAY, "numeric[]"}},
        {2277, {GenericColumnType::ARRAY, "anyarray"}},
        {2951, {GenericColumnType::ARRAY, "uuid[]"}},
        {3807, {GenericColumnType::ARRAY, "jsonb[]"}},
    };
    return OIDS;
}

} // namespace

GenericColumnType PgTypeMap::oid_to_generic_type(uint32_t oid) {
    const auto& table = oid_table();
    auto it = table.find(oid);
    return it != table.end() ? it->second.generic : GenericColumnType::UNKNOWN;
}

std::string PgTypeMap::oid_to_type_name(uint32_t oid) {
    const auto& table = oid_table();
    auto it = table.find(oid);
    return it != table.end() ? it->second.name : "unknown";
}

DbValue PgTypeMap::to_value(GenericColumnType type, std::string_view text) {
    const char* first = text.data();
    const char* last = text.data() + text.size();

    switch (type) {
        case GenericColumnType::BOOLEAN:
            if (text == "t") return true;
            if (text == "f") return false;
            break;

        case GenericColumnType::SMALLINT:
        case GenericColumnType::INTEGER:
        case GenericColumnType::BIGINT: {
            int64_t v = 0;
            const auto [ptr, ec] = std::from_chars(first, last, v);
            if (ec == std::errc() && ptr == last) return v;
            break;
        }

        case GenericColumnType::REAL:
        case GenericColumnType::DOUBLE_PRECISION: {
            double v = 0.0;
            const auto [ptr, ec] = std::from_chars(first, last, v);
            if (ec == std::errc() && ptr == last) return v;
            break;
        }

        case GenericColumnType::JSON:
        case GenericColumnType::JSONB: {
            auto parsed = nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/false);
            if (!parsed.is_discarded()) return OpaqueJson{std::move(parsed)};
            break;
        }

        default:
            break;
    }

    // NUMERIC and MONEY land here on purpose: fixed-point stays exact as text
    return std::string(text);
}

} // namespace dbaccess
