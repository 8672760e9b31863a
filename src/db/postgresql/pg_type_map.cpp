#include "db/postgresql/pg_type_map.hpp"
#include <unordered_map>

namespace sqlrunner {

std::string PgTypeMap::oid_to_type_name(uint32_t oid) {
    static const std::unordered_map<uint32_t, std::string> OID_TO_NAME = {
        {16, "bool"},
        {17, "bytea"},
        {20, "int8"},
        {21, "int2"},
        {23, "int4"},
        {25, "text"},
        {114, "json"},
        {1043, "varchar"},
        {1082, "date"},
        {1114, "timestamp"},
        {1184, "timestamptz"},
        {1700, "numeric"},
    };

    auto it = OID_TO_NAME.find(oid);
    return it != OID_TO_NAME.end() ? it->second : kDefaultTypeName;
}

} // namespace sqlrunner
