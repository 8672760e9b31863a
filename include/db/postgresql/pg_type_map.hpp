#pragma once

#include <cstdint>
#include <string>

namespace sqlrunner {

/**
 * @brief PostgreSQL type OID to display name mapping
 *
 * Only the common built-in types are named; everything else (including
 * user-defined types, whose OIDs vary per database) reports "string".
 */
class PgTypeMap {
public:
    static constexpr const char* kDefaultTypeName = "string";

    /**
     * @brief Map PostgreSQL OID to the name shown next to column headers
     * @param oid PostgreSQL type OID
     * @return Type name, or "string" if unknown
     */
    [[nodiscard]] static std::string oid_to_type_name(uint32_t oid);
};

} // namespace sqlrunner
