/**
 * @file status_oids.hpp
 * @brief Fixed table of printer status fields and their OIDs.
 *
 * @copyright Copyright (c) 2024 qlnet Contributors
 * @license MIT License
 */

#pragma once

#include "qlnet/snmp/export.hpp"

#include <array>
#include <optional>
#include <string>

namespace qlnet {
namespace snmp {

/**
 * @enum StatusField
 * @brief Logical status fields a printer answers over SNMP.
 */
enum class StatusField {
    IP,
    NETMASK,
    MAC,
    LOCATION,
    MODEL,
    SERIAL,
    STATUS
};

struct StatusOidEntry {
    StatusField field;
    const char* name;
    const char* oid;
};

// netmask and mac share an OID in the printer's private MIB.
inline constexpr std::array<StatusOidEntry, 7> STATUS_OID_TABLE = {{
    {StatusField::IP,       "ip",       "1.3.6.1.4.1.1240.2.3.4.5.2.3.0"},
    {StatusField::NETMASK,  "netmask",  "1.3.6.1.4.1.1240.2.3.4.5.2.4.0"},
    {StatusField::MAC,      "mac",      "1.3.6.1.4.1.1240.2.3.4.5.2.4.0"},
    {StatusField::LOCATION, "location", "1.3.6.1.2.1.1.6.0"},
    {StatusField::MODEL,    "model",    "1.3.6.1.2.1.25.3.2.1.3.1"},
    {StatusField::SERIAL,   "serial",   "1.3.6.1.2.1.43.5.1.1.17"},
    {StatusField::STATUS,   "status",   "1.3.6.1.4.1.2435.3.3.9.1.6.1.0"},
}};

inline const StatusOidEntry& statusOidEntry(StatusField field) {
    for (const auto& entry : STATUS_OID_TABLE) {
        if (entry.field == field) {
            return entry;
        }
    }
    return STATUS_OID_TABLE.back();
}

inline std::string oidFor(StatusField field) {
    return statusOidEntry(field).oid;
}

inline const char* statusFieldToString(StatusField field) {
    return statusOidEntry(field).name;
}

inline std::optional<StatusField> statusFieldFromString(const std::string& name) {
    for (const auto& entry : STATUS_OID_TABLE) {
        if (name == entry.name) {
            return entry.field;
        }
    }
    return std::nullopt;
}

}  // namespace snmp
}  // namespace qlnet
