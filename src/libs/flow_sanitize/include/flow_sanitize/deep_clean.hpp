#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace flow_sanitize {

inline const char* const default_fallback_flow_name = "Unnamed Flow";
inline const char* const unknown_card_id = "unknown";
inline const char* const unknown_owner_uri = "homey:app:unknown";

// False for null, blank strings, and empty objects or arrays.
bool is_valid_value(const nlohmann::json& value);

// Recursively drops invalid values, and object entries with empty keys. A
// top-level object or array comes back as {} / [] when everything is dropped;
// an invalid top-level scalar comes back as null.
nlohmann::json deep_clean(const nlohmann::json& value);

// deep_clean plus the repair applied to every flow record read from the hub:
// a name is always present, "cards" is always an object, and each card keeps
// type/id/ownerUri plus position and output edges only. Every repair is logged.
nlohmann::json clean_flow_record(const nlohmann::json& record,
    const std::string& fallback_name = default_fallback_flow_name);

// Applies clean_flow_record to each entry of an id -> record map, skipping
// null and non-object records. Non-map input is returned unchanged.
nlohmann::json clean_flow_collection(const nlohmann::json& flows,
    const std::string& fallback_name = default_fallback_flow_name);

} // namespace flow_sanitize
