#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace flow_sanitize {

bool is_blank(std::string_view s);
std::string trim(std::string_view s);

// "Flow " followed by 8 random alphanumeric characters.
std::string generate_flow_name();

// Trimmed name, or a generated one when the value is null, not a string or
// blank. The substitution is logged at warn level.
std::string sanitize_flow_name(const nlohmann::json& value);

// Booleans as is, numbers by non-zero, strings "true"/"1"/"yes"/"on" (any
// case); anything else yields `fallback`.
bool coerce_bool(const nlohmann::json& value, bool fallback);

// Trimmed string when the value is a non-blank string.
std::optional<std::string> non_blank_string(const nlohmann::json& value);

// `j[key]` when `j` is an object that has it, null otherwise.
const nlohmann::json& field_or_null(const nlohmann::json& j, const char* key);

} // namespace flow_sanitize
