#pragma once

#include <istream>
#include <optional>
#include <string>

namespace flow_config {

struct GatewayConfig {
    // spdlog level name, lower case
    std::string log_level = "info";
    // empty -> stderr
    std::string log_file;
    bool offline_mode = false;
    bool demo_mode = false;
    // capability catalog document; empty -> no advisory checks unless demo/offline
    std::string catalog_path;
    // substituted for a missing name on records read back from the hub
    std::string fallback_flow_name = "Unnamed Flow";
};

std::optional<GatewayConfig> load_config_from_json(std::istream& in);
std::optional<GatewayConfig> load_config_from_json_file(const std::string& path);

// FLOWGUARD_LOG_LEVEL, FLOWGUARD_LOG_FILE, FLOWGUARD_OFFLINE_MODE,
// FLOWGUARD_DEMO_MODE and FLOWGUARD_CATALOG override file values.
void apply_env_overrides(GatewayConfig& config);

// "1", "true", "yes", "on" (any case) are true.
bool parse_bool_flag(const std::string& value);

} // namespace flow_config
