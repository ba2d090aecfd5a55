#include <flow_config/config.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>

namespace flow_config {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::optional<GatewayConfig> parse_json(const nlohmann::json& j) {
    if (!j.is_object()) return std::nullopt;

    GatewayConfig cfg;
    if (j.contains("log_level") && j["log_level"].is_string()) cfg.log_level = lower(j["log_level"].get<std::string>());
    if (j.contains("log_file") && j["log_file"].is_string()) cfg.log_file = j["log_file"].get<std::string>();
    if (j.contains("offline_mode") && j["offline_mode"].is_boolean()) cfg.offline_mode = j["offline_mode"].get<bool>();
    if (j.contains("demo_mode") && j["demo_mode"].is_boolean()) cfg.demo_mode = j["demo_mode"].get<bool>();
    if (j.contains("catalog_path") && j["catalog_path"].is_string()) cfg.catalog_path = j["catalog_path"].get<std::string>();
    if (j.contains("fallback_flow_name") && j["fallback_flow_name"].is_string()
        && !j["fallback_flow_name"].get<std::string>().empty())
        cfg.fallback_flow_name = j["fallback_flow_name"].get<std::string>();
    return cfg;
}

const char* env(const char* name) {
    const char* v = std::getenv(name);
    return v && *v ? v : nullptr;
}

} // namespace

bool parse_bool_flag(const std::string& value) {
    const std::string v = lower(value);
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

std::optional<GatewayConfig> load_config_from_json(std::istream& in) {
    try {
        nlohmann::json j = nlohmann::json::parse(in);
        return parse_json(j);
    } catch (const nlohmann::json::parse_error&) {
        return std::nullopt;
    }
}

std::optional<GatewayConfig> load_config_from_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) return std::nullopt;
    return load_config_from_json(f);
}

void apply_env_overrides(GatewayConfig& config) {
    if (const char* v = env("FLOWGUARD_LOG_LEVEL")) config.log_level = lower(v);
    if (const char* v = env("FLOWGUARD_LOG_FILE")) config.log_file = v;
    if (const char* v = env("FLOWGUARD_OFFLINE_MODE")) config.offline_mode = parse_bool_flag(v);
    if (const char* v = env("FLOWGUARD_DEMO_MODE")) config.demo_mode = parse_bool_flag(v);
    if (const char* v = env("FLOWGUARD_CATALOG")) config.catalog_path = v;
}

} // namespace flow_config
