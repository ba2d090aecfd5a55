#include <flow_sanitize/field_rules.hpp>
#include <flow_log/logger.hpp>
#include <algorithm>
#include <cctype>
#include <random>

namespace flow_sanitize {

namespace {

const char alphanumerics[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";
const std::size_t generated_name_length = 8;

const nlohmann::json null_value;

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

bool is_blank(std::string_view s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

std::string trim(std::string_view s) {
    std::size_t begin = 0;
    std::size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return std::string(s.substr(begin, end - begin));
}

std::string generate_flow_name() {
    thread_local std::mt19937 rng(std::random_device{}());
    std::uniform_int_distribution<std::size_t> pick(0, sizeof(alphanumerics) - 2);
    std::string name = "Flow ";
    for (std::size_t i = 0; i < generated_name_length; ++i)
        name += alphanumerics[pick(rng)];
    return name;
}

std::string sanitize_flow_name(const nlohmann::json& value) {
    if (auto name = non_blank_string(value)) return *name;
    std::string generated = generate_flow_name();
    flow_log::logger()->warn("Flow name is {}; using generated name '{}'",
        value.is_null() ? "missing" : (value.is_string() ? "blank" : "not a string"), generated);
    return generated;
}

bool coerce_bool(const nlohmann::json& value, bool fallback) {
    if (value.is_boolean()) return value.get<bool>();
    if (value.is_number()) return value.get<double>() != 0.0;
    if (value.is_string()) {
        const std::string v = lower(trim(value.get<std::string>()));
        if (v == "true" || v == "1" || v == "yes" || v == "on") return true;
        if (v == "false" || v == "0" || v == "no" || v == "off") return false;
    }
    return fallback;
}

std::optional<std::string> non_blank_string(const nlohmann::json& value) {
    if (!value.is_string()) return std::nullopt;
    std::string s = trim(value.get<std::string>());
    if (s.empty()) return std::nullopt;
    return s;
}

const nlohmann::json& field_or_null(const nlohmann::json& j, const char* key) {
    if (!j.is_object()) return null_value;
    auto it = j.find(key);
    return it == j.end() ? null_value : *it;
}

} // namespace flow_sanitize
