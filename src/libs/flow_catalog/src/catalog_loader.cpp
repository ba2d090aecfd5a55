#include <flow_catalog/catalog_loader.hpp>
#include <flow_model/json_codec.hpp>
#include <nlohmann/json.hpp>
#include <fstream>

namespace flow_catalog {

namespace {

std::vector<flow_model::Capability> parse_list(const nlohmann::json& j, const char* key) {
    std::vector<flow_model::Capability> out;
    if (!j.contains(key) || !j[key].is_array()) return out;
    for (const auto& entry : j[key]) {
        if (auto cap = flow_model::capability_from_json(entry))
            out.push_back(std::move(*cap));
    }
    return out;
}

std::optional<CatalogSnapshot> parse_json(const nlohmann::json& j) {
    if (!j.is_object()) return std::nullopt;
    CatalogSnapshot s;
    s.triggers = parse_list(j, "triggers");
    s.conditions = parse_list(j, "conditions");
    s.actions = parse_list(j, "actions");
    return s;
}

} // namespace

std::optional<CatalogSnapshot> load_catalog_from_json(std::istream& in) {
    try {
        nlohmann::json j = nlohmann::json::parse(in);
        return parse_json(j);
    } catch (const nlohmann::json::parse_error&) {
        return std::nullopt;
    }
}

std::optional<CatalogSnapshot> load_catalog_from_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) return std::nullopt;
    return load_catalog_from_json(f);
}

} // namespace flow_catalog
