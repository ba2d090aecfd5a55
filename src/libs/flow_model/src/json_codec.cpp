#include <flow_model/json_codec.hpp>

namespace flow_model {

namespace {

void put_list(nlohmann::json& j, const char* key, const std::vector<std::string>& values) {
    if (!values.empty()) j[key] = values;
}

template <typename T>
void put_optional(nlohmann::json& j, const char* key, const std::optional<T>& value) {
    if (value) j[key] = *value;
}

void put_args(nlohmann::json& j, const nlohmann::json& args) {
    if (args.is_object() && !args.empty()) j["args"] = args;
}

std::string string_field(const nlohmann::json& j, const char* key) {
    return j.contains(key) && j[key].is_string() ? j[key].get<std::string>() : "";
}

} // namespace

nlohmann::json to_json(const Card& card) {
    nlohmann::json j = nlohmann::json::object();
    j["type"] = std::string(to_string(card.type));
    put_optional(j, "id", card.capability_id);
    put_optional(j, "ownerUri", card.owner_uri);
    j["x"] = card.x;
    j["y"] = card.y;
    put_list(j, "outputSuccess", card.output_success);
    put_list(j, "outputTrue", card.output_true);
    put_list(j, "outputFalse", card.output_false);
    put_list(j, "outputError", card.output_error);
    put_list(j, "input", card.input);
    put_args(j, card.args);
    put_optional(j, "droptoken", card.droptoken);
    put_optional(j, "inverted", card.inverted);
    put_optional(j, "value", card.value);
    put_optional(j, "color", card.color);
    put_optional(j, "width", card.width);
    put_optional(j, "height", card.height);
    return j;
}

nlohmann::json to_json(const FlowGraph& flow) {
    nlohmann::json j = nlohmann::json::object();
    j["name"] = flow.name;
    j["enabled"] = flow.enabled;
    j["triggerable"] = flow.triggerable;
    j["broken"] = flow.broken;
    put_optional(j, "folder", flow.folder);
    nlohmann::json cards = nlohmann::json::object();
    for (const auto& [key, card] : flow.cards)
        cards[key] = to_json(card);
    j["cards"] = std::move(cards);
    return j;
}

nlohmann::json to_json(const FlowCard& card) {
    nlohmann::json j = nlohmann::json::object();
    j["id"] = card.id;
    put_optional(j, "uri", card.uri);
    put_args(j, card.args);
    put_optional(j, "droptoken", card.droptoken);
    put_optional(j, "group", card.group);
    put_optional(j, "inverted", card.inverted);
    return j;
}

nlohmann::json to_json(const BasicFlow& flow) {
    nlohmann::json j = nlohmann::json::object();
    j["name"] = flow.name;
    j["enabled"] = flow.enabled;
    j["trigger"] = to_json(flow.trigger);
    nlohmann::json conditions = nlohmann::json::array();
    for (const auto& c : flow.conditions)
        conditions.push_back(to_json(c));
    j["conditions"] = std::move(conditions);
    nlohmann::json actions = nlohmann::json::array();
    for (const auto& a : flow.actions)
        actions.push_back(to_json(a));
    j["actions"] = std::move(actions);
    put_optional(j, "folder", flow.folder);
    return j;
}

nlohmann::json to_json(const Folder& folder) {
    nlohmann::json j = nlohmann::json::object();
    if (!folder.id.empty()) j["id"] = folder.id;
    j["name"] = folder.name;
    put_optional(j, "parent", folder.parent);
    return j;
}

nlohmann::json to_json(const Capability& capability) {
    nlohmann::json j = nlohmann::json::object();
    j["id"] = capability.id;
    j["uri"] = capability.uri;
    j["title"] = capability.title;
    j["titleFormatted"] = capability.title_formatted;
    j["args"] = capability.args;
    return j;
}

std::optional<Capability> capability_from_json(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("id") || !j["id"].is_string()) return std::nullopt;
    Capability c;
    c.id = j["id"].get<std::string>();
    c.uri = string_field(j, "uri");
    c.title = string_field(j, "title");
    c.title_formatted = string_field(j, "titleFormatted");
    if (j.contains("args") && j["args"].is_array()) c.args = j["args"];
    return c;
}

} // namespace flow_model
