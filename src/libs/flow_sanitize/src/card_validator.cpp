#include <flow_sanitize/card_validator.hpp>
#include <flow_sanitize/deep_clean.hpp>
#include <flow_sanitize/field_rules.hpp>
#include <flow_log/logger.hpp>
#include <flow_model/card_types.hpp>
#include <utility>

namespace flow_sanitize {

namespace {

// Checked by the required-field pass, copied as is here.
const char* const required_candidates[] = { "type", "x", "y", "ownerUri", "id" };
const char* const list_fields[] = {
    "outputSuccess", "outputTrue", "outputFalse", "outputError", "input"
};
const char* const text_fields[] = { "droptoken", "value", "color" };
const char* const number_fields[] = { "width", "height" };

nlohmann::json stringify_entries(const nlohmann::json& list) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& entry : list) {
        if (entry.is_null()) continue;
        out.push_back(entry.is_string() ? entry.get<std::string>() : entry.dump());
    }
    return out;
}

std::vector<std::string> string_list(const nlohmann::json& filtered, const char* key) {
    std::vector<std::string> out;
    if (!filtered.contains(key)) return out;
    for (const auto& entry : filtered[key])
        out.push_back(entry.get<std::string>());
    return out;
}

std::optional<std::string> optional_text(const nlohmann::json& filtered, const char* key) {
    if (!filtered.contains(key)) return std::nullopt;
    return filtered[key].get<std::string>();
}

std::optional<double> optional_number(const nlohmann::json& filtered, const char* key) {
    if (!filtered.contains(key)) return std::nullopt;
    return filtered[key].get<double>();
}

void require_field(const nlohmann::json& filtered, std::string_view field, flow_model::CardType type,
    const std::string& card_key)
{
    const std::string name(field);
    if (name == "x" || name == "y") {
        if (!filtered.contains(name) || !filtered[name].is_number())
            throw flow_model::CardFieldError(card_key, name, "is required and must be numeric");
        return;
    }
    if (!non_blank_string(field_or_null(filtered, name.c_str())))
        throw flow_model::CardFieldError(card_key, name,
            "is required for " + std::string(flow_model::to_string(type)) + " cards");
}

} // namespace

nlohmann::json filter_card_fields(const nlohmann::json& raw) {
    nlohmann::json out = nlohmann::json::object();
    if (!raw.is_object()) return out;

    for (const char* key : required_candidates) {
        if (raw.contains(key) && !raw[key].is_null()) out[key] = raw[key];
    }
    for (const char* key : list_fields) {
        if (raw.contains(key) && raw[key].is_array()) out[key] = stringify_entries(raw[key]);
    }
    if (raw.contains("args") && raw["args"].is_object()) out["args"] = deep_clean(raw["args"]);
    for (const char* key : text_fields) {
        if (non_blank_string(field_or_null(raw, key))) out[key] = raw[key];
    }
    if (raw.contains("inverted") && raw["inverted"].is_boolean()) out["inverted"] = raw["inverted"];
    for (const char* key : number_fields) {
        if (raw.contains(key) && raw[key].is_number()) out[key] = raw[key];
    }
    return out;
}

flow_model::Card check_required_fields(const nlohmann::json& filtered, const std::string& card_key) {
    const auto& type_value = field_or_null(filtered, "type");
    if (!type_value.is_string())
        throw flow_model::CardFieldError(card_key, "type", "is required");
    auto type = flow_model::card_type_from_string(type_value.get<std::string>());
    if (!type)
        throw flow_model::CardFieldError(card_key, "type",
            "has unknown card type '" + type_value.get<std::string>() + "'");

    for (auto field : flow_model::required_fields(*type))
        require_field(filtered, field, *type, card_key);

    flow_model::Card card;
    card.type = *type;
    card.x = filtered["x"].get<double>();
    card.y = filtered["y"].get<double>();
    card.owner_uri = non_blank_string(field_or_null(filtered, "ownerUri"));
    card.capability_id = non_blank_string(field_or_null(filtered, "id"));
    card.output_success = string_list(filtered, "outputSuccess");
    card.output_true = string_list(filtered, "outputTrue");
    card.output_false = string_list(filtered, "outputFalse");
    card.output_error = string_list(filtered, "outputError");
    card.input = string_list(filtered, "input");
    if (filtered.contains("args")) card.args = filtered["args"];
    card.droptoken = optional_text(filtered, "droptoken");
    card.value = optional_text(filtered, "value");
    card.color = optional_text(filtered, "color");
    if (filtered.contains("inverted")) card.inverted = filtered["inverted"].get<bool>();
    card.width = optional_number(filtered, "width");
    card.height = optional_number(filtered, "height");
    return card;
}

CardValidator::CardValidator(std::shared_ptr<const flow_catalog::CatalogSnapshot> catalog)
    : catalog_(std::move(catalog)) {}

flow_model::Card CardValidator::validate(const nlohmann::json& raw, const std::string& card_key) const {
    if (!raw.is_object())
        throw flow_model::CardFieldError(card_key, "card", std::string("must be an object, got ") + raw.type_name());
    return check_required_fields(filter_card_fields(raw), card_key);
}

std::vector<flow_model::AdvisoryWarning> CardValidator::advise(const flow_model::Card& card,
    const std::string& card_key) const
{
    std::vector<flow_model::AdvisoryWarning> out;
    if (!catalog_ || !catalog_->covers(card.type) || !card.capability_id) return out;
    if (catalog_->find(card.type, *card.capability_id)) return out;

    const std::string type(flow_model::to_string(card.type));
    flow_model::AdvisoryWarning w;
    w.card_key = card_key;
    w.card_type = type;
    w.capability_id = *card.capability_id;
    w.message = "Capability '" + w.capability_id + "' not found in available " + type + "s for card " + card_key;
    flow_log::logger()->warn("{}", w.message);
    out.push_back(std::move(w));
    return out;
}

flow_model::FlowCard validate_flow_card(const nlohmann::json& raw, flow_model::CardType role,
    const std::string& label)
{
    if (!raw.is_object() || raw.empty())
        throw flow_model::CardFieldError(label, "card", "must be a non-empty object");

    auto id = non_blank_string(field_or_null(raw, "id"));
    if (!id) throw flow_model::CardFieldError(label, "id", "is required");

    flow_model::FlowCard card;
    card.id = *id;
    card.uri = non_blank_string(field_or_null(raw, "uri"));
    if (!card.uri) card.uri = non_blank_string(field_or_null(raw, "ownerUri"));
    if (raw.contains("args") && raw["args"].is_object()) card.args = deep_clean(raw["args"]);
    card.droptoken = non_blank_string(field_or_null(raw, "droptoken"));
    card.group = non_blank_string(field_or_null(raw, "group"));
    if (role == flow_model::CardType::Condition && raw.contains("inverted") && raw["inverted"].is_boolean())
        card.inverted = raw["inverted"].get<bool>();
    return card;
}

} // namespace flow_sanitize
