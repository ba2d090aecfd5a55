#include <flow_sanitize/flow_sanitizer.hpp>
#include <flow_sanitize/card_validator.hpp>
#include <flow_sanitize/deep_clean.hpp>
#include <flow_sanitize/field_rules.hpp>
#include <flow_log/logger.hpp>
#include <flow_model/json_codec.hpp>

namespace flow_sanitize {

namespace {

std::vector<flow_model::FlowCard> sanitize_card_list(const nlohmann::json& list, flow_model::CardType role,
    const char* field)
{
    std::vector<flow_model::FlowCard> out;
    for (std::size_t i = 0; i < list.size(); ++i) {
        const std::string label = std::string(field) + "[" + std::to_string(i) + "]";
        try {
            out.push_back(validate_flow_card(list[i], role, label));
        } catch (const flow_model::CardFieldError& e) {
            flow_log::logger()->warn("Dropping invalid {}: {}", label, e.what());
        }
    }
    return out;
}

} // namespace

flow_model::BasicFlow sanitize_basic_flow(const nlohmann::json& raw) {
    if (!raw.is_object())
        throw flow_model::StructuralError("flow", "Flow definition must be an object");

    flow_model::BasicFlow flow;
    flow.name = sanitize_flow_name(field_or_null(raw, "name"));
    flow.enabled = coerce_bool(field_or_null(raw, "enabled"), true);

    const auto& trigger = field_or_null(raw, "trigger");
    if (!trigger.is_object() || trigger.empty())
        throw flow_model::StructuralError("trigger", "Flow trigger must be a valid object");
    flow.trigger = validate_flow_card(trigger, flow_model::CardType::Trigger, "trigger");

    const auto& actions = field_or_null(raw, "actions");
    if (actions.is_array())
        flow.actions = sanitize_card_list(actions, flow_model::CardType::Action, "actions");
    if (flow.actions.empty())
        throw flow_model::StructuralError("actions", "Flow must have at least one valid action");

    const auto& conditions = field_or_null(raw, "conditions");
    if (conditions.is_array())
        flow.conditions = sanitize_card_list(conditions, flow_model::CardType::Condition, "conditions");
    else if (!conditions.is_null())
        flow_log::logger()->warn("Ignoring conditions of type {}", conditions.type_name());

    flow.folder = non_blank_string(field_or_null(raw, "folder"));

    flow_log::logger()->debug("Basic flow '{}' sanitized: {} conditions, {} actions",
        flow.name, flow.conditions.size(), flow.actions.size());
    return flow;
}

nlohmann::json basic_flow_payload(const flow_model::BasicFlow& flow) {
    return deep_clean(flow_model::to_json(flow));
}

std::string sanitize_flow_id(const nlohmann::json& raw) {
    auto id = non_blank_string(raw);
    if (!id) throw flow_model::StructuralError("flow_id", "Flow ID must be a non-empty string");
    return *id;
}

} // namespace flow_sanitize
