#pragma once

#include <flow_catalog/capability_source.hpp>
#include <flow_model/errors.hpp>
#include <flow_model/types.hpp>
#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <vector>

namespace flow_sanitize {

// Whitelist pass. Keeps known card fields that pass their type check and
// coerces them; everything else is dropped. Never throws. Non-object input
// yields an empty object.
nlohmann::json filter_card_fields(const nlohmann::json& raw);

// Required-field pass over the output of filter_card_fields. Throws
// CardFieldError naming the first missing or mistyped field.
flow_model::Card check_required_fields(const nlohmann::json& filtered, const std::string& card_key = "");

// Validates advanced-flow cards. The optional catalog snapshot is used by
// advise() only and never makes validation fail.
class CardValidator {
public:
    CardValidator() = default;
    explicit CardValidator(std::shared_ptr<const flow_catalog::CatalogSnapshot> catalog);

    flow_model::Card validate(const nlohmann::json& raw, const std::string& card_key = "") const;

    // Capability ids missing from the catalog for trigger, condition and
    // action cards. Each warning is also logged.
    std::vector<flow_model::AdvisoryWarning> advise(const flow_model::Card& card,
        const std::string& card_key = "") const;

private:
    std::shared_ptr<const flow_catalog::CatalogSnapshot> catalog_;
};

// Basic-flow card rule: a non-empty object with a non-blank "id". `label`
// names the card in errors, e.g. "trigger" or "actions[2]".
flow_model::FlowCard validate_flow_card(const nlohmann::json& raw, flow_model::CardType role,
    const std::string& label);

} // namespace flow_sanitize
