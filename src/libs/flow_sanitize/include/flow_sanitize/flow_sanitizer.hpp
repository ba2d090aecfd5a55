#pragma once

#include <flow_model/errors.hpp>
#include <flow_model/types.hpp>
#include <nlohmann/json.hpp>
#include <string>

namespace flow_sanitize {

// Normalizes a basic flow (one trigger, actions, optional conditions).
// Throws StructuralError when the trigger is missing or no action survives,
// CardFieldError when the trigger itself is invalid. Invalid actions and
// conditions are dropped and logged.
flow_model::BasicFlow sanitize_basic_flow(const nlohmann::json& raw);

// Wire form of a sanitized basic flow, deep-cleaned.
nlohmann::json basic_flow_payload(const flow_model::BasicFlow& flow);

// Trimmed flow id; throws StructuralError for null, non-string or blank ids.
std::string sanitize_flow_id(const nlohmann::json& raw);

} // namespace flow_sanitize
