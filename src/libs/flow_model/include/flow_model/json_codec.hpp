#pragma once

#include <flow_model/types.hpp>
#include <nlohmann/json.hpp>
#include <optional>

namespace flow_model {

// Wire encoders. Absent optionals and empty lists are omitted, never null.
nlohmann::json to_json(const Card& card);
nlohmann::json to_json(const FlowGraph& flow);
nlohmann::json to_json(const FlowCard& card);
nlohmann::json to_json(const BasicFlow& flow);
nlohmann::json to_json(const Folder& folder);
nlohmann::json to_json(const Capability& capability);

// Hub capability descriptor; nullopt when `id` is missing.
std::optional<Capability> capability_from_json(const nlohmann::json& j);

} // namespace flow_model
