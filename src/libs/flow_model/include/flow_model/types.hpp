#pragma once

#include <flow_model/card_types.hpp>
#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace flow_model {

// One node of an advanced flow. `capability_id` travels as "id" on the wire;
// the card's own key lives in the owning FlowGraph::cards map.
struct Card {
    CardType type = CardType::Action;
    std::optional<std::string> owner_uri;
    std::optional<std::string> capability_id;
    double x = 0;
    double y = 0;
    std::vector<std::string> output_success;
    std::vector<std::string> output_true;
    std::vector<std::string> output_false;
    std::vector<std::string> output_error;
    // "card-key::outputType" references
    std::vector<std::string> input;
    nlohmann::json args = nlohmann::json::object();
    std::optional<std::string> droptoken;
    std::optional<bool> inverted;
    // note cards
    std::optional<std::string> value;
    std::optional<std::string> color;
    std::optional<double> width;
    std::optional<double> height;

    std::vector<std::string>* outputs(std::string_view field);
    const std::vector<std::string>* outputs(std::string_view field) const;
};

struct FlowGraph {
    std::string name;
    bool enabled = true;
    bool triggerable = false;
    bool broken = false;
    std::optional<std::string> folder;
    std::map<std::string, Card> cards;
};

// Card of a basic flow: no canvas position, no edges.
struct FlowCard {
    std::string id;
    std::optional<std::string> uri;
    nlohmann::json args = nlohmann::json::object();
    std::optional<std::string> droptoken;
    std::optional<std::string> group;
    std::optional<bool> inverted;
};

struct BasicFlow {
    std::string name;
    bool enabled = true;
    FlowCard trigger;
    std::vector<FlowCard> conditions;
    std::vector<FlowCard> actions;
    std::optional<std::string> folder;
};

struct Folder {
    std::string id;
    std::string name;
    std::optional<std::string> parent;
};

struct Capability {
    std::string id;
    std::string uri;
    std::string title;
    std::string title_formatted;
    nlohmann::json args = nlohmann::json::array();
};

enum class FlowKind { Regular, Advanced };

} // namespace flow_model
