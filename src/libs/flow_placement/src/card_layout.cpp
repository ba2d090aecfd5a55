#include <flow_placement/card_layout.hpp>

namespace flow_placement {

namespace {

const double trigger_column_x = 50;
const double condition_column_x = 400;
const double other_column_x = 600;
const double action_column_x = 800;
const double top_y = 40;
const double row_spacing = 100;

} // namespace

void arrange_cards_by_type(nlohmann::json& cards) {
    if (!cards.is_object()) return;

    int triggers = 0;
    int conditions = 0;
    int actions = 0;
    int others = 0;
    for (auto it = cards.begin(); it != cards.end(); ++it) {
        auto& card = *it;
        if (!card.is_object()) continue;
        const std::string type = card.contains("type") && card["type"].is_string()
            ? card["type"].get<std::string>() : "action";
        if (type == "trigger") {
            card["x"] = trigger_column_x;
            card["y"] = top_y + triggers++ * row_spacing;
        } else if (type == "condition") {
            card["x"] = condition_column_x;
            card["y"] = top_y + conditions++ * row_spacing;
        } else if (type == "action") {
            card["x"] = action_column_x;
            card["y"] = top_y + actions++ * row_spacing;
        } else {
            card["x"] = other_column_x;
            card["y"] = top_y + others++ * row_spacing;
        }
    }
}

} // namespace flow_placement
