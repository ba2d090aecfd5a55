#pragma once

#include <nlohmann/json.hpp>

namespace flow_placement {

// Column layout by card type: triggers left, conditions centre, actions
// right, everything else between conditions and actions. Only cards that are
// objects are moved; non-map input is left alone.
void arrange_cards_by_type(nlohmann::json& cards);

} // namespace flow_placement
