#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace flow_model {

enum class CardType { Trigger, Condition, Action, Delay, Any, All, Note, Start };

// One row per card variant. Builtin variants are control-flow nodes that have
// no capability owner on the hub.
struct CardTypeTraits {
    CardType type;
    std::string_view name;
    bool builtin;
    // Output list used when linking this card to the next one in list order.
    std::string_view auto_wire_field;
    // Terminal cards are never linked forward.
    bool terminal;
};

inline constexpr std::array<CardTypeTraits, 8> card_type_table = { {
    { CardType::Trigger, "trigger", false, "outputSuccess", false },
    { CardType::Condition, "condition", false, "outputTrue", false },
    { CardType::Action, "action", false, "outputSuccess", false },
    { CardType::Delay, "delay", true, "outputSuccess", false },
    { CardType::Any, "any", true, "outputSuccess", false },
    { CardType::All, "all", true, "outputSuccess", false },
    { CardType::Note, "note", true, "outputSuccess", true },
    { CardType::Start, "start", true, "outputSuccess", false },
} };

// Output edge lists a card may carry, in wire order.
inline constexpr std::array<std::string_view, 4> output_fields = {
    "outputSuccess", "outputTrue", "outputFalse", "outputError"
};

// Marker type an author can place in a card list to stop forward wiring.
inline constexpr std::string_view end_marker_type = "end";

const CardTypeTraits& traits_of(CardType type);
std::optional<CardType> card_type_from_string(std::string_view name);
std::string_view to_string(CardType type);
bool is_builtin(CardType type);

// Fields a card of the given variant must carry after whitelist filtering.
std::vector<std::string_view> required_fields(CardType type);

} // namespace flow_model
