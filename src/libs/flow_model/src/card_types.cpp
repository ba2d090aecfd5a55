#include <flow_model/card_types.hpp>

namespace flow_model {

namespace {

const std::vector<std::string_view> builtin_required = { "type", "x", "y" };
const std::vector<std::string_view> capability_required = { "type", "x", "y", "ownerUri", "id" };

} // namespace

const CardTypeTraits& traits_of(CardType type) {
    for (const auto& t : card_type_table)
        if (t.type == type) return t;
    return card_type_table.front();
}

std::optional<CardType> card_type_from_string(std::string_view name) {
    for (const auto& t : card_type_table)
        if (t.name == name) return t.type;
    return std::nullopt;
}

std::string_view to_string(CardType type) {
    return traits_of(type).name;
}

bool is_builtin(CardType type) {
    return traits_of(type).builtin;
}

std::vector<std::string_view> required_fields(CardType type) {
    return is_builtin(type) ? builtin_required : capability_required;
}

} // namespace flow_model
