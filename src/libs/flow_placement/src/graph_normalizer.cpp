#include <flow_placement/graph_normalizer.hpp>
#include <flow_log/logger.hpp>
#include <flow_model/card_types.hpp>
#include <vector>

namespace flow_placement {

namespace {

const double first_card_x = 50;
const double column_step = 200;
const double row_y = 100;

std::string type_of(const nlohmann::json& card) {
    if (card.is_object() && card.contains("type") && card["type"].is_string()) {
        std::string t = card["type"].get<std::string>();
        if (!t.empty()) return t;
    }
    return "card";
}

bool is_terminal(const nlohmann::json& card) {
    const std::string t = type_of(card);
    if (t == flow_model::end_marker_type) return true;
    auto type = flow_model::card_type_from_string(t);
    return type && flow_model::traits_of(*type).terminal;
}

std::string_view wire_field(const nlohmann::json& card) {
    auto type = flow_model::card_type_from_string(type_of(card));
    return type ? flow_model::traits_of(*type).auto_wire_field : std::string_view("outputSuccess");
}

// Integer entries in a list-form card refer to list positions.
void resolve_index_edges(nlohmann::json& card, const std::vector<std::string>& keys) {
    for (auto field : flow_model::output_fields) {
        const std::string name(field);
        if (!card.contains(name) || !card[name].is_array()) continue;
        for (auto& target : card[name]) {
            if (!target.is_number_integer()) continue;
            const auto idx = target.get<long long>();
            if (idx >= 0 && static_cast<std::size_t>(idx) < keys.size())
                target = keys[static_cast<std::size_t>(idx)];
            else
                target = std::to_string(idx);
        }
    }
}

} // namespace

std::string CardKeyGenerator::next(std::string_view type, std::size_t index) {
    const std::uint64_t seq = counter_.fetch_add(1) + 1;
    return std::string(type) + "_" + std::to_string(index) + "_" + std::to_string(seq);
}

CardKeyGenerator& default_key_generator() {
    static CardKeyGenerator generator;
    return generator;
}

bool declares_outputs(const nlohmann::json& card) {
    if (!card.is_object()) return false;
    for (auto field : flow_model::output_fields) {
        auto it = card.find(std::string(field));
        if (it == card.end() || !it->is_array()) continue;
        for (const auto& target : *it)
            if (!target.is_null()) return true;
    }
    return false;
}

nlohmann::json normalize_cards(const nlohmann::json& cards) {
    return normalize_cards(cards, default_key_generator());
}

nlohmann::json normalize_cards(const nlohmann::json& cards, CardKeyGenerator& keys) {
    if (!cards.is_array()) return cards;

    const std::size_t count = cards.size();
    std::vector<std::string> card_keys;
    card_keys.reserve(count);
    for (std::size_t i = 0; i < count; ++i)
        card_keys.push_back(keys.next(type_of(cards[i]), i));

    nlohmann::json graph = nlohmann::json::object();
    for (std::size_t i = 0; i < count; ++i) {
        nlohmann::json card = cards[i];
        if (card.is_object()) {
            resolve_index_edges(card, card_keys);
            // Present but malformed coordinates are left for the validator.
            if (!card.contains("x") || card["x"].is_null())
                card["x"] = first_card_x + static_cast<double>(i) * column_step;
            if (!card.contains("y") || card["y"].is_null())
                card["y"] = row_y;
        }
        graph[card_keys[i]] = std::move(card);
    }

    std::size_t wired = 0;
    for (std::size_t i = 0; i + 1 < count; ++i) {
        const auto& original = cards[i];
        if (!original.is_object() || is_terminal(original) || declares_outputs(original)) continue;
        graph[card_keys[i]][std::string(wire_field(original))] = nlohmann::json::array({ card_keys[i + 1] });
        ++wired;
    }

    flow_log::logger()->debug("Converted {} listed cards to a keyed graph with {} auto-wired edges", count, wired);
    return graph;
}

} // namespace flow_placement
