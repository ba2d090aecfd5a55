#include <flow_sanitize/advanced_flow.hpp>
#include <flow_sanitize/card_validator.hpp>
#include <flow_sanitize/deep_clean.hpp>
#include <flow_sanitize/field_rules.hpp>
#include <flow_log/logger.hpp>
#include <flow_model/json_codec.hpp>
#include <flow_placement/card_layout.hpp>

namespace flow_sanitize {

namespace {

std::size_t prune_dangling_edges(flow_model::FlowGraph& flow) {
    std::size_t pruned = 0;
    for (auto it = flow.cards.begin(); it != flow.cards.end(); ++it) {
        for (auto field : flow_model::output_fields) {
            auto* targets = it->second.outputs(field);
            for (auto t = targets->begin(); t != targets->end();) {
                if (flow.cards.count(*t)) {
                    ++t;
                    continue;
                }
                flow_log::logger()->warn("Card '{}': removing {} edge to unknown card '{}'", it->first, field, *t);
                t = targets->erase(t);
                ++pruned;
            }
        }
    }
    return pruned;
}

} // namespace

flow_model::FlowGraph normalize_and_validate_advanced_flow(const nlohmann::json& raw,
    const AdvancedFlowOptions& options)
{
    if (!raw.is_object())
        throw flow_model::StructuralError("flow", "Advanced flow definition must be an object");

    auto log = flow_log::logger();
    flow_model::FlowGraph flow;
    flow.name = sanitize_flow_name(field_or_null(raw, "name"));
    flow.enabled = coerce_bool(field_or_null(raw, "enabled"), true);
    flow.triggerable = coerce_bool(field_or_null(raw, "triggerable"), false);
    flow.broken = coerce_bool(field_or_null(raw, "broken"), false);
    flow.folder = non_blank_string(field_or_null(raw, "folder"));

    const auto& cards = field_or_null(raw, "cards");
    if (cards.is_null())
        throw flow_model::StructuralError("cards", "Advanced flow requires cards");
    const bool from_list = cards.is_array();
    if (!from_list && !cards.is_object())
        throw flow_model::StructuralError("cards", "Advanced flow cards must be an object or an array");

    nlohmann::json graph = from_list
        ? (options.keys ? flow_placement::normalize_cards(cards, *options.keys) : flow_placement::normalize_cards(cards))
        : cards;
    if (options.arrange_by_type) flow_placement::arrange_cards_by_type(graph);

    CardValidator validator(options.catalog);
    std::size_t excluded = 0;
    for (auto it = graph.begin(); it != graph.end(); ++it) {
        try {
            if (it.key().empty())
                throw flow_model::CardFieldError(it.key(), "key", "must not be empty");
            flow.cards[it.key()] = validator.validate(it.value(), it.key());
        } catch (const flow_model::CardFieldError& e) {
            if (!from_list) throw;
            log->warn("Excluding card '{}': {}", it.key(), e.what());
            ++excluded;
        }
    }
    if (flow.cards.empty())
        throw flow_model::StructuralError("cards", "Advanced flow must have at least one valid card");

    const std::size_t pruned = prune_dangling_edges(flow);

    for (const auto& [key, card] : flow.cards) {
        auto advice = validator.advise(card, key);
        if (options.warnings)
            options.warnings->insert(options.warnings->end(), advice.begin(), advice.end());
    }

    log->info("Advanced flow '{}' validated: {} cards, {} excluded, {} dangling edges removed",
        flow.name, flow.cards.size(), excluded, pruned);
    return flow;
}

nlohmann::json advanced_flow_payload(const flow_model::FlowGraph& flow) {
    return deep_clean(flow_model::to_json(flow));
}

} // namespace flow_sanitize
