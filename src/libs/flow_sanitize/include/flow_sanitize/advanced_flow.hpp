#pragma once

#include <flow_catalog/capability_source.hpp>
#include <flow_model/errors.hpp>
#include <flow_model/types.hpp>
#include <flow_placement/graph_normalizer.hpp>
#include <nlohmann/json.hpp>
#include <memory>
#include <vector>

namespace flow_sanitize {

struct AdvancedFlowOptions {
    // Advisory capability checks; null disables them.
    std::shared_ptr<const flow_catalog::CatalogSnapshot> catalog;
    // Re-lay out every card in type columns after normalization.
    bool arrange_by_type = false;
    // Receives advisory warnings when set.
    std::vector<flow_model::AdvisoryWarning>* warnings = nullptr;
    // Key source for list-form cards; the process-wide generator when null.
    flow_placement::CardKeyGenerator* keys = nullptr;
};

// Normalizes list- or map-shaped cards into a validated FlowGraph.
// List form: invalid cards are excluded and logged. Map form: the first
// invalid card throws CardFieldError. Zero remaining cards, or missing or
// mistyped cards, throw StructuralError. Edges to unknown keys are pruned.
flow_model::FlowGraph normalize_and_validate_advanced_flow(const nlohmann::json& raw,
    const AdvancedFlowOptions& options = {});

// Wire form of a validated advanced flow, deep-cleaned.
nlohmann::json advanced_flow_payload(const flow_model::FlowGraph& flow);

} // namespace flow_sanitize
