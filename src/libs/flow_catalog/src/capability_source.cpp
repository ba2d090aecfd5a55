#include <flow_catalog/capability_source.hpp>
#include <utility>

namespace flow_catalog {

namespace {

const std::vector<flow_model::Capability>* list_for(const CatalogSnapshot& s, flow_model::CardType type) {
    switch (type) {
    case flow_model::CardType::Trigger: return &s.triggers;
    case flow_model::CardType::Condition: return &s.conditions;
    case flow_model::CardType::Action: return &s.actions;
    default: return nullptr;
    }
}

} // namespace

bool CatalogSnapshot::covers(flow_model::CardType type) const {
    return list_for(*this, type) != nullptr;
}

const flow_model::Capability* CatalogSnapshot::find(flow_model::CardType type, std::string_view id) const {
    const auto* list = list_for(*this, type);
    if (!list) return nullptr;
    for (const auto& c : *list)
        if (c.id == id) return &c;
    return nullptr;
}

StaticCapabilitySource::StaticCapabilitySource(CatalogSnapshot snapshot)
    : snapshot_(std::move(snapshot)) {}

} // namespace flow_catalog
