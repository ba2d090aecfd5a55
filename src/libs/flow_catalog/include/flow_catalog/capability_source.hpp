#pragma once

#include <flow_model/card_types.hpp>
#include <flow_model/types.hpp>
#include <string_view>
#include <vector>

namespace flow_catalog {

// Hub-side listing of flow card capabilities. Implementations may block.
class CapabilitySource {
public:
    virtual ~CapabilitySource() = default;
    virtual std::vector<flow_model::Capability> list_triggers() = 0;
    virtual std::vector<flow_model::Capability> list_conditions() = 0;
    virtual std::vector<flow_model::Capability> list_actions() = 0;
};

// Immutable view of the three capability lists.
struct CatalogSnapshot {
    std::vector<flow_model::Capability> triggers;
    std::vector<flow_model::Capability> conditions;
    std::vector<flow_model::Capability> actions;

    // Only trigger, condition and action cards are catalogued.
    bool covers(flow_model::CardType type) const;
    const flow_model::Capability* find(flow_model::CardType type, std::string_view id) const;
    std::size_t size() const { return triggers.size() + conditions.size() + actions.size(); }
};

// Serves a fixed snapshot; used for catalog files and for demo/offline mode.
class StaticCapabilitySource : public CapabilitySource {
public:
    explicit StaticCapabilitySource(CatalogSnapshot snapshot);

    std::vector<flow_model::Capability> list_triggers() override { return snapshot_.triggers; }
    std::vector<flow_model::Capability> list_conditions() override { return snapshot_.conditions; }
    std::vector<flow_model::Capability> list_actions() override { return snapshot_.actions; }

private:
    CatalogSnapshot snapshot_;
};

// Capabilities the gateway advertises in demo/offline mode.
CatalogSnapshot demo_catalog();

} // namespace flow_catalog
