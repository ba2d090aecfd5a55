/**
 * @file advanced_flow_test.cpp
 * @brief Advanced flow pipeline: normalization, validation, pruning, advisories
 */

#include <flow_catalog/capability_source.hpp>
#include <flow_log/logger.hpp>
#include <flow_sanitize/advanced_flow.hpp>

#include <cstdio>
#include <cstdlib>
#include <memory>
#include <set>
#include <string>
#include <vector>

#define CHECK(cond) do { \
    if (!(cond)) { \
        std::fprintf(stderr, "FAIL: %s @ %s:%d\n", #cond, __FILE__, __LINE__); \
        std::exit(1); \
    } \
} while(0)

using nlohmann::json;
using flow_model::CardType;
using namespace flow_sanitize;

static const char* three_cards = R"({
    "name": "Motion light",
    "cards": [
        {"type": "trigger", "id": "motion_detected", "ownerUri": "homey:device:sensor"},
        {"type": "condition", "id": "time_between", "ownerUri": "homey:app:com.athom.time"},
        {"type": "action", "id": "turn_on_device", "ownerUri": "homey:manager:device"}
    ]
})";

static std::string key_with_type(const flow_model::FlowGraph& flow, CardType type) {
    for (const auto& [key, card] : flow.cards)
        if (card.type == type) return key;
    return "";
}

static std::size_t edge_count(const flow_model::FlowGraph& flow) {
    std::size_t n = 0;
    for (const auto& [key, card] : flow.cards)
        n += card.output_success.size() + card.output_true.size() + card.output_false.size()
            + card.output_error.size();
    return n;
}

/* Message of the StructuralError thrown for `raw`, or "" when none is thrown. */
static std::string structural_error(const json& raw) {
    try {
        normalize_and_validate_advanced_flow(raw);
    } catch (const flow_model::StructuralError& e) {
        return e.what();
    }
    return "";
}

static void test_three_card_chain() {
    flow_placement::CardKeyGenerator keys;
    AdvancedFlowOptions options;
    options.keys = &keys;
    auto flow = normalize_and_validate_advanced_flow(json::parse(three_cards), options);

    CHECK(flow.name == "Motion light");
    CHECK(flow.enabled);
    CHECK(!flow.triggerable);
    CHECK(flow.cards.size() == 3);

    const std::string t = key_with_type(flow, CardType::Trigger);
    const std::string c = key_with_type(flow, CardType::Condition);
    const std::string a = key_with_type(flow, CardType::Action);
    CHECK(t.rfind("trigger_0_", 0) == 0);
    CHECK(c.rfind("condition_1_", 0) == 0);
    CHECK(a.rfind("action_2_", 0) == 0);

    CHECK(flow.cards[t].output_success == std::vector<std::string>{ c });
    CHECK(flow.cards[c].output_true == std::vector<std::string>{ a });
    CHECK(flow.cards[c].output_success.empty());
    CHECK(flow.cards[a].output_success.empty());
    CHECK(edge_count(flow) == 2);

    CHECK(flow.cards[t].x == 50);
    CHECK(flow.cards[c].x == 250);
    CHECK(flow.cards[a].x == 450);
    CHECK(flow.cards[a].y == 100);
    std::printf("  [PASS] three_card_chain\n");
}

static void test_long_chain_edges() {
    json raw = json::object();
    raw["name"] = "Chain";
    raw["cards"] = json::array();
    const std::size_t n = 6;
    for (std::size_t i = 0; i < n; ++i)
        raw["cards"].push_back({ { "type", "action" }, { "id", "a" + std::to_string(i) }, { "ownerUri", "homey:app:x" } });

    auto flow = normalize_and_validate_advanced_flow(raw);
    CHECK(flow.cards.size() == n);
    CHECK(edge_count(flow) == n - 1);

    std::set<std::string> targets;
    for (const auto& [key, card] : flow.cards)
        for (const auto& target : card.output_success) {
            CHECK(flow.cards.count(target) == 1);
            CHECK(target != key);
            targets.insert(target);
        }
    CHECK(targets.size() == n - 1);
    std::printf("  [PASS] long_chain_edges\n");
}

static void test_map_input_idempotent() {
    auto first = normalize_and_validate_advanced_flow(json::parse(three_cards));
    json payload = advanced_flow_payload(first);
    auto second = normalize_and_validate_advanced_flow(payload);
    CHECK(advanced_flow_payload(second) == payload);
    CHECK(second.cards.size() == 3);
    std::printf("  [PASS] map_input_idempotent\n");
}

static void test_list_excludes_map_rejects() {
    json listed = json::parse(R"({"name": "L", "cards": [
        {"type": "trigger", "id": "t", "ownerUri": "homey:app:a"},
        {"type": "action", "id": "a"},
        {"type": "teleport", "id": "x", "ownerUri": "homey:app:a"},
        "junk",
        {"type": "delay"}
    ]})");
    auto flow = normalize_and_validate_advanced_flow(listed);
    CHECK(flow.cards.size() == 2);
    CHECK(!key_with_type(flow, CardType::Trigger).empty());
    CHECK(!key_with_type(flow, CardType::Delay).empty());
    /* the trigger's auto-wired edge pointed at the excluded action */
    CHECK(edge_count(flow) == 0);

    json mapped = json::parse(R"({"name": "M", "cards": {
        "t1": {"type": "trigger", "id": "t", "ownerUri": "homey:app:a", "x": 0, "y": 0},
        "a1": {"type": "action", "id": "a", "x": 0, "y": 0}
    }})");
    bool threw = false;
    try {
        normalize_and_validate_advanced_flow(mapped);
    } catch (const flow_model::CardFieldError& e) {
        threw = e.card_key() == "a1" && e.field() == "ownerUri";
    }
    CHECK(threw);
    std::printf("  [PASS] list_excludes_map_rejects\n");
}

static void test_malformed_position_excluded() {
    json listed = json::parse(R"({"name": "P", "cards": [
        {"type": "trigger", "id": "t", "ownerUri": "homey:app:a"},
        {"type": "action", "id": "a", "ownerUri": "homey:app:a", "x": "left", "y": {"bad": 1}}
    ]})");
    auto flow = normalize_and_validate_advanced_flow(listed);
    CHECK(flow.cards.size() == 1);
    CHECK(key_with_type(flow, CardType::Action).empty());
    CHECK(edge_count(flow) == 0);

    json mapped = json::parse(R"({"name": "P", "cards": {
        "a1": {"type": "action", "id": "a", "ownerUri": "homey:app:a", "x": "left", "y": 0}
    }})");
    bool threw = false;
    try {
        normalize_and_validate_advanced_flow(mapped);
    } catch (const flow_model::CardFieldError& e) {
        threw = e.card_key() == "a1" && e.field() == "x";
    }
    CHECK(threw);
    std::printf("  [PASS] malformed_position_excluded\n");
}

static void test_empty_output_list_still_chained() {
    json raw = json::parse(R"({"name": "E", "cards": [
        {"type": "trigger", "id": "t", "ownerUri": "homey:app:a"},
        {"type": "condition", "id": "c", "ownerUri": "homey:app:a", "outputFalse": []},
        {"type": "action", "id": "a", "ownerUri": "homey:app:a"}
    ]})");
    auto flow = normalize_and_validate_advanced_flow(raw);
    CHECK(flow.cards.size() == 3);
    CHECK(edge_count(flow) == 2);
    const std::string c = key_with_type(flow, CardType::Condition);
    CHECK(flow.cards[c].output_true == std::vector<std::string>{ key_with_type(flow, CardType::Action) });
    std::printf("  [PASS] empty_output_list_still_chained\n");
}

static void test_structural_errors() {
    CHECK(structural_error(json::parse(R"({"name": "x", "cards": []})")).find("at least one") != std::string::npos);
    CHECK(structural_error(json::parse(R"({"name": "x", "cards": {}})")).find("at least one") != std::string::npos);
    CHECK(structural_error(json::parse(R"({"name": "x", "cards": [{"type": "action"}]})")).find("at least one") != std::string::npos);
    CHECK(structural_error(json::parse(R"({"name": "x"})")) == "Advanced flow requires cards");
    CHECK(structural_error(json::parse(R"({"name": "x", "cards": null})")) == "Advanced flow requires cards");
    CHECK(structural_error(json::parse(R"({"name": "x", "cards": "abc"})")).find("object or an array") != std::string::npos);
    CHECK(!structural_error(json::array()).empty());
    std::printf("  [PASS] structural_errors\n");
}

static void test_dangling_edges_pruned() {
    json raw = json::parse(R"({"name": "D", "cards": {
        "t1": {"type": "trigger", "id": "t", "ownerUri": "homey:app:a", "x": 0, "y": 0,
               "outputSuccess": ["a1", "ghost"]},
        "a1": {"type": "action", "id": "a", "ownerUri": "homey:app:a", "x": 400, "y": 0,
               "outputError": ["nowhere"]}
    }})");
    auto flow = normalize_and_validate_advanced_flow(raw);
    CHECK(flow.cards["t1"].output_success == std::vector<std::string>{ "a1" });
    CHECK(flow.cards["a1"].output_error.empty());

    /* out-of-range list index */
    json listed = json::parse(R"({"name": "I", "cards": [
        {"type": "trigger", "id": "t", "ownerUri": "homey:app:a", "outputSuccess": [1, 9]},
        {"type": "action", "id": "a", "ownerUri": "homey:app:a"}
    ]})");
    auto indexed = normalize_and_validate_advanced_flow(listed);
    const std::string t = key_with_type(indexed, CardType::Trigger);
    const std::string a = key_with_type(indexed, CardType::Action);
    CHECK(indexed.cards[t].output_success == std::vector<std::string>{ a });
    std::printf("  [PASS] dangling_edges_pruned\n");
}

static void test_advisory_warnings() {
    AdvancedFlowOptions options;
    options.catalog = std::make_shared<const flow_catalog::CatalogSnapshot>(flow_catalog::demo_catalog());
    std::vector<flow_model::AdvisoryWarning> warnings;
    options.warnings = &warnings;

    json raw = json::parse(R"({"name": "W", "cards": [
        {"type": "trigger", "id": "sunset", "ownerUri": "homey:app:com.athom.sun"},
        {"type": "action", "id": "launch_rocket", "ownerUri": "homey:app:space"},
        {"type": "delay", "args": {"delay": 5}}
    ]})");
    auto flow = normalize_and_validate_advanced_flow(raw, options);
    CHECK(flow.cards.size() == 3);
    CHECK(warnings.size() == 1);
    CHECK(warnings[0].capability_id == "launch_rocket");
    CHECK(warnings[0].card_type == "action");
    CHECK(warnings[0].message.find("launch_rocket") != std::string::npos);

    warnings.clear();
    options.catalog = nullptr;
    normalize_and_validate_advanced_flow(raw, options);
    CHECK(warnings.empty());
    std::printf("  [PASS] advisory_warnings\n");
}

static void test_arrange_by_type() {
    AdvancedFlowOptions options;
    options.arrange_by_type = true;
    auto flow = normalize_and_validate_advanced_flow(json::parse(three_cards), options);
    CHECK(flow.cards[key_with_type(flow, CardType::Trigger)].x == 50);
    CHECK(flow.cards[key_with_type(flow, CardType::Condition)].x == 400);
    CHECK(flow.cards[key_with_type(flow, CardType::Action)].x == 800);
    CHECK(flow.cards[key_with_type(flow, CardType::Action)].y == 40);
    std::printf("  [PASS] arrange_by_type\n");
}

static bool contains_null(const json& j) {
    if (j.is_null()) return true;
    if (j.is_structured())
        for (const auto& v : j)
            if (contains_null(v)) return true;
    return false;
}

static void test_payload_has_no_nulls() {
    json raw = json::parse(R"({"name": null, "enabled": "no", "folder": null, "cards": [
        {"type": "trigger", "id": "t", "ownerUri": "homey:app:a", "args": {"a": null, "b": [null, 1]}, "droptoken": null},
        {"type": "note", "value": "remember", "color": null}
    ]})");
    auto flow = normalize_and_validate_advanced_flow(raw);
    json payload = advanced_flow_payload(flow);
    CHECK(!contains_null(payload));
    CHECK(payload["enabled"] == false);
    CHECK(payload["name"].get<std::string>().rfind("Flow ", 0) == 0);
    CHECK(!payload.contains("folder"));
    std::printf("  [PASS] payload_has_no_nulls\n");
}

int main() {
    std::printf("=== advanced_flow_test ===\n");
    flow_log::configure_logging("off");
    test_three_card_chain();
    test_long_chain_edges();
    test_map_input_idempotent();
    test_list_excludes_map_rejects();
    test_malformed_position_excluded();
    test_empty_output_list_still_chained();
    test_structural_errors();
    test_dangling_edges_pruned();
    test_advisory_warnings();
    test_arrange_by_type();
    test_payload_has_no_nulls();
    std::printf("All 11 advanced_flow tests passed.\n");
    return 0;
}
