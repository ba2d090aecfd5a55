/**
 * @file card_types_test.cpp
 * @brief Card variant table, required-field sets and JSON encoders
 */

#include <flow_model/card_types.hpp>
#include <flow_model/errors.hpp>
#include <flow_model/json_codec.hpp>

#include <cstdio>
#include <cstdlib>
#include <string>

#define CHECK(cond) do { \
    if (!(cond)) { \
        std::fprintf(stderr, "FAIL: %s @ %s:%d\n", #cond, __FILE__, __LINE__); \
        std::exit(1); \
    } \
} while(0)

using namespace flow_model;

static void test_variant_table() {
    CHECK(card_type_from_string("trigger") == CardType::Trigger);
    CHECK(card_type_from_string("start") == CardType::Start);
    CHECK(!card_type_from_string("end"));
    CHECK(!card_type_from_string("Trigger"));
    CHECK(to_string(CardType::Condition) == "condition");

    int builtin = 0;
    for (const auto& t : card_type_table)
        if (t.builtin) ++builtin;
    CHECK(builtin == 5);
    CHECK(!is_builtin(CardType::Action));
    CHECK(is_builtin(CardType::Note));
    CHECK(traits_of(CardType::Condition).auto_wire_field == "outputTrue");
    CHECK(traits_of(CardType::Delay).auto_wire_field == "outputSuccess");
    CHECK(traits_of(CardType::Note).terminal);
    std::printf("  [PASS] variant_table\n");
}

static void test_required_fields() {
    auto builtin = required_fields(CardType::Delay);
    CHECK(builtin.size() == 3);
    auto owned = required_fields(CardType::Trigger);
    CHECK(owned.size() == 5);
    CHECK(owned[3] == "ownerUri");
    CHECK(owned[4] == "id");
    std::printf("  [PASS] required_fields\n");
}

static void test_card_encoding_omits_absent_fields() {
    Card card;
    card.type = CardType::Delay;
    card.x = 10;
    card.y = 20;
    card.args = { { "delay", { { "number", 5 }, { "multiplier", 60 } } } };
    nlohmann::json j = to_json(card);
    CHECK(j["type"] == "delay");
    CHECK(!j.contains("ownerUri"));
    CHECK(!j.contains("id"));
    CHECK(!j.contains("outputSuccess"));
    CHECK(!j.contains("inverted"));
    CHECK(j["args"]["delay"]["number"] == 5);

    card.output_success = { "next" };
    card.inverted = false;
    j = to_json(card);
    CHECK(j["outputSuccess"] == nlohmann::json::array({ "next" }));
    CHECK(j["inverted"] == false);
    std::printf("  [PASS] card_encoding_omits_absent_fields\n");
}

static void test_folder_encoding() {
    Folder f;
    f.name = "Lights";
    nlohmann::json j = to_json(f);
    CHECK(!j.contains("parent"));
    CHECK(!j.contains("id"));
    f.parent = "root";
    CHECK(to_json(f)["parent"] == "root");
    std::printf("  [PASS] folder_encoding\n");
}

static void test_card_field_error_message() {
    CardFieldError e("action_1", "ownerUri", "is required for action cards");
    CHECK(e.field() == "ownerUri");
    CHECK(e.card_key() == "action_1");
    CHECK(std::string(e.what()).find("ownerUri") != std::string::npos);
    CHECK(std::string(e.what()).find("action_1") != std::string::npos);
    std::printf("  [PASS] card_field_error_message\n");
}

static void test_capability_from_json() {
    auto cap = capability_from_json({ { "id", "sunset" }, { "uri", "homey:app:com.athom.sun" }, { "title", "Sunset" } });
    CHECK(cap);
    CHECK(cap->uri == "homey:app:com.athom.sun");
    CHECK(cap->args.is_array());
    CHECK(!capability_from_json({ { "uri", "homey:app:x" } }));
    CHECK(!capability_from_json(nullptr));
    std::printf("  [PASS] capability_from_json\n");
}

static void test_output_lists() {
    flow_model::Card card;
    card.outputs("outputTrue")->push_back("next");
    CHECK(card.output_true.size() == 1);
    CHECK(card.outputs("input") == nullptr);

    const flow_model::Card& view = card;
    CHECK(view.outputs("outputTrue") == &card.output_true);
    CHECK(view.outputs("outputError") == &card.output_error);
    CHECK(view.outputs("bogus") == nullptr);
    std::printf("  [PASS] output_lists\n");
}

int main() {
    std::printf("=== card_types_test ===\n");
    test_variant_table();
    test_required_fields();
    test_card_encoding_omits_absent_fields();
    test_folder_encoding();
    test_card_field_error_message();
    test_capability_from_json();
    test_output_lists();
    std::printf("All 7 card_types tests passed.\n");
    return 0;
}
