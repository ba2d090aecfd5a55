#include <flow_sanitize/deep_clean.hpp>
#include <flow_sanitize/field_rules.hpp>
#include <flow_log/logger.hpp>

namespace flow_sanitize {

namespace {

const char* const kept_card_fields[] = {
    "x", "y", "outputSuccess", "outputTrue", "outputFalse", "outputError"
};

std::string record_label(const nlohmann::json& record) {
    if (record.contains("id") && record["id"].is_string()) return record["id"].get<std::string>();
    if (record.contains("id") && record["id"].is_number()) return record["id"].dump();
    return "<no id>";
}

nlohmann::json reshape_card(const std::string& flow, const std::string& key, const nlohmann::json& card) {
    auto log = flow_log::logger();
    nlohmann::json out = nlohmann::json::object();

    auto required = [&](const char* field, const char* fallback) {
        if (!card.contains(field)) {
            log->warn("Flow {}: card '{}' has no {}; substituting '{}'", flow, key, field, fallback);
            out[field] = fallback;
        } else if (card[field].is_structured()) {
            log->warn("Flow {}: card '{}' has {} of type {}; substituting '{}'", flow, key, field,
                card[field].type_name(), fallback);
            out[field] = fallback;
        } else {
            out[field] = card[field];
        }
    };
    required("type", "action");
    required("id", unknown_card_id);
    required("ownerUri", unknown_owner_uri);

    for (const char* field : kept_card_fields) {
        if (card.contains(field) && is_valid_value(card[field]))
            out[field] = card[field];
    }
    return out;
}

} // namespace

bool is_valid_value(const nlohmann::json& value) {
    if (value.is_null() || value.is_discarded()) return false;
    if (value.is_string()) return !is_blank(value.get_ref<const std::string&>());
    if (value.is_object() || value.is_array()) return !value.empty();
    return true;
}

nlohmann::json deep_clean(const nlohmann::json& value) {
    if (value.is_object()) {
        nlohmann::json cleaned = nlohmann::json::object();
        for (auto it = value.begin(); it != value.end(); ++it) {
            if (it.key().empty()) continue;
            nlohmann::json v = deep_clean(it.value());
            if (is_valid_value(v)) cleaned[it.key()] = std::move(v);
        }
        return cleaned;
    }
    if (value.is_array()) {
        nlohmann::json cleaned = nlohmann::json::array();
        for (const auto& item : value) {
            nlohmann::json v = deep_clean(item);
            if (is_valid_value(v)) cleaned.push_back(std::move(v));
        }
        return cleaned;
    }
    return is_valid_value(value) ? value : nlohmann::json();
}

nlohmann::json clean_flow_record(const nlohmann::json& record, const std::string& fallback_name) {
    nlohmann::json result = deep_clean(record);
    if (!result.is_object()) return result;

    auto log = flow_log::logger();
    const std::string label = record_label(result);

    if (!result.contains("name") || !result["name"].is_string()) {
        log->warn("Flow {} has no usable name; substituting '{}'", label, fallback_name);
        result["name"] = fallback_name;
    }

    if (!result.contains("cards")) {
        result["cards"] = nlohmann::json::object();
    } else if (!result["cards"].is_object()) {
        log->warn("Flow {} has cards of type {}; replacing with an empty map", label, result["cards"].type_name());
        result["cards"] = nlohmann::json::object();
    }

    nlohmann::json cards = nlohmann::json::object();
    for (auto it = result["cards"].begin(); it != result["cards"].end(); ++it) {
        if (!it.value().is_object()) {
            log->warn("Flow {}: dropping card '{}' of type {}", label, it.key(), it.value().type_name());
            continue;
        }
        cards[it.key()] = reshape_card(label, it.key(), it.value());
    }
    result["cards"] = std::move(cards);
    return result;
}

nlohmann::json clean_flow_collection(const nlohmann::json& flows, const std::string& fallback_name) {
    if (!flows.is_object()) return flows;

    auto log = flow_log::logger();
    nlohmann::json cleaned = nlohmann::json::object();
    for (auto it = flows.begin(); it != flows.end(); ++it) {
        if (it.value().is_null()) {
            log->warn("Skipping null flow record '{}'", it.key());
            continue;
        }
        nlohmann::json flow = clean_flow_record(it.value(), fallback_name);
        if (!flow.is_object()) {
            log->warn("Skipping flow record '{}' of type {}", it.key(), it.value().type_name());
            continue;
        }
        cleaned[it.key()] = std::move(flow);
    }
    log->info("Cleaned {} of {} flow records", cleaned.size(), flows.size());
    return cleaned;
}

} // namespace flow_sanitize
