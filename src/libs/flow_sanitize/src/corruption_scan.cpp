#include <flow_sanitize/corruption_scan.hpp>
#include <flow_sanitize/field_rules.hpp>
#include <flow_log/logger.hpp>

namespace flow_sanitize {

namespace {

bool missing(const nlohmann::json& record, const char* key) {
    return field_or_null(record, key).is_null();
}

} // namespace

std::vector<std::string> find_flow_issues(const nlohmann::json& record, flow_model::FlowKind kind) {
    std::vector<std::string> issues;
    if (record.is_null()) {
        issues.push_back("Record is null");
        return issues;
    }
    if (!record.is_object()) {
        issues.push_back(std::string("Record is not an object: ") + record.type_name());
        return issues;
    }

    const auto& name = field_or_null(record, "name");
    if (name.is_null())
        issues.push_back("Missing name (null)");
    else if (!name.is_string())
        issues.push_back("Name is not a string: " + std::string(name.type_name()) + " - " + name.dump());
    else if (is_blank(name.get<std::string>()))
        issues.push_back("Empty name string");

    if (missing(record, "id")) issues.push_back("Missing id");
    if (missing(record, "enabled")) issues.push_back("Missing enabled field");

    if (kind == flow_model::FlowKind::Regular) {
        if (missing(record, "trigger")) issues.push_back("Missing trigger");
        if (missing(record, "actions")) issues.push_back("Missing actions");
    } else {
        const auto& cards = field_or_null(record, "cards");
        if (cards.is_null())
            issues.push_back("Missing cards");
        else if (!cards.is_object())
            issues.push_back("Cards is not an object: " + std::string(cards.type_name()));
    }
    return issues;
}

std::map<std::string, std::vector<std::string>> find_corrupt_flows(const nlohmann::json& flows,
    flow_model::FlowKind kind)
{
    std::map<std::string, std::vector<std::string>> out;
    if (!flows.is_object()) return out;

    for (auto it = flows.begin(); it != flows.end(); ++it) {
        auto issues = find_flow_issues(it.value(), kind);
        if (!issues.empty()) out[it.key()] = std::move(issues);
    }
    flow_log::logger()->info("Scanned {} flow records, {} with issues", flows.size(), out.size());
    return out;
}

} // namespace flow_sanitize
