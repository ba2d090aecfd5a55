#pragma once

#include <flow_model/types.hpp>
#include <nlohmann/json.hpp>
#include <map>
#include <string>
#include <vector>

namespace flow_sanitize {

// Problems in a stored flow record that clean_flow_record would have to
// repair, or that make the record unusable. Empty when the record is sound.
std::vector<std::string> find_flow_issues(const nlohmann::json& record, flow_model::FlowKind kind);

// id -> issues for every record of an id -> record map that has any.
std::map<std::string, std::vector<std::string>> find_corrupt_flows(const nlohmann::json& flows,
    flow_model::FlowKind kind);

} // namespace flow_sanitize
