#include <flow_sanitize/folder_sanitizer.hpp>
#include <flow_sanitize/deep_clean.hpp>
#include <flow_sanitize/field_rules.hpp>
#include <flow_model/json_codec.hpp>

namespace flow_sanitize {

flow_model::Folder sanitize_folder(const nlohmann::json& name, const nlohmann::json& parent) {
    auto folder_name = non_blank_string(name);
    if (!folder_name)
        throw flow_model::StructuralError("name", "Folder name must be a non-empty string");

    flow_model::Folder folder;
    folder.name = *folder_name;
    folder.parent = non_blank_string(parent);
    return folder;
}

nlohmann::json folder_payload(const flow_model::Folder& folder) {
    return deep_clean(flow_model::to_json(folder));
}

} // namespace flow_sanitize
