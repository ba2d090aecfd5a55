#pragma once

#include <flow_model/errors.hpp>
#include <flow_model/types.hpp>
#include <nlohmann/json.hpp>

namespace flow_sanitize {

// Folder creation payload. Throws StructuralError when the name is null, not
// a string or blank. The parent is kept only when it is a non-blank string.
flow_model::Folder sanitize_folder(const nlohmann::json& name, const nlohmann::json& parent = nullptr);

nlohmann::json folder_payload(const flow_model::Folder& folder);

} // namespace flow_sanitize
