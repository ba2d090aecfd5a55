#pragma once

#include <flow_catalog/capability_source.hpp>
#include <istream>
#include <optional>
#include <string>

namespace flow_catalog {

// Document shape: {"triggers": [...], "conditions": [...], "actions": [...]}.
// Missing lists are empty; descriptors without a string id are skipped.
std::optional<CatalogSnapshot> load_catalog_from_json(std::istream& in);
std::optional<CatalogSnapshot> load_catalog_from_json_file(const std::string& path);

} // namespace flow_catalog
