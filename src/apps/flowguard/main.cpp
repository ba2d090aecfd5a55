// flowguard: sanitize and validate hub flow documents from the command line.
#include <flow_catalog/capability_catalog.hpp>
#include <flow_catalog/catalog_loader.hpp>
#include <flow_config/config.hpp>
#include <flow_log/logger.hpp>
#include <flow_sanitize/advanced_flow.hpp>
#include <flow_sanitize/corruption_scan.hpp>
#include <flow_sanitize/deep_clean.hpp>
#include <flow_sanitize/field_rules.hpp>
#include <flow_sanitize/flow_sanitizer.hpp>
#include <flow_sanitize/folder_sanitizer.hpp>
#include <nlohmann/json.hpp>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace {

const int exit_invalid = 1;
const int exit_usage = 2;

void print_usage() {
    (void)fprintf(stderr,
        "usage: flowguard [--config <file>] [--catalog <file>] [--demo] [--arrange] <command> [<input.json>]\n"
        "commands:\n"
        "  basic             sanitize a basic flow (trigger, conditions, actions)\n"
        "  advanced          normalize and validate an advanced flow (cards)\n"
        "  folder            sanitize a folder payload {\"name\", \"parent\"}\n"
        "  clean             deep-clean any document and repair it as a flow record\n"
        "  clean-collection  repair an id -> flow map as returned by the hub\n"
        "  scan              report corrupt records in an id -> flow map\n"
        "  scan-advanced     same as scan for advanced flows\n");
}

std::optional<nlohmann::json> read_document(const std::string& path) {
    try {
        if (path.empty() || path == "-") return nlohmann::json::parse(std::cin);
        std::ifstream f(path);
        if (!f) return std::nullopt;
        return nlohmann::json::parse(f);
    } catch (const nlohmann::json::parse_error& e) {
        flow_log::logger()->error("Cannot parse {}: {}", path.empty() ? "stdin" : path, e.what());
        return std::nullopt;
    }
}

std::shared_ptr<const flow_catalog::CatalogSnapshot> load_catalog(const flow_config::GatewayConfig& cfg) {
    std::shared_ptr<flow_catalog::CapabilitySource> source;
    if (!cfg.catalog_path.empty()) {
        auto snapshot = flow_catalog::load_catalog_from_json_file(cfg.catalog_path);
        if (!snapshot) {
            flow_log::logger()->warn("Capability catalog {} unreadable; advisory checks disabled", cfg.catalog_path);
            return nullptr;
        }
        source = std::make_shared<flow_catalog::StaticCapabilitySource>(std::move(*snapshot));
    } else if (cfg.demo_mode || cfg.offline_mode) {
        source = std::make_shared<flow_catalog::StaticCapabilitySource>(flow_catalog::demo_catalog());
    } else {
        return nullptr;
    }
    flow_catalog::CapabilityCatalog catalog(source);
    return catalog.snapshot();
}

nlohmann::json scan_report(const nlohmann::json& doc, flow_model::FlowKind kind) {
    nlohmann::json report = nlohmann::json::object();
    for (const auto& [id, issues] : flow_sanitize::find_corrupt_flows(doc, kind))
        report[id] = issues;
    return report;
}

} // namespace

int main(int argc, char* argv[])
{
    std::string config_path;
    std::string catalog_path;
    bool demo = false;
    bool arrange = false;
    std::string command;
    std::string input_path;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if ((arg == "--config" || arg == "--catalog") && i + 1 < argc) {
            (arg == "--config" ? config_path : catalog_path) = argv[++i];
        } else if (arg == "--demo") {
            demo = true;
        } else if (arg == "--arrange") {
            arrange = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else if (command.empty()) {
            command = arg;
        } else if (input_path.empty()) {
            input_path = arg;
        } else {
            print_usage();
            return exit_usage;
        }
    }
    if (command.empty()) {
        print_usage();
        return exit_usage;
    }

    flow_config::GatewayConfig cfg;
    if (!config_path.empty()) {
        auto loaded = flow_config::load_config_from_json_file(config_path);
        if (!loaded) {
            (void)fprintf(stderr, "cannot read config file %s\n", config_path.c_str());
            return exit_usage;
        }
        cfg = std::move(*loaded);
    }
    flow_config::apply_env_overrides(cfg);
    if (demo) cfg.demo_mode = true;
    if (!catalog_path.empty()) cfg.catalog_path = catalog_path;
    flow_log::configure_logging(cfg.log_level, cfg.log_file);
    auto log = flow_log::logger();

    auto doc = read_document(input_path);
    if (!doc) {
        log->error("No JSON document read from {}", input_path.empty() ? "stdin" : input_path);
        return exit_usage;
    }

    nlohmann::json out;
    try {
        if (command == "basic") {
            out = flow_sanitize::basic_flow_payload(flow_sanitize::sanitize_basic_flow(*doc));
        } else if (command == "advanced") {
            flow_sanitize::AdvancedFlowOptions options;
            options.catalog = load_catalog(cfg);
            options.arrange_by_type = arrange;
            out = flow_sanitize::advanced_flow_payload(
                flow_sanitize::normalize_and_validate_advanced_flow(*doc, options));
        } else if (command == "folder") {
            auto folder = flow_sanitize::sanitize_folder(flow_sanitize::field_or_null(*doc, "name"),
                flow_sanitize::field_or_null(*doc, "parent"));
            out = flow_sanitize::folder_payload(folder);
        } else if (command == "clean") {
            out = flow_sanitize::clean_flow_record(*doc, cfg.fallback_flow_name);
        } else if (command == "clean-collection") {
            out = flow_sanitize::clean_flow_collection(*doc, cfg.fallback_flow_name);
        } else if (command == "scan") {
            out = scan_report(*doc, flow_model::FlowKind::Regular);
        } else if (command == "scan-advanced") {
            out = scan_report(*doc, flow_model::FlowKind::Advanced);
        } else {
            log->error("Unknown command '{}'", command);
            print_usage();
            return exit_usage;
        }
    } catch (const flow_model::ValidationError& e) {
        log->error("Validation failed on '{}': {}", e.field(), e.what());
        return exit_invalid;
    }

    std::cout << out.dump(2) << std::endl;
    return 0;
}
