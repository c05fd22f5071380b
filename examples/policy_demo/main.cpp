/// @file main.cpp
/// @brief Packaging policy demo
///
/// Loads a packaging policy and a catalog of extension module variants from JSON,
/// resolves the extension modules for one target triple and logs the selection.

#include <pyembed/core/log.hpp>
#include <pyembed/packaging/packaging.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

using pyembed_packaging::LibraryDependency;
using pyembed_packaging::PythonExtensionModule;
using pyembed_packaging::PythonExtensionModuleVariants;

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " [OPTIONS] POLICY_JSON CATALOG_JSON TARGET_TRIPLE\n"
              << "\n"
              << "Arguments:\n"
              << "  POLICY_JSON     Packaging policy document\n"
              << "  CATALOG_JSON    Extension module variants available in the distribution\n"
              << "  TARGET_TRIPLE   Target to resolve for (e.g. x86_64-unknown-linux-gnu)\n"
              << "\n"
              << "Options:\n"
              << "  --help, -h          Show this help message\n"
              << "  --log-level LEVEL   trace, debug, info, warn, error, critical, off\n"
              << "  --log-file PATH     Also write the log to PATH\n"
              << "\n"
              << "Example:\n"
              << "  " << program_name
              << " data/policy.json data/catalog.json x86_64-unknown-linux-musl\n";
}

/// Parse one variant object of the catalog
PythonExtensionModule parse_variant(const std::string& name, const nlohmann::json& j) {
    PythonExtensionModule em;
    em.name = name;
    em.init_fn = j.value("init_fn", "PyInit_" + name);
    em.builtin_default = j.value("builtin_default", false);
    em.required = j.value("required", false);
    em.is_package = j.value("is_package", false);

    if (j.contains("variant")) {
        em.variant = j.at("variant").get<std::string>();
    }

    for (const auto& library : j.value("link_libraries", nlohmann::json::array())) {
        LibraryDependency dep;
        dep.name = library.get<std::string>();
        em.link_libraries.push_back(std::move(dep));
    }

    if (j.contains("licenses")) {
        em.licenses = j.at("licenses").get<std::vector<std::string>>();
    }
    if (j.contains("license_public_domain")) {
        em.license_public_domain = j.at("license_public_domain").get<bool>();
    }

    return em;
}

/// Load the extension catalog: [{"name": "_ssl", "variants": [{...}, ...]}, ...]
bool load_catalog(spdlog::logger& logger, const fs::path& path,
                  std::vector<PythonExtensionModuleVariants>& out) {
    std::ifstream file(path);
    if (!file.is_open()) {
        logger.error("Failed to open catalog: {}", path.string());
        return false;
    }

    try {
        auto j = nlohmann::json::parse(file);
        for (const auto& entry : j.at("extensions")) {
            auto name = entry.at("name").get<std::string>();
            PythonExtensionModuleVariants variants;
            for (const auto& variant : entry.at("variants")) {
                variants.push(parse_variant(name, variant));
            }
            out.push_back(std::move(variants));
        }
    } catch (const nlohmann::json::exception& e) {
        logger.error("Invalid catalog {}: {}", path.string(), e.what());
        return false;
    }

    return true;
}

} // anonymous namespace

// =============================================================================
// Main
// =============================================================================

int main(int argc, char** argv) {
    std::vector<std::string> positional;
    pyembed_core::LogConfig log_config;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--log-level") {
            if (i + 1 >= argc) {
                std::cerr << "--log-level requires a value\n";
                return 1;
            }
            auto level = pyembed_core::parse_log_level(argv[++i]);
            if (!level) {
                std::cerr << "Unknown log level: " << argv[i] << "\n";
                return 1;
            }
            log_config.level = *level;
        } else if (arg == "--log-file") {
            if (i + 1 >= argc) {
                std::cerr << "--log-file requires a value\n";
                return 1;
            }
            log_config.log_file = fs::path(argv[++i]);
        } else if (!arg.empty() && arg[0] != '-') {
            positional.push_back(arg);
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (positional.size() != 3) {
        print_usage(argv[0]);
        return 1;
    }

    pyembed_core::configure_logging(log_config);
    auto logger = pyembed_core::get_logger("policy_demo");

    const fs::path policy_path = positional[0];
    const fs::path catalog_path = positional[1];
    const std::string& target_triple = positional[2];

    auto policy = pyembed_packaging::PythonPackagingPolicy::load(policy_path);
    if (!policy) {
        logger->error("Failed to load policy: {}", pyembed_core::build_error_chain(policy.error()));
        return 1;
    }

    logger->info("Policy: filter={} resources={}",
        pyembed_packaging::extension_module_filter_to_string(policy->extension_module_filter()),
        policy->resources_policy().to_string());
    logger->debug("Effective policy:\n{}", policy->to_json_string());

    std::vector<PythonExtensionModuleVariants> catalog;
    if (!load_catalog(*logger, catalog_path, catalog)) {
        return 1;
    }

    auto resolved = policy->resolve_python_extension_modules(catalog, target_triple);
    if (!resolved) {
        logger->error("Resolution failed: {}", pyembed_core::build_error_chain(resolved.error()));
        return 1;
    }

    logger->info("Selected {} extension module entries for {}:", resolved->size(), target_triple);
    for (const auto& em : *resolved) {
        logger->info("  - {}{}{}", em.display_name(),
            em.is_minimally_required() ? " (required)" : "",
            em.requires_libraries() ? " (links libraries)" : "");
    }

    pyembed_core::flush_all_loggers();
    return 0;
}
