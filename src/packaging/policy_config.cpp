/// @file policy_config.cpp
/// @brief JSON loading and saving of packaging policies

#include <pyembed/packaging/policy.hpp>
#include <pyembed/core/log.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

namespace pyembed_packaging {

// =============================================================================
// JSON Parsing Helpers
// =============================================================================

namespace {

using pyembed_core::ConfigError;
using pyembed_core::Error;

/// Read an optional boolean key
pyembed_core::Result<void> read_bool(const nlohmann::json& j, const char* key, bool& out) {
    if (!j.contains(key)) {
        return pyembed_core::Ok();
    }
    if (!j[key].is_boolean()) {
        return pyembed_core::Err(Error(ConfigError::wrong_type(key, "a boolean")));
    }
    out = j[key].get<bool>();
    return pyembed_core::Ok();
}

/// Parse "preferred_extension_module_variants": { "name": "variant", ... }
pyembed_core::Result<void> parse_preferred_variants(
    const nlohmann::json& j, PythonPackagingPolicy& policy) {

    constexpr const char* key = "preferred_extension_module_variants";
    if (!j.contains(key)) {
        return pyembed_core::Ok();
    }
    if (!j[key].is_object()) {
        return pyembed_core::Err(Error(ConfigError::wrong_type(key, "an object")));
    }

    for (const auto& [extension, variant] : j[key].items()) {
        if (!variant.is_string()) {
            return pyembed_core::Err(Error(ConfigError::wrong_type(
                std::string(key) + "." + extension, "a string")));
        }
        policy.set_preferred_extension_module_variant(extension, variant.get<std::string>());
    }
    return pyembed_core::Ok();
}

/// Parse "broken_extensions": { "triple": ["name", ...], ... }
pyembed_core::Result<void> parse_broken_extensions(
    const nlohmann::json& j, PythonPackagingPolicy& policy) {

    constexpr const char* key = "broken_extensions";
    if (!j.contains(key)) {
        return pyembed_core::Ok();
    }
    if (!j[key].is_object()) {
        return pyembed_core::Err(Error(ConfigError::wrong_type(key, "an object")));
    }

    for (const auto& [triple, names] : j[key].items()) {
        std::string path = std::string(key) + "." + triple;
        if (!names.is_array()) {
            return pyembed_core::Err(Error(ConfigError::wrong_type(path, "an array of strings")));
        }
        for (const auto& name : names) {
            if (!name.is_string()) {
                return pyembed_core::Err(Error(ConfigError::wrong_type(path, "an array of strings")));
            }
            policy.register_broken_extension(triple, name.get<std::string>());
        }
    }
    return pyembed_core::Ok();
}

/// Parse the whole document into a fresh policy
pyembed_core::Result<PythonPackagingPolicy> parse_policy(const nlohmann::json& j) {
    PythonPackagingPolicy policy;

    if (!j.is_object()) {
        return pyembed_core::Err<PythonPackagingPolicy>(
            Error(ConfigError::wrong_type("<document>", "an object")));
    }

    if (j.contains("extension_module_filter")) {
        if (!j["extension_module_filter"].is_string()) {
            return pyembed_core::Err<PythonPackagingPolicy>(
                Error(ConfigError::wrong_type("extension_module_filter", "a string")));
        }
        auto filter = parse_extension_module_filter(j["extension_module_filter"].get<std::string>());
        if (!filter) {
            return pyembed_core::Err<PythonPackagingPolicy>(
                filter.error().with_context("key", "extension_module_filter"));
        }
        policy.set_extension_module_filter(*filter);
    }

    if (j.contains("resources_policy")) {
        if (!j["resources_policy"].is_string()) {
            return pyembed_core::Err<PythonPackagingPolicy>(
                Error(ConfigError::wrong_type("resources_policy", "a string")));
        }
        auto resources = PythonResourcesPolicy::parse(j["resources_policy"].get<std::string>());
        if (!resources) {
            return pyembed_core::Err<PythonPackagingPolicy>(
                resources.error().with_context("key", "resources_policy"));
        }
        policy.set_resources_policy(std::move(*resources));
    }

    bool include_sources = policy.include_distribution_sources();
    bool include_resources = policy.include_distribution_resources();
    bool include_test = policy.include_test();

    for (auto result : {
            read_bool(j, "include_distribution_sources", include_sources),
            read_bool(j, "include_distribution_resources", include_resources),
            read_bool(j, "include_test", include_test)}) {
        if (!result) {
            return pyembed_core::Err<PythonPackagingPolicy>(result.error());
        }
    }

    policy.set_include_distribution_sources(include_sources);
    policy.set_include_distribution_resources(include_resources);
    policy.set_include_test(include_test);

    if (auto result = parse_preferred_variants(j, policy); !result) {
        return pyembed_core::Err<PythonPackagingPolicy>(result.error());
    }

    if (auto result = parse_broken_extensions(j, policy); !result) {
        return pyembed_core::Err<PythonPackagingPolicy>(result.error());
    }

    return pyembed_core::Ok(std::move(policy));
}

} // anonymous namespace

// =============================================================================
// PythonPackagingPolicy Configuration
// =============================================================================

pyembed_core::Result<PythonPackagingPolicy> PythonPackagingPolicy::load(
    const std::filesystem::path& path) {

    std::error_code ec;
    auto status = std::filesystem::status(path, ec);
    if (status.type() == std::filesystem::file_type::not_found) {
        return pyembed_core::Err<PythonPackagingPolicy>(
            Error(ConfigError::file_not_found(path.string())));
    }
    if (ec || !std::filesystem::is_regular_file(status)) {
        return pyembed_core::Err<PythonPackagingPolicy>(
            Error(ConfigError::file_unreadable(path.string())));
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return pyembed_core::Err<PythonPackagingPolicy>(
            Error(ConfigError::file_unreadable(path.string())));
    }

    // An empty file sets failbit on the buffer only; it is left to the parser.
    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return pyembed_core::Err<PythonPackagingPolicy>(
            Error(ConfigError::file_unreadable(path.string())));
    }

    auto result = from_json_string(buffer.str(), path);
    if (result) {
        PYEMBED_PACKAGING_DEBUG("Loaded packaging policy from {}", path.string());
    }
    return result;
}

pyembed_core::Result<PythonPackagingPolicy> PythonPackagingPolicy::from_json_string(
    const std::string& json_str,
    const std::filesystem::path& source_path) {

    std::string source = source_path.empty() ? std::string("<string>") : source_path.string();

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_str);
    } catch (const nlohmann::json::parse_error& e) {
        return pyembed_core::Err<PythonPackagingPolicy>(
            Error(ConfigError::syntax(source, e.what())));
    }

    auto result = parse_policy(j);
    if (!result) {
        result.error().with_context("source", source);
    }
    return result;
}

std::string PythonPackagingPolicy::to_json_string(int indent) const {
    nlohmann::json j;
    j["extension_module_filter"] = extension_module_filter_to_string(m_extension_module_filter);
    j["resources_policy"] = m_resources_policy.to_string();
    j["include_distribution_sources"] = m_include_distribution_sources;
    j["include_distribution_resources"] = m_include_distribution_resources;
    j["include_test"] = m_include_test;
    j["preferred_extension_module_variants"] = m_preferred_extension_module_variants;
    j["broken_extensions"] = m_broken_extensions;
    return j.dump(indent);
}

} // namespace pyembed_packaging
