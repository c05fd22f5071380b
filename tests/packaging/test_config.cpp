// pyembed_packaging policy configuration tests
//
// Tests for loading packaging policies from JSON documents and files.

#include <catch2/catch.hpp>
#include <pyembed/packaging/policy.hpp>

#include <filesystem>
#include <fstream>
#include <string>

using namespace pyembed_packaging;
using namespace pyembed_core;

namespace {

/// Write a file into a per-test temporary directory
std::filesystem::path write_temp_file(const std::string& name, const std::string& contents) {
    auto dir = std::filesystem::temp_directory_path() / "pyembed_tests";
    std::filesystem::create_directories(dir);
    auto path = dir / name;
    std::ofstream out(path);
    out << contents;
    return path;
}

} // anonymous namespace

TEST_CASE("Policy from JSON string", "[packaging][config]") {
    SECTION("empty object keeps defaults") {
        auto result = PythonPackagingPolicy::from_json_string("{}");
        REQUIRE(result.is_ok());
        REQUIRE(result->extension_module_filter() == ExtensionModuleFilter::All);
        REQUIRE(result->resources_policy() == PythonResourcesPolicy::in_memory_only());
        REQUIRE(result->include_distribution_sources());
        REQUIRE_FALSE(result->include_distribution_resources());
        REQUIRE_FALSE(result->include_test());
    }

    SECTION("every key") {
        auto result = PythonPackagingPolicy::from_json_string(R"({
  "extension_module_filter": "no-gpl",
  "resources_policy": "prefer-in-memory-fallback-filesystem-relative:lib",
  "include_distribution_sources": false,
  "include_distribution_resources": true,
  "include_test": true,
  "preferred_extension_module_variants": { "_ssl": "openssl", "_sqlite3": "system" },
  "broken_extensions": {
    "x86_64-unknown-linux-musl": ["_crypt", "_ctypes"],
    "x86_64-apple-darwin": ["_tkinter"]
  }
})");
        REQUIRE(result.is_ok());
        const auto& policy = result.value();
        REQUIRE(policy.extension_module_filter() == ExtensionModuleFilter::NoGPL);
        REQUIRE(policy.resources_policy() ==
                PythonResourcesPolicy::prefer_in_memory_fallback_filesystem_relative("lib"));
        REQUIRE_FALSE(policy.include_distribution_sources());
        REQUIRE(policy.include_distribution_resources());
        REQUIRE(policy.include_test());
        REQUIRE(policy.preferred_extension_module_variants().at("_ssl") == "openssl");
        REQUIRE(policy.preferred_extension_module_variants().at("_sqlite3") == "system");
        REQUIRE(policy.is_broken_extension("x86_64-unknown-linux-musl", "_ctypes"));
        REQUIRE(policy.is_broken_extension("x86_64-apple-darwin", "_tkinter"));
        REQUIRE_FALSE(policy.is_broken_extension("x86_64-apple-darwin", "_crypt"));
    }

    SECTION("to_json_string round trips") {
        PythonPackagingPolicy policy;
        policy.set_extension_module_filter(ExtensionModuleFilter::NoLibraries);
        policy.set_resources_policy(PythonResourcesPolicy::filesystem_relative_only("a:b"));
        policy.set_include_test(true);
        policy.set_preferred_extension_module_variant("_ssl", "libressl");
        policy.register_broken_extension("i686-pc-windows-msvc", "_curses");

        auto result = PythonPackagingPolicy::from_json_string(policy.to_json_string());
        REQUIRE(result.is_ok());
        REQUIRE(result->to_json_string() == policy.to_json_string());
        REQUIRE(result->resources_policy().prefix() == "a:b");
    }
}

TEST_CASE("Policy JSON errors", "[packaging][config]") {
    SECTION("syntax error") {
        auto result = PythonPackagingPolicy::from_json_string("{ not json", "policy.json");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::ParseError);
        REQUIRE(result.error().as<ConfigError>()->kind == ConfigError::Kind::Syntax);
        REQUIRE(result.error().message().find("policy.json") != std::string::npos);
    }

    SECTION("document must be an object") {
        auto result = PythonPackagingPolicy::from_json_string("[]");
        REQUIRE(result.is_err());
        REQUIRE(result.error().as<ConfigError>()->kind == ConfigError::Kind::WrongType);
    }

    SECTION("invalid filter value propagates the policy error") {
        auto result = PythonPackagingPolicy::from_json_string(
            R"({"extension_module_filter": "bogus"})", "policy.json");
        REQUIRE(result.is_err());
        REQUIRE(result.error().as<PolicyError>()->kind == PolicyError::Kind::InvalidFilterValue);
        REQUIRE(*result.error().get_context("key") == "extension_module_filter");
        REQUIRE(*result.error().get_context("source") == "policy.json");
    }

    SECTION("invalid resources policy propagates the policy error") {
        auto result = PythonPackagingPolicy::from_json_string(R"({"resources_policy": "bogus"})");
        REQUIRE(result.is_err());
        REQUIRE(result.error().as<PolicyError>()->kind == PolicyError::Kind::InvalidPolicyValue);
        REQUIRE(result.error().as<PolicyError>()->value == "bogus");
    }

    SECTION("wrong value types") {
        for (const char* doc : {
                 R"({"extension_module_filter": 3})",
                 R"({"resources_policy": null})",
                 R"({"include_test": "yes"})",
                 R"({"include_distribution_sources": 1})",
                 R"({"preferred_extension_module_variants": []})",
                 R"({"preferred_extension_module_variants": {"_ssl": 1}})",
                 R"({"broken_extensions": {"x86_64-unknown-linux-gnu": "_crypt"}})",
                 R"({"broken_extensions": {"x86_64-unknown-linux-gnu": [1]}})"}) {
            INFO(doc);
            auto result = PythonPackagingPolicy::from_json_string(doc);
            REQUIRE(result.is_err());
            REQUIRE(result.error().code() == ErrorCode::ParseError);
            REQUIRE(result.error().as<ConfigError>()->kind == ConfigError::Kind::WrongType);
        }
    }

    SECTION("unknown keys are ignored") {
        auto result = PythonPackagingPolicy::from_json_string(R"({"comment": "hi"})");
        REQUIRE(result.is_ok());
    }
}

TEST_CASE("Policy from file", "[packaging][config]") {
    SECTION("load existing file") {
        auto path = write_temp_file("policy_minimal.json",
            R"({"extension_module_filter": "minimal", "include_test": true})");
        auto result = PythonPackagingPolicy::load(path);
        REQUIRE(result.is_ok());
        REQUIRE(result->extension_module_filter() == ExtensionModuleFilter::Minimal);
        REQUIRE(result->include_test());
    }

    SECTION("missing file") {
        auto result = PythonPackagingPolicy::load(
            std::filesystem::temp_directory_path() / "pyembed_tests" / "does_not_exist.json");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::NotFound);
    }

    SECTION("directory is unreadable") {
        auto dir = std::filesystem::temp_directory_path() / "pyembed_tests" / "policy_dir.json";
        std::filesystem::create_directories(dir);
        auto result = PythonPackagingPolicy::load(dir);
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::IOError);
        REQUIRE(result.error().as<ConfigError>()->kind == ConfigError::Kind::FileUnreadable);
    }

    SECTION("empty file is a syntax error") {
        auto path = write_temp_file("policy_empty.json", "");
        auto result = PythonPackagingPolicy::load(path);
        REQUIRE(result.is_err());
        REQUIRE(result.error().as<ConfigError>()->kind == ConfigError::Kind::Syntax);
    }

    SECTION("errors carry the file path") {
        auto path = write_temp_file("policy_bad.json", R"({"include_test": "no"})");
        auto result = PythonPackagingPolicy::load(path);
        REQUIRE(result.is_err());
        REQUIRE(*result.error().get_context("source") == path.string());
    }
}
