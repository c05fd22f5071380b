#pragma once

/// @file resource.hpp
/// @brief Resources discovered in a Python distribution
///
/// PythonResource is a closed tagged union. Code that consumes it should use
/// std::visit with one branch per alternative so that a new alternative fails
/// to compile until every consumer handles it.

#include "fwd.hpp"
#include "extension_module.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <variant>
#include <vector>

namespace pyembed_packaging {

// =============================================================================
// Module Code
// =============================================================================

/// Python source code for a module
struct PythonModuleSource {
    std::string name;        ///< Fully qualified module name (e.g., "json.decoder")
    std::string source;      ///< Module source text
    bool is_package = false; ///< Module is a package (__init__)
    std::string cache_tag;   ///< Interpreter cache tag (e.g., "cpython-39")
    bool is_stdlib = false;  ///< Part of the standard library
    bool is_test = false;    ///< Only used by the test suite
};

/// Request to compile module source to bytecode while packaging
struct PythonModuleBytecodeRequest {
    std::string name;
    std::string source;
    BytecodeOptimizationLevel optimize_level = BytecodeOptimizationLevel::Zero;
    bool is_package = false;
    std::string cache_tag;
    bool is_stdlib = false;
    bool is_test = false;
};

/// Already compiled module bytecode
struct PythonModuleBytecode {
    std::string name;
    std::vector<std::uint8_t> bytecode;
    BytecodeOptimizationLevel optimize_level = BytecodeOptimizationLevel::Zero;
    bool is_package = false;
    std::string cache_tag;
    bool is_stdlib = false;
    bool is_test = false;
};

// =============================================================================
// Non-code Files
// =============================================================================

/// Non-code file inside a Python package (loaded with importlib.resources)
struct PythonPackageResource {
    std::string leaf_package;   ///< Package directly containing the file
    std::string relative_name;  ///< Path relative to the package directory
    std::vector<std::uint8_t> data;
    bool is_stdlib = false;
    bool is_test = false;

    /// "package/relative_name"
    [[nodiscard]] std::string symbolic_name() const {
        return leaf_package + "/" + relative_name;
    }
};

/// File from a package's .dist-info or .egg-info metadata directory
struct PythonPackageDistributionResource {
    std::string package;  ///< Distribution name
    std::string version;  ///< Distribution version
    std::string name;     ///< File name inside the metadata directory
    std::vector<std::uint8_t> data;
};

// =============================================================================
// Extension Modules
// =============================================================================

/// Extension module shipped as a shared library
struct ExtensionModuleDynamicLibrary {
    PythonExtensionModule module;
    std::vector<std::uint8_t> shared_library;
};

/// Extension module linked into libpython
struct ExtensionModuleStaticallyLinked {
    PythonExtensionModule module;
    std::vector<std::filesystem::path> object_files;
};

// =============================================================================
// Path Entries
// =============================================================================

/// A .pth file
struct PythonPathExtension {
    std::string name;
    std::vector<std::uint8_t> data;
};

/// A .egg archive or directory
struct PythonEggFile {
    std::filesystem::path path;
};

// =============================================================================
// PythonResource
// =============================================================================

/// Any resource discovered in a distribution
using PythonResource = std::variant<
    PythonModuleSource,
    PythonModuleBytecodeRequest,
    PythonModuleBytecode,
    PythonPackageResource,
    PythonPackageDistributionResource,
    ExtensionModuleDynamicLibrary,
    ExtensionModuleStaticallyLinked,
    PythonPathExtension,
    PythonEggFile
>;

/// Get the kind tag of a resource
[[nodiscard]] ResourceKind resource_kind(const PythonResource& resource) noexcept;

/// Name identifying a resource in diagnostics
[[nodiscard]] std::string resource_name(const PythonResource& resource);

/// Whether a resource is flagged as test-only (false for kinds without the flag)
[[nodiscard]] bool resource_is_test(const PythonResource& resource) noexcept;

} // namespace pyembed_packaging
