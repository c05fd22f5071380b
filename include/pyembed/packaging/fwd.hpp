#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for pyembed_packaging module

#include <cstdint>

namespace pyembed_packaging {

// =============================================================================
// Resource Types
// =============================================================================

/// Kind tag of a PythonResource alternative
enum class ResourceKind : std::uint8_t {
    ModuleSource,                     ///< Python source for a module
    ModuleBytecodeRequest,            ///< Source to be compiled to bytecode at packaging time
    ModuleBytecode,                   ///< Already compiled bytecode
    Resource,                         ///< Non-code file inside a package
    DistributionResource,             ///< File from a package's distribution metadata
    ExtensionModuleDynamicLibrary,    ///< Extension module as a shared library
    ExtensionModuleStaticallyLinked,  ///< Extension module linked into libpython
    PathExtension,                    ///< A .pth file
    EggFile,                          ///< A .egg archive
};

/// Optimization level bytecode is compiled at
enum class BytecodeOptimizationLevel : std::uint8_t {
    Zero,  ///< Plain .pyc
    One,   ///< -O
    Two,   ///< -OO
};

struct PythonModuleSource;
struct PythonModuleBytecodeRequest;
struct PythonModuleBytecode;
struct PythonPackageResource;
struct PythonPackageDistributionResource;
struct ExtensionModuleDynamicLibrary;
struct ExtensionModuleStaticallyLinked;
struct PythonPathExtension;
struct PythonEggFile;

// =============================================================================
// Extension Module Types
// =============================================================================

struct LibraryDependency;
struct PythonExtensionModule;
class PythonExtensionModuleVariants;

// =============================================================================
// Policy Types
// =============================================================================

/// How aggressively extension modules are included
enum class ExtensionModuleFilter : std::uint8_t {
    Minimal,      ///< Only minimally required extensions
    All,          ///< Every available extension
    NoLibraries,  ///< Extensions that link no external libraries
    NoGPL,        ///< Extensions whose linked libraries are not copyleft
};

class PythonResourcesPolicy;
class PythonPackagingPolicy;

// =============================================================================
// Utility Functions
// =============================================================================

/// Convert ResourceKind to string
[[nodiscard]] const char* resource_kind_to_string(ResourceKind kind) noexcept;

/// Convert ExtensionModuleFilter to its canonical text form
[[nodiscard]] const char* extension_module_filter_to_string(ExtensionModuleFilter filter) noexcept;

} // namespace pyembed_packaging
