#pragma once

/// @file policy.hpp
/// @brief Packaging policy: which resources and extension modules to embed
///
/// A PythonPackagingPolicy is built once (setters or a JSON document), then used
/// read-only to:
/// - filter individual resources with filter_python_resource()
/// - pick extension module variants for a target with
///   resolve_python_extension_modules()
///
/// Thread-safety: const members may be called concurrently as long as no thread
/// mutates the policy at the same time.

#include "fwd.hpp"
#include "extension_module.hpp"
#include "resource.hpp"
#include <pyembed/core/error.hpp>

#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace pyembed_packaging {

// =============================================================================
// PythonResourcesPolicy
// =============================================================================

/// Where Python resources may be loaded from at run time
///
/// Text forms:
/// - `in-memory-only`
/// - `filesystem-relative-only:<prefix>`
/// - `prefer-in-memory-fallback-filesystem-relative:<prefix>`
///
/// The prefix is an opaque path prefix relative to the produced binary and is
/// not validated.
class PythonResourcesPolicy {
public:
    enum class Kind : std::uint8_t {
        InMemoryOnly,                              ///< Load from memory only
        FilesystemRelativeOnly,                    ///< Load from files next to the binary only
        PreferInMemoryFallbackFilesystemRelative,  ///< Memory first, then files
    };

    /// Default is in-memory only
    PythonResourcesPolicy() = default;

    [[nodiscard]] static PythonResourcesPolicy in_memory_only();
    [[nodiscard]] static PythonResourcesPolicy filesystem_relative_only(std::string prefix);
    [[nodiscard]] static PythonResourcesPolicy prefer_in_memory_fallback_filesystem_relative(
        std::string prefix);

    /// Parse the text form
    ///
    /// @return Policy, or PolicyError::InvalidPolicyValue carrying @p value
    [[nodiscard]] static pyembed_core::Result<PythonResourcesPolicy> parse(std::string_view value);

    /// Text form; parse(p.to_string()) == p for every policy
    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] Kind kind() const noexcept { return m_kind; }

    /// Path prefix (empty for InMemoryOnly)
    [[nodiscard]] const std::string& prefix() const noexcept { return m_prefix; }

    /// Whether resources may be placed in memory
    [[nodiscard]] bool allows_in_memory() const noexcept;

    /// Whether resources may be placed on the filesystem
    [[nodiscard]] bool allows_filesystem_relative() const noexcept;

    bool operator==(const PythonResourcesPolicy& other) const = default;

private:
    PythonResourcesPolicy(Kind kind, std::string prefix)
        : m_kind(kind), m_prefix(std::move(prefix)) {}

    Kind m_kind = Kind::InMemoryOnly;
    std::string m_prefix;
};

/// Parse an ExtensionModuleFilter from `minimal`, `all`, `no-libraries` or `no-gpl`
///
/// @return Filter, or PolicyError::InvalidFilterValue carrying @p value
[[nodiscard]] pyembed_core::Result<ExtensionModuleFilter> parse_extension_module_filter(
    std::string_view value);

// =============================================================================
// PythonPackagingPolicy
// =============================================================================

/// Defines how Python resources should be packaged
class PythonPackagingPolicy {
public:
    /// Mapping of module name to preferred variant label
    using PreferredVariants = std::map<std::string, std::string>;

    /// Mapping of target triple to extension names broken on that target
    using BrokenExtensions = std::map<std::string, std::vector<std::string>>;

    /// Defaults: all extensions, in-memory only, distribution sources included,
    /// distribution resources and tests excluded.
    PythonPackagingPolicy() = default;

    // =========================================================================
    // Configuration
    // =========================================================================

    /// Load a policy from a JSON file
    ///
    /// Keys (all optional, missing keys keep defaults):
    /// ```json
    /// {
    ///   "extension_module_filter": "no-gpl",
    ///   "resources_policy": "filesystem-relative-only:lib",
    ///   "include_distribution_sources": true,
    ///   "include_distribution_resources": false,
    ///   "include_test": false,
    ///   "preferred_extension_module_variants": { "_ssl": "openssl" },
    ///   "broken_extensions": { "x86_64-unknown-linux-musl": ["_crypt"] }
    /// }
    /// ```
    [[nodiscard]] static pyembed_core::Result<PythonPackagingPolicy> load(
        const std::filesystem::path& path);

    /// Parse a policy from a JSON document
    ///
    /// @param json_str JSON text
    /// @param source_path Optional source path for error messages
    [[nodiscard]] static pyembed_core::Result<PythonPackagingPolicy> from_json_string(
        const std::string& json_str,
        const std::filesystem::path& source_path = {});

    /// Serialize to the document format accepted by from_json_string()
    [[nodiscard]] std::string to_json_string(int indent = 2) const;

    // =========================================================================
    // Accessors
    // =========================================================================

    [[nodiscard]] ExtensionModuleFilter extension_module_filter() const noexcept {
        return m_extension_module_filter;
    }

    [[nodiscard]] const PreferredVariants& preferred_extension_module_variants() const noexcept {
        return m_preferred_extension_module_variants;
    }

    [[nodiscard]] const PythonResourcesPolicy& resources_policy() const noexcept {
        return m_resources_policy;
    }

    [[nodiscard]] bool include_distribution_sources() const noexcept {
        return m_include_distribution_sources;
    }

    [[nodiscard]] bool include_distribution_resources() const noexcept {
        return m_include_distribution_resources;
    }

    [[nodiscard]] bool include_test() const noexcept { return m_include_test; }

    [[nodiscard]] const BrokenExtensions& broken_extensions() const noexcept {
        return m_broken_extensions;
    }

    /// Whether @p extension was registered broken for @p target_triple
    [[nodiscard]] bool is_broken_extension(
        const std::string& target_triple, const std::string& extension) const;

    // =========================================================================
    // Mutators
    // =========================================================================

    void set_extension_module_filter(ExtensionModuleFilter filter);

    /// Denote the preferred variant for an extension module
    ///
    /// If set, the named variant is chosen whenever it is present. Replaces any
    /// earlier preference for the same module.
    void set_preferred_extension_module_variant(const std::string& extension,
                                                const std::string& variant);

    void set_resources_policy(PythonResourcesPolicy policy);

    /// Whether to include module source from the Python distribution
    void set_include_distribution_sources(bool include);

    /// Whether to include package resource files from the Python distribution
    void set_include_distribution_resources(bool include);

    /// Whether to include resources only used by tests
    void set_include_test(bool include);

    /// Mark an extension as broken on a target, so it is never selected there
    ///
    /// Registering the same pair twice is harmless.
    void register_broken_extension(const std::string& target_triple,
                                   const std::string& extension);

    // =========================================================================
    // Resolution
    // =========================================================================

    /// Whether a resource meets the inclusion requirements of this policy
    ///
    /// Extension modules are never accepted here; they are selected with
    /// resolve_python_extension_modules().
    [[nodiscard]] bool filter_python_resource(const PythonResource& resource) const;

    /// Select extension module variants compliant with this policy
    ///
    /// For each group, in order:
    /// 1. Skip it if its name is registered broken for @p target_triple.
    /// 2. If it has minimally required variants, choose one of them.
    /// 3. Depending on the filter, choose one more from all variants (All),
    ///    from variants without libraries (NoLibraries) or from variants with
    ///    admissible licenses (NoGPL).
    ///
    /// Steps 2 and 3 both append, so with All a group may contribute two entries
    /// that name the same variant. Callers deduplicate if they need to.
    [[nodiscard]] pyembed_core::Result<std::vector<PythonExtensionModule>>
    resolve_python_extension_modules(
        const std::vector<PythonExtensionModuleVariants>& extensions_variants,
        const std::string& target_triple) const;

    /// Whether a variant may be used under ExtensionModuleFilter::NoGPL
    ///
    /// First match wins: no linked libraries; explicitly public domain; every
    /// listed license non-GPL. A variant with libraries and no license data is
    /// refused.
    [[nodiscard]] static bool is_license_admissible(const PythonExtensionModule& em);

private:
    ExtensionModuleFilter m_extension_module_filter = ExtensionModuleFilter::All;
    PreferredVariants m_preferred_extension_module_variants;
    PythonResourcesPolicy m_resources_policy;
    bool m_include_distribution_sources = true;
    bool m_include_distribution_resources = false;
    bool m_include_test = false;
    BrokenExtensions m_broken_extensions;
};

} // namespace pyembed_packaging
