#pragma once

/// @file extension_module.hpp
/// @brief Python extension modules and groups of interchangeable variants
///
/// A Python distribution may ship several builds of the same extension module,
/// for example `_ssl` linked against a system OpenSSL and `_ssl` built against a
/// bundled static copy. Each build is a PythonExtensionModule; the builds sharing
/// a module name form a PythonExtensionModuleVariants group.

#include "fwd.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace pyembed_packaging {

// =============================================================================
// LibraryDependency
// =============================================================================

/// A library an extension module must be linked against
struct LibraryDependency {
    std::string name;              ///< Library name (e.g., "ssl", "z")
    bool system = false;           ///< Provided by the target operating system
    bool framework = false;        ///< Apple framework
    bool static_library = false;   ///< Distribution ships a static archive
    bool dynamic_library = false;  ///< Distribution ships a shared library

    bool operator==(const LibraryDependency& other) const = default;
};

// =============================================================================
// PythonExtensionModule
// =============================================================================

/// One concrete build of a Python extension module
struct PythonExtensionModule {
    std::string name;                    ///< Fully qualified module name (e.g., "_ssl")
    std::optional<std::string> variant;  ///< Variant label (e.g., "openssl", "libressl")
    std::string init_fn;                 ///< Module initialization function (e.g., "PyInit__ssl")
    bool builtin_default = false;        ///< Built into libpython by default
    bool required = false;               ///< Interpreter cannot start without it
    bool is_package = false;             ///< Module is a package

    /// Libraries this build links against
    std::vector<LibraryDependency> link_libraries;

    /// SPDX identifiers of the licenses of the linked libraries, when known
    std::optional<std::vector<std::string>> licenses;

    /// Whether the linked libraries are in the public domain, when known
    std::optional<bool> license_public_domain;

    /// Whether the interpreter requires this build to function
    [[nodiscard]] bool is_minimally_required() const noexcept {
        return required;
    }

    /// Whether this build links any library at all
    [[nodiscard]] bool requires_libraries() const noexcept {
        return !link_libraries.empty();
    }

    /// "name" or "name[variant]" for diagnostics
    [[nodiscard]] std::string display_name() const;

    bool operator==(const PythonExtensionModule& other) const = default;
};

// =============================================================================
// PythonExtensionModuleVariants
// =============================================================================

/// Ordered group of interchangeable builds of one extension module
///
/// The first variant added is the default variant.
class PythonExtensionModuleVariants {
public:
    using container_type = std::vector<PythonExtensionModule>;
    using const_iterator = container_type::const_iterator;

    PythonExtensionModuleVariants() = default;

    /// Build a group from an iterator range
    template<typename InputIt>
    PythonExtensionModuleVariants(InputIt first, InputIt last)
        : m_variants(first, last) {}

    /// Append a variant
    void push(PythonExtensionModule em);

    [[nodiscard]] bool empty() const noexcept { return m_variants.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return m_variants.size(); }

    [[nodiscard]] const_iterator begin() const noexcept { return m_variants.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return m_variants.end(); }

    /// The default variant (the first one added)
    ///
    /// @throws std::out_of_range if the group is empty
    [[nodiscard]] const PythonExtensionModule& default_variant() const;

    /// Choose one variant honoring preferred variant names
    ///
    /// Starts from the default variant. If @p preferred maps the module name to a
    /// variant label and a variant with that label exists, the first such variant
    /// is chosen instead.
    ///
    /// @param preferred Module name to preferred variant label
    /// @throws std::out_of_range if the group is empty
    [[nodiscard]] const PythonExtensionModule& choose_variant(
        const std::map<std::string, std::string>& preferred) const;

    /// Copy of this group restricted to variants matching @p pred, order kept
    template<typename Pred>
    [[nodiscard]] PythonExtensionModuleVariants filter(Pred&& pred) const {
        PythonExtensionModuleVariants out;
        for (const auto& em : m_variants) {
            if (pred(em)) {
                out.push(em);
            }
        }
        return out;
    }

private:
    container_type m_variants;
};

} // namespace pyembed_packaging
