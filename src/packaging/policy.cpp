/// @file policy.cpp
/// @brief Packaging policy implementation

#include <pyembed/packaging/policy.hpp>
#include <pyembed/packaging/licensing.hpp>
#include <pyembed/core/log.hpp>

#include <algorithm>
#include <type_traits>

namespace pyembed_packaging {

namespace {

constexpr std::string_view k_in_memory_only = "in-memory-only";
constexpr std::string_view k_filesystem_relative_only = "filesystem-relative-only:";
constexpr std::string_view k_prefer_in_memory = "prefer-in-memory-fallback-filesystem-relative:";

template<typename>
inline constexpr bool k_unhandled_resource = false;

bool starts_with(std::string_view value, std::string_view prefix) noexcept {
    return value.size() >= prefix.size() && value.substr(0, prefix.size()) == prefix;
}

} // anonymous namespace

// =============================================================================
// PythonResourcesPolicy
// =============================================================================

PythonResourcesPolicy PythonResourcesPolicy::in_memory_only() {
    return PythonResourcesPolicy{};
}

PythonResourcesPolicy PythonResourcesPolicy::filesystem_relative_only(std::string prefix) {
    return PythonResourcesPolicy{Kind::FilesystemRelativeOnly, std::move(prefix)};
}

PythonResourcesPolicy PythonResourcesPolicy::prefer_in_memory_fallback_filesystem_relative(
    std::string prefix) {
    return PythonResourcesPolicy{Kind::PreferInMemoryFallbackFilesystemRelative, std::move(prefix)};
}

pyembed_core::Result<PythonResourcesPolicy> PythonResourcesPolicy::parse(std::string_view value) {
    if (value == k_in_memory_only) {
        return pyembed_core::Ok(in_memory_only());
    }
    if (starts_with(value, k_filesystem_relative_only)) {
        return pyembed_core::Ok(filesystem_relative_only(
            std::string(value.substr(k_filesystem_relative_only.size()))));
    }
    if (starts_with(value, k_prefer_in_memory)) {
        return pyembed_core::Ok(prefer_in_memory_fallback_filesystem_relative(
            std::string(value.substr(k_prefer_in_memory.size()))));
    }

    return pyembed_core::Err<PythonResourcesPolicy>(
        pyembed_core::PolicyError::invalid_policy_value(std::string(value)));
}

std::string PythonResourcesPolicy::to_string() const {
    switch (m_kind) {
        case Kind::InMemoryOnly:
            return std::string(k_in_memory_only);
        case Kind::FilesystemRelativeOnly:
            return std::string(k_filesystem_relative_only) + m_prefix;
        case Kind::PreferInMemoryFallbackFilesystemRelative:
            return std::string(k_prefer_in_memory) + m_prefix;
    }
    return std::string(k_in_memory_only);
}

bool PythonResourcesPolicy::allows_in_memory() const noexcept {
    switch (m_kind) {
        case Kind::InMemoryOnly: return true;
        case Kind::FilesystemRelativeOnly: return false;
        case Kind::PreferInMemoryFallbackFilesystemRelative: return true;
    }
    return false;
}

bool PythonResourcesPolicy::allows_filesystem_relative() const noexcept {
    switch (m_kind) {
        case Kind::InMemoryOnly: return false;
        case Kind::FilesystemRelativeOnly: return true;
        case Kind::PreferInMemoryFallbackFilesystemRelative: return true;
    }
    return false;
}

// =============================================================================
// ExtensionModuleFilter
// =============================================================================

pyembed_core::Result<ExtensionModuleFilter> parse_extension_module_filter(std::string_view value) {
    if (value == "minimal") {
        return pyembed_core::Ok(ExtensionModuleFilter::Minimal);
    }
    if (value == "all") {
        return pyembed_core::Ok(ExtensionModuleFilter::All);
    }
    if (value == "no-libraries") {
        return pyembed_core::Ok(ExtensionModuleFilter::NoLibraries);
    }
    if (value == "no-gpl") {
        return pyembed_core::Ok(ExtensionModuleFilter::NoGPL);
    }

    return pyembed_core::Err<ExtensionModuleFilter>(
        pyembed_core::PolicyError::invalid_filter_value(std::string(value)));
}

// =============================================================================
// PythonPackagingPolicy Mutators
// =============================================================================

void PythonPackagingPolicy::set_extension_module_filter(ExtensionModuleFilter filter) {
    m_extension_module_filter = filter;
}

void PythonPackagingPolicy::set_preferred_extension_module_variant(
    const std::string& extension, const std::string& variant) {
    m_preferred_extension_module_variants[extension] = variant;
}

void PythonPackagingPolicy::set_resources_policy(PythonResourcesPolicy policy) {
    m_resources_policy = std::move(policy);
}

void PythonPackagingPolicy::set_include_distribution_sources(bool include) {
    m_include_distribution_sources = include;
}

void PythonPackagingPolicy::set_include_distribution_resources(bool include) {
    m_include_distribution_resources = include;
}

void PythonPackagingPolicy::set_include_test(bool include) {
    m_include_test = include;
}

void PythonPackagingPolicy::register_broken_extension(
    const std::string& target_triple, const std::string& extension) {
    m_broken_extensions[target_triple].push_back(extension);
}

bool PythonPackagingPolicy::is_broken_extension(
    const std::string& target_triple, const std::string& extension) const {
    auto it = m_broken_extensions.find(target_triple);
    if (it == m_broken_extensions.end()) {
        return false;
    }
    const auto& names = it->second;
    return std::find(names.begin(), names.end(), extension) != names.end();
}

// =============================================================================
// Resource Filtering
// =============================================================================

bool PythonPackagingPolicy::filter_python_resource(const PythonResource& resource) const {
    return std::visit([this](const auto& r) -> bool {
        using T = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<T, PythonModuleSource>) {
            if (!m_include_test && r.is_test) {
                return false;
            }
            return m_include_distribution_sources;
        } else if constexpr (std::is_same_v<T, PythonModuleBytecodeRequest>) {
            return m_include_test || !r.is_test;
        } else if constexpr (std::is_same_v<T, PythonModuleBytecode>) {
            return false;
        } else if constexpr (std::is_same_v<T, PythonPackageResource>) {
            if (!m_include_distribution_resources) {
                return false;
            }
            return m_include_test || !r.is_test;
        } else if constexpr (std::is_same_v<T, PythonPackageDistributionResource>) {
            return false;
        } else if constexpr (std::is_same_v<T, ExtensionModuleDynamicLibrary>) {
            return false;
        } else if constexpr (std::is_same_v<T, ExtensionModuleStaticallyLinked>) {
            return false;
        } else if constexpr (std::is_same_v<T, PythonPathExtension>) {
            return false;
        } else if constexpr (std::is_same_v<T, PythonEggFile>) {
            return false;
        } else {
            static_assert(k_unhandled_resource<T>, "unhandled PythonResource alternative");
        }
    }, resource);
}

// =============================================================================
// Extension Module Resolution
// =============================================================================

bool PythonPackagingPolicy::is_license_admissible(const PythonExtensionModule& em) {
    if (em.link_libraries.empty()) {
        return true;
    }

    if (em.license_public_domain == true) {
        return true;
    }

    // Allow-list, so an unknown identifier can only exclude.
    if (em.licenses.has_value()) {
        return std::all_of(em.licenses->begin(), em.licenses->end(),
            [](const std::string& license) { return is_non_gpl_license(license); });
    }

    // No license data: presume copyleft.
    return false;
}

pyembed_core::Result<std::vector<PythonExtensionModule>>
PythonPackagingPolicy::resolve_python_extension_modules(
    const std::vector<PythonExtensionModuleVariants>& extensions_variants,
    const std::string& target_triple) const {

    PYEMBED_LOG_SCOPE(pyembed_core::packaging_logger(), "resolve_python_extension_modules");
    std::vector<PythonExtensionModule> res;

    auto append = [&](const PythonExtensionModuleVariants& candidates, const char* reason) {
        const auto& chosen = candidates.choose_variant(m_preferred_extension_module_variants);
        PYEMBED_PACKAGING_TRACE("Selected extension {} ({})", chosen.display_name(), reason);
        res.push_back(chosen);
    };

    for (const auto& variants : extensions_variants) {
        if (variants.empty()) {
            PYEMBED_PACKAGING_WARN("Skipping empty extension variant group");
            continue;
        }

        const auto& name = variants.default_variant().name;

        if (is_broken_extension(target_triple, name)) {
            PYEMBED_PACKAGING_DEBUG("Skipping extension {}: broken on {}", name, target_triple);
            continue;
        }

        // Minimally required extensions go in regardless of the filter.
        auto minimal = variants.filter([](const PythonExtensionModule& em) {
            return em.is_minimally_required();
        });
        if (!minimal.empty()) {
            append(minimal, "minimally required");
        }

        switch (m_extension_module_filter) {
            case ExtensionModuleFilter::Minimal:
                break;

            case ExtensionModuleFilter::All:
                append(variants, "all");
                break;

            case ExtensionModuleFilter::NoLibraries: {
                auto candidates = variants.filter([](const PythonExtensionModule& em) {
                    return !em.requires_libraries();
                });
                if (!candidates.empty()) {
                    append(candidates, "no-libraries");
                }
                break;
            }

            case ExtensionModuleFilter::NoGPL: {
                auto candidates = variants.filter([&](const PythonExtensionModule& em) {
                    bool admissible = is_license_admissible(em);
                    if (!admissible) {
                        PYEMBED_PACKAGING_TRACE("Refusing extension {}: license not known to be non-GPL",
                            em.display_name());
                    }
                    return admissible;
                });
                if (!candidates.empty()) {
                    append(candidates, "no-gpl");
                }
                break;
            }
        }
    }

    PYEMBED_PACKAGING_DEBUG("Resolved {} extension module entries from {} groups for {} (filter: {})",
        res.size(), extensions_variants.size(), target_triple,
        extension_module_filter_to_string(m_extension_module_filter));

    return pyembed_core::Ok(std::move(res));
}

} // namespace pyembed_packaging
