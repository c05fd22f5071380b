/// @file resource.cpp
/// @brief Python resource helpers

#include <pyembed/packaging/resource.hpp>
#include <type_traits>

namespace pyembed_packaging {

namespace {

template<typename>
inline constexpr bool k_unhandled_resource = false;

} // anonymous namespace

ResourceKind resource_kind(const PythonResource& resource) noexcept {
    return std::visit([](const auto& r) -> ResourceKind {
        using T = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<T, PythonModuleSource>) {
            return ResourceKind::ModuleSource;
        } else if constexpr (std::is_same_v<T, PythonModuleBytecodeRequest>) {
            return ResourceKind::ModuleBytecodeRequest;
        } else if constexpr (std::is_same_v<T, PythonModuleBytecode>) {
            return ResourceKind::ModuleBytecode;
        } else if constexpr (std::is_same_v<T, PythonPackageResource>) {
            return ResourceKind::Resource;
        } else if constexpr (std::is_same_v<T, PythonPackageDistributionResource>) {
            return ResourceKind::DistributionResource;
        } else if constexpr (std::is_same_v<T, ExtensionModuleDynamicLibrary>) {
            return ResourceKind::ExtensionModuleDynamicLibrary;
        } else if constexpr (std::is_same_v<T, ExtensionModuleStaticallyLinked>) {
            return ResourceKind::ExtensionModuleStaticallyLinked;
        } else if constexpr (std::is_same_v<T, PythonPathExtension>) {
            return ResourceKind::PathExtension;
        } else if constexpr (std::is_same_v<T, PythonEggFile>) {
            return ResourceKind::EggFile;
        } else {
            static_assert(k_unhandled_resource<T>, "unhandled PythonResource alternative");
        }
    }, resource);
}

std::string resource_name(const PythonResource& resource) {
    return std::visit([](const auto& r) -> std::string {
        using T = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<T, PythonModuleSource> ||
                      std::is_same_v<T, PythonModuleBytecodeRequest> ||
                      std::is_same_v<T, PythonModuleBytecode> ||
                      std::is_same_v<T, PythonPathExtension>) {
            return r.name;
        } else if constexpr (std::is_same_v<T, PythonPackageResource>) {
            return r.symbolic_name();
        } else if constexpr (std::is_same_v<T, PythonPackageDistributionResource>) {
            return r.package + "-" + r.version + "/" + r.name;
        } else if constexpr (std::is_same_v<T, ExtensionModuleDynamicLibrary> ||
                             std::is_same_v<T, ExtensionModuleStaticallyLinked>) {
            return r.module.display_name();
        } else if constexpr (std::is_same_v<T, PythonEggFile>) {
            return r.path.string();
        } else {
            static_assert(k_unhandled_resource<T>, "unhandled PythonResource alternative");
        }
    }, resource);
}

bool resource_is_test(const PythonResource& resource) noexcept {
    return std::visit([](const auto& r) -> bool {
        using T = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<T, PythonModuleSource> ||
                      std::is_same_v<T, PythonModuleBytecodeRequest> ||
                      std::is_same_v<T, PythonModuleBytecode> ||
                      std::is_same_v<T, PythonPackageResource>) {
            return r.is_test;
        } else {
            return false;
        }
    }, resource);
}

} // namespace pyembed_packaging
