/// @file fwd.cpp
/// @brief Implementation of forward declaration utilities

#include <pyembed/packaging/fwd.hpp>

namespace pyembed_packaging {

const char* resource_kind_to_string(ResourceKind kind) noexcept {
    switch (kind) {
        case ResourceKind::ModuleSource:                    return "module-source";
        case ResourceKind::ModuleBytecodeRequest:           return "module-bytecode-request";
        case ResourceKind::ModuleBytecode:                  return "module-bytecode";
        case ResourceKind::Resource:                        return "resource";
        case ResourceKind::DistributionResource:            return "distribution-resource";
        case ResourceKind::ExtensionModuleDynamicLibrary:   return "extension-module-dynamic-library";
        case ResourceKind::ExtensionModuleStaticallyLinked: return "extension-module-statically-linked";
        case ResourceKind::PathExtension:                   return "path-extension";
        case ResourceKind::EggFile:                         return "egg-file";
    }
    return "unknown";
}

const char* extension_module_filter_to_string(ExtensionModuleFilter filter) noexcept {
    switch (filter) {
        case ExtensionModuleFilter::Minimal:     return "minimal";
        case ExtensionModuleFilter::All:         return "all";
        case ExtensionModuleFilter::NoLibraries: return "no-libraries";
        case ExtensionModuleFilter::NoGPL:       return "no-gpl";
    }
    return "unknown";
}

} // namespace pyembed_packaging
