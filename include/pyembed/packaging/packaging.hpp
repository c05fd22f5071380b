#pragma once

/// @file packaging.hpp
/// @brief Main include file for pyembed_packaging module
///
/// # Overview
///
/// pyembed_packaging decides which parts of a Python distribution are embedded
/// into a standalone binary for one target platform.
///
/// | Resource kind | Accepted by filter_python_resource() when |
/// |---------------|-------------------------------------------|
/// | Module source | sources enabled, and tests enabled or not a test |
/// | Bytecode request | tests enabled or not a test |
/// | Package resource | resources enabled, and tests enabled or not a test |
/// | Everything else | never |
///
/// Extension modules are chosen per group of variants by
/// resolve_python_extension_modules().
///
/// # Basic Usage
///
/// ```cpp
/// #include <pyembed/packaging/packaging.hpp>
///
/// using namespace pyembed_packaging;
///
/// PythonPackagingPolicy policy;
/// policy.set_extension_module_filter(ExtensionModuleFilter::NoGPL);
/// policy.register_broken_extension("x86_64-unknown-linux-musl", "_crypt");
///
/// for (const auto& resource : discovered) {
///     if (policy.filter_python_resource(resource)) {
///         embed(resource);
///     }
/// }
///
/// auto extensions = policy.resolve_python_extension_modules(groups, target);
/// ```

#include "fwd.hpp"
#include "extension_module.hpp"
#include "resource.hpp"
#include "licensing.hpp"
#include "policy.hpp"
