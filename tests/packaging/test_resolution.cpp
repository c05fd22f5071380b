// pyembed_packaging extension resolution tests
//
// Tests for resolve_python_extension_modules():
// - Broken extension denylist takes precedence over every filter
// - Minimally required variants are always selected
// - NoLibraries and NoGPL candidate filtering
// - Preferred variants and deterministic output order
// - Duplicate entries produced by the All filter

#include <catch2/catch.hpp>
#include <pyembed/packaging/packaging.hpp>

#include <optional>
#include <string>
#include <vector>

using namespace pyembed_packaging;

// =============================================================================
// Test Utilities
// =============================================================================

namespace {

constexpr const char* k_linux = "x86_64-unknown-linux-gnu";
constexpr const char* k_musl = "x86_64-unknown-linux-musl";

const std::vector<ExtensionModuleFilter> k_all_filters = {
    ExtensionModuleFilter::Minimal,
    ExtensionModuleFilter::All,
    ExtensionModuleFilter::NoLibraries,
    ExtensionModuleFilter::NoGPL,
};

/// Builder for extension module variants
struct ExtensionBuilder {
    PythonExtensionModule em;

    explicit ExtensionBuilder(const std::string& name) {
        em.name = name;
        em.init_fn = "PyInit_" + name;
    }

    ExtensionBuilder& variant(const std::string& v) {
        em.variant = v;
        return *this;
    }

    ExtensionBuilder& required() {
        em.required = true;
        return *this;
    }

    ExtensionBuilder& links(const std::string& library) {
        em.link_libraries.push_back(LibraryDependency{library, false, false, true, false});
        return *this;
    }

    ExtensionBuilder& licenses(std::vector<std::string> ids) {
        em.licenses = std::move(ids);
        return *this;
    }

    ExtensionBuilder& public_domain(bool value) {
        em.license_public_domain = value;
        return *this;
    }

    operator PythonExtensionModule() const { return em; }
};

PythonExtensionModuleVariants group(std::vector<PythonExtensionModule> variants) {
    return PythonExtensionModuleVariants(variants.begin(), variants.end());
}

std::vector<std::string> display_names(const std::vector<PythonExtensionModule>& modules) {
    std::vector<std::string> names;
    for (const auto& em : modules) {
        names.push_back(em.display_name());
    }
    return names;
}

std::vector<PythonExtensionModule> resolve(
    const PythonPackagingPolicy& policy,
    const std::vector<PythonExtensionModuleVariants>& groups,
    const std::string& target = k_linux) {
    auto result = policy.resolve_python_extension_modules(groups, target);
    REQUIRE(result.is_ok());
    return std::move(result).value();
}

PythonPackagingPolicy policy_with(ExtensionModuleFilter filter) {
    PythonPackagingPolicy policy;
    policy.set_extension_module_filter(filter);
    return policy;
}

/// A small distribution: a required builtin, an OpenSSL-backed module with a
/// GPL alternative, a pure module and a GPL-only readline.
std::vector<PythonExtensionModuleVariants> sample_distribution() {
    return {
        group({ExtensionBuilder("_io").required()}),
        group({
            ExtensionBuilder("_ssl").variant("openssl").links("ssl").licenses({"OpenSSL"}),
            ExtensionBuilder("_ssl").variant("gnutls").links("gnutls").licenses({"LGPL-2.1-or-later"}),
        }),
        group({ExtensionBuilder("_json")}),
        group({ExtensionBuilder("readline").links("readline").licenses({"GPL-3.0-or-later"})}),
    };
}

} // anonymous namespace

// =============================================================================
// Strategy Tests
// =============================================================================

TEST_CASE("Resolution per filter on a sample distribution", "[packaging][resolve]") {
    auto groups = sample_distribution();

    SECTION("minimal") {
        auto out = resolve(policy_with(ExtensionModuleFilter::Minimal), groups);
        REQUIRE(display_names(out) == std::vector<std::string>{"_io"});
    }

    SECTION("all") {
        auto out = resolve(policy_with(ExtensionModuleFilter::All), groups);
        REQUIRE(display_names(out) ==
                std::vector<std::string>{"_io", "_io", "_ssl[openssl]", "_json", "readline"});
    }

    SECTION("no-libraries") {
        auto out = resolve(policy_with(ExtensionModuleFilter::NoLibraries), groups);
        REQUIRE(display_names(out) == std::vector<std::string>{"_io", "_io", "_json"});
    }

    SECTION("no-gpl") {
        auto out = resolve(policy_with(ExtensionModuleFilter::NoGPL), groups);
        REQUIRE(display_names(out) ==
                std::vector<std::string>{"_io", "_io", "_ssl[openssl]", "_json"});
    }
}

TEST_CASE("Empty input and empty groups", "[packaging][resolve]") {
    for (auto filter : k_all_filters) {
        auto policy = policy_with(filter);
        REQUIRE(resolve(policy, {}).empty());
        REQUIRE(resolve(policy, {PythonExtensionModuleVariants{}}).empty());
    }
}

// =============================================================================
// Denylist Tests
// =============================================================================

TEST_CASE("Broken extensions are never selected", "[packaging][resolve][broken]") {
    std::vector<PythonExtensionModuleVariants> groups = {
        group({ExtensionBuilder("_crypt").required(), ExtensionBuilder("_crypt").variant("alt")}),
        group({ExtensionBuilder("_json")}),
    };

    for (auto filter : k_all_filters) {
        auto policy = policy_with(filter);
        policy.register_broken_extension(k_musl, "_crypt");

        SECTION(std::string("on the broken target, filter ") +
                extension_module_filter_to_string(filter)) {
            auto out = resolve(policy, groups, k_musl);
            for (const auto& em : out) {
                REQUIRE(em.name != "_crypt");
            }
        }

        SECTION(std::string("other targets are unaffected, filter ") +
                extension_module_filter_to_string(filter)) {
            auto out = resolve(policy, groups, k_linux);
            REQUIRE_FALSE(out.empty());
            REQUIRE(out.front().name == "_crypt");
        }
    }
}

TEST_CASE("Broken extension is matched on the default variant name", "[packaging][resolve][broken]") {
    auto policy = policy_with(ExtensionModuleFilter::All);
    policy.register_broken_extension(k_linux, "_tkinter");
    policy.register_broken_extension(k_linux, "_tkinter");

    auto out = resolve(policy, {
        group({ExtensionBuilder("_tkinter").links("tk"), ExtensionBuilder("_tkinter").variant("x")}),
        group({ExtensionBuilder("_json")}),
    });
    REQUIRE(display_names(out) == std::vector<std::string>{"_json"});
}

// =============================================================================
// Minimal Inclusion Tests
// =============================================================================

TEST_CASE("Minimally required variants are always included", "[packaging][resolve][minimal]") {
    std::vector<PythonExtensionModuleVariants> groups = {
        group({
            ExtensionBuilder("_codecs").variant("full").links("iconv"),
            ExtensionBuilder("_codecs").variant("core").required(),
        }),
        group({ExtensionBuilder("_json")}),
    };

    SECTION("minimal picks only from the required subset") {
        auto policy = policy_with(ExtensionModuleFilter::Minimal);
        auto out = resolve(policy, groups);
        REQUIRE(out.size() == 1);
        REQUIRE(out[0].is_minimally_required());
        REQUIRE(out[0].variant == std::optional<std::string>("core"));
    }

    SECTION("a preference for a non-required variant does not leak into the required pick") {
        auto policy = policy_with(ExtensionModuleFilter::Minimal);
        policy.set_preferred_extension_module_variant("_codecs", "full");
        auto out = resolve(policy, groups);
        REQUIRE(out.size() == 1);
        REQUIRE(out[0].variant == std::optional<std::string>("core"));
    }

    SECTION("every filter contributes the required variant first") {
        for (auto filter : k_all_filters) {
            auto out = resolve(policy_with(filter), groups);
            REQUIRE_FALSE(out.empty());
            REQUIRE(out[0].name == "_codecs");
            REQUIRE(out[0].is_minimally_required());
        }
    }

    SECTION("no-libraries adds the library-free variant after the required one") {
        auto out = resolve(policy_with(ExtensionModuleFilter::NoLibraries), groups);
        REQUIRE(display_names(out) ==
                std::vector<std::string>{"_codecs[core]", "_codecs[core]", "_json"});
    }
}

TEST_CASE("All duplicates the required variant when it is also the default choice",
          "[packaging][resolve][minimal]") {
    // Group with required V1 and optional V2, V1 preferred: step 2 picks V1 from the
    // required subset and the All filter picks V1 again from the full group.
    auto groups = std::vector<PythonExtensionModuleVariants>{
        group({
            ExtensionBuilder("_sre").variant("v1").required(),
            ExtensionBuilder("_sre").variant("v2"),
        }),
    };

    auto policy = policy_with(ExtensionModuleFilter::All);
    policy.set_preferred_extension_module_variant("_sre", "v1");

    auto out = resolve(policy, groups);
    REQUIRE(display_names(out) == std::vector<std::string>{"_sre[v1]", "_sre[v1]"});
    REQUIRE(out[0] == out[1]);

    SECTION("preferring the optional variant yields both variants") {
        policy.set_preferred_extension_module_variant("_sre", "v2");
        auto out2 = resolve(policy, groups);
        REQUIRE(display_names(out2) == std::vector<std::string>{"_sre[v1]", "_sre[v2]"});
    }
}

// =============================================================================
// NoLibraries Tests
// =============================================================================

TEST_CASE("NoLibraries skips groups where every variant links libraries",
          "[packaging][resolve][no_libraries]") {
    auto policy = policy_with(ExtensionModuleFilter::NoLibraries);

    auto out = resolve(policy, {
        group({ExtensionBuilder("_sqlite3").links("sqlite3")}),
        group({
            ExtensionBuilder("_decimal").variant("system").links("mpdec"),
            ExtensionBuilder("_decimal").variant("bundled"),
        }),
    });
    REQUIRE(display_names(out) == std::vector<std::string>{"_decimal[bundled]"});
}

// =============================================================================
// NoGPL Tests
// =============================================================================

TEST_CASE("NoGPL license admission", "[packaging][resolve][no_gpl]") {
    SECTION("no linked libraries is admitted") {
        REQUIRE(PythonPackagingPolicy::is_license_admissible(ExtensionBuilder("_json")));
    }

    SECTION("public domain wins over a GPL license list") {
        REQUIRE(PythonPackagingPolicy::is_license_admissible(
            ExtensionBuilder("_sqlite3").links("sqlite3")
                .public_domain(true).licenses({"GPL-3.0"})));
    }

    SECTION("explicit public_domain false falls through to the license list") {
        REQUIRE(PythonPackagingPolicy::is_license_admissible(
            ExtensionBuilder("zlib").links("z").public_domain(false).licenses({"Zlib"})));
        REQUIRE_FALSE(PythonPackagingPolicy::is_license_admissible(
            ExtensionBuilder("zlib").links("z").public_domain(false)));
    }

    SECTION("allow-listed license is admitted") {
        REQUIRE(PythonPackagingPolicy::is_license_admissible(
            ExtensionBuilder("_ctypes").links("ffi").licenses({"MIT"})));
    }

    SECTION("GPL license is excluded") {
        REQUIRE_FALSE(PythonPackagingPolicy::is_license_admissible(
            ExtensionBuilder("readline").links("readline").licenses({"GPL-3.0"})));
    }

    SECTION("every license must be allow-listed") {
        REQUIRE_FALSE(PythonPackagingPolicy::is_license_admissible(
            ExtensionBuilder("_dbm").links("gdbm").licenses({"MIT", "GPL-3.0-or-later"})));
        REQUIRE(PythonPackagingPolicy::is_license_admissible(
            ExtensionBuilder("_lzma").links("lzma").licenses({"0BSD", "Unlicense"})));
    }

    SECTION("empty license list admits vacuously") {
        REQUIRE(PythonPackagingPolicy::is_license_admissible(
            ExtensionBuilder("_x").links("x").licenses({})));
    }

    SECTION("libraries without license metadata are excluded") {
        REQUIRE_FALSE(PythonPackagingPolicy::is_license_admissible(
            ExtensionBuilder("_bz2").links("bz2")));
    }
}

TEST_CASE("NoGPL resolution picks among admitted variants", "[packaging][resolve][no_gpl]") {
    auto policy = policy_with(ExtensionModuleFilter::NoGPL);
    policy.set_preferred_extension_module_variant("_ssl", "gnutls");

    auto out = resolve(policy, {
        group({
            ExtensionBuilder("_ssl").variant("gnutls").links("gnutls").licenses({"GPL-3.0"}),
            ExtensionBuilder("_ssl").variant("openssl").links("ssl").licenses({"Apache-2.0"}),
        }),
        group({ExtensionBuilder("_gdbm").links("gdbm")}),
    });

    // The preferred variant is not admissible, so the first admitted one wins.
    REQUIRE(display_names(out) == std::vector<std::string>{"_ssl[openssl]"});
}

// =============================================================================
// Preference and Determinism Tests
// =============================================================================

TEST_CASE("Preferred variants drive the choice", "[packaging][resolve][preferred]") {
    std::vector<PythonExtensionModuleVariants> groups = {
        group({
            ExtensionBuilder("_sqlite3").variant("bundled"),
            ExtensionBuilder("_sqlite3").variant("system").links("sqlite3"),
        }),
    };

    SECTION("default variant without preference") {
        auto out = resolve(policy_with(ExtensionModuleFilter::All), groups);
        REQUIRE(display_names(out) == std::vector<std::string>{"_sqlite3[bundled]"});
    }

    SECTION("preferred variant when present") {
        auto policy = policy_with(ExtensionModuleFilter::All);
        policy.set_preferred_extension_module_variant("_sqlite3", "system");
        REQUIRE(display_names(resolve(policy, groups)) ==
                std::vector<std::string>{"_sqlite3[system]"});
    }

    SECTION("unknown preferred variant falls back to the default") {
        auto policy = policy_with(ExtensionModuleFilter::All);
        policy.set_preferred_extension_module_variant("_sqlite3", "missing");
        REQUIRE(display_names(resolve(policy, groups)) ==
                std::vector<std::string>{"_sqlite3[bundled]"});
    }
}

TEST_CASE("Resolution is deterministic", "[packaging][resolve]") {
    auto groups = sample_distribution();

    for (auto filter : k_all_filters) {
        auto policy = policy_with(filter);
        policy.set_preferred_extension_module_variant("_ssl", "gnutls");
        policy.register_broken_extension(k_linux, "readline");

        auto first = resolve(policy, groups);
        auto second = resolve(policy, groups);
        REQUIRE(first == second);
    }
}

TEST_CASE("Resolution does not modify the policy or the input", "[packaging][resolve]") {
    auto groups = sample_distribution();
    auto groups_copy = groups;

    auto policy = policy_with(ExtensionModuleFilter::NoGPL);
    policy.register_broken_extension(k_linux, "_json");
    auto before = policy.to_json_string();

    auto out = resolve(policy, groups);
    REQUIRE(policy.to_json_string() == before);
    REQUIRE(groups.size() == groups_copy.size());
    for (std::size_t i = 0; i < groups.size(); ++i) {
        REQUIRE(std::vector<PythonExtensionModule>(groups[i].begin(), groups[i].end()) ==
                std::vector<PythonExtensionModule>(groups_copy[i].begin(), groups_copy[i].end()));
    }
}
