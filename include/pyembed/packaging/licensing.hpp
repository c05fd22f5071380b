#pragma once

/// @file licensing.hpp
/// @brief License identifiers that do not impose copyleft terms on a binary
///
/// The allow-list holds SPDX license identifiers. Anything not on the list is
/// treated as copyleft, so a new or misspelled identifier can only ever cause a
/// library to be excluded, never admitted.

#include <set>
#include <string_view>

namespace pyembed_packaging {

/// All license identifiers considered non-GPL
[[nodiscard]] const std::set<std::string_view>& non_gpl_licenses();

/// Exact, case-sensitive membership test against non_gpl_licenses()
[[nodiscard]] bool is_non_gpl_license(std::string_view spdx_id);

} // namespace pyembed_packaging
