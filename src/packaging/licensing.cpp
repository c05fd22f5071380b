/// @file licensing.cpp
/// @brief Non-copyleft license allow-list

#include <pyembed/packaging/licensing.hpp>

namespace pyembed_packaging {

const std::set<std::string_view>& non_gpl_licenses() {
    static const std::set<std::string_view> licenses = {
        "0BSD",
        "AFL-3.0",
        "Apache-1.1",
        "Apache-2.0",
        "Artistic-2.0",
        "BSD-1-Clause",
        "BSD-2-Clause",
        "BSD-2-Clause-Patent",
        "BSD-3-Clause",
        "BSD-3-Clause-Clear",
        "BSD-4-Clause",
        "BSL-1.0",
        "bzip2-1.0.6",
        "CC0-1.0",
        "curl",
        "ECL-2.0",
        "EFL-2.0",
        "HPND",
        "ICU",
        "ISC",
        "Libpng",
        "libtiff",
        "MirOS",
        "MIT",
        "MIT-0",
        "MPL-2.0",
        "NCSA",
        "OpenSSL",
        "PostgreSQL",
        "PSF-2.0",
        "Python-2.0",
        "TCL",
        "Unicode-DFS-2016",
        "Unlicense",
        "UPL-1.0",
        "W3C",
        "X11",
        "XFree86-1.1",
        "Zlib",
        "zlib-acknowledgement",
        "ZPL-2.1",
    };
    return licenses;
}

bool is_non_gpl_license(std::string_view spdx_id) {
    const auto& licenses = non_gpl_licenses();
    return licenses.find(spdx_id) != licenses.end();
}

} // namespace pyembed_packaging
